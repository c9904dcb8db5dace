#include <string>
#include <fstream>
#include <iomanip>
#include <Eigen/Dense>

#include "errors.hpp"
#include "output.hpp"


/* Open a result file or fail with its path */
static std::ofstream open_file(const std::string& path) {
    std::ofstream file(path);
    if (!file.is_open()) {
        throw Errors::Error("Cannot open result file " + path);
    }
    file << std::setprecision(12);
    return file;
}

/* Save the spectrum of a single point */
void Output::save_spectrum(const std::string& path, const std::string& gate, const double flux, const Eigen::VectorXd& energies, const Analysis::GateMetrics& metrics) {
    std::ofstream file = open_file(path);
    file << "# gate " << gate << " flux " << flux << " levels " << energies.size() << std::endl;
    file << "# level energy(GHz)" << std::endl;
    for (int k = 0; k < energies.size(); ++k) {
        file << k << " " << energies[k] << std::endl;
    }
    file << "# ground_state_energy " << metrics.ground_state_energy << std::endl;
    if (metrics.transition_frequency) {
        file << "# transition_frequency " << *metrics.transition_frequency << std::endl;
    }
    if (metrics.anharmonicity) {
        file << "# anharmonicity " << *metrics.anharmonicity << std::endl;
    }
}

/* Save the energy table of a sweep */
void Output::save_sweep(const std::string& path, const std::string& gate, const std::string& loop, const Sweep::SweepResult& sweep, const int level_a, const int level_b, const Analysis::MinGap& min_gap) {
    std::ofstream file = open_file(path);
    file << "# gate " << gate << " loop " << loop << " points " << sweep.size() << " levels " << sweep.level_count << std::endl;
    file << "# flux";
    for (int k = 0; k < sweep.level_count; ++k) {
        file << " E" << k;
    }
    file << std::endl;
    for (const auto& point : sweep.points) {
        file << point.parameter;
        for (int k = 0; k < point.energies.size(); ++k) {
            file << " " << point.energies[k];
        }
        file << std::endl;
    }
    for (const auto& failure : sweep.failures) {
        file << "# failed " << failure.index << " " << failure.parameter << " " << failure.reason << std::endl;
    }
    file << "# min_gap " << level_a << " " << level_b << " " << min_gap.gap << " " << min_gap.parameter << " " << min_gap.index << std::endl;
}
