#include <cmath>
#include <limits>
#include <string>
#include <Eigen/Dense>

#include "errors.hpp"
#include "sweep.hpp"
#include "analysis.hpp"


        /* GATE METRICS */

/* Calculate the gate metrics of an ascending spectrum */
Analysis::GateMetrics Analysis::gate_metrics(const Eigen::VectorXd& energies) {
    if (energies.size() < 2) {
        throw Errors::ValidationError("need at least 2 energy levels");
    }
    GateMetrics metrics;
    metrics.ground_state_energy = energies[0];
    metrics.first_excited_energy = energies[1];
    metrics.transition_frequency = energies[1] - energies[0];
    if (energies.size() >= 3) {
        metrics.anharmonicity = (energies[2] - energies[1]) - (energies[1] - energies[0]);
    }
    return metrics;
}

/* Deviation of the second spacing from the first one */
double Analysis::anharmonicity(const Eigen::VectorXd& energies) {
    if (energies.size() < 3) {
        throw Errors::ValidationError("need at least 3 energy levels to calculate anharmonicity");
    }
    return (energies[2] - energies[1]) - (energies[1] - energies[0]);
}

/* Transition frequencies from the ground state */
Eigen::VectorXd Analysis::transition_frequencies(const Eigen::VectorXd& energies) {
    if (energies.size() < 2) {
        throw Errors::ValidationError("need at least 2 energy levels");
    }
    const Eigen::Index n = energies.size() - 1;
    return (energies.tail(n).array() - energies[0]).matrix();
}


        /* ANTI-CROSSING */

/* Check that a level index exists in every point of the sweep */
static void check_level(const Sweep::SweepResult& sweep, const int level, const char* name) {
    if (level < 0 || level >= sweep.level_count) {
        throw Errors::ValidationError(std::string(name) + " = " + std::to_string(level) + " is not a valid level index (level_count = " + std::to_string(sweep.level_count) + ")");
    }
    for (int i = 0; i < sweep.size(); ++i) {
        if (level >= sweep.points[i].energies.size()) {
            throw Errors::ValidationError(std::string(name) + " = " + std::to_string(level) + " is missing at sweep point " + std::to_string(i));
        }
    }
}

/* Absolute gap between two levels along the sweep */
Eigen::VectorXd Analysis::level_gaps(const Sweep::SweepResult& sweep, const int level_a, const int level_b) {
    check_level(sweep, level_a, "level_a");
    check_level(sweep, level_b, "level_b");
    Eigen::VectorXd gaps(sweep.size());
    for (int i = 0; i < sweep.size(); ++i) {
        const Eigen::VectorXd& e = sweep.points[i].energies;
        gaps[i] = std::abs(e[level_b] - e[level_a]);
    }
    return gaps;
}

/* Locate the smallest gap, NaN points are skipped */
Analysis::MinGap Analysis::find_min_gap(const Sweep::SweepResult& sweep, const int level_a, const int level_b) {
    if (sweep.size() == 0) {
        throw Errors::ValidationError("cannot locate a minimum gap in an empty sweep");
    }
    const Eigen::VectorXd gaps = level_gaps(sweep, level_a, level_b);
    MinGap best;
    best.gap = std::numeric_limits<double>::quiet_NaN();
    best.parameter = sweep.points[0].parameter;
    best.index = 0;
    for (int i = 0; i < gaps.size(); ++i) {
        if (std::isnan(gaps[i])) continue;
        if (std::isnan(best.gap) || gaps[i] < best.gap) {
            best.gap = gaps[i];
            best.parameter = sweep.points[i].parameter;
            best.index = i;
        }
    }
    return best;
}
