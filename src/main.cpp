#include <cmath>
#include <atomic>
#include <algorithm>
#include <stdexcept>
#include <csignal>
#include <memory>
#include <string>
#include <iostream>
#include <filesystem>
#include <Eigen/Dense>

#include <getopt.h>

#include "errors.hpp"
#include "parameters.hpp"
#include "hamiltonian.hpp"
#include "operator.hpp"
#include "sweep.hpp"
#include "analysis.hpp"
#include "output.hpp"
#include "resource.hpp"

static std::atomic<bool> interrupted(false);

extern "C" void on_interrupt(int) {
    interrupted = true;
}

void print_usage() {
    std::cout << "Usage: program [options]\n"
              << "Options:\n"
              << "  -g, --gate        Gate type: 'inverter' (default), 'anb' or 'loop'\n"
              << "  -J, --Ej          Josephson energy in GHz (default: 10.0)\n"
              << "  -C, --Ec          Charging energy in GHz (default: 0.2)\n"
              << "  -L, --El          Inductive energy in GHz, loop gate (default: 0.1)\n"
              << "  -k, --coupling    Coupling junction energy in GHz, anb gate (default: 0.5)\n"
              << "  -q, --ng          Gate charge offset, inverter (default: 0.0)\n"
              << "  -f, --flux        Flux bias of every loop in flux quanta (default: 0.5)\n"
              << "  -n, --levels      Number of energy levels (default: 10)\n"
              << "  -s, --sweep       Flux sweep instead of a single point\n"
              << "  -p, --points      Number of flux points of the sweep (default: 100)\n"
              << "  -a, --flux-min    Lower end of the sweep (default: 0.0)\n"
              << "  -b, --flux-max    Upper end of the sweep (default: 1.0)\n"
              << "  -l, --loop        Name of the swept loop (default: first loop)\n"
              << "  -t, --trunc       Basis cutoff per mode (default: 50, 201 grid points for the loop gate)\n"
              << "  -P, --parallel    Parallel sweep with one circuit per thread\n"
              << "  -x, --crossing    Levels a,b of the anti-crossing analysis (default: 1,2)\n"
              << "  -o, --output      Output directory (default: current directory)\n";
}

/* parse "a,b" into two level indices */
static bool parse_levels(const std::string& text, int& a, int& b) {
    const size_t comma = text.find(',');
    if (comma == std::string::npos) {
        return false;
    }
    a = std::stoi(text.substr(0, comma));
    b = std::stoi(text.substr(comma + 1));
    return true;
}


int main(int argc, char *argv[]) {

    // PARAMETERS OF THE GATE
    std::string gate = "inverter";
    double Ej = 10.0, Ec = 0.2, El = 0.1, J = 0.5, ng = 0.0, flux = 0.5;
    int levels = 10;
    bool sweep = false, parallel = false;
    int points = 100;
    double flux_min = 0.0, flux_max = 1.0;
    std::string loop_name;
    int trunc = 0;
    int level_a = 1, level_b = 2;
    std::string output = ".";

    const char* const short_opts = "g:J:C:L:k:q:f:n:sp:a:b:l:t:Px:o:h";
    const option long_opts[] = {
        {"gate", required_argument, nullptr, 'g'},
        {"Ej", required_argument, nullptr, 'J'},
        {"Ec", required_argument, nullptr, 'C'},
        {"El", required_argument, nullptr, 'L'},
        {"coupling", required_argument, nullptr, 'k'},
        {"ng", required_argument, nullptr, 'q'},
        {"flux", required_argument, nullptr, 'f'},
        {"levels", required_argument, nullptr, 'n'},
        {"sweep", no_argument, nullptr, 's'},
        {"points", required_argument, nullptr, 'p'},
        {"flux-min", required_argument, nullptr, 'a'},
        {"flux-max", required_argument, nullptr, 'b'},
        {"loop", required_argument, nullptr, 'l'},
        {"trunc", required_argument, nullptr, 't'},
        {"parallel", no_argument, nullptr, 'P'},
        {"crossing", required_argument, nullptr, 'x'},
        {"output", required_argument, nullptr, 'o'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, no_argument, nullptr, 0}
    };

    try {
        while (true) {
            const auto opt = getopt_long(argc, argv, short_opts, long_opts, nullptr);
            if (-1 == opt) break;
            switch (opt) {
                case 'g':
                    gate = optarg;
                    break;
                case 'J':
                    Ej = std::stod(optarg);
                    break;
                case 'C':
                    Ec = std::stod(optarg);
                    break;
                case 'L':
                    El = std::stod(optarg);
                    break;
                case 'k':
                    J = std::stod(optarg);
                    break;
                case 'q':
                    ng = std::stod(optarg);
                    break;
                case 'f':
                    flux = std::stod(optarg);
                    break;
                case 'n':
                    levels = std::stoi(optarg);
                    break;
                case 's':
                    sweep = true;
                    break;
                case 'p':
                    points = std::stoi(optarg);
                    break;
                case 'a':
                    flux_min = std::stod(optarg);
                    break;
                case 'b':
                    flux_max = std::stod(optarg);
                    break;
                case 'l':
                    loop_name = optarg;
                    break;
                case 't':
                    trunc = std::stoi(optarg);
                    break;
                case 'P':
                    parallel = true;
                    break;
                case 'x':
                    if (!parse_levels(optarg, level_a, level_b)) {
                        std::cerr << "Error: crossing levels must be given as a,b." << std::endl;
                        return 1;
                    }
                    break;
                case 'o':
                    output = optarg;
                    break;
                case 'h':
                default:
                    print_usage();
                    return 0;
            }
        }
    } catch (const std::logic_error& e) {
        std::cerr << "Error: invalid numeric option value (" << e.what() << ")." << std::endl;
        return 1;
    }

    if (gate != "inverter" && gate != "anb" && gate != "loop") {
        std::cerr << "Error: gate must be inverter, anb or loop." << std::endl;
        return 1;
    }
    if (trunc < 0) {
        std::cerr << "Error: trunc must be positive." << std::endl;
        return 1;
    }

    // Each call builds an independent circuit, the parallel sweep builds one per thread
    const Circuit::Factory factory = [=]() -> std::unique_ptr<Circuit::HamiltonianProvider> {
        if (gate == "anb") {
            return std::make_unique<RQL::AnbGate>(Ej, Ej, Ec, J, flux, flux, Param::Truncation::uniform(2, trunc > 0 ? trunc : Param::default_cutoff));
        }
        if (gate == "loop") {
            return std::make_unique<RQL::Loop>(Ej, Ec, El, flux, Param::Truncation::uniform(1, trunc > 0 ? trunc : RQL::default_grid_points));
        }
        return std::make_unique<RQL::Inverter>(Ej, Ec, flux, ng, Param::Truncation::uniform(1, trunc > 0 ? trunc : Param::default_cutoff));
    };

    std::cout << "RQL gate: " << gate << " - Ej = " << Ej << " GHz, Ec = " << Ec << " GHz, flux = " << flux << std::endl;

    try {
        // Start of the calculations
        const Resource::Stopwatch stopwatch;
        const std::unique_ptr<Circuit::HamiltonianProvider> circuit = factory();
        std::cout << "Hilbert space dimension: " << circuit->dimension() << std::endl;
        std::filesystem::create_directories(output);

        if (!sweep) {
            const Op::Spectrum spectrum = Op::diagonalize(*circuit, levels);
            std::cout << "Energy levels (GHz):" << std::endl;
            for (int k = 0; k < std::min<int>(10, spectrum.energies.size()); ++k) {
                std::cout << "  Level " << k << ": " << spectrum.energies[k] << std::endl;
            }
            if (spectrum.energies.size() < 2) {
                std::cout << "Gate metrics need at least 2 levels." << std::endl;
            } else {
                const Analysis::GateMetrics metrics = Analysis::gate_metrics(spectrum.energies);
                std::cout << "Ground state energy: " << metrics.ground_state_energy << " GHz" << std::endl;
                std::cout << "Transition frequency: " << *metrics.transition_frequency << " GHz" << std::endl;
                if (metrics.anharmonicity) {
                    std::cout << "Anharmonicity: " << *metrics.anharmonicity << " GHz" << std::endl;
                }
                const std::string path = (std::filesystem::path(output) / (gate + "_spectrum.txt")).string();
                Output::save_spectrum(path, gate, flux, spectrum.energies, metrics);
                std::cout << "Results saved to " << path << std::endl;
            }
        } else {
            if (loop_name.empty()) {
                loop_name = circuit->loop_names().front();
            }
            std::signal(SIGINT, on_interrupt);
            Sweep::ConsoleObserver observer;
            Sweep::Options options;
            options.observer = &observer;
            options.cancel = &interrupted;
            const Param::FluxRange range{flux_min, flux_max};
            const Sweep::SweepResult result = parallel
                ? Sweep::parallel_flux_sweep(factory, loop_name, range, points, levels, options)
                : Sweep::flux_sweep(*circuit, circuit->loop(loop_name), range, points, levels, options);

            const Analysis::MinGap min_gap = Analysis::find_min_gap(result, level_a, level_b);
            std::cout << "Minimum gap between levels " << level_a << " and " << level_b << ": " << min_gap.gap
                      << " GHz at flux " << min_gap.parameter << " (point " << min_gap.index << ")" << std::endl;
            const std::string path = (std::filesystem::path(output) / (gate + "_flux_sweep.txt")).string();
            Output::save_sweep(path, gate, loop_name, result, level_a, level_b, min_gap);
            std::cout << "Results saved to " << path << std::endl;
        }

        // End of the calculations
        std::cout << "Duration: " << Resource::format_duration(stopwatch.seconds())
                  << " - Memory usage: " << Resource::resident_memory_kb() << " KB" << std::endl;
    } catch (const Errors::CancelledError& e) {
        std::cerr << std::endl << "Interrupted: " << e.what() << std::endl;
        return 130;
    } catch (const Errors::Error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
