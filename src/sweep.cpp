#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>
#include <atomic>
#include <iostream>
#include <algorithm>
#include <exception>
#include <omp.h>

#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include "errors.hpp"
#include "sweep.hpp"
#include "operator.hpp"
#include "resource.hpp"


        /* RESULTS */

Eigen::VectorXd Sweep::SweepResult::parameters() const {
    Eigen::VectorXd values(size());
    for (int i = 0; i < size(); ++i) {
        values[i] = points[i].parameter;
    }
    return values;
}

Eigen::MatrixXd Sweep::SweepResult::energy_table() const {
    Eigen::MatrixXd table(size(), level_count);
    for (int i = 0; i < size(); ++i) {
        table.row(i) = points[i].energies.transpose();
    }
    return table;
}


        /* REPORTING */

void Sweep::ConsoleObserver::on_start(const int n_points, const int level_count) {
    n_points_ = n_points;
    done_ = 0;
    stopwatch_.restart();
    std::cout << "Flux sweep: " << n_points << " points, " << level_count << " levels" << std::endl;
}

void Sweep::ConsoleObserver::on_point(int, double, const Eigen::VectorXd&) {
    progress();
}

void Sweep::ConsoleObserver::on_failure(const PointFailure& failure) {
    std::cerr << "Warning: flux point " << failure.index << " (flux = " << failure.parameter << ") failed: " << failure.reason << std::endl;
    progress();
}

void Sweep::ConsoleObserver::on_finish(const SweepResult& result) {
    std::cout << "\rFlux sweep completed: " << result.size() << " points, " << result.failures.size() << " recovered in " << Resource::format_duration(stopwatch_.seconds()) << std::endl;
}

void Sweep::ConsoleObserver::progress() {
    ++done_;
    if (n_points_ > 0 && (done_ % every_ == 0 || done_ == n_points_)) {
        const int percent = (done_ * 100) / n_points_;
        std::cout << "\rFlux sweep: " << done_ << "/" << n_points_ << " points - " << percent << "%" << std::flush;
    }
}


        /* GRID */

/* Evenly spaced values, the last one is exactly hi */
std::vector<double> Sweep::linspace(const double lo, const double hi, const int n) {
    std::vector<double> params(n > 0 ? n : 0);
    if (n <= 1) {
        if (n == 1) params[0] = lo;
        return params;
    }
    const double lin_step = (hi - lo) / (n - 1);
    for (int i = 0; i < n - 1; ++i) {
        params[i] = lo + i * lin_step;
    }
    params[n - 1] = hi;
    return params;
}


        /* HELPERS */

/* Fail fast on a malformed request */
static void validate_request(const Param::FluxRange& range, const int n_points, const int level_count) {
    Param::validate_range(range.lo, range.hi);
    if (n_points < 1) {
        throw Errors::ValidationError("n_points must be at least 1, got " + std::to_string(n_points));
    }
    if (level_count < 1) {
        throw Errors::ValidationError("level_count must be at least 1, got " + std::to_string(level_count));
    }
}

/* Copy the solver output into level_count slots, zero padded */
Eigen::VectorXd Sweep::pad_levels(const Eigen::VectorXd& energies, const int level_count) {
    Eigen::VectorXd levels = Eigen::VectorXd::Zero(level_count);
    const int n = std::min(level_count, static_cast<int>(energies.size()));
    levels.head(n) = energies.head(n);
    return levels;
}

/* Recovery policy: last known good levels, NaN when there is no previous point */
static void recover_point(Sweep::SweepResult& result, const int index) {
    Sweep::SpectrumPoint& point = result.points[index];
    if (index > 0) {
        point.energies = result.points[index - 1].energies;
    } else {
        point.energies = Eigen::VectorXd::Constant(result.level_count, std::numeric_limits<double>::quiet_NaN());
    }
    point.eigenvectors.resize(0, 0);
    point.recovered = true;
}

/* Set the flux, rebuild and diagonalize one grid point */
static void solve_point(Circuit::HamiltonianProvider& circuit, const Circuit::LoopId& loop, const int level_count, const Sweep::Options& options, Sweep::SpectrumPoint& point) {
    circuit.set_flux(loop, point.parameter);
    circuit.rebuild();
    Op::Spectrum spectrum = Op::diagonalize(circuit, level_count, options.method);
    point.energies = Sweep::pad_levels(spectrum.energies, level_count);
    if (options.keep_eigenvectors) {
        point.eigenvectors = std::move(spectrum.eigenvectors);
    }
    point.recovered = false;
}


        /* SEQUENTIAL SWEEP */

Sweep::SweepResult Sweep::flux_sweep(Circuit::HamiltonianProvider& circuit, const Circuit::LoopId& loop, const Param::FluxRange& range, const int n_points, const int level_count, const Options& options) {

    // Prerequisites
    validate_request(range, n_points, level_count);
    if (!circuit.owns(loop)) {
        throw Errors::ConfigurationError("Loop handle '" + loop.name + "' does not belong to the swept circuit");
    }
    Observer silent;
    Observer& observer = options.observer != nullptr ? *options.observer : silent;

    const std::vector<double> grid = linspace(range.lo, range.hi, n_points);
    SweepResult result;
    result.level_count = level_count;
    result.points.resize(n_points);
    observer.on_start(n_points, level_count);

    // Main loop, one point after the other since the circuit is shared
    for (int i = 0; i < n_points; ++i) {
        if (options.cancel != nullptr && options.cancel->load()) {
            throw Errors::CancelledError("Flux sweep cancelled before point " + std::to_string(i) + " of " + std::to_string(n_points), i);
        }
        SpectrumPoint& point = result.points[i];
        point.parameter = grid[i];
        try {
            solve_point(circuit, loop, level_count, options, point);
            observer.on_point(i, point.parameter, point.energies);
        } catch (const Errors::PointError& e) {
            recover_point(result, i);
            const PointFailure failure{i, point.parameter, e.what()};
            result.failures.push_back(failure);
            observer.on_failure(failure);
        }
    }

    observer.on_finish(result);
    return result;
}


        /* PARALLEL SWEEP */

Sweep::SweepResult Sweep::parallel_flux_sweep(const Circuit::Factory& factory, const std::string& loop_name, const Param::FluxRange& range, const int n_points, const int level_count, const Options& options, const int threads) {

    // Prerequisites, the probe circuit resolves the loop before any work
    validate_request(range, n_points, level_count);
    if (!factory) {
        throw Errors::ConfigurationError("No circuit factory given to the parallel sweep");
    }
    const std::unique_ptr<Circuit::HamiltonianProvider> probe = factory();
    if (!probe) {
        throw Errors::ConfigurationError("Circuit factory returned no circuit");
    }
    probe->loop(loop_name);
    if (threads > 0) {
        omp_set_num_threads(threads);
    } else {
        probe->rebuild();
        omp_set_num_threads(Resource::sweep_threads(probe->hamiltonian(), level_count));
    }

    Observer silent;
    Observer& observer = options.observer != nullptr ? *options.observer : silent;

    const std::vector<double> grid = linspace(range.lo, range.hi, n_points);
    SweepResult result;
    result.level_count = level_count;
    result.points.resize(n_points);
    for (int i = 0; i < n_points; ++i) {
        result.points[i].parameter = grid[i];
    }
    std::vector<char> succeeded(n_points, 0);
    std::vector<std::string> reasons(n_points);

    std::atomic<bool> stop(false);
    std::exception_ptr fatal = nullptr;
    int cancelled_at = -1;
    observer.on_start(n_points, level_count);

    // Each thread owns its circuit, nothing mutable is shared
    #pragma omp parallel
    {
        std::unique_ptr<Circuit::HamiltonianProvider> circuit;
        Circuit::LoopId loop;
        bool ready = false;
        try {
            circuit = factory();
            if (!circuit) {
                throw Errors::ConfigurationError("Circuit factory returned no circuit");
            }
            loop = circuit->loop(loop_name);
            ready = true;
        } catch (...) {
            #pragma omp critical(sweep_fatal)
            {
                if (!fatal) fatal = std::current_exception();
            }
            stop = true;
        }

        #pragma omp for schedule(dynamic)
        for (int i = 0; i < n_points; ++i) {
            if (!ready || stop.load()) continue;
            if (options.cancel != nullptr && options.cancel->load()) {
                stop = true;
                #pragma omp critical(sweep_fatal)
                {
                    if (cancelled_at < 0 || i < cancelled_at) cancelled_at = i;
                }
                continue;
            }
            SpectrumPoint& point = result.points[i];
            try {
                solve_point(*circuit, loop, level_count, options, point);
                succeeded[i] = 1;
                #pragma omp critical(sweep_report)
                {
                    observer.on_point(i, point.parameter, point.energies);
                }
            } catch (const Errors::PointError& e) {
                reasons[i] = e.what();
            } catch (...) {
                #pragma omp critical(sweep_fatal)
                {
                    if (!fatal) fatal = std::current_exception();
                }
                stop = true;
            }
        }
    }

    if (fatal) {
        std::rethrow_exception(fatal);
    }
    if (cancelled_at >= 0) {
        throw Errors::CancelledError("Flux sweep cancelled before point " + std::to_string(cancelled_at) + " of " + std::to_string(n_points), cancelled_at);
    }

    // Recovery in parameter order, identical to the sequential sweep
    for (int i = 0; i < n_points; ++i) {
        if (succeeded[i]) continue;
        recover_point(result, i);
        const PointFailure failure{i, result.points[i].parameter, reasons[i]};
        result.failures.push_back(failure);
        observer.on_failure(failure);
    }

    observer.on_finish(result);
    return result;
}
