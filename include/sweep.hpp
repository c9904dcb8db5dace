#pragma once

#include <atomic>
#include <string>
#include <vector>
#include <Eigen/Dense>

#include "circuit.hpp"
#include "operator.hpp"
#include "parameters.hpp"
#include "resource.hpp"


namespace Sweep
{

// RESULTS :

    /* one diagonalization inside a sweep */
    struct SpectrumPoint {
        double parameter = 0.0;
        Eigen::VectorXd energies;      // level_count entries, ascending
        Eigen::MatrixXd eigenvectors;  // empty unless requested
        bool recovered = false;        // filled by the recovery policy
    };

    /* a parameter point whose Hamiltonian or diagonalization failed */
    struct PointFailure {
        int index = 0;
        double parameter = 0.0;
        std::string reason;
    };

    /* ordered spectrum table, always one point per grid value */
    struct SweepResult {
        int level_count = 0;
        std::vector<SpectrumPoint> points;
        std::vector<PointFailure> failures;

        int size() const { return static_cast<int>(points.size()); }

        /* grid values in sweep order */
        Eigen::VectorXd parameters() const;

        /* n_points x level_count energies */
        Eigen::MatrixXd energy_table() const;
    };


// REPORTING :

    /* Progress and failure reporting, every method is a no-op by default.
       In a parallel sweep the calls are serialized but on_point comes in completion order. */
    class Observer {
    public:
        virtual ~Observer() = default;
        virtual void on_start(int /*n_points*/, int /*level_count*/) {}
        virtual void on_point(int /*index*/, double /*parameter*/, const Eigen::VectorXd& /*energies*/) {}
        virtual void on_failure(const PointFailure& /*failure*/) {}
        virtual void on_finish(const SweepResult& /*result*/) {}
    };

    /* progress on std::cout every `every` points, failures on std::cerr, wall time at the end */
    class ConsoleObserver : public Observer {
    public:
        explicit ConsoleObserver(int every = 20) : every_(every > 0 ? every : 1) {}
        void on_start(int n_points, int level_count) override;
        void on_point(int index, double parameter, const Eigen::VectorXd& energies) override;
        void on_failure(const PointFailure& failure) override;
        void on_finish(const SweepResult& result) override;
    private:
        void progress();
        int every_;
        int n_points_ = 0;
        int done_ = 0;
        Resource::Stopwatch stopwatch_;
    };


// OPTIONS :

    struct Options {
        Op::Method method = Op::Method::Auto;
        bool keep_eigenvectors = false;
        Observer* observer = nullptr;             // nullptr: no reporting
        const std::atomic<bool>* cancel = nullptr; // checked between points
    };


// GRID :

    /* n evenly spaced values over [lo, hi], both ends included */
    std::vector<double> linspace(double lo, double hi, int n);

    /* The first level_count energies, zero padded when the solver returned fewer.
       Op::diagonalize always returns level_count levels, other solvers may not. */
    Eigen::VectorXd pad_levels(const Eigen::VectorXd& energies, int level_count);


// SWEEPS :

    /* Sweep the flux of one loop of a borrowed circuit, re-diagonalizing at each grid point.
       A failed point is filled with the previous point's levels, or NaN for the first point.
       The circuit is left at the last grid value. */
    SweepResult flux_sweep(Circuit::HamiltonianProvider& circuit, const Circuit::LoopId& loop, const Param::FluxRange& range, int n_points, int level_count, const Options& options = Options());

    /* Same sweep with OpenMP, every thread diagonalizes on its own circuit built by the factory.
       threads <= 0 chooses the count from the available memory. */
    SweepResult parallel_flux_sweep(const Circuit::Factory& factory, const std::string& loop_name, const Param::FluxRange& range, int n_points, int level_count, const Options& options = Options(), int threads = 0);

}
