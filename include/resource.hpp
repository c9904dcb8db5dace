#pragma once

#include <chrono>
#include <string>
#include <cstddef>
#include <Eigen/SparseCore>


namespace Resource
{

// MEMORY :

    /* resident set size of the process in KB, -1 if /proc is unreadable */
    long resident_memory_kb();

    /* free RAM in KB, -1 on failure */
    long available_memory_kb();

    /* bytes held by one compressed Hamiltonian */
    size_t hamiltonian_bytes(const Eigen::SparseMatrix<double>& H);

    /* working set of one diagonalization for level_count levels, dense below Op::dense_limit */
    size_t diagonalization_bytes(const Eigen::SparseMatrix<double>& H, int level_count);

    /* OpenMP threads for a parallel sweep: each thread owns a circuit (stored and freshly
       assembled Hamiltonian) and one diagonalization, 80% of the free RAM is usable */
    int sweep_threads(const Eigen::SparseMatrix<double>& H, int level_count);


// TIMING :

    /* wall time since construction or the last restart() */
    class Stopwatch {
    public:
        Stopwatch() : start_(std::chrono::steady_clock::now()) {}
        void restart() { start_ = std::chrono::steady_clock::now(); }
        double seconds() const;
    private:
        std::chrono::steady_clock::time_point start_;
    };

    /* "12.5s" or "3m 4.25s" */
    std::string format_duration(double seconds);

}
