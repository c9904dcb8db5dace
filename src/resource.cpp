#include <chrono>
#include <string>
#include <fstream>
#include <sstream>
#include <iostream>
#include <algorithm>
#include <sys/sysinfo.h>
#include <omp.h>

#include "operator.hpp"
#include "resource.hpp"


// MEMORY :

/* Read VmRSS from /proc/self/status */
long Resource::resident_memory_kb() {
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.compare(0, 6, "VmRSS:") == 0) {
            std::istringstream fields(line.substr(6));
            long kb = -1;
            fields >> kb;
            return kb;
        }
    }
    std::cerr << "Warning: resident memory not available from /proc/self/status." << std::endl;
    return -1;
}

long Resource::available_memory_kb() {
    struct sysinfo info;
    if (sysinfo(&info) != 0) {
        std::cerr << "Warning: sysinfo failed, free memory unknown." << std::endl;
        return -1;
    }
    return static_cast<long>(static_cast<unsigned long long>(info.freeram) * info.mem_unit / 1024);
}

/* Values and inner indices per non-zero, one outer index per column */
size_t Resource::hamiltonian_bytes(const Eigen::SparseMatrix<double>& H) {
    using Index = Eigen::SparseMatrix<double>::StorageIndex;
    const size_t nnz = H.nonZeros();
    const size_t cols = H.cols();
    return nnz * (sizeof(double) + sizeof(Index)) + (cols + 1) * sizeof(Index);
}

size_t Resource::diagonalization_bytes(const Eigen::SparseMatrix<double>& H, const int level_count) {
    const size_t n = H.rows();
    if (H.rows() <= Op::dense_limit) {
        // dense copy of H and the full eigenvector matrix
        return 2 * n * n * sizeof(double);
    }
    // Krylov basis of the Lanczos solver
    const size_t ncv = std::min<size_t>(n, std::max(2 * level_count + 1, 20));
    return n * ncv * sizeof(double);
}

int Resource::sweep_threads(const Eigen::SparseMatrix<double>& H, const int level_count) {
    const int max_threads = std::max(1, omp_get_max_threads());
    const long available = available_memory_kb();
    if (available <= 0) {
        return max_threads;
    }
    const size_t per_thread = 2 * hamiltonian_bytes(H) + diagonalization_bytes(H, level_count);
    const size_t usable = static_cast<size_t>(available) * 1024 / 5 * 4;
    const size_t fitting = per_thread > 0 ? usable / per_thread : static_cast<size_t>(max_threads);
    return static_cast<int>(std::max<size_t>(1, std::min<size_t>(fitting, max_threads)));
}


// TIMING :

double Resource::Stopwatch::seconds() const {
    return std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
}

std::string Resource::format_duration(const double seconds) {
    std::ostringstream text;
    if (seconds >= 60.0) {
        const int minutes = static_cast<int>(seconds / 60.0);
        text << minutes << "m " << seconds - minutes * 60.0 << "s";
    } else {
        text << seconds << "s";
    }
    return text.str();
}
