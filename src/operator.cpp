#include <cmath>
#include <string>
#include <vector>
#include <numeric>
#include <exception>
#include <algorithm>
#include <Eigen/Dense>
#include <Eigen/SparseCore>
#include <Eigen/Eigenvalues>
#include <Spectra/SymEigsSolver.h>
#include <Spectra/MatOp/SparseSymMatProd.h>

#include "errors.hpp"
#include "operator.hpp"

using namespace Spectra;



///// SORTING /////

/* Sort eigenvalues and eigenvectors in ascending order by eigenvalue */
void Op::sort_eigen(Eigen::VectorXd& eigenvalues, Eigen::MatrixXd& eigenvectors) {
    const int n = eigenvalues.size();
    std::vector<int> indices(n);
    std::iota(indices.begin(), indices.end(), 0);
    std::stable_sort(indices.begin(), indices.end(),
                     [&eigenvalues](int i, int j) { return eigenvalues[i] < eigenvalues[j]; });

    Eigen::VectorXd sorted_values(n);
    Eigen::MatrixXd sorted_vectors(eigenvectors.rows(), n);
    for (int i = 0; i < n; ++i) {
        sorted_values[i] = eigenvalues[indices[i]];
        sorted_vectors.col(i) = eigenvectors.col(indices[i]);
    }
    eigenvalues = std::move(sorted_values);
    eigenvectors = std::move(sorted_vectors);
}


///// DIAGONALIZATION /////

    /* IMPLICITLY RESTARTED LANCZOS METHOD (IRLM) */

/* Find the smallest nb_eigen eigenpairs of a sparse symmetric matrix */
Op::Spectrum Op::IRLM_eigen(const Eigen::SparseMatrix<double>& O, const int nb_eigen) {
    const int n = O.rows();
    const int ncv = std::min(n, std::max(2 * nb_eigen + 1, 20));
    Spectrum spectrum;
    bool converged = false;
    try {
        SparseSymMatProd<double> op(O); // matrix operation object for a symmetric matrix
        SymEigsSolver<SparseSymMatProd<double>> eigs(op, nb_eigen, ncv);
        eigs.init();
        eigs.compute(SortRule::SmallestAlge); // smallest algebraic eigenvalues
        converged = (eigs.info() == CompInfo::Successful);
        if (converged) {
            spectrum.energies = eigs.eigenvalues(); // eigenvalues are real for symmetric matrices
            spectrum.eigenvectors = eigs.eigenvectors();
        }
    } catch (const std::exception& e) {
        throw Errors::DiagonalizationError(std::string("Lanczos eigensolver failed: ") + e.what());
    }
    if (!converged) {
        throw Errors::DiagonalizationError("Lanczos eigensolver did not converge for " + std::to_string(nb_eigen) + " levels (dimension " + std::to_string(n) + ")");
    }
    sort_eigen(spectrum.energies, spectrum.eigenvectors);
    return spectrum;
}


    /* EXACT DIAGONALIZATION */

/* Calculate all eigenvalues and eigenvectors by a dense diagonalization */
Op::Spectrum Op::exact_eigen(const Eigen::SparseMatrix<double>& O) {
    Spectrum spectrum;
    bool converged = false;
    try {
        const Eigen::MatrixXd dense_smat = Eigen::MatrixXd(O); // convert sparse matrix to dense matrix
        Eigen::SelfAdjointEigenSolver<Eigen::MatrixXd> eigensolver(dense_smat);
        converged = (eigensolver.info() == Eigen::Success);
        if (converged) {
            spectrum.energies = eigensolver.eigenvalues();
            spectrum.eigenvectors = eigensolver.eigenvectors();
        }
    } catch (const std::exception& e) {
        throw Errors::DiagonalizationError("Dense eigensolver failed (dimension " + std::to_string(O.rows()) + "): " + e.what());
    }
    if (!converged) {
        throw Errors::DiagonalizationError("Dense eigensolver did not converge (dimension " + std::to_string(O.rows()) + ")");
    }
    sort_eigen(spectrum.energies, spectrum.eigenvectors);
    return spectrum;
}


    /* ENTRY POINTS */

/* Lowest level_count eigenpairs of a Hamiltonian */
Op::Spectrum Op::diagonalize(const Eigen::SparseMatrix<double>& H, const int level_count, const Method method) {
    if (level_count < 1) {
        throw Errors::ValidationError("level_count must be at least 1, got " + std::to_string(level_count));
    }
    const int n = H.rows();
    if (n == 0 || H.cols() != n) {
        throw Errors::DiagonalizationError("Hamiltonian must be a non-empty square matrix, got " + std::to_string(H.rows()) + "x" + std::to_string(H.cols()));
    }
    if (level_count > n) {
        throw Errors::DiagonalizationError("Requested " + std::to_string(level_count) + " levels but the truncated basis has dimension " + std::to_string(n));
    }
    for (int k = 0; k < H.outerSize(); ++k) {
        for (Eigen::SparseMatrix<double>::InnerIterator it(H, k); it; ++it) {
            if (!std::isfinite(it.value())) {
                throw Errors::DiagonalizationError("Hamiltonian has a non-finite entry at (" + std::to_string(it.row()) + ", " + std::to_string(it.col()) + ")");
            }
        }
    }

    // Spectra needs nb_eigen < ncv <= n
    const bool lanczos_fits = level_count < n && 2 * level_count + 1 <= n;
    bool use_lanczos = false;
    switch (method) {
        case Method::Exact:
            use_lanczos = false;
            break;
        case Method::Lanczos:
            if (!lanczos_fits) {
                throw Errors::DiagonalizationError("Lanczos needs a dimension above 2 * levels, got " + std::to_string(n) + " for " + std::to_string(level_count) + " levels");
            }
            use_lanczos = true;
            break;
        case Method::Auto:
        default:
            use_lanczos = lanczos_fits && n > dense_limit;
            break;
    }

    Spectrum spectrum = use_lanczos ? IRLM_eigen(H, level_count) : exact_eigen(H);
    if (spectrum.energies.size() > level_count) {
        spectrum.energies.conservativeResize(level_count);
        spectrum.eigenvectors.conservativeResize(Eigen::NoChange, level_count);
    }
    return spectrum;
}

/* Lowest level_count eigenpairs of the current Hamiltonian of a circuit */
Op::Spectrum Op::diagonalize(const Circuit::HamiltonianProvider& circuit, const int level_count, const Method method) {
    return diagonalize(circuit.hamiltonian(), level_count, method);
}
