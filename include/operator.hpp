#pragma once

#include <cmath>
#include <Eigen/Dense>
#include <Eigen/SparseCore>
#include <Eigen/Eigenvalues>

#include "circuit.hpp"


namespace Op
{

// RESULTS :

    /* ascending eigenvalues (GHz) and the matching eigenvectors in columns */
    struct Spectrum {
        Eigen::VectorXd energies;
        Eigen::MatrixXd eigenvectors;
    };

    enum class Method { Auto, Exact, Lanczos };

    /* Auto uses the dense solver up to this dimension */
    constexpr int dense_limit = 400;


// SORTING :

    /* sort eigenvalues and eigenvectors in ascending order */
    void sort_eigen(Eigen::VectorXd& eigenvalues, Eigen::MatrixXd& eigenvectors);


// DIAGONALIZATION :

    /* smallest nb_eigen eigenpairs by the implicitly restarted Lanczos method */
    Spectrum IRLM_eigen(const Eigen::SparseMatrix<double>& O, int nb_eigen);

    /* all eigenpairs by a dense exact diagonalization */
    Spectrum exact_eigen(const Eigen::SparseMatrix<double>& O);

    /* lowest level_count eigenpairs in ascending order, throws DiagonalizationError on failure */
    Spectrum diagonalize(const Eigen::SparseMatrix<double>& H, int level_count, Method method = Method::Auto);

    /* same on the current Hamiltonian of a circuit, which must have been rebuilt */
    Spectrum diagonalize(const Circuit::HamiltonianProvider& circuit, int level_count, Method method = Method::Auto);

}
