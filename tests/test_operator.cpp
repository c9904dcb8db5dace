#include <catch2/catch.hpp>

#include <cmath>
#include <limits>
#include <vector>
#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include "errors.hpp"
#include "operator.hpp"
#include "hamiltonian.hpp"


static Eigen::SparseMatrix<double> diagonal(const std::vector<double>& values) {
    const int n = static_cast<int>(values.size());
    std::vector<Eigen::Triplet<double>> triplets;
    for (int k = 0; k < n; ++k) {
        triplets.emplace_back(k, k, values[k]);
    }
    Eigen::SparseMatrix<double> H(n, n);
    H.setFromTriplets(triplets.begin(), triplets.end());
    return H;
}


TEST_CASE("sort_eigen orders eigenpairs ascending", "[operator]") {
    Eigen::VectorXd values(3);
    values << 2.0, -1.0, 0.5;
    Eigen::MatrixXd vectors = Eigen::MatrixXd::Identity(3, 3);
    Op::sort_eigen(values, vectors);
    REQUIRE(values[0] == -1.0);
    REQUIRE(values[1] == 0.5);
    REQUIRE(values[2] == 2.0);
    REQUIRE(vectors(1, 0) == 1.0);
    REQUIRE(vectors(2, 1) == 1.0);
    REQUIRE(vectors(0, 2) == 1.0);
}

TEST_CASE("diagonalize returns the lowest levels in ascending order", "[operator]") {
    const Eigen::SparseMatrix<double> H = diagonal({3.0, -2.0, 7.0, 1.0, 0.0});
    const Op::Spectrum spectrum = Op::diagonalize(H, 3);
    REQUIRE(spectrum.energies.size() == 3);
    REQUIRE(spectrum.eigenvectors.cols() == 3);
    REQUIRE(spectrum.energies[0] == Approx(-2.0));
    REQUIRE(spectrum.energies[1] == Approx(0.0).margin(1e-12));
    REQUIRE(spectrum.energies[2] == Approx(1.0));
    REQUIRE(std::abs(spectrum.eigenvectors(1, 0)) == Approx(1.0));
}

TEST_CASE("requests beyond the truncated basis fail", "[operator]") {
    const Eigen::SparseMatrix<double> H = diagonal({1.0, 2.0});
    REQUIRE_THROWS_AS(Op::diagonalize(H, 3), Errors::DiagonalizationError);
    REQUIRE_THROWS_AS(Op::diagonalize(H, 0), Errors::ValidationError);
    REQUIRE_THROWS_AS(Op::diagonalize(H, 2, Op::Method::Lanczos), Errors::DiagonalizationError);
    REQUIRE_THROWS_AS(Op::diagonalize(Eigen::SparseMatrix<double>(2, 3), 1), Errors::DiagonalizationError);
}

TEST_CASE("non-finite Hamiltonians are rejected", "[operator]") {
    const Eigen::SparseMatrix<double> H = diagonal({1.0, std::numeric_limits<double>::quiet_NaN(), 2.0});
    REQUIRE_THROWS_AS(Op::diagonalize(H, 1), Errors::DiagonalizationError);
}

TEST_CASE("Lanczos agrees with the dense solver on the lowest levels", "[operator][lanczos]") {
    const RQL::Inverter inverter(10.0, 0.2, 0.2, 0.1, Param::Truncation::uniform(1, 20));
    const Op::Spectrum exact = Op::diagonalize(inverter, 4, Op::Method::Exact);
    const Op::Spectrum lanczos = Op::diagonalize(inverter, 4, Op::Method::Lanczos);
    REQUIRE(lanczos.energies.size() == 4);
    for (int k = 0; k < 4; ++k) {
        REQUIRE(lanczos.energies[k] == Approx(exact.energies[k]).margin(1e-6));
    }
}
