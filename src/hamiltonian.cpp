#include <cmath>
#include <vector>
#include <string>
#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include "errors.hpp"
#include "hamiltonian.hpp"


/////  IMPLEMENTATION OF THE RQL CIRCUIT MODELS  /////


    /* BASIS SIZES */

/* Dimension of the charge basis with states -cutoff..cutoff */
int RQL::charge_dimension(const int cutoff) {
    return 2 * cutoff + 1;
}


    /* SINGLE MODE TERMS */

/* Effective Josephson energy of a symmetric SQUID, Ej |cos(pi flux)| */
double RQL::squid_josephson(const double Ej, const double flux) {
    return Ej * std::abs(std::cos(M_PI * flux));
}

/* Fill the charging term 4 Ec (n - ng)^2, state k holds the charge n = k - cutoff */
void RQL::fill_charging(const int cutoff, const double Ec, const double ng, std::vector<Eigen::Triplet<double>>& triplets) {
    const int D = charge_dimension(cutoff);
    for (int k = 0; k < D; ++k) {
        const double n = k - cutoff - ng;
        triplets.emplace_back(k, k, 4.0 * Ec * n * n);
    }
}

/* Fill the tunnelling term of a junction in the charge basis, -Ej cos(phi) = -Ej/2 (|n><n+1| + h.c.) */
void RQL::fill_tunnelling(const int cutoff, const double Ej, std::vector<Eigen::Triplet<double>>& triplets) {
    const int D = charge_dimension(cutoff);
    for (int k = 0; k < D - 1; ++k) {
        triplets.emplace_back(k, k + 1, -0.5 * Ej);
        triplets.emplace_back(k + 1, k, -0.5 * Ej);
    }
}

/* Fill the phase grid Hamiltonian with a three point finite difference for the kinetic term */
void RQL::fill_phase_grid(const int points, const double extent, const double Ec, const double El, const double Ej, const double flux, std::vector<Eigen::Triplet<double>>& triplets) {
    const double h = 2.0 * extent / (points - 1);
    const double kinetic = 4.0 * Ec / (h * h);
    for (int k = 0; k < points; ++k) {
        const double phi = -extent + k * h;
        const double potential = 0.5 * El * phi * phi - Ej * std::cos(phi - 2.0 * M_PI * flux);
        triplets.emplace_back(k, k, 2.0 * kinetic + potential);
        if (k + 1 < points) {
            triplets.emplace_back(k, k + 1, -kinetic);
            triplets.emplace_back(k + 1, k, -kinetic);
        }
    }
}


    /* MODE HAMILTONIANS */

/* Create the Hamiltonian of a charge mode */
Eigen::SparseMatrix<double> RQL::charge_mode(const int cutoff, const double Ec, const double Ej, const double ng) {
    const int D = charge_dimension(cutoff);
    std::vector<Eigen::Triplet<double>> tripletList;
    tripletList.reserve(3 * D);
    fill_charging(cutoff, Ec, ng, tripletList);
    if (Ej != 0.0) {
        fill_tunnelling(cutoff, Ej, tripletList);
    }
    Eigen::SparseMatrix<double> H(D, D);
    H.setFromTriplets(tripletList.begin(), tripletList.end());
    return H;
}

/* Create the Hamiltonian of an inductively shunted mode on the phase grid */
Eigen::SparseMatrix<double> RQL::phase_mode(const int points, const double extent, const double Ec, const double El, const double Ej, const double flux) {
    std::vector<Eigen::Triplet<double>> tripletList;
    tripletList.reserve(3 * points);
    fill_phase_grid(points, extent, Ec, El, Ej, flux, tripletList);
    Eigen::SparseMatrix<double> H(points, points);
    H.setFromTriplets(tripletList.begin(), tripletList.end());
    return H;
}

/* Create the Hamiltonian of two coupled charge modes, state (k1, k2) has the index k1 * D2 + k2 */
Eigen::SparseMatrix<double> RQL::coupled_modes(const Eigen::SparseMatrix<double>& H1, const int cutoff1, const Eigen::SparseMatrix<double>& H2, const int cutoff2, const double J) {
    const int D1 = charge_dimension(cutoff1);
    const int D2 = charge_dimension(cutoff2);
    const int D = D1 * D2;
    std::vector<Eigen::Triplet<double>> tripletList;
    tripletList.reserve(H1.nonZeros() * D2 + H2.nonZeros() * D1 + 2 * D);

    // H1 x 1
    for (int k = 0; k < H1.outerSize(); ++k) {
        for (Eigen::SparseMatrix<double>::InnerIterator it(H1, k); it; ++it) {
            for (int j = 0; j < D2; ++j) {
                tripletList.emplace_back(it.row() * D2 + j, it.col() * D2 + j, it.value());
            }
        }
    }

    // 1 x H2
    for (int k = 0; k < H2.outerSize(); ++k) {
        for (Eigen::SparseMatrix<double>::InnerIterator it(H2, k); it; ++it) {
            for (int i = 0; i < D1; ++i) {
                tripletList.emplace_back(i * D2 + it.row(), i * D2 + it.col(), it.value());
            }
        }
    }

    // Coupling junction, a Cooper pair tunnels from mode 2 to mode 1
    for (int i = 0; i + 1 < D1; ++i) {
        for (int j = 1; j < D2; ++j) {
            const int from = i * D2 + j;
            const int to = (i + 1) * D2 + (j - 1);
            tripletList.emplace_back(to, from, -0.5 * J);
            tripletList.emplace_back(from, to, -0.5 * J);
        }
    }

    Eigen::SparseMatrix<double> H(D, D);
    H.setFromTriplets(tripletList.begin(), tripletList.end());
    return H;
}


    /* INVERTER */

RQL::Inverter::Inverter(const double Ej, const double Ec, const double flux, const double ng, const Param::Truncation& trunc)
    : Ej_("Ej", Ej), Ec_("Ec", Ec), ng_(ng), cutoff_(0) {
    if (!std::isfinite(ng)) {
        throw Errors::ValidationError("Gate charge ng must be finite");
    }
    bias_ = add_loop("loop1", flux);
    trunc.validate(1);
    cutoff_ = trunc.cutoffs[0];
    rebuild();
}

int RQL::Inverter::dimension() const {
    return charge_dimension(cutoff_);
}

Eigen::SparseMatrix<double> RQL::Inverter::assemble() const {
    return charge_mode(cutoff_, Ec_.value(), squid_josephson(Ej_.value(), loop_flux(bias_.index)), ng_);
}


    /* A-NOT-B GATE */

RQL::AnbGate::AnbGate(const double Ej1, const double Ej2, const double Ec, const double J, const double flux1, const double flux2, const Param::Truncation& trunc)
    : Ej1_("Ej1", Ej1), Ej2_("Ej2", Ej2), Ec_("Ec", Ec), J_("J", J), cutoff1_(0), cutoff2_(0) {
    loop1_ = add_loop("loop1", flux1);
    loop2_ = add_loop("loop2", flux2);
    trunc.validate(2);
    cutoff1_ = trunc.cutoffs[0];
    cutoff2_ = trunc.cutoffs[1];
    rebuild();
}

int RQL::AnbGate::dimension() const {
    return charge_dimension(cutoff1_) * charge_dimension(cutoff2_);
}

Eigen::SparseMatrix<double> RQL::AnbGate::assemble() const {
    const Eigen::SparseMatrix<double> H1 = charge_mode(cutoff1_, Ec_.value(), squid_josephson(Ej1_.value(), loop_flux(loop1_.index)), 0.0);
    const Eigen::SparseMatrix<double> H2 = charge_mode(cutoff2_, Ec_.value(), squid_josephson(Ej2_.value(), loop_flux(loop2_.index)), 0.0);
    return coupled_modes(H1, cutoff1_, H2, cutoff2_, J_.value());
}


    /* RQL LOOP */

RQL::Loop::Loop(const double Ej, const double Ec, const double El, const double flux, const Param::Truncation& trunc, const double extent)
    : Ej_("Ej", Ej), Ec_("Ec", Ec), El_("El", El), points_(0), extent_(extent) {
    bias_ = add_loop("loop1", flux);
    trunc.validate(1, 3);
    if (!std::isfinite(extent) || extent <= 0.0) {
        throw Errors::ConfigurationError("Phase grid extent must be positive, got " + std::to_string(extent));
    }
    points_ = trunc.cutoffs[0];
    rebuild();
}

int RQL::Loop::dimension() const {
    return points_;
}

Eigen::SparseMatrix<double> RQL::Loop::assemble() const {
    return phase_mode(points_, extent_, Ec_.value(), El_.value(), Ej_.value(), loop_flux(bias_.index));
}
