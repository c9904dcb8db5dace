#pragma once

#include <cmath>
#include <vector>
#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include "circuit.hpp"
#include "parameters.hpp"


namespace RQL
{

// BASIS SIZES :

    /* points of the phase grid used for inductively shunted modes */
    constexpr int default_grid_points = 201;

    /* half width of the phase grid in radians */
    constexpr double default_phase_extent = 3.0 * M_PI;

    /* dimension of the charge basis -cutoff..cutoff */
    int charge_dimension(int cutoff);


// SINGLE MODE TERMS :

    /* effective Josephson energy of a symmetric SQUID threaded by the given flux */
    double squid_josephson(double Ej, double flux);

    /* fill 4 Ec (n - ng)^2 on the diagonal of a charge mode */
    void fill_charging(int cutoff, double Ec, double ng, std::vector<Eigen::Triplet<double>>& triplets);

    /* fill the tunnelling term -Ej/2 (|n><n+1| + h.c.) of a charge mode */
    void fill_tunnelling(int cutoff, double Ej, std::vector<Eigen::Triplet<double>>& triplets);

    /* fill -4 Ec d^2/dphi^2 + El/2 phi^2 - Ej cos(phi - 2 pi flux) on a uniform phase grid */
    void fill_phase_grid(int points, double extent, double Ec, double El, double Ej, double flux, std::vector<Eigen::Triplet<double>>& triplets);


// MODE HAMILTONIANS :

    /* flux tunable charge mode (SQUID shunted by a capacitor) in the charge basis */
    Eigen::SparseMatrix<double> charge_mode(int cutoff, double Ec, double Ej, double ng);

    /* inductively shunted junction on a phase grid */
    Eigen::SparseMatrix<double> phase_mode(int points, double extent, double Ec, double El, double Ej, double flux);

    /* two charge modes H1 x 1 + 1 x H2 coupled by a junction -J cos(phi1 - phi2) */
    Eigen::SparseMatrix<double> coupled_modes(const Eigen::SparseMatrix<double>& H1, int cutoff1, const Eigen::SparseMatrix<double>& H2, int cutoff2, double J);


// REFERENCE GATES :

    /* RQL inverter: one flux tunable junction loop shunted by a capacitor, one loop "loop1" */
    class Inverter : public Circuit::HamiltonianProvider {
    public:
        Inverter(double Ej = 10.0, double Ec = 0.2, double flux = 0.5, double ng = 0.0,
                 const Param::Truncation& trunc = Param::Truncation::uniform(1));
        int dimension() const override;
        Circuit::LoopId bias() const { return bias_; }
    protected:
        Eigen::SparseMatrix<double> assemble() const override;
    private:
        Param::EnergyParameter Ej_;
        Param::EnergyParameter Ec_;
        double ng_;
        int cutoff_;
        Circuit::LoopId bias_;
    };

    /* A-NOT-B gate: two flux tunable loops "loop1" and "loop2" coupled by a junction of energy J */
    class AnbGate : public Circuit::HamiltonianProvider {
    public:
        AnbGate(double Ej1 = 10.0, double Ej2 = 10.0, double Ec = 0.2, double J = 0.5, double flux1 = 0.5, double flux2 = 0.5,
                const Param::Truncation& trunc = Param::Truncation::uniform(2));
        int dimension() const override;
        Circuit::LoopId first() const { return loop1_; }
        Circuit::LoopId second() const { return loop2_; }
    protected:
        Eigen::SparseMatrix<double> assemble() const override;
    private:
        Param::EnergyParameter Ej1_;
        Param::EnergyParameter Ej2_;
        Param::EnergyParameter Ec_;
        Param::EnergyParameter J_;
        int cutoff1_;
        int cutoff2_;
        Circuit::LoopId loop1_;
        Circuit::LoopId loop2_;
    };

    /* RQL loop: junction, capacitor and inductor in parallel, one loop "loop1" */
    class Loop : public Circuit::HamiltonianProvider {
    public:
        Loop(double Ej = 10.0, double Ec = 0.2, double El = 0.1, double flux = 0.5,
             const Param::Truncation& trunc = Param::Truncation::uniform(1, default_grid_points),
             double extent = default_phase_extent);
        int dimension() const override;
        Circuit::LoopId bias() const { return bias_; }
    protected:
        Eigen::SparseMatrix<double> assemble() const override;
    private:
        Param::EnergyParameter Ej_;
        Param::EnergyParameter Ec_;
        Param::EnergyParameter El_;
        int points_;
        double extent_;
        Circuit::LoopId bias_;
    };

}
