#pragma once

#include <string>
#include <Eigen/Dense>

#include "sweep.hpp"
#include "analysis.hpp"


namespace Output
{
    /* level energies and gate metrics of a single point */
    void save_spectrum(const std::string& path, const std::string& gate, double flux, const Eigen::VectorXd& energies, const Analysis::GateMetrics& metrics);

    /* flux and energies of every sweep point, failures and the minimum gap as comment lines */
    void save_sweep(const std::string& path, const std::string& gate, const std::string& loop, const Sweep::SweepResult& sweep, int level_a, int level_b, const Analysis::MinGap& min_gap);
}
