#pragma once

#include <optional>
#include <Eigen/Dense>

#include "sweep.hpp"


namespace Analysis
{

// RESULTS :

    /* scalar figures of merit of one spectrum, in GHz */
    struct GateMetrics {
        double ground_state_energy = 0.0;
        std::optional<double> first_excited_energy;
        std::optional<double> transition_frequency;
        std::optional<double> anharmonicity;   // only with three levels or more
    };

    /* location of the avoided crossing between two levels */
    struct MinGap {
        double gap = 0.0;
        double parameter = 0.0;
        int index = 0;
    };


// GATE METRICS :

    /* ground energy, 0-1 transition and anharmonicity of an ascending spectrum, needs 2 levels */
    GateMetrics gate_metrics(const Eigen::VectorXd& energies);

    /* (E2 - E1) - (E1 - E0), needs 3 levels */
    double anharmonicity(const Eigen::VectorXd& energies);

    /* E_k - E0 for every excited level k, needs 2 levels */
    Eigen::VectorXd transition_frequencies(const Eigen::VectorXd& energies);


// ANTI-CROSSING :

    /* |E_b - E_a| at every point of a sweep */
    Eigen::VectorXd level_gaps(const Sweep::SweepResult& sweep, int level_a, int level_b);

    /* minimum of |E_b - E_a| over the sweep, first occurrence on ties */
    MinGap find_min_gap(const Sweep::SweepResult& sweep, int level_a, int level_b);

}
