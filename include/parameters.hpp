#pragma once

#include <string>
#include <vector>


namespace Param
{

// LIMITS :

    /* energies above this value (GHz) are accepted with a plausibility warning */
    constexpr double energy_warning_limit = 1000.0;

    /* default basis cutoff per mode */
    constexpr int default_cutoff = 50;


// VALIDATION :

    /* check that an energy is finite and strictly positive, warn if above the plausibility limit */
    void validate_energy(double value, const std::string& name = "Energy");

    /* check that a flux lies in the closed interval [0, 1] */
    void validate_flux(double value, const std::string& name = "Flux");

    /* check that 0 <= lo < hi <= 1 */
    void validate_range(double lo, double hi);


// PHYSICAL PARAMETERS :

    /* Josephson, charging, inductive or coupling energy in GHz, value > 0 */
    class EnergyParameter {
    public:
        EnergyParameter(const std::string& name, double value);
        const std::string& name() const { return name_; }
        double value() const { return value_; }
        bool unusually_high() const { return value_ > energy_warning_limit; }
    private:
        std::string name_;
        double value_;
    };

    /* external flux bias in units of the flux quantum, value in [0, 1] */
    class FluxParameter {
    public:
        FluxParameter(const std::string& name, double value);
        const std::string& name() const { return name_; }
        double value() const { return value_; }
        void set(double value);
    private:
        std::string name_;
        double value_;
    };

    /* closed flux interval swept by a sweep */
    struct FluxRange {
        double lo = 0.0;
        double hi = 1.0;
    };


// TRUNCATION :

    /* per-mode basis cutoffs, resolved once when a circuit is constructed
       charge modes use the charge states -c..c, phase-grid modes use c grid points */
    struct Truncation {
        std::vector<int> cutoffs;

        /* same cutoff for each of the given number of modes */
        static Truncation uniform(int modes, int cutoff = default_cutoff);

        /* check the number of modes and the minimal cutoff of each mode */
        void validate(int modes, int min_cutoff = 1) const;
    };

}
