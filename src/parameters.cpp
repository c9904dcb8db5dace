#include <cmath>
#include <string>
#include <iostream>

#include "errors.hpp"
#include "parameters.hpp"


///// VALIDATION /////

/* Check that an energy is finite and strictly positive, warn if it is unusually high */
void Param::validate_energy(const double value, const std::string& name) {
    if (!std::isfinite(value) || value <= 0.0) {
        throw Errors::ValidationError(name + " must be positive, got " + std::to_string(value));
    }
    if (value > energy_warning_limit) {
        std::cerr << "Warning: " << name << " value " << value << " GHz seems unusually high" << std::endl;
    }
}

/* Check that a flux lies in [0, 1], never clamp */
void Param::validate_flux(const double value, const std::string& name) {
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
        throw Errors::ValidationError(name + " must be between 0 and 1, got " + std::to_string(value));
    }
}

/* Check a sweep interval */
void Param::validate_range(const double lo, const double hi) {
    if (!std::isfinite(lo) || !std::isfinite(hi) || !(0.0 <= lo && lo < hi && hi <= 1.0)) {
        throw Errors::ValidationError("Invalid flux range: (" + std::to_string(lo) + ", " + std::to_string(hi) + "), expected 0 <= lo < hi <= 1");
    }
}


///// PHYSICAL PARAMETERS /////

Param::EnergyParameter::EnergyParameter(const std::string& name, const double value) : name_(name), value_(value) {
    validate_energy(value, name);
}

Param::FluxParameter::FluxParameter(const std::string& name, const double value) : name_(name), value_(value) {
    validate_flux(value, name);
}

/* Update the flux, the old value is kept if the new one is rejected */
void Param::FluxParameter::set(const double value) {
    validate_flux(value, name_);
    value_ = value;
}


///// TRUNCATION /////

Param::Truncation Param::Truncation::uniform(const int modes, const int cutoff) {
    Truncation trunc;
    trunc.cutoffs.assign(modes > 0 ? modes : 0, cutoff);
    return trunc;
}

void Param::Truncation::validate(const int modes, const int min_cutoff) const {
    if (static_cast<int>(cutoffs.size()) != modes) {
        throw Errors::ConfigurationError("Truncation needs " + std::to_string(modes) + " cutoff(s), got " + std::to_string(cutoffs.size()));
    }
    for (size_t i = 0; i < cutoffs.size(); ++i) {
        if (cutoffs[i] < min_cutoff) {
            throw Errors::ConfigurationError("Truncation cutoff of mode " + std::to_string(i) + " must be at least " + std::to_string(min_cutoff) + ", got " + std::to_string(cutoffs[i]));
        }
    }
}
