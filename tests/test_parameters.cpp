#include <catch2/catch.hpp>

#include <cmath>
#include <limits>

#include "errors.hpp"
#include "parameters.hpp"

using namespace Param;


TEST_CASE("flux outside [0, 1] is rejected, never clamped", "[parameters]") {
    REQUIRE_NOTHROW(validate_flux(0.0));
    REQUIRE_NOTHROW(validate_flux(0.5));
    REQUIRE_NOTHROW(validate_flux(1.0));
    REQUIRE_THROWS_AS(validate_flux(1.5), Errors::ValidationError);
    REQUIRE_THROWS_AS(validate_flux(-0.1), Errors::ValidationError);
    REQUIRE_THROWS_AS(validate_flux(std::numeric_limits<double>::quiet_NaN()), Errors::ValidationError);
    REQUIRE_THROWS_AS(FluxParameter("flux", 1.5), Errors::ValidationError);
}

TEST_CASE("energies must be strictly positive", "[parameters]") {
    REQUIRE_NOTHROW(validate_energy(10.0));
    REQUIRE_NOTHROW(validate_energy(0.1));
    REQUIRE_THROWS_AS(validate_energy(-1.0), Errors::ValidationError);
    REQUIRE_THROWS_AS(validate_energy(0.0), Errors::ValidationError);
    REQUIRE_THROWS_AS(EnergyParameter("Ej", -1.0), Errors::ValidationError);
}

TEST_CASE("unusually high energies are accepted with a warning", "[parameters]") {
    const EnergyParameter high("Ej", 2000.0);
    REQUIRE(high.value() == 2000.0);
    REQUIRE(high.unusually_high());
    REQUIRE_FALSE(EnergyParameter("Ec", 0.2).unusually_high());
}

TEST_CASE("a rejected flux update keeps the previous value", "[parameters]") {
    FluxParameter flux("loop1", 0.25);
    REQUIRE_THROWS_AS(flux.set(1.01), Errors::ValidationError);
    REQUIRE(flux.value() == 0.25);
    flux.set(0.75);
    REQUIRE(flux.value() == 0.75);
}

TEST_CASE("flux ranges need 0 <= lo < hi <= 1", "[parameters]") {
    REQUIRE_NOTHROW(validate_range(0.0, 1.0));
    REQUIRE_THROWS_AS(validate_range(0.5, 0.5), Errors::ValidationError);
    REQUIRE_THROWS_AS(validate_range(0.6, 0.4), Errors::ValidationError);
    REQUIRE_THROWS_AS(validate_range(-0.1, 0.4), Errors::ValidationError);
    REQUIRE_THROWS_AS(validate_range(0.0, 1.2), Errors::ValidationError);
}

TEST_CASE("truncation checks the mode count and the cutoffs", "[parameters]") {
    const Truncation two = Truncation::uniform(2, 10);
    REQUIRE(two.cutoffs.size() == 2);
    REQUIRE_NOTHROW(two.validate(2));
    REQUIRE_THROWS_AS(two.validate(1), Errors::ConfigurationError);

    Truncation bad;
    bad.cutoffs = {10, 0};
    REQUIRE_THROWS_AS(bad.validate(2), Errors::ConfigurationError);
    REQUIRE_THROWS_AS(Truncation::uniform(1, 2).validate(1, 3), Errors::ConfigurationError);
}
