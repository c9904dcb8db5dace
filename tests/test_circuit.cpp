#include <catch2/catch.hpp>

#include <cmath>
#include <Eigen/Dense>
#include <Eigen/SparseCore>

#include "errors.hpp"
#include "hamiltonian.hpp"
#include "operator.hpp"
#include "sweep.hpp"
#include "analysis.hpp"
#include "fake_circuit.hpp"


static bool is_symmetric(const Eigen::SparseMatrix<double>& H) {
    const Eigen::MatrixXd dense = Eigen::MatrixXd(H);
    return (dense - dense.transpose()).cwiseAbs().maxCoeff() < 1e-12;
}


TEST_CASE("loops are resolved by name", "[circuit]") {
    FakeCircuit circuit;
    REQUIRE(circuit.loop_names() == std::vector<std::string>{"bias", "other"});
    const Circuit::LoopId id = circuit.loop("other");
    REQUIRE(id.index == 1);
    REQUIRE(circuit.owns(id));
    REQUIRE_THROWS_AS(circuit.loop("loop3"), Errors::ConfigurationError);

    REQUIRE_FALSE(circuit.owns(Circuit::LoopId{5, "bias"}));
    REQUIRE_THROWS_AS(circuit.set_flux(Circuit::LoopId{0, "nope"}, 0.5), Errors::ConfigurationError);
}

TEST_CASE("a Hamiltonian is stale until rebuilt", "[circuit]") {
    FakeCircuit circuit;
    REQUIRE(circuit.is_stale());
    REQUIRE_THROWS_AS(circuit.hamiltonian(), Errors::ConfigurationError);
    REQUIRE_THROWS_AS(Op::diagonalize(circuit, 2), Errors::ConfigurationError);

    circuit.rebuild();
    REQUIRE_FALSE(circuit.is_stale());
    REQUIRE(circuit.hamiltonian().rows() == 4);

    circuit.set_flux(circuit.bias(), 0.3);
    REQUIRE(circuit.flux(circuit.bias()) == 0.3);
    REQUIRE(circuit.is_stale());
    REQUIRE_THROWS_AS(circuit.set_flux(circuit.bias(), 1.5), Errors::ValidationError);
    REQUIRE(circuit.flux(circuit.bias()) == 0.3);
}

TEST_CASE("rebuild reports any assembly failure as a HamiltonianError", "[circuit]") {
    FakeCircuit circuit(4, {0.5});
    circuit.foreign_failure = true;
    circuit.set_flux(circuit.bias(), 0.5);
    REQUIRE_THROWS_AS(circuit.rebuild(), Errors::HamiltonianError);
    REQUIRE(circuit.is_stale());
    circuit.set_flux(circuit.bias(), 0.25);
    REQUIRE_NOTHROW(circuit.rebuild());
    REQUIRE_FALSE(circuit.is_stale());
}

TEST_CASE("gate constructors validate their parameters", "[circuit][rql]") {
    REQUIRE_THROWS_AS(RQL::Inverter(-10.0, 0.2, 0.5), Errors::ValidationError);
    REQUIRE_THROWS_AS(RQL::Inverter(10.0, 0.2, 1.5), Errors::ValidationError);
    REQUIRE_THROWS_AS(RQL::Loop(10.0, 0.2, 0.0, 0.5), Errors::ValidationError);
    REQUIRE_THROWS_AS(RQL::AnbGate(10.0, 10.0, 0.2, 0.5, 0.5, 0.5, Param::Truncation::uniform(1, 5)), Errors::ConfigurationError);
    REQUIRE_THROWS_AS(RQL::Loop(10.0, 0.2, 0.1, 0.5, Param::Truncation::uniform(1, 2)), Errors::ConfigurationError);
}

TEST_CASE("gate Hamiltonians are symmetric with the configured dimension", "[circuit][rql]") {
    const RQL::Inverter inverter(10.0, 0.2, 0.1, 0.3, Param::Truncation::uniform(1, 8));
    REQUIRE(inverter.dimension() == 17);
    REQUIRE(inverter.hamiltonian().rows() == 17);
    REQUIRE(is_symmetric(inverter.hamiltonian()));

    const RQL::AnbGate anb(10.0, 9.0, 0.2, 0.5, 0.2, 0.4, Param::Truncation::uniform(2, 3));
    REQUIRE(anb.dimension() == 49);
    REQUIRE(is_symmetric(anb.hamiltonian()));
    REQUIRE(anb.loop_names() == std::vector<std::string>{"loop1", "loop2"});

    const RQL::Loop loop(10.0, 0.2, 0.1, 0.3, Param::Truncation::uniform(1, 51));
    REQUIRE(loop.dimension() == 51);
    REQUIRE(is_symmetric(loop.hamiltonian()));
}

TEST_CASE("inverter spectrum at zero flux is transmon-like", "[circuit][rql]") {
    const RQL::Inverter inverter(10.0, 0.2, 0.0, 0.0, Param::Truncation::uniform(1, 20));
    const Op::Spectrum spectrum = Op::diagonalize(inverter, 3);
    const Analysis::GateMetrics metrics = Analysis::gate_metrics(spectrum.energies);
    // sqrt(8 Ej Ec) - Ec = 3.8 GHz, anharmonicity close to -Ec
    REQUIRE(*metrics.transition_frequency > 3.5);
    REQUIRE(*metrics.transition_frequency < 3.9);
    REQUIRE(*metrics.anharmonicity > -0.3);
    REQUIRE(*metrics.anharmonicity < -0.15);
}

TEST_CASE("inverter at half flux reduces to the charging spectrum", "[circuit][rql]") {
    const RQL::Inverter inverter(10.0, 0.2, 0.5, 0.0, Param::Truncation::uniform(1, 10));
    const Op::Spectrum spectrum = Op::diagonalize(inverter, 3);
    REQUIRE(spectrum.energies[0] == Approx(0.0).margin(1e-9));
    REQUIRE(spectrum.energies[1] == Approx(0.8).margin(1e-9));
    REQUIRE(spectrum.energies[2] == Approx(0.8).margin(1e-9));
}

TEST_CASE("loop spectrum is mirror symmetric around half flux", "[circuit][rql]") {
    RQL::Loop loop(10.0, 0.2, 0.1, 0.3, Param::Truncation::uniform(1, 101));
    const Eigen::VectorXd low = Op::diagonalize(loop, 4).energies;
    loop.set_flux(loop.bias(), 0.7);
    loop.rebuild();
    const Eigen::VectorXd high = Op::diagonalize(loop, 4).energies;
    for (int k = 0; k < 4; ++k) {
        REQUIRE(low[k] == Approx(high[k]).margin(1e-8));
    }
}

TEST_CASE("the ANB gate anti-crosses where both loops are biased alike", "[circuit][rql][anticrossing]") {
    RQL::AnbGate anb(10.0, 10.0, 0.2, 0.5, 0.0, 0.2, Param::Truncation::uniform(2, 6));
    const Sweep::SweepResult sweep = Sweep::flux_sweep(anb, anb.first(), {0.0, 0.35}, 36, 3);
    REQUIRE(sweep.failures.empty());
    const Analysis::MinGap crossing = Analysis::find_min_gap(sweep, 1, 2);
    REQUIRE(crossing.parameter == Approx(0.2).margin(0.02));
    REQUIRE(crossing.gap > 0.0);
    const Eigen::VectorXd gaps = Analysis::level_gaps(sweep, 1, 2);
    REQUIRE(crossing.gap < gaps[0]);
    REQUIRE(crossing.gap < gaps[gaps.size() - 1]);
}
