#include <string>
#include <vector>
#include <exception>
#include <Eigen/SparseCore>

#include "errors.hpp"
#include "circuit.hpp"


///// FLUX LOOPS /////

/* Declare a new loop, names must be unique inside a circuit */
Circuit::LoopId Circuit::HamiltonianProvider::add_loop(const std::string& name, const double flux) {
    for (const auto& loop : loops_) {
        if (loop.name() == name) {
            throw Errors::ConfigurationError("Loop '" + name + "' is declared twice");
        }
    }
    loops_.emplace_back(name, flux);
    stale_ = true;
    return LoopId{static_cast<int>(loops_.size()) - 1, name};
}

/* Resolve a loop by its name */
Circuit::LoopId Circuit::HamiltonianProvider::loop(const std::string& name) const {
    for (size_t i = 0; i < loops_.size(); ++i) {
        if (loops_[i].name() == name) {
            return LoopId{static_cast<int>(i), name};
        }
    }
    std::string known;
    for (const auto& l : loops_) {
        known += (known.empty() ? "" : ", ") + l.name();
    }
    throw Errors::ConfigurationError("No flux loop named '" + name + "' in circuit (loops: " + (known.empty() ? "none" : known) + ")");
}

std::vector<std::string> Circuit::HamiltonianProvider::loop_names() const {
    std::vector<std::string> names;
    names.reserve(loops_.size());
    for (const auto& loop : loops_) {
        names.push_back(loop.name());
    }
    return names;
}

bool Circuit::HamiltonianProvider::owns(const LoopId& id) const {
    return id.index >= 0 && id.index < static_cast<int>(loops_.size()) && loops_[id.index].name() == id.name;
}

void Circuit::HamiltonianProvider::check(const LoopId& id) const {
    if (!owns(id)) {
        throw Errors::ConfigurationError("Loop handle '" + id.name + "' (index " + std::to_string(id.index) + ") does not belong to this circuit");
    }
}

/* Set the flux of a loop, the Hamiltonian becomes stale */
void Circuit::HamiltonianProvider::set_flux(const LoopId& id, const double value) {
    check(id);
    loops_[id.index].set(value);
    stale_ = true;
}

double Circuit::HamiltonianProvider::flux(const LoopId& id) const {
    check(id);
    return loops_[id.index].value();
}

double Circuit::HamiltonianProvider::loop_flux(const int index) const {
    return loops_.at(index).value();
}


///// HAMILTONIAN /////

/* Rebuild the Hamiltonian from the current loop values, any assembly failure is a HamiltonianError */
void Circuit::HamiltonianProvider::rebuild() {
    Eigen::SparseMatrix<double> H;
    try {
        H = assemble();
    } catch (const Errors::Error&) {
        throw;
    } catch (const std::exception& e) {
        throw Errors::HamiltonianError(std::string("Hamiltonian assembly failed: ") + e.what());
    }
    if (H.rows() != dimension() || H.cols() != dimension()) {
        throw Errors::HamiltonianError("Assembled Hamiltonian is " + std::to_string(H.rows()) + "x" + std::to_string(H.cols()) + ", expected dimension " + std::to_string(dimension()));
    }
    hamiltonian_ = std::move(H);
    stale_ = false;
}

const Eigen::SparseMatrix<double>& Circuit::HamiltonianProvider::hamiltonian() const {
    if (stale_) {
        throw Errors::ConfigurationError("Hamiltonian is stale, rebuild() must be called after changing the circuit");
    }
    return hamiltonian_;
}
