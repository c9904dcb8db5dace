#pragma once

#include <memory>
#include <string>
#include <vector>
#include <functional>
#include <Eigen/SparseCore>

#include "parameters.hpp"


namespace Circuit
{

// FLUX LOOPS :

    /* stable handle on a flux loop, assigned when the loop is declared */
    struct LoopId {
        int index = -1;
        std::string name;
    };


// HAMILTONIAN PROVIDER :

    /* Circuit model producing a real symmetric Hamiltonian (GHz) as a function of its flux loops.
       The owner keeps the model alive; the analysis code only borrows it. After any set_flux the
       Hamiltonian is stale until rebuild() is called. */
    class HamiltonianProvider {
    public:
        virtual ~HamiltonianProvider() = default;

        /* resolve a loop by name, throws ConfigurationError for an unknown name */
        LoopId loop(const std::string& name) const;

        /* names of the declared loops, in declaration order */
        std::vector<std::string> loop_names() const;

        /* check that the handle belongs to this circuit */
        bool owns(const LoopId& id) const;

        void set_flux(const LoopId& id, double value);
        double flux(const LoopId& id) const;

        /* reassemble the Hamiltonian for the current loop values */
        void rebuild();

        /* current Hamiltonian, throws ConfigurationError when stale */
        const Eigen::SparseMatrix<double>& hamiltonian() const;

        bool is_stale() const { return stale_; }

        /* dimension of the truncated Hilbert space */
        virtual int dimension() const = 0;

    protected:
        /* declare a loop at construction time and return its handle */
        LoopId add_loop(const std::string& name, double flux);

        /* flux of the loop at the given declaration index */
        double loop_flux(int index) const;

        /* build the Hamiltonian matrix for the current loop values */
        virtual Eigen::SparseMatrix<double> assemble() const = 0;

    private:
        void check(const LoopId& id) const;

        std::vector<Param::FluxParameter> loops_;
        Eigen::SparseMatrix<double> hamiltonian_;
        bool stale_ = true;
    };

    /* builds an independent circuit instance, one per parallel worker */
    using Factory = std::function<std::unique_ptr<HamiltonianProvider>()>;

}
