#pragma once

#include <string>
#include <stdexcept>


namespace Errors
{

// BASE :

    /* base class of every error raised by the spectral analysis engine */
    class Error : public std::runtime_error {
    public:
        explicit Error(const std::string& what) : std::runtime_error(what) {}
    };


// INPUT AND STRUCTURE :

    /* malformed input to a core operation, always raised before any computation */
    class ValidationError : public Error {
    public:
        explicit ValidationError(const std::string& what) : Error(what) {}
    };

    /* structurally unusable circuit (unknown loop, bad truncation, stale Hamiltonian) */
    class ConfigurationError : public Error {
    public:
        explicit ConfigurationError(const std::string& what) : Error(what) {}
    };


// PER-POINT FAILURES :

    /* failure confined to a single parameter point, recoverable inside a sweep */
    class PointError : public Error {
    public:
        explicit PointError(const std::string& what) : Error(what) {}
    };

    /* the eigensolver failed or the request exceeds the truncated basis */
    class DiagonalizationError : public PointError {
    public:
        explicit DiagonalizationError(const std::string& what) : PointError(what) {}
    };

    /* a circuit could not produce its Hamiltonian at the current parameter */
    class HamiltonianError : public PointError {
    public:
        explicit HamiltonianError(const std::string& what) : PointError(what) {}
    };


// CANCELLATION :

    /* a sweep was interrupted through its cancel flag */
    class CancelledError : public Error {
    public:
        CancelledError(const std::string& what, int index) : Error(what), index_(index) {}
        int index() const { return index_; }
    private:
        int index_;
    };

}
