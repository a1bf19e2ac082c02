#pragma once

#include <stdexcept>
#include <string>

namespace capsolve {

// Base class for every failure the solver core reports to its caller.
// None of these are retried internally; the caller decides whether to
// request a fresh challenge set.
class PowError : public std::runtime_error {
public:
    explicit PowError(const std::string& what) : std::runtime_error(what) {}
};

// Malformed token or generation parameters. Raised before any work starts.
class InputError : public PowError {
public:
    explicit InputError(const std::string& what) : PowError("invalid input: " + what) {}
};

// Unexpected internal failure while hashing. Aborts the whole batch.
class SolverFault : public PowError {
public:
    explicit SolverFault(const std::string& what) : PowError("solver fault: " + what) {}
};

// Caller-initiated abort or batch deadline. Not a crash.
class CancellationError : public PowError {
public:
    explicit CancellationError(const std::string& what) : PowError("cancelled: " + what) {}
};

}
