#pragma once

#include <exception>
#include <functional>
#include <string>

#include "pow_errors.hpp"

namespace capsolve {

// Process exit codes of the capsolve tool.
enum ExitStatus {
    EXIT_OK = 0,
    EXIT_FATAL = 1,
    EXIT_INPUT_ERROR = 2,
    EXIT_SOLVER_FAULT = 3,
    EXIT_CANCELLED = 4
};

struct SolveOutcome {
    int exit_code = EXIT_OK;
    std::string solution;
    std::string error;
};

// Runs `solve` and maps every std::exception it raises to an exit code, so
// callers always reach their own cleanup.
inline SolveOutcome run_guarded(const std::function<std::string()>& solve) {
    SolveOutcome outcome;
    try {
        outcome.solution = solve();
    } catch (const InputError& e) {
        outcome.exit_code = EXIT_INPUT_ERROR;
        outcome.error = e.what();
    } catch (const SolverFault& e) {
        outcome.exit_code = EXIT_SOLVER_FAULT;
        outcome.error = e.what();
    } catch (const CancellationError& e) {
        outcome.exit_code = EXIT_CANCELLED;
        outcome.error = e.what();
    } catch (const std::exception& e) {
        outcome.exit_code = EXIT_FATAL;
        outcome.error = std::string("Fatal error: ") + e.what();
    }
    return outcome;
}

}
