#pragma once

#include <stdexcept>
#include <string>

// Base of every failure the engine reports to its callers.
struct ArenaError : std::runtime_error {
    explicit ArenaError(const std::string& msg) : std::runtime_error(msg) {}
};

// Bad generator or server parameters.
struct ConfigurationError : ArenaError {
    using ArenaError::ArenaError;
};

// Unknown or evicted session id. Recoverable by starting a new round.
struct SessionNotFoundError : ArenaError {
    using ArenaError::ArenaError;
};

// Submitted route breaks the round's rules. Recoverable by resubmitting.
struct InvalidRouteError : ArenaError {
    using ArenaError::ArenaError;
};

// Random search asked to sample zero or fewer tours.
struct SearchBudgetError : ArenaError {
    using ArenaError::ArenaError;
};
