// ElectionErrors.h : Exceptions raised by the ranked-choice counting core.

#pragma once

#include <stdexcept>
#include <string>

// A submitted ranking is not a permutation of 1..N for the election's candidate count.
// Recoverable: the ballot is rejected and the election is left untouched.
class InvalidBallotError : public std::invalid_argument {
public:
    explicit InvalidBallotError(const std::string& msg = "Invalid ballot") : std::invalid_argument(msg) {}
};

// More candidates were registered than the election was sized for.
class CandidateOverflowError : public std::out_of_range {
public:
    explicit CandidateOverflowError(const std::string& msg) : std::out_of_range(msg) {}
};

// A candidate was eliminated twice.
class DegenerateEliminationError : public std::logic_error {
public:
    explicit DegenerateEliminationError(const std::string& msg) : std::logic_error(msg) {}
};
