#pragma once

#include <stdexcept>
#include <string>

// thrown when an estimator is used in a way that breaks its invariants
// (NaN into an ordered window, reading an empty window, a failed revert...).
// the estimator must not be trusted afterwards.
class InvariantViolation : public std::logic_error
{
public:
    explicit InvariantViolation(const std::string &what) : std::logic_error(what) {}
};
