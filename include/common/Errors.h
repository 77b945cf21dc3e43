#pragma once

#include <stdexcept>
#include <string>

namespace factorsim {

// Fatal, raised before the simulation starts
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error("configuration error: " + what) {}
};

// Missing price or score for one symbol on one date
class DataUnavailable : public std::runtime_error {
public:
    explicit DataUnavailable(const std::string& what)
        : std::runtime_error(what) {}
};

// A scoring collaborator failed or timed out; handled like DataUnavailable
class ScoringFailure : public std::runtime_error {
public:
    explicit ScoringFailure(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace factorsim
