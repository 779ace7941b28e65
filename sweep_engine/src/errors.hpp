#pragma once

#include <string>
#include <stdexcept>

enum class ErrorKind {
    InsufficientData,   // not enough bars yet; retry later
    InvalidTransition,  // guard violated or stale event
    AmbiguousSweep,     // both sides breached and no policy resolves it
    Configuration
};

inline std::string to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InsufficientData: return "insufficient_data";
        case ErrorKind::InvalidTransition: return "invalid_transition";
        case ErrorKind::AmbiguousSweep: return "ambiguous_sweep";
        case ErrorKind::Configuration: return "configuration";
    }
    return "unknown";
}

// Typed reason returned by detectors and transitions instead of throwing
struct Rejection {
    ErrorKind kind;
    std::string reason;
};

// Startup only: thrown from validate(), never mid-session
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};
