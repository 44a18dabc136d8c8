#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// Bad or inconsistent configuration, detected before any resource is opened
class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A bounded retry policy ran out of attempts
class AcquisitionError : public std::runtime_error {
public:
    AcquisitionError(const std::string& what, uint32_t attempts)
        : std::runtime_error("giving up on " + what + " after " + std::to_string(attempts) + " attempts"),
          attempts_(attempts) {}

    uint32_t attempts() const { return attempts_; }

private:
    uint32_t attempts_;
};

// The owning service is stopping while a resource was still being acquired
class AcquisitionCancelled : public std::runtime_error {
public:
    explicit AcquisitionCancelled(const std::string& what)
        : std::runtime_error("acquisition of " + what + " cancelled") {}
};

// A received message cannot be turned into a model input
class DecodeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The model artifact loaded but does not fit the configured input
class ModelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A single inference call failed; the session stays usable
class InferenceError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};
