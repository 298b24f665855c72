#pragma once

#include <exception>
#include <stdexcept>
#include <string>

namespace ridge_texture {

class RidgeTextureError : public std::runtime_error {
public:
    explicit RidgeTextureError(const std::string& message)
        : std::runtime_error(message) {}
};

class ConfigError : public RidgeTextureError {
public:
    explicit ConfigError(const std::string& message)
        : RidgeTextureError("Config error: " + message) {}
};

class ValidationError : public RidgeTextureError {
public:
    explicit ValidationError(const std::string& message)
        : RidgeTextureError("Validation error: " + message) {}
};

class IOError : public RidgeTextureError {
public:
    explicit IOError(const std::string& message)
        : RidgeTextureError("I/O error: " + message) {}
};

class StorageError : public IOError {
public:
    explicit StorageError(const std::string& message)
        : IOError("Storage error: " + message) {}
};

class StoreUnavailable : public IOError {
public:
    explicit StoreUnavailable(const std::string& message)
        : IOError("Run store unavailable: " + message) {}
};

// Malformed or undecodable input. Fatal to the run, never retried.
class InvalidImage : public RidgeTextureError {
public:
    explicit InvalidImage(const std::string& message)
        : RidgeTextureError("Invalid image: " + message) {}
};

// An internal pipeline invariant was violated.
class SynthesisError : public RidgeTextureError {
public:
    explicit SynthesisError(const std::string& message)
        : RidgeTextureError("Synthesis error: " + message) {}
};

class OracleUnavailable : public RidgeTextureError {
public:
    explicit OracleUnavailable(const std::string& message)
        : RidgeTextureError("Oracle unavailable: " + message) {}
};

class NotificationFailed : public RidgeTextureError {
public:
    explicit NotificationFailed(const std::string& message)
        : RidgeTextureError("Notification failed: " + message) {}
};

class StateError : public RidgeTextureError {
public:
    explicit StateError(const std::string& message)
        : RidgeTextureError("State error: " + message) {}
};

class StopRequested : public RidgeTextureError {
public:
    StopRequested() : RidgeTextureError("Stop requested by caller") {}
};

// Taxonomy name recorded on a failed run.
std::string error_kind_of(const std::exception& e);

} // namespace ridge_texture
