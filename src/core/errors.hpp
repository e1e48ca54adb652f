#pragma once
#include <stdexcept>
#include <string>

namespace core {

/**
 * @brief Base class for all errors raised by the processing core
 */
class Error : public std::runtime_error {
public:
    explicit Error(const std::string& what) : std::runtime_error(what) {}
};

/// Speech-to-text failed. Fatal for the processing call.
class TranscriptionError : public Error {
public:
    explicit TranscriptionError(const std::string& what) : Error(what) {}
};

/// Caller or provider broke the input contract (empty buffer, bad timestamps, ...)
class InvalidInputError : public Error {
public:
    explicit InvalidInputError(const std::string& what) : Error(what) {}
};

/// A model could not be loaded from disk
class ModelLoadError : public Error {
public:
    explicit ModelLoadError(const std::string& what) : Error(what) {}
};

/// Settings file unreadable or malformed
class ConfigError : public Error {
public:
    explicit ConfigError(const std::string& what) : Error(what) {}
};

/// Caller requested cancellation before the call finished
class ProcessingCancelled : public Error {
public:
    ProcessingCancelled() : Error("processing cancelled") {}
};

} // namespace core
