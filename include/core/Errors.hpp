#pragma once
#include <stdexcept>
#include <string>

// Base of every error raised by the generator core.
class GeneratorError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Digits, section size or section count that cannot describe a domain.
class ConfigurationError : public GeneratorError {
public:
    using GeneratorError::GeneratorError;
};

// Persisted state that is structurally invalid. Never repaired.
class CorruptStateError : public GeneratorError {
public:
    using GeneratorError::GeneratorError;
};

// No eligible section could be selected although the cycle is not finished.
class ExhaustedSelectionError : public GeneratorError {
public:
    using GeneratorError::GeneratorError;
};

// Loaded state was created for a different domain, section size or traversal.
class ConfigurationMismatchError : public GeneratorError {
public:
    using GeneratorError::GeneratorError;
};

// State file could not be written or replaced.
class StateIoError : public GeneratorError {
public:
    using GeneratorError::GeneratorError;
};
