#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Raised when a session or the service is configured with values
 * outside their valid range (threshold outside (0,1], empty registry,
 * malformed configuration file). Nothing is created or mutated.
 */
struct InvalidConfiguration : std::invalid_argument {
  explicit InvalidConfiguration(const std::string& what)
    : std::invalid_argument("invalid configuration: " + what) {}
};

/**
 * @brief Raised when an operation is invoked in a session state that forbids
 * it. The session is left untouched.
 */
struct InvalidState : std::logic_error {
  explicit InvalidState(const std::string& what)
    : std::logic_error("invalid state: " + what) {}
};

/// Rejected device registration (empty name, duplicate identifier).
struct RegistrationError : std::runtime_error {
  explicit RegistrationError(const std::string& what)
    : std::runtime_error("registration failed: " + what) {}
};
