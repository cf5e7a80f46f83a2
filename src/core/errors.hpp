#ifndef PIIGUARD_CORE_ERRORS_HPP
#define PIIGUARD_CORE_ERRORS_HPP

#include <stdexcept>
#include <string>

/**
 * @file errors.hpp
 * @brief Exception types raised by the anonymization engine.
 *
 * Only ConfigurationError and PatternCompilationError ever reach a caller,
 * and only while the engine is being set up. The model errors are caught
 * inside Anonymizer::anonymize() and downgraded to pattern-only detection.
 */

namespace piiguard {
namespace core {

/// Malformed or incomplete configuration. Fatal at startup.
class ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/// A configured detector pattern does not compile. Fatal at startup.
class PatternCompilationError : public ConfigurationError
{
public:
    PatternCompilationError(const std::string &patternName, const std::string &detail)
        : ConfigurationError("pattern '" + patternName + "' does not compile: " + detail),
          patternName_(patternName)
    {
    }

    const std::string &patternName() const { return patternName_; }

private:
    std::string patternName_;
};

/// The entity model could not be constructed or reached.
class ModelUnavailableError : public std::runtime_error
{
public:
    explicit ModelUnavailableError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

/// The entity model was reachable but inference failed or returned garbage.
class InferenceError : public std::runtime_error
{
public:
    explicit InferenceError(const std::string &what)
        : std::runtime_error(what)
    {
    }
};

} // namespace core
} // namespace piiguard

#endif // PIIGUARD_CORE_ERRORS_HPP
