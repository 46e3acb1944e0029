#pragma once

#include <stdexcept>
#include <string>

namespace relaunch {
namespace core {

/**
 * @brief Raised when an optional lifecycle operation is invoked on a variant
 * that does not implement it.
 *
 * Callers are expected to consult canRestart() / canReplaceArtifact() first,
 * so seeing this exception means the caller skipped the check.
 */
class UnsupportedOperationError : public std::logic_error {
public:
    explicit UnsupportedOperationError(const std::string& message)
        : std::logic_error(message) {}
};

/**
 * @brief Raised when a variant's declared capabilities disagree with the
 * operations it actually implements.
 *
 * This is a defect in the variant, never a normal "unsupported" answer.
 */
class CapabilityMismatchError : public std::logic_error {
public:
    explicit CapabilityMismatchError(const std::string& message)
        : std::logic_error(message) {}
};

/**
 * @brief Raised by concrete variants when a supported restart or artifact
 * replacement fails for environmental reasons (permissions, I/O, the
 * process manager refusing the request).
 */
class LifecycleOperationError : public std::runtime_error {
public:
    explicit LifecycleOperationError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief No lifecycle variant is registered under the requested name.
 */
class UnknownLifecycleError : public std::runtime_error {
public:
    explicit UnknownLifecycleError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief The configured lifecycle variant could not be resolved or
 * instantiated. Fatal to process startup; the original cause is nested.
 */
class StrategySelectionError : public std::runtime_error {
public:
    StrategySelectionError(const std::string& selection, const std::string& message)
        : std::runtime_error(message), selection_(selection) {}

    /// The selection key value that failed.
    const std::string& selection() const noexcept { return selection_; }

private:
    std::string selection_;
};

/**
 * @brief A configuration source could not be read.
 */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace core
} // namespace relaunch
