/**
 * @file errors.hpp
 * @brief Exception types raised by the conversion engine.
 *
 * Each type maps to one class of failure. The executor catches all of them
 * at the file boundary and turns them into a Rejected outcome, so a single
 * file never aborts a batch.
 */

#ifndef QSHIFT_ERRORS_HPP
#define QSHIFT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

namespace qshift {

/**
 * @brief Required source metadata is missing or the file cannot be probed.
 *
 * Fatal for the file. Never retried.
 */
class ProbeError : public std::runtime_error {
public:
    enum class Kind {
        MissingField, ///< A characteristic the predictor needs is absent
        Unreadable    ///< The container could not be opened or parsed
    };

    ProbeError(const Kind kind, std::string field, const std::string& message)
        : std::runtime_error(message), kind_(kind), field_(std::move(field)) {}

    /// Convenience constructor for a missing field.
    static ProbeError missing(const std::string& field) {
        return {Kind::MissingField, field, "missing required source field: " + field};
    }

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    /// @return Name of the missing field, or empty for Unreadable.
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    Kind kind_;
    std::string field_;
};

/**
 * @brief An encode trial did not produce a usable artifact.
 */
class EncodeFailure : public std::runtime_error {
public:
    enum class Kind {
        NonZeroExit, ///< The encoder exited with an error status
        EmptyOutput, ///< Exit status was fine but the artifact is missing or empty
        Stuck,       ///< Killed by the heartbeat supervisor after the absolute ceiling
        SpawnFailed  ///< The process could not be started
    };

    EncodeFailure(const Kind kind, const std::string& message, std::string diagnostic = {})
        : std::runtime_error(message), kind_(kind), diagnostic_(std::move(diagnostic)) {}

    [[nodiscard]] Kind kind() const noexcept { return kind_; }
    /// @return The most relevant line of the encoder's diagnostic stream.
    [[nodiscard]] const std::string& diagnostic() const noexcept { return diagnostic_; }

private:
    Kind kind_;
    std::string diagnostic_;
};

/// @return Short name of an EncodeFailure kind, for logs and reports.
std::string_view to_string(EncodeFailure::Kind kind) noexcept;

/**
 * @brief A metric could not be computed for a reference/candidate pair.
 *
 * Drives the metric fallback chain. Distinguishes a missing tool from an
 * input the tool cannot decode and from a layout the metric does not model.
 */
class MetricUnavailable : public std::runtime_error {
public:
    enum class Reason {
        ToolMissing,        ///< Filter or binary not available on this machine
        DecodeIncompatible, ///< The tool ran but could not decode or align the inputs
        UnsupportedLayout   ///< Pixel layout outside the metric's channel model
    };

    MetricUnavailable(const Reason reason, const std::string& message)
        : std::runtime_error(message), reason_(reason) {}

    [[nodiscard]] Reason reason() const noexcept { return reason_; }

private:
    Reason reason_;
};

/// @return Short name of a MetricUnavailable reason.
std::string_view to_string(MetricUnavailable::Reason reason) noexcept;

/**
 * @brief A global stop request interrupted an external process.
 *
 * Aborts the current file. Any temporary artifact is discarded.
 */
class OperationCancelled : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Every metric in the fallback chain failed.
 *
 * Fatal for the file. A candidate is never accepted without a reading.
 */
class QualityUnverifiable : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

} // namespace qshift

#endif // QSHIFT_ERRORS_HPP
