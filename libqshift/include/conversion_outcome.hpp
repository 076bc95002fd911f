/**
 * @file conversion_outcome.hpp
 * @brief The single terminal result produced for every input file.
 */

#ifndef QSHIFT_CONVERSION_OUTCOME_HPP
#define QSHIFT_CONVERSION_OUTCOME_HPP

#include "quality_report.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace qshift {

/**
 * @brief Why a file was not converted.
 */
enum class RejectReason {
    NoCompression,          ///< No tested parameter produced output below the input size
    SizeOrQualityNotMet,    ///< The chosen candidate failed the size or quality policy
    IterationLimitExceeded, ///< The search hit its iteration ceiling before converging
    QualityUnverifiable,    ///< Every metric in the fallback chain failed
    ProbeFailed,            ///< Source metadata missing or unreadable
    EncodeFailed,           ///< The encoder failed and no retry path remained
    CommitFailed,           ///< The temporary artifact could not be moved into place
    Cancelled,              ///< Interrupted by a stop request
    Skipped                 ///< Codec policy or resume list excluded the file
};

/// @return Short kebab-case name of a reason.
std::string_view to_string(RejectReason reason) noexcept;

/**
 * @brief Output committed with a full size and quality pass.
 */
struct Accepted {
    double parameter = 0.0;
    std::optional<QualityReport> report;  ///< Absent for strategies without a quality floor
    std::uintmax_t output_size = 0;
    std::filesystem::path destination;    ///< Where the bytes were committed (empty on dry-run)
};

/**
 * @brief Original preserved; states the failed check and its numbers.
 */
struct Rejected {
    RejectReason reason = RejectReason::SizeOrQualityNotMet;
    std::string message;
};

/**
 * @brief Output committed under the compatibility exception.
 *
 * Only for sources with no fully compatible target. Always logged apart
 * from Accepted.
 */
struct BestEffortAccepted {
    double parameter = 0.0;
    std::string reason;                   ///< The check that failed and why it was waived
    std::uintmax_t output_size = 0;
    std::filesystem::path destination;
};

using ConversionOutcome = std::variant<Accepted, Rejected, BestEffortAccepted>;

/// @return True for Accepted and BestEffortAccepted.
[[nodiscard]] bool is_committed(const ConversionOutcome& outcome) noexcept;

/// @return "accepted", "best-effort" or "rejected".
[[nodiscard]] std::string_view outcome_name(const ConversionOutcome& outcome) noexcept;

/// @return Human-readable description including parameter, reason or report.
[[nodiscard]] std::string describe(const ConversionOutcome& outcome);

} // namespace qshift

#endif // QSHIFT_CONVERSION_OUTCOME_HPP
