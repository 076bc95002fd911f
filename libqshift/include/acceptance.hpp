/**
 * @file acceptance.hpp
 * @brief Final size/quality decision and the atomic commit of an artifact.
 */

#ifndef QSHIFT_ACCEPTANCE_HPP
#define QSHIFT_ACCEPTANCE_HPP

#include "conversion_outcome.hpp"
#include "quality_report.hpp"
#include "search_config.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace qshift {

/**
 * @brief Everything the gate looks at.
 */
struct AcceptanceInput {
    std::uintmax_t input_size = 0;
    std::uintmax_t output_size = 0;
    double parameter = 0.0;
    SizePolicy size_policy;
    std::optional<QualityReport> report;  ///< Set when verification is active
    bool best_effort_eligible = false;
};

/**
 * @brief Combines the size policy, the quality verdict and best-effort eligibility.
 */
class AcceptanceGate {
public:
    /**
     * @return Accepted, BestEffortAccepted or Rejected. Destinations are left
     *         empty; they are filled in once the artifact is committed.
     */
    [[nodiscard]] static ConversionOutcome decide(const AcceptanceInput& input);
};

/**
 * @brief Where and how an artifact is committed.
 */
struct CommitOptions {
    bool dry_run = false;
    bool in_place = false;                 ///< Allow replacing a source whose name the output reuses
    std::optional<std::filesystem::path> output_dir;
    int max_retries = 10;
    std::chrono::milliseconds retry_delay{250};
};

/**
 * @brief Result of commit_artifact().
 */
struct CommitResult {
    bool ok = false;
    std::filesystem::path destination;  ///< Empty on dry-run
    std::string error;
};

/**
 * @brief Copies file beside destination under a hidden temporary name.
 *
 * Used when a rename crosses filesystems. On failure ec is set, any partial
 * copy is removed and an empty path is returned.
 */
std::filesystem::path stage_copy(const std::filesystem::path& file, const std::filesystem::path& destination,
                                 std::error_code& ec);

/**
 * @brief Final path for a converted source.
 *
 * `<dir>/<stem><extension>`, where dir is the output directory or the
 * source's own directory. If another file already holds that name, the
 * first free one of "<stem>_qshift", "<stem>_qshift_2", ... is used
 * instead; existing files are never overwritten.
 *
 * @return std::nullopt if the path is the source itself and
 *         `options.in_place` is off.
 */
[[nodiscard]] std::optional<std::filesystem::path> destination_for(const std::filesystem::path& source,
                                                                   std::string_view extension,
                                                                   const CommitOptions& options);

/**
 * @brief Moves a temporary artifact to its destination.
 *
 * Renames with retries on EBUSY, EACCES and ENOENT. Across filesystems it
 * copies next to the destination and renames from there. On dry-run, or on
 * any failure, the temporary file is deleted.
 */
CommitResult commit_artifact(const std::filesystem::path& temp, const std::filesystem::path& destination,
                             const CommitOptions& options);

} // namespace qshift

#endif // QSHIFT_ACCEPTANCE_HPP
