/**
 * @file codec_policy.hpp
 * @brief Which sources are worth converting, and which may be best-effort.
 */

#ifndef QSHIFT_CODEC_POLICY_HPP
#define QSHIFT_CODEC_POLICY_HPP

#include "media_probe.hpp"
#include <optional>
#include <string>

namespace qshift {

/**
 * @brief Source-codec decisions taken before any trial runs.
 *
 * In compatibility mode the goal is playback on Apple devices, so modern
 * codecs those devices cannot decode are re-encoded instead of skipped.
 */
struct CodecPolicy {
    bool compat = false;

    /// @return True if the codec is HEVC, AV1, VVC or AV2.
    [[nodiscard]] static bool is_modern(SourceCodec codec) noexcept;

    /// @return True if Apple devices decode the codec natively.
    [[nodiscard]] static bool apple_compatible(SourceCodec codec) noexcept;

    /**
     * @return The skip reason, or std::nullopt if the source should be converted.
     */
    [[nodiscard]] std::optional<std::string> should_skip_source(SourceCodec codec) const;

    /**
     * @return True only in compat mode for sources without a compatible target.
     */
    [[nodiscard]] bool best_effort_eligible(SourceCodec codec) const noexcept;
};

} // namespace qshift

#endif // QSHIFT_CODEC_POLICY_HPP
