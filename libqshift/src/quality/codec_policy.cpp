#include "../../include/codec_policy.hpp"

namespace qshift {

bool CodecPolicy::is_modern(const SourceCodec codec) noexcept {
    switch (codec) {
        case SourceCodec::Hevc:
        case SourceCodec::Av1:
        case SourceCodec::Vvc:
        case SourceCodec::Av2:
            return true;
        default:
            return false;
    }
}

bool CodecPolicy::apple_compatible(const SourceCodec codec) noexcept {
    switch (codec) {
        case SourceCodec::Av1:
        case SourceCodec::Vp9:
        case SourceCodec::Vp8:
        case SourceCodec::Vvc:
        case SourceCodec::Av2:
            return false;
        default:
            return true;
    }
}

std::optional<std::string> CodecPolicy::should_skip_source(const SourceCodec codec) const {
    if (!is_modern(codec)) return std::nullopt;
    if (compat && !apple_compatible(codec)) return std::nullopt;
    return "already modern codec (" + std::string(to_string(codec)) + ")";
}

bool CodecPolicy::best_effort_eligible(const SourceCodec codec) const noexcept {
    return compat && !apple_compatible(codec);
}

} // namespace qshift
