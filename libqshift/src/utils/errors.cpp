#include "../../include/errors.hpp"

namespace qshift {

std::string_view to_string(const EncodeFailure::Kind kind) noexcept {
    switch (kind) {
        case EncodeFailure::Kind::NonZeroExit: return "non-zero exit";
        case EncodeFailure::Kind::EmptyOutput: return "empty output";
        case EncodeFailure::Kind::Stuck:       return "stuck";
        case EncodeFailure::Kind::SpawnFailed: return "spawn failed";
    }
    return "unknown";
}

std::string_view to_string(const MetricUnavailable::Reason reason) noexcept {
    switch (reason) {
        case MetricUnavailable::Reason::ToolMissing:        return "tool missing";
        case MetricUnavailable::Reason::DecodeIncompatible: return "decode incompatible";
        case MetricUnavailable::Reason::UnsupportedLayout:  return "unsupported layout";
    }
    return "unknown";
}

} // namespace qshift
