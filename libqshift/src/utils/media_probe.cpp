#include "../../include/media_probe.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace qshift {

std::string_view to_string(const SourceCodec codec) noexcept {
    switch (codec) {
        case SourceCodec::H264:         return "h264";
        case SourceCodec::Hevc:         return "hevc";
        case SourceCodec::Vp8:          return "vp8";
        case SourceCodec::Vp9:          return "vp9";
        case SourceCodec::Av1:          return "av1";
        case SourceCodec::Vvc:          return "vvc";
        case SourceCodec::Av2:          return "av2";
        case SourceCodec::Mpeg2:        return "mpeg2";
        case SourceCodec::Mpeg4:        return "mpeg4";
        case SourceCodec::ProRes:       return "prores";
        case SourceCodec::DnxHd:        return "dnxhd";
        case SourceCodec::Mjpeg:        return "mjpeg";
        case SourceCodec::Ffv1:         return "ffv1";
        case SourceCodec::Utvideo:      return "utvideo";
        case SourceCodec::HuffYuv:      return "huffyuv";
        case SourceCodec::RawVideo:     return "rawvideo";
        case SourceCodec::Gif:          return "gif";
        case SourceCodec::Apng:         return "apng";
        case SourceCodec::WebpAnimated: return "webp";
        case SourceCodec::Unknown:      return "unknown";
    }
    return "unknown";
}

std::string_view to_string(const TargetCodec codec) noexcept {
    switch (codec) {
        case TargetCodec::Hevc: return "hevc";
        case TargetCodec::Av1:  return "av1";
        case TargetCodec::H264: return "h264";
    }
    return "unknown";
}

std::string_view to_string(const ContentType type) noexcept {
    switch (type) {
        case ContentType::Unknown:         return "unknown";
        case ContentType::LiveAction:      return "live-action";
        case ContentType::Animation:       return "animation";
        case ContentType::ScreenRecording: return "screen";
        case ContentType::Gaming:          return "gaming";
        case ContentType::FilmGrain:       return "film-grain";
    }
    return "unknown";
}

SourceCodec parse_source_codec(const std::string_view name) {
    std::string lower(name);
    std::ranges::transform(lower, lower.begin(),
                           [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static constexpr std::array<std::pair<std::string_view, SourceCodec>, 34> aliases{{
        {"h264", SourceCodec::H264}, {"avc", SourceCodec::H264}, {"avc1", SourceCodec::H264},
        {"x264", SourceCodec::H264}, {"libx264", SourceCodec::H264},
        {"hevc", SourceCodec::Hevc}, {"h265", SourceCodec::Hevc}, {"x265", SourceCodec::Hevc},
        {"libx265", SourceCodec::Hevc}, {"hvc1", SourceCodec::Hevc},
        {"vp8", SourceCodec::Vp8}, {"vp9", SourceCodec::Vp9}, {"libvpx-vp9", SourceCodec::Vp9},
        {"av1", SourceCodec::Av1}, {"libdav1d", SourceCodec::Av1}, {"libaom-av1", SourceCodec::Av1},
        {"libsvtav1", SourceCodec::Av1},
        {"vvc", SourceCodec::Vvc}, {"h266", SourceCodec::Vvc}, {"av2", SourceCodec::Av2},
        {"mpeg2video", SourceCodec::Mpeg2}, {"mpeg2", SourceCodec::Mpeg2},
        {"mpeg4", SourceCodec::Mpeg4}, {"prores", SourceCodec::ProRes}, {"prores_ks", SourceCodec::ProRes},
        {"dnxhd", SourceCodec::DnxHd}, {"mjpeg", SourceCodec::Mjpeg}, {"ffv1", SourceCodec::Ffv1},
        {"utvideo", SourceCodec::Utvideo}, {"huffyuv", SourceCodec::HuffYuv},
        {"rawvideo", SourceCodec::RawVideo}, {"gif", SourceCodec::Gif}, {"apng", SourceCodec::Apng},
        {"webp", SourceCodec::WebpAnimated},
    }};

    for (const auto& [alias, codec] : aliases) {
        if (lower == alias) return codec;
    }
    return SourceCodec::Unknown;
}

std::optional<TargetCodec> parse_target_codec(const std::string_view name) {
    for (const auto codec : {TargetCodec::Hevc, TargetCodec::Av1, TargetCodec::H264}) {
        if (name == to_string(codec)) return codec;
    }
    if (name == "h265" || name == "x265") return TargetCodec::Hevc;
    if (name == "x264") return TargetCodec::H264;
    return std::nullopt;
}

std::optional<ContentType> parse_content_type(const std::string_view name) {
    for (const auto type : {ContentType::Unknown, ContentType::LiveAction, ContentType::Animation,
                            ContentType::ScreenRecording, ContentType::Gaming, ContentType::FilmGrain}) {
        if (name == to_string(type)) return type;
    }
    return std::nullopt;
}

} // namespace qshift
