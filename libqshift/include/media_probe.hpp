/**
 * @file media_probe.hpp
 * @brief Source characteristics gathered once per input file.
 */

#ifndef QSHIFT_MEDIA_PROBE_HPP
#define QSHIFT_MEDIA_PROBE_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace qshift {

/**
 * @brief Codec of the source video stream.
 */
enum class SourceCodec {
    H264,
    Hevc,
    Vp8,
    Vp9,
    Av1,
    Vvc,
    Av2,
    Mpeg2,
    Mpeg4,
    ProRes,
    DnxHd,
    Mjpeg,
    Ffv1,
    Utvideo,
    HuffYuv,
    RawVideo,
    Gif,
    Apng,
    WebpAnimated,
    Unknown
};

/**
 * @brief Codec produced by the exact encode path.
 */
enum class TargetCodec {
    Hevc, ///< libx265
    Av1,  ///< libsvtav1
    H264  ///< libx264
};

/**
 * @brief Chroma layout of the source pixels.
 */
enum class ChromaSubsampling {
    Yuv420,
    Yuv422,
    Yuv444,
    Rgb,
    Unknown
};

/**
 * @brief Optional content classification hint.
 *
 * Supplied by the caller (e.g. from the command line); the prober never
 * guesses it.
 */
enum class ContentType {
    Unknown,
    LiveAction,
    Animation,
    ScreenRecording,
    Gaming,
    FilmGrain
};

/**
 * @brief Immutable description of one source file.
 *
 * @details Fields the predictor strictly requires (dimensions, frame rate,
 * bitrate or duration) are optionals so that a missing value is visible
 * instead of silently defaulted. Refinement fields (GOP, chroma, depth)
 * fall back to neutral factors when absent.
 */
struct MediaProbe {
    std::filesystem::path path;              ///< Source file
    std::uintmax_t file_size = 0;            ///< Size on disk in bytes

    std::optional<unsigned> width;           ///< Luma width in pixels
    std::optional<unsigned> height;          ///< Luma height in pixels
    std::optional<double> frame_rate;        ///< Average frames per second
    std::optional<double> duration_secs;     ///< Container duration
    std::optional<std::uint64_t> bitrate;    ///< Video stream bitrate in bits/s

    SourceCodec codec = SourceCodec::Unknown;
    std::string codec_name;                  ///< Decoder name as reported by the prober
    std::optional<ChromaSubsampling> chroma;
    std::optional<unsigned> bit_depth;       ///< Bits per luma sample
    std::optional<bool> hdr;                 ///< PQ or HLG transfer characteristics
    bool bt2020 = false;                     ///< BT.2020 primaries
    std::optional<unsigned> gop_size;        ///< Frames between keyframes (estimated)
    std::optional<unsigned> b_frames;        ///< Reordering depth; 0 means no B-frames
    bool has_alpha = false;
    bool palette = false;                    ///< Indexed-palette pixel layout (e.g. GIF)
    bool lossless = false;                   ///< Lossless intra codec (FFV1, UT Video, HuffYUV, raw)

    std::optional<ContentType> content;      ///< Caller-supplied content hint
    std::optional<bool> film_grain;          ///< Caller-supplied grain hint

    /// @return Luma pixel count, or 0 when dimensions are unknown.
    [[nodiscard]] std::uint64_t pixels() const noexcept {
        return width && height ? static_cast<std::uint64_t>(*width) * *height : 0;
    }
};

/// @return Display name of a source codec (e.g. "h264").
std::string_view to_string(SourceCodec codec) noexcept;

/// @return Display name of a target codec ("hevc", "av1", "h264").
std::string_view to_string(TargetCodec codec) noexcept;

/// @return Display name of a content type.
std::string_view to_string(ContentType type) noexcept;

/**
 * @brief Maps a decoder or format name to a SourceCodec.
 *
 * Matching is case-insensitive and accepts the common aliases used by
 * ffmpeg ("h265", "x265", "libdav1d", "prores_ks", ...).
 *
 * @param name Codec name.
 * @return The matching codec, or SourceCodec::Unknown.
 */
SourceCodec parse_source_codec(std::string_view name);

/// @return The target for "hevc", "av1" or "h264", or std::nullopt.
std::optional<TargetCodec> parse_target_codec(std::string_view name);

/// @return The content type for a name produced by to_string(ContentType), or std::nullopt.
std::optional<ContentType> parse_content_type(std::string_view name);

} // namespace qshift

#endif // QSHIFT_MEDIA_PROBE_HPP
