/**
 * @file ffmpeg_encoder.hpp
 * @brief Encode capability backed by an external ffmpeg process.
 */

#ifndef QSHIFT_FFMPEG_ENCODER_HPP
#define QSHIFT_FFMPEG_ENCODER_HPP

#include "encoder.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qshift {

/**
 * @brief Which ffmpeg encoder family produces the video stream.
 */
enum class EncoderBackend {
    Software,     ///< libx265 / libsvtav1 / libx264
    VideoToolbox, ///< Apple hardware encoder
    Nvenc,        ///< NVIDIA hardware encoder
    Vaapi         ///< VA-API hardware encoder (Linux)
};

/// @return "software", "videotoolbox", "nvenc" or "vaapi".
std::string_view to_string(EncoderBackend backend) noexcept;

/// @return The backend for a name accepted by --fast-path, or std::nullopt.
std::optional<EncoderBackend> parse_encoder_backend(std::string_view name);

/**
 * @brief Construction options of FfmpegEncoder.
 */
struct FfmpegEncoderOptions {
    std::string ffmpeg = "ffmpeg";        ///< Binary name or path
    TargetCodec target = TargetCodec::Hevc;
    EncoderBackend backend = EncoderBackend::Software;
    bool fast_path = false;               ///< Approximate path; output is never committed
    unsigned threads = 0;                 ///< 0 lets the encoder decide
    std::string preset = "medium";        ///< x26x preset name; mapped for SVT-AV1
    std::string vaapi_device = "/dev/dri/renderD128";
};

/**
 * @brief Runs `ffmpeg -y -threads N -i in -c:v <encoder> <quality> ... out`.
 *
 * @details The software backends take the parameter as CRF. Hardware
 * backends map it onto their own quality knob (VideoToolbox `-q:v` is
 * inverted as 100 - 2 * parameter). Audio streams are copied.
 */
class FfmpegEncoder final : public IEncoder {
public:
    explicit FfmpegEncoder(FfmpegEncoderOptions options);

    [[nodiscard]] std::string_view get_name() const noexcept override { return name_; }
    [[nodiscard]] bool is_fast_path() const noexcept override { return options_.fast_path; }
    [[nodiscard]] TargetCodec target() const noexcept override { return options_.target; }
    [[nodiscard]] std::string_view output_extension() const noexcept override { return ".mp4"; }

    EncodeResult encode(const EncodeRequest& request, const CallContext& ctx) override;

    /// @return The full argv for a request, without running it.
    [[nodiscard]] std::vector<std::string> build_args(const EncodeRequest& request) const;

    /// @return ffmpeg encoder name for a target and backend (e.g. "hevc_nvenc").
    [[nodiscard]] static std::string encoder_name(TargetCodec target, EncoderBackend backend);

private:
    [[nodiscard]] std::vector<std::string> quality_args(double parameter) const;

    FfmpegEncoderOptions options_;
    std::string name_;
};

} // namespace qshift

#endif // QSHIFT_FFMPEG_ENCODER_HPP
