#include "../../include/ffmpeg_encoder.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/process_runner.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>

namespace qshift {

namespace {

std::string format_number(const double value, const int decimals) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return buf;
}

/// x26x preset names mapped to SVT-AV1 numeric presets.
std::string svtav1_preset(const std::string& preset) {
    if (preset == "ultrafast" || preset == "superfast") return "12";
    if (preset == "veryfast") return "10";
    if (preset == "faster" || preset == "fast") return "8";
    if (preset == "slow") return "4";
    if (preset == "slower" || preset == "veryslow") return "2";
    return "6";
}

} // namespace

std::string_view to_string(const EncoderBackend backend) noexcept {
    switch (backend) {
        case EncoderBackend::Software:     return "software";
        case EncoderBackend::VideoToolbox: return "videotoolbox";
        case EncoderBackend::Nvenc:        return "nvenc";
        case EncoderBackend::Vaapi:        return "vaapi";
    }
    return "unknown";
}

std::optional<EncoderBackend> parse_encoder_backend(const std::string_view name) {
    if (name == "software" || name == "sample") return EncoderBackend::Software;
    if (name == "videotoolbox") return EncoderBackend::VideoToolbox;
    if (name == "nvenc") return EncoderBackend::Nvenc;
    if (name == "vaapi") return EncoderBackend::Vaapi;
    return std::nullopt;
}

FfmpegEncoder::FfmpegEncoder(FfmpegEncoderOptions options)
    : options_(std::move(options)),
      name_(encoder_name(options_.target, options_.backend)) {}

std::string FfmpegEncoder::encoder_name(const TargetCodec target, const EncoderBackend backend) {
    std::string codec;
    switch (target) {
        case TargetCodec::Hevc: codec = "hevc"; break;
        case TargetCodec::Av1:  codec = "av1"; break;
        case TargetCodec::H264: codec = "h264"; break;
    }
    switch (backend) {
        case EncoderBackend::Software:
            switch (target) {
                case TargetCodec::Hevc: return "libx265";
                case TargetCodec::Av1:  return "libsvtav1";
                case TargetCodec::H264: return "libx264";
            }
            break;
        case EncoderBackend::VideoToolbox: return codec + "_videotoolbox";
        case EncoderBackend::Nvenc:        return codec + "_nvenc";
        case EncoderBackend::Vaapi:        return codec + "_vaapi";
    }
    return codec;
}

std::vector<std::string> FfmpegEncoder::quality_args(const double parameter) const {
    switch (options_.backend) {
        case EncoderBackend::Software:
            // libsvtav1 only takes integral CRF values.
            if (options_.target == TargetCodec::Av1) {
                return {"-crf", format_number(std::round(parameter), 0)};
            }
            return {"-crf", format_number(parameter, 1)};
        case EncoderBackend::VideoToolbox:
            return {"-q:v", format_number(std::clamp(100.0 - parameter * 2.0, 1.0, 100.0), 0)};
        case EncoderBackend::Nvenc:
            return {"-rc", "vbr", "-cq", format_number(std::clamp(parameter, 0.0, 51.0), 0)};
        case EncoderBackend::Vaapi:
            return {"-global_quality", format_number(std::clamp(parameter, 1.0, 51.0), 0)};
    }
    return {};
}

std::vector<std::string> FfmpegEncoder::build_args(const EncodeRequest& request) const {
    std::vector<std::string> args{options_.ffmpeg, "-hide_banner", "-nostdin", "-y"};

    if (options_.backend == EncoderBackend::Vaapi) {
        args.insert(args.end(), {"-vaapi_device", options_.vaapi_device});
    }
    args.insert(args.end(), {"-threads", std::to_string(options_.threads)});
    args.insert(args.end(), {"-i", request.input.string()});
    if (request.sample_secs && *request.sample_secs > 0.0) {
        args.insert(args.end(), {"-t", format_number(*request.sample_secs, 3)});
    }
    args.insert(args.end(), {"-map", "0:v:0", "-map", "0:a?", "-c:a", "copy"});
    args.insert(args.end(), {"-c:v", name_});

    const auto quality = quality_args(request.parameter);
    args.insert(args.end(), quality.begin(), quality.end());

    if (options_.backend == EncoderBackend::Software) {
        switch (options_.target) {
            case TargetCodec::Hevc:
                args.insert(args.end(), {"-preset", options_.preset, "-tag:v", "hvc1",
                                         "-x265-params", "log-level=error"});
                break;
            case TargetCodec::Av1:
                args.insert(args.end(), {"-svtav1-params",
                                         "tune=0:film-grain=0:preset=" + svtav1_preset(options_.preset)});
                break;
            case TargetCodec::H264:
                args.insert(args.end(), {"-preset", options_.preset, "-profile:v", "high"});
                break;
        }
    } else if (options_.backend == EncoderBackend::Vaapi) {
        args.insert(args.end(), {"-vf", "format=nv12,hwupload"});
    } else if (options_.target == TargetCodec::Hevc) {
        args.insert(args.end(), {"-tag:v", "hvc1"});
    }

    args.push_back(request.output.string());
    return args;
}

EncodeResult FfmpegEncoder::encode(const EncodeRequest& request, const CallContext& ctx) {
    remove_quietly(request.output, "Encoder");
    const auto result = run_process(build_args(request), ctx);

    switch (result.termination) {
        case ProcessResult::Termination::SpawnFailed:
            throw EncodeFailure(EncodeFailure::Kind::SpawnFailed,
                                "cannot start " + options_.ffmpeg, result.stderr_text);
        case ProcessResult::Termination::Stuck:
            remove_quietly(request.output, "Encoder");
            throw EncodeFailure(EncodeFailure::Kind::Stuck,
                                name_ + " stopped reporting progress at parameter " +
                                format_number(request.parameter, 1),
                                format_error_tail(result.stderr_text));
        case ProcessResult::Termination::Signaled:
        case ProcessResult::Termination::Exited:
            break;
    }

    if (!result.ok()) {
        remove_quietly(request.output, "Encoder");
        const auto tail = format_error_tail(result.stderr_text);
        Logger::log(LogLevel::Debug, name_ + " exited with " + std::to_string(result.exit_code) + ": " + tail,
                    "Encoder");
        throw EncodeFailure(EncodeFailure::Kind::NonZeroExit,
                            name_ + " exited with status " + std::to_string(result.exit_code) +
                            " at parameter " + format_number(request.parameter, 1) + ": " + tail,
                            tail);
    }

    const auto size = file_size_if_exists(request.output);
    if (!size || *size == 0) {
        remove_quietly(request.output, "Encoder");
        throw EncodeFailure(EncodeFailure::Kind::EmptyOutput,
                            name_ + " produced no output at parameter " + format_number(request.parameter, 1),
                            format_error_tail(result.stderr_text));
    }
    return {*size};
}

} // namespace qshift
