#include "../../include/media_prober.hpp"
#include "../../include/errors.hpp"
#include "../../include/logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/pixdesc.h>
}

#include <algorithm>
#include <system_error>
#include <vector>

namespace qshift {

namespace {

// closes the input on every exit path
struct FormatGuard {
    AVFormatContext* ctx = nullptr;
    ~FormatGuard() {
        if (ctx) avformat_close_input(&ctx);
    }
};

std::string av_error(const int err) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {};
    av_strerror(err, buf, sizeof(buf));
    return buf;
}

ChromaSubsampling chroma_of(const AVPixFmtDescriptor* desc) {
    if (desc->flags & AV_PIX_FMT_FLAG_RGB) return ChromaSubsampling::Rgb;
    if (desc->log2_chroma_w == 1 && desc->log2_chroma_h == 1) return ChromaSubsampling::Yuv420;
    if (desc->log2_chroma_w == 1 && desc->log2_chroma_h == 0) return ChromaSubsampling::Yuv422;
    if (desc->log2_chroma_w == 0 && desc->log2_chroma_h == 0) return ChromaSubsampling::Yuv444;
    return ChromaSubsampling::Unknown;
}

bool is_lossless_codec(const SourceCodec codec) {
    switch (codec) {
        case SourceCodec::Ffv1:
        case SourceCodec::Utvideo:
        case SourceCodec::HuffYuv:
        case SourceCodec::RawVideo:
            return true;
        default:
            return false;
    }
}

double rational_or_zero(const AVRational r) {
    return r.num > 0 && r.den > 0 ? av_q2d(r) : 0.0;
}

} // namespace

MediaProbe LibavMediaProber::probe(const std::filesystem::path& path) const {
    MediaProbe probe;
    probe.path = path;

    std::error_code ec;
    probe.file_size = std::filesystem::file_size(path, ec);
    if (ec) {
        throw ProbeError(ProbeError::Kind::Unreadable, {}, "cannot stat " + path.string() + ": " + ec.message());
    }

    FormatGuard fmt;
    if (const int err = avformat_open_input(&fmt.ctx, path.c_str(), nullptr, nullptr); err < 0) {
        throw ProbeError(ProbeError::Kind::Unreadable, {}, "failed to open container: " + av_error(err));
    }
    if (const int err = avformat_find_stream_info(fmt.ctx, nullptr); err < 0) {
        throw ProbeError(ProbeError::Kind::Unreadable, {}, "failed to read stream info: " + av_error(err));
    }

    const int index = av_find_best_stream(fmt.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
    if (index < 0) {
        throw ProbeError(ProbeError::Kind::Unreadable, {}, "no video stream in " + path.filename().string());
    }
    const AVStream* st = fmt.ctx->streams[index];
    const AVCodecParameters* par = st->codecpar;

    probe.codec_name = avcodec_get_name(par->codec_id);
    probe.codec = parse_source_codec(probe.codec_name);
    probe.lossless = is_lossless_codec(probe.codec);

    if (par->width > 0) probe.width = static_cast<unsigned>(par->width);
    if (par->height > 0) probe.height = static_cast<unsigned>(par->height);

    double fps = rational_or_zero(st->avg_frame_rate);
    if (fps <= 0.0) fps = rational_or_zero(st->r_frame_rate);
    if (fps > 0.0 && fps < 1000.0) probe.frame_rate = fps;

    if (fmt.ctx->duration != AV_NOPTS_VALUE && fmt.ctx->duration > 0) {
        probe.duration_secs = static_cast<double>(fmt.ctx->duration) / AV_TIME_BASE;
    } else if (st->duration != AV_NOPTS_VALUE && st->duration > 0) {
        probe.duration_secs = static_cast<double>(st->duration) * av_q2d(st->time_base);
    }

    if (par->bit_rate > 0) {
        probe.bitrate = static_cast<std::uint64_t>(par->bit_rate);
    } else if (fmt.ctx->bit_rate > 0) {
        probe.bitrate = static_cast<std::uint64_t>(fmt.ctx->bit_rate);
    }

    if (const auto* desc = av_pix_fmt_desc_get(static_cast<AVPixelFormat>(par->format))) {
        probe.bit_depth = static_cast<unsigned>(desc->comp[0].depth);
        probe.chroma = chroma_of(desc);
        probe.has_alpha = (desc->flags & AV_PIX_FMT_FLAG_ALPHA) != 0;
        probe.palette = (desc->flags & AV_PIX_FMT_FLAG_PAL) != 0;
    }
    if (par->codec_id == AV_CODEC_ID_GIF) probe.palette = true;

    if (par->color_trc != AVCOL_TRC_UNSPECIFIED) {
        probe.hdr = par->color_trc == AVCOL_TRC_SMPTE2084 || par->color_trc == AVCOL_TRC_ARIB_STD_B67;
    }
    probe.bt2020 = par->color_primaries == AVCOL_PRI_BT2020;
    probe.b_frames = static_cast<unsigned>(std::max(par->video_delay, 0));

    // keyframe interval from the first packets of the stream
    if (gop_scan_packets_ > 0) {
        AVPacket* pkt = av_packet_alloc();
        if (pkt) {
            std::vector<unsigned> keyframes;
            unsigned seen = 0;
            while (seen < gop_scan_packets_ && av_read_frame(fmt.ctx, pkt) >= 0) {
                if (pkt->stream_index == index) {
                    if (pkt->flags & AV_PKT_FLAG_KEY) keyframes.push_back(seen);
                    ++seen;
                }
                av_packet_unref(pkt);
            }
            av_packet_free(&pkt);
            if (keyframes.size() >= 2) {
                probe.gop_size = (keyframes.back() - keyframes.front()) /
                                 static_cast<unsigned>(keyframes.size() - 1);
            }
        }
    }

    Logger::log(LogLevel::Debug, path.filename().string() + ": " + probe.codec_name + " " +
                std::to_string(par->width) + "x" + std::to_string(par->height) +
                (probe.frame_rate ? " @" + std::to_string(*probe.frame_rate) : std::string()) +
                (probe.gop_size ? " gop=" + std::to_string(*probe.gop_size) : std::string()), "Probe");
    return probe;
}

} // namespace qshift
