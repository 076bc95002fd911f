#include "../../include/tuning.hpp"

namespace qshift {

const CodecCurve& PredictorTuning::curve(const TargetCodec target) const noexcept {
    switch (target) {
        case TargetCodec::Av1:  return av1;
        case TargetCodec::H264: return h264;
        case TargetCodec::Hevc: break;
    }
    return hevc;
}

PredictorTuning PredictorTuning::defaults() {
    PredictorTuning t;
    t.source_efficiency = {
        {SourceCodec::H264, 1.0},
        {SourceCodec::Hevc, 0.65},
        {SourceCodec::Vp8, 0.85},
        {SourceCodec::Vp9, 0.70},
        {SourceCodec::Av1, 0.50},
        {SourceCodec::Vvc, 0.35},
        {SourceCodec::Av2, 0.35},
        {SourceCodec::Mpeg4, 1.3},
        {SourceCodec::Mpeg2, 1.8},
        {SourceCodec::ProRes, 1.8},
        {SourceCodec::DnxHd, 1.8},
        {SourceCodec::Mjpeg, 2.5},
        {SourceCodec::Ffv1, 1.0},
        {SourceCodec::Utvideo, 1.0},
        {SourceCodec::HuffYuv, 1.0},
        {SourceCodec::RawVideo, 1.0},
        {SourceCodec::Gif, 3.0},
        {SourceCodec::Apng, 1.8},
        {SourceCodec::WebpAnimated, 0.9},
        {SourceCodec::Unknown, 1.0},
    };
    t.target_efficiency = {
        {TargetCodec::Av1, 0.5},
        {TargetCodec::Hevc, 0.7},
        {TargetCodec::H264, 1.0},
    };
    t.content_offset = {
        {ContentType::Unknown, 0.0},
        {ContentType::LiveAction, 0.0},
        {ContentType::Animation, 4.0},
        {ContentType::ScreenRecording, 5.0},
        {ContentType::Gaming, -1.0},
        {ContentType::FilmGrain, -3.0},
    };
    return t;
}

} // namespace qshift
