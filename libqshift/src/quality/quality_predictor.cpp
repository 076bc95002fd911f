#include "../../include/quality_predictor.hpp"
#include "../../include/errors.hpp"
#include <algorithm>
#include <cmath>
#include <iterator>

namespace qshift {

namespace {

double gop_factor(const PredictorTuning& t, const std::optional<unsigned>& gop,
                  const std::optional<unsigned>& b_frames) {
    double base = 1.0;
    if (gop) {
        const auto it = t.gop_factors.lower_bound(*gop);
        base = it != t.gop_factors.end() ? it->second : t.gop_factor_above;
    }
    double bonus = 1.0;
    if (b_frames) {
        const auto it = t.b_frame_bonus.find(*b_frames);
        bonus = it != t.b_frame_bonus.end() ? it->second : t.b_frame_bonus_above;
    }
    return base * bonus;
}

double resolution_factor(const PredictorTuning& t, const std::uint64_t pixels) {
    const auto& curve = t.resolution_curve;
    if (curve.empty()) return 1.0;
    const double mp = static_cast<double>(pixels) / 1'000'000.0;

    const auto upper = curve.upper_bound(mp);
    if (upper == curve.end()) {
        const auto& [last_mp, last] = *curve.rbegin();
        if (last_mp <= 0.0) return last;
        return t.resolution_floor + (last - t.resolution_floor) * std::min(1.0, last_mp / mp);
    }
    if (upper == curve.begin()) return upper->second;
    const auto lower = std::prev(upper);
    const double span = (mp - lower->first) / (upper->first - lower->first);
    return lower->second + (upper->second - lower->second) * span;
}

double aspect_factor(const PredictorTuning& t, const unsigned width, const unsigned height) {
    const double ratio = static_cast<double>(width) / std::max(1u, height);
    if (ratio > t.ultra_wide_aspect) return t.ultra_wide_aspect_factor;
    if (ratio > t.wide_aspect) return t.wide_aspect_factor;
    if (ratio < t.tall_aspect) return t.tall_aspect_factor;
    return 1.0;
}

// content complexity estimated from how far the source bpp sits above what
// a typical encode at this resolution would use
double complexity_factor(const PredictorTuning& t, const double raw_bpp, const std::uint64_t pixels) {
    double expected = 0.0;
    for (const auto& [above, bpp] : t.expected_bpp) {
        if (pixels > above) expected = bpp;
    }
    if (expected <= 0.0) return 1.0;

    const double ratio = raw_bpp / expected;
    if (ratio > t.complexity_high_ratio) return t.complexity_max_factor;
    if (ratio > 1.0) {
        return 1.0 + (t.complexity_max_factor - 1.0) * (ratio - 1.0) / (t.complexity_high_ratio - 1.0);
    }
    if (ratio > t.complexity_low_ratio) return 1.0;
    return t.complexity_low_factor;
}

template <typename K>
double lookup(const std::map<K, double>& table, const K key, const double fallback) {
    const auto it = table.find(key);
    return it != table.end() ? it->second : fallback;
}

} // namespace

std::string_view to_string(const Confidence confidence) noexcept {
    switch (confidence) {
        case Confidence::Low:    return "low";
        case Confidence::Medium: return "medium";
        case Confidence::High:   return "high";
    }
    return "low";
}

QualityPredictor::QualityPredictor(PredictorTuning tuning)
    : tuning_(std::move(tuning)) {}

BppBreakdown QualityPredictor::effective_bpp(const MediaProbe& probe, const TargetCodec target) const {
    if (!probe.width || !probe.height || *probe.width == 0 || *probe.height == 0) {
        throw ProbeError::missing("resolution");
    }
    if (!probe.frame_rate || *probe.frame_rate <= 0.0) {
        throw ProbeError::missing("frame_rate");
    }

    const auto pixels = static_cast<double>(probe.pixels());
    const double fps = *probe.frame_rate;

    BppBreakdown b;
    if (probe.bitrate && *probe.bitrate > 0) {
        b.raw_bpp = static_cast<double>(*probe.bitrate) / fps / pixels;
    } else if (probe.duration_secs && *probe.duration_secs > 0.0 && probe.file_size > 0) {
        const double frames = std::max(1.0, std::floor(*probe.duration_secs * fps));
        b.raw_bpp = static_cast<double>(probe.file_size) * 8.0 / frames / pixels;
    } else {
        throw ProbeError::missing("bitrate");
    }

    b.source_efficiency = lookup(tuning_.source_efficiency, probe.codec, 1.0);
    b.target_efficiency = lookup(tuning_.target_efficiency, target, 1.0);
    b.gop = gop_factor(tuning_, probe.gop_size, probe.b_frames);

    if (probe.chroma) {
        switch (*probe.chroma) {
            case ChromaSubsampling::Yuv444: b.chroma = tuning_.chroma_444_factor; break;
            case ChromaSubsampling::Yuv422: b.chroma = tuning_.chroma_422_factor; break;
            case ChromaSubsampling::Rgb:    b.chroma = tuning_.chroma_rgb_factor; break;
            case ChromaSubsampling::Yuv420:
            case ChromaSubsampling::Unknown: break;
        }
    }

    if (probe.hdr.value_or(false)) {
        b.hdr = tuning_.hdr_factor;
    } else if (probe.bt2020) {
        b.hdr = tuning_.bt2020_factor;
    }

    b.aspect = aspect_factor(tuning_, *probe.width, *probe.height);
    b.complexity = complexity_factor(tuning_, b.raw_bpp, probe.pixels());
    b.grain = probe.film_grain.value_or(false) ? tuning_.grain_factor : 1.0;
    b.resolution = resolution_factor(tuning_, probe.pixels());
    b.alpha = probe.has_alpha ? tuning_.alpha_factor : 1.0;

    if (probe.bit_depth) {
        if (const auto it = tuning_.bit_depth_factor.find(*probe.bit_depth);
            it != tuning_.bit_depth_factor.end()) {
            b.depth = it->second;
        } else if (*probe.bit_depth <= 8 && (probe.palette || probe.codec == SourceCodec::Gif)) {
            b.depth = tuning_.palette_depth_factor;
        }
    }

    const double eff = b.raw_bpp * b.gop * b.chroma * b.hdr * b.aspect * b.complexity
                       * b.grain * b.resolution * b.alpha
                       / b.source_efficiency / b.depth / b.target_efficiency;
    b.effective_bpp = std::clamp(eff, tuning_.safe_bpp_min, tuning_.safe_bpp_max);
    return b;
}

double QualityPredictor::parameter_for_bpp(const double effective_bpp, const TargetCodec target) const {
    const CodecCurve& c = tuning_.curve(target);
    const double bpp = std::clamp(effective_bpp, tuning_.safe_bpp_min, tuning_.safe_bpp_max);

    double param = c.base - c.scale * std::log2(bpp * 100.0);
    if (bpp < c.low_bpp_threshold) {
        param = std::min(param, c.low_bpp_cap);
    } else if (bpp > c.high_bpp_threshold) {
        param = std::max(param, c.high_bpp_floor);
    }
    param = std::round(param * 2.0) / 2.0;
    return std::clamp(param, c.min, c.max);
}

QualityTarget QualityPredictor::predict(const MediaProbe& probe, const TargetCodec target) const {
    QualityTarget result;
    result.breakdown = effective_bpp(probe, target);

    double param = parameter_for_bpp(result.breakdown.effective_bpp, target);
    if (probe.content) {
        const CodecCurve& c = tuning_.curve(target);
        param = std::clamp(param + lookup(tuning_.content_offset, *probe.content, 0.0), c.min, c.max);
    }
    result.parameter = param;

    result.confidence_score = confidence_score(probe);
    if (result.confidence_score >= 0.85) {
        result.confidence = Confidence::High;
    } else if (result.confidence_score >= 0.60) {
        result.confidence = Confidence::Medium;
    } else {
        result.confidence = Confidence::Low;
    }
    return result;
}

double QualityPredictor::confidence_score(const MediaProbe& probe) {
    struct Item {
        bool present;
        double weight;
    };
    const Item items[] = {
        {probe.pixels() > 0, 25.0},
        {probe.file_size > 0 || probe.bitrate.has_value(), 20.0},
        {probe.codec != SourceCodec::Unknown, 8.0},
        {probe.bitrate.has_value(), 15.0},
        {probe.gop_size.has_value(), 4.0},
        {probe.b_frames.has_value(), 3.0},
        {probe.chroma.has_value(), 3.0},
        {probe.hdr.has_value(), 3.0},
        {probe.content.has_value(), 2.0},
        {probe.duration_secs.has_value(), 4.0},
        {probe.frame_rate.has_value(), 4.0},
        {probe.bit_depth.has_value(), 3.0},
    };

    double score = 0.0;
    double max_score = 0.0;
    for (const auto& [present, weight] : items) {
        max_score += weight;
        if (present) score += weight;
    }
    return std::clamp(score / max_score, 0.0, 1.0);
}

} // namespace qshift
