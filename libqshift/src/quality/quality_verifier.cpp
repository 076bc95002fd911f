#include "../../include/quality_verifier.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/logger.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace qshift {

namespace {

constexpr std::array kChain{MetricKind::MsSsim, MetricKind::SsimAll, MetricKind::SsimY};

std::string fmt4(const double value) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4) << value;
    return oss.str();
}

} // namespace

QualityVerifier::QualityVerifier(IMetricTool& metric, VerifierTuning tuning, EventBus* bus)
    : metric_(metric), tuning_(tuning), bus_(bus) {}

double QualityVerifier::weight_for(const MetricKind primary) const noexcept {
    switch (primary) {
        case MetricKind::MsSsim:  return tuning_.ms_ssim_weight;
        case MetricKind::SsimAll: return tuning_.ssim_all_weight;
        case MetricKind::SsimY:   return tuning_.ssim_y_weight;
        case MetricKind::Psnr:    return 0.0;
    }
    return tuning_.ssim_all_weight;
}

double QualityVerifier::fuse(const MetricKind primary, const double value, const double psnr) const noexcept {
    const double w = weight_for(primary);
    const double norm = tuning_.psnr_norm_db > 0.0 ? std::clamp(psnr / tuning_.psnr_norm_db, 0.0, 1.0) : 0.0;
    return w * value + (1.0 - w) * norm;
}

double QualityVerifier::fused_threshold(const std::optional<double> duration_secs, const bool quality_priority,
                                        const bool relaxed) const noexcept {
    double threshold;
    if (duration_secs && *duration_secs < tuning_.short_duration_secs) {
        threshold = quality_priority ? tuning_.fused_quality_short : tuning_.fused_standard_short;
    } else if (duration_secs && *duration_secs >= tuning_.long_duration_secs) {
        threshold = quality_priority ? tuning_.fused_quality_long : tuning_.fused_standard_long;
    } else {
        threshold = quality_priority ? tuning_.fused_quality_normal : tuning_.fused_standard_normal;
    }
    if (relaxed) threshold -= tuning_.relaxed_delta;
    return threshold;
}

QualityReport QualityVerifier::verify(const VerifyRequest& request, const CallContext& ctx) {
    const std::string name = request.candidate.filename().string();
    QualityReport report;

    auto step_down = [&](const MetricKind from, const std::string& note, const LogLevel level) {
        report.notes.push_back(note);
        Logger::log(level, name + ": " + note, "Verifier");
        if (bus_) {
            const auto it = std::find(kChain.begin(), kChain.end(), from);
            if (it != kChain.end() && std::next(it) != kChain.end()) {
                bus_->publish(MetricFallbackEvent{request.reference, from, *std::next(it), note});
            }
        }
    };

    size_t start = 0;
    if (request.palette) {
        step_down(MetricKind::MsSsim, "palette layout incompatible with multi-scale metric", LogLevel::Warning);
        start = 1;
    } else if (request.duration_secs && *request.duration_secs >= tuning_.long_duration_secs &&
               !request.thresholds.force_ms_ssim_long) {
        step_down(MetricKind::MsSsim, "long input, multi-scale metric skipped", LogLevel::Info);
        start = 1;
    }

    std::optional<double> primary;
    for (size_t i = start; i < kChain.size() && !primary; ++i) {
        const auto kind = kChain[i];
        try {
            primary = metric_.measure(request.reference, request.candidate, kind, ctx);
            report.path = kind;
        } catch (const MetricUnavailable& e) {
            std::string note = std::string(to_string(kind)) + " unavailable (" +
                               std::string(to_string(e.reason())) + "): " + e.what();
            if (i + 1 < kChain.size()) note += "; falling back to " + std::string(to_string(kChain[i + 1]));
            step_down(kind, note, LogLevel::Warning);
        }
    }
    if (!primary) {
        std::string joined;
        for (const auto& n : report.notes) {
            if (!joined.empty()) joined += "; ";
            joined += n;
        }
        Logger::log(LogLevel::Error, name + ": quality unverifiable", "Verifier");
        throw QualityUnverifiable("quality unverifiable, every metric failed: " + joined);
    }

    report.readings[report.path] = *primary;
    report.floor = request.thresholds.floor_for(report.path);
    const double eps = tuning_.epsilon;
    bool passed = *primary >= report.floor - eps;

    try {
        const double psnr = metric_.measure(request.reference, request.candidate, MetricKind::Psnr, ctx);
        report.readings[MetricKind::Psnr] = psnr;
        report.fused_score = fuse(report.path, *primary, psnr);
        report.fused_threshold = fused_threshold(request.duration_secs, quality_priority(request.strategy),
                                                 request.thresholds.relaxed);
        passed = passed && *report.fused_score >= *report.fused_threshold - eps;
        if (psnr < request.thresholds.min_psnr - eps) {
            report.notes.push_back("psnr " + fmt4(psnr) + " below floor " + fmt4(request.thresholds.min_psnr));
            passed = false;
        }
    } catch (const MetricUnavailable& e) {
        report.notes.push_back(std::string("psnr unavailable: ") + e.what());
        Logger::log(LogLevel::Debug, name + ": psnr unavailable, primary metric decides alone", "Verifier");
    }

    report.passed = passed;
    Logger::log(passed ? LogLevel::Debug : LogLevel::Info, name + ": " + report.summary(), "Verifier");
    return report;
}

} // namespace qshift
