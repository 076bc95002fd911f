#include "../../include/quality_report.hpp"
#include <iomanip>
#include <sstream>

namespace qshift {

std::string_view to_string(const MetricKind kind) noexcept {
    switch (kind) {
        case MetricKind::MsSsim:  return "ms-ssim";
        case MetricKind::SsimAll: return "ssim-all";
        case MetricKind::SsimY:   return "ssim-y";
        case MetricKind::Psnr:    return "psnr";
    }
    return "unknown";
}

std::string QualityReport::summary() const {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(4);
    oss << (passed ? "pass" : "fail") << " via " << to_string(path);
    for (const auto& [kind, value] : readings) {
        oss << " " << to_string(kind) << "=" << value;
    }
    oss << " (floor " << floor << ")";
    if (fused_score) {
        oss << " fused=" << *fused_score;
        if (fused_threshold) oss << " (threshold " << *fused_threshold << ")";
    }
    return oss.str();
}

} // namespace qshift
