#include "../../include/search_config.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace qshift {

namespace {
template <class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
} // namespace

std::string_view strategy_name(const Strategy& strategy) noexcept {
    return std::visit(overloaded{
        [](const CompressOnly&) { return std::string_view("compress"); },
        [](const SizeOnly&) { return std::string_view("size-only"); },
        [](const QualityMatch&) { return std::string_view("quality-match"); },
        [](const PreciseQualityMatch&) { return std::string_view("precise-quality"); },
        [](const PreciseQualityMatchWithCompression&) { return std::string_view("precise-quality-compress"); },
        [](const CompressWithQuality&) { return std::string_view("compress-quality"); },
        [](const Ultimate&) { return std::string_view("ultimate"); },
    }, strategy);
}

std::optional<Strategy> parse_strategy(const std::string_view name) {
    if (name == "compress") return CompressOnly{};
    if (name == "size-only") return SizeOnly{};
    if (name == "quality-match") return QualityMatch{};
    if (name == "precise-quality") return PreciseQualityMatch{};
    if (name == "precise-quality-compress") return PreciseQualityMatchWithCompression{};
    if (name == "compress-quality") return CompressWithQuality{};
    if (name == "ultimate") return Ultimate{};
    return std::nullopt;
}

std::optional<Strategy> strategy_for_intent(const std::string_view intent) {
    if (intent == "compress") return CompressOnly{};
    if (intent == "explore") return PreciseQualityMatch{};
    if (intent == "match-quality") return QualityMatch{};
    if (intent == "ultimate") return Ultimate{};
    return std::nullopt;
}

bool requires_verification(const Strategy& strategy) noexcept {
    return !std::holds_alternative<CompressOnly>(strategy) &&
           !std::holds_alternative<SizeOnly>(strategy);
}

bool measures_each_trial(const Strategy& strategy) noexcept {
    return std::holds_alternative<PreciseQualityMatch>(strategy) ||
           std::holds_alternative<PreciseQualityMatchWithCompression>(strategy) ||
           std::holds_alternative<Ultimate>(strategy);
}

bool quality_priority(const Strategy& strategy) noexcept {
    return measures_each_trial(strategy);
}

double QualityThresholds::floor_for(const MetricKind kind) const noexcept {
    switch (kind) {
        case MetricKind::MsSsim:  return min_ms_ssim;
        case MetricKind::SsimAll:
        case MetricKind::SsimY:   return min_ssim;
        case MetricKind::Psnr:    return min_psnr;
    }
    return min_ssim;
}

bool SizePolicy::allows(const std::uintmax_t output, const std::uintmax_t input) const noexcept {
    if (!tolerance_pct) return output < input;
    const double limit = static_cast<double>(input) * (1.0 + *tolerance_pct / 100.0);
    return static_cast<double>(output) <= limit;
}

std::string SizePolicy::describe() const {
    if (!tolerance_pct) return "<";
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << "<= +" << *tolerance_pct << "%";
    return oss.str();
}

unsigned derive_iteration_ceiling(const double range, const double precision, const SearchTuning& tuning) {
    const double steps = precision > 0.0 ? range / precision : 1.0;
    const double log_steps = steps > 1.0 ? std::ceil(std::log2(steps)) : 0.0;
    const auto ceiling = static_cast<unsigned>(log_steps) + 10u;
    return std::clamp(ceiling, tuning.min_iterations, tuning.max_iterations);
}

unsigned derive_zero_gains(const std::optional<double> duration_secs, const double range, const bool ultimate,
                           const SearchTuning& tuning) {
    unsigned base = ultimate ? tuning.ultimate_zero_gains : tuning.normal_zero_gains;
    if (duration_secs && *duration_secs >= tuning.long_duration_secs) {
        base = tuning.long_zero_gains;
    }
    const double factor = range >= 20.0 ? 1.0 : std::clamp(range / 20.0, 0.5, 1.0);
    const auto scaled = static_cast<unsigned>(std::lround(static_cast<double>(base) * factor));
    return std::max(3u, scaled);
}

} // namespace qshift
