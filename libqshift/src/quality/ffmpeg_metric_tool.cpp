#include "../../include/ffmpeg_metric_tool.hpp"
#include "../../include/errors.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/process_runner.hpp"
#include "../../include/random_utils.hpp"

#include <charconv>
#include <cmath>
#include <limits>
#include <sstream>

namespace qshift {

namespace {

constexpr double kInfinitePsnr = 100.0;

/// @return The number after the last occurrence of `key` in `text`.
std::optional<double> number_after_last(std::string_view text, std::string_view key) {
    const auto pos = text.rfind(key);
    if (pos == std::string_view::npos) return std::nullopt;
    auto rest = text.substr(pos + key.size());
    while (!rest.empty() && rest.front() == ' ') rest.remove_prefix(1);
    if (rest.substr(0, 3) == "inf") return std::numeric_limits<double>::infinity();
    double value = 0.0;
    const auto [ptr, ec] = std::from_chars(rest.data(), rest.data() + rest.size(), value);
    if (ec != std::errc() || ptr == rest.data()) return std::nullopt;
    return value;
}

/// @return The last line of `text` that contains `marker`.
std::string_view last_line_with(std::string_view text, std::string_view marker) {
    const auto pos = text.rfind(marker);
    if (pos == std::string_view::npos) return {};
    const auto begin = text.find_last_of("\r\n", pos);
    const auto start = begin == std::string_view::npos ? 0 : begin + 1;
    const auto end = text.find_first_of("\r\n", pos);
    return text.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
}

bool filter_missing(std::string_view stderr_text, std::string_view filter) {
    return stderr_text.find("No such filter: '" + std::string(filter) + "'") != std::string_view::npos ||
           stderr_text.find("No such filter: " + std::string(filter)) != std::string_view::npos;
}

/// Maps a failed metric process to the matching MetricUnavailable.
[[noreturn]] void throw_unavailable(const ProcessResult& result, std::string_view filter,
                                    const std::string& what) {
    if (result.termination == ProcessResult::Termination::SpawnFailed) {
        throw MetricUnavailable(MetricUnavailable::Reason::ToolMissing, what + ": " + result.stderr_text);
    }
    if (filter_missing(result.stderr_text, filter)) {
        throw MetricUnavailable(MetricUnavailable::Reason::ToolMissing,
                                what + ": ffmpeg lacks the " + std::string(filter) + " filter");
    }
    if (result.termination == ProcessResult::Termination::Stuck) {
        throw MetricUnavailable(MetricUnavailable::Reason::DecodeIncompatible,
                                what + ": metric process stopped reporting progress");
    }
    throw MetricUnavailable(MetricUnavailable::Reason::DecodeIncompatible,
                            what + ": " + format_error_tail(result.stderr_text));
}

} // namespace

FfmpegMetricTool::FfmpegMetricTool(std::string ffmpeg, std::filesystem::path scratch_dir)
    : ffmpeg_(std::move(ffmpeg)),
      scratch_dir_(scratch_dir.empty() ? std::filesystem::temp_directory_path() : std::move(scratch_dir)) {}

std::vector<std::string> FfmpegMetricTool::ssim_graphs() {
    return {
        "[0:v]scale='iw-mod(iw,2)':'ih-mod(ih,2)':flags=bicubic[ref];[ref][1:v]ssim",
        "[0:v]format=yuv420p[ref];[1:v]format=yuv420p[cand];[ref][cand]ssim",
        "ssim",
    };
}

std::optional<double> FfmpegMetricTool::parse_ssim_all(std::string_view stderr_text) {
    const auto line = last_line_with(stderr_text, "All:");
    if (line.empty()) return std::nullopt;
    const auto value = number_after_last(line, "All:");
    if (!value || !std::isfinite(*value)) return std::nullopt;
    return value;
}

std::optional<double> FfmpegMetricTool::parse_ssim_y(std::string_view stderr_text) {
    const auto line = last_line_with(stderr_text, "SSIM Y:");
    if (line.empty()) return std::nullopt;
    const auto value = number_after_last(line, "Y:");
    if (!value || !std::isfinite(*value)) return std::nullopt;
    return value;
}

std::optional<double> FfmpegMetricTool::parse_psnr(std::string_view stderr_text) {
    const auto line = last_line_with(stderr_text, "average:");
    if (line.empty()) return std::nullopt;
    const auto value = number_after_last(line, "average:");
    if (!value) return std::nullopt;
    if (std::isinf(*value)) return kInfinitePsnr;
    return value;
}

std::optional<double> FfmpegMetricTool::parse_ms_ssim_csv(std::string_view csv) {
    std::istringstream in{std::string(csv)};
    std::string line;
    if (!std::getline(in, line)) return std::nullopt;

    int column = -1;
    {
        std::istringstream header(line);
        std::string cell;
        for (int i = 0; std::getline(header, cell, ','); ++i) {
            if (!cell.empty() && cell.back() == '\r') cell.pop_back();
            if (cell == "float_ms_ssim") {
                column = i;
                break;
            }
        }
    }
    if (column < 0) return std::nullopt;

    double sum = 0.0;
    size_t frames = 0;
    while (std::getline(in, line)) {
        std::istringstream row(line);
        std::string cell;
        for (int i = 0; std::getline(row, cell, ','); ++i) {
            if (i != column) continue;
            double value = 0.0;
            const auto [ptr, ec] = std::from_chars(cell.data(), cell.data() + cell.size(), value);
            if (ec == std::errc() && ptr != cell.data() && std::isfinite(value)) {
                sum += value;
                ++frames;
            }
            break;
        }
    }
    if (frames == 0) return std::nullopt;
    return sum / static_cast<double>(frames);
}

std::vector<std::string> FfmpegMetricTool::base_args(const std::filesystem::path& reference,
                                                     const std::filesystem::path& candidate,
                                                     const std::string& graph) const {
    return {ffmpeg_, "-hide_banner", "-nostdin",
            "-i", reference.string(), "-i", candidate.string(),
            "-lavfi", graph, "-f", "null", "-"};
}

double FfmpegMetricTool::measure(const std::filesystem::path& reference,
                                 const std::filesystem::path& candidate,
                                 const MetricKind kind,
                                 const CallContext& ctx) {
    switch (kind) {
        case MetricKind::MsSsim:  return run_ms_ssim(reference, candidate, ctx);
        case MetricKind::SsimAll:
        case MetricKind::SsimY:   return run_ssim(reference, candidate, kind, ctx);
        case MetricKind::Psnr:    return run_psnr(reference, candidate, ctx);
    }
    throw MetricUnavailable(MetricUnavailable::Reason::ToolMissing, "unknown metric");
}

double FfmpegMetricTool::run_ssim(const std::filesystem::path& reference,
                                  const std::filesystem::path& candidate,
                                  const MetricKind kind,
                                  const CallContext& ctx) {
    const std::string what(to_string(kind));
    const auto graphs = ssim_graphs();
    std::optional<ProcessResult> last;

    for (size_t i = 0; i < graphs.size(); ++i) {
        auto result = run_process(base_args(reference, candidate, graphs[i]), ctx);
        if (result.ok()) {
            const auto value = kind == MetricKind::SsimAll ? parse_ssim_all(result.stderr_text)
                                                           : parse_ssim_y(result.stderr_text);
            if (value) return *value;
        }
        if (result.termination == ProcessResult::Termination::SpawnFailed ||
            filter_missing(result.stderr_text, "ssim")) {
            throw_unavailable(result, "ssim", what);
        }
        Logger::log(LogLevel::Debug, what + " graph " + std::to_string(i + 1) + " of " +
                    std::to_string(graphs.size()) + " failed: " + format_error_tail(result.stderr_text),
                    "Verifier");
        last = std::move(result);
    }
    if (last && last->ok()) {
        throw MetricUnavailable(MetricUnavailable::Reason::DecodeIncompatible,
                                what + ": no SSIM summary in ffmpeg output");
    }
    throw_unavailable(*last, "ssim", what);
}

double FfmpegMetricTool::run_psnr(const std::filesystem::path& reference,
                                  const std::filesystem::path& candidate,
                                  const CallContext& ctx) {
    const auto graph = "[0:v]scale='iw-mod(iw,2)':'ih-mod(ih,2)':flags=bicubic[ref];[ref][1:v]psnr";
    const auto result = run_process(base_args(reference, candidate, graph), ctx);
    if (!result.ok()) throw_unavailable(result, "psnr", "psnr");
    const auto value = parse_psnr(result.stderr_text);
    if (!value) {
        throw MetricUnavailable(MetricUnavailable::Reason::DecodeIncompatible,
                                "psnr: no PSNR summary in ffmpeg output");
    }
    return *value;
}

double FfmpegMetricTool::run_ms_ssim(const std::filesystem::path& reference,
                                     const std::filesystem::path& candidate,
                                     const CallContext& ctx) {
    const auto log_path = scratch_dir_ / ("qshift-msssim-" + RandomUtils::random_suffix() + ".csv");
    // libvmaf takes the distorted stream first.
    const std::string graph =
        "[0:v]scale='iw-mod(iw,2)':'ih-mod(ih,2)':flags=bicubic,format=yuv420p[ref];"
        "[1:v]scale='iw-mod(iw,2)':'ih-mod(ih,2)':flags=bicubic,format=yuv420p[cand];"
        "[cand][ref]libvmaf=feature=name=float_ms_ssim:log_fmt=csv:log_path=" + log_path.string();

    struct LogGuard {
        std::filesystem::path path;
        ~LogGuard() { remove_quietly(path, "Verifier"); }
    } guard{log_path};

    const auto result = run_process(base_args(reference, candidate, graph), ctx);
    if (!result.ok()) throw_unavailable(result, "libvmaf", "ms-ssim");

    std::string csv;
    try {
        csv = read_text_file(log_path);
    } catch (const std::runtime_error& e) {
        throw MetricUnavailable(MetricUnavailable::Reason::DecodeIncompatible,
                                std::string("ms-ssim: libvmaf log missing: ") + e.what());
    }
    const auto value = parse_ms_ssim_csv(csv);
    if (!value) {
        throw MetricUnavailable(MetricUnavailable::Reason::DecodeIncompatible,
                                "ms-ssim: no float_ms_ssim values in libvmaf log");
    }
    return *value;
}

} // namespace qshift
