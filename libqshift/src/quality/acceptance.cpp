#include "../../include/acceptance.hpp"
#include "../../include/logger.hpp"
#include "../../include/random_utils.hpp"

#include <iomanip>
#include <sstream>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace qshift {

namespace {

std::string fmt(const double value, const int decimals) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(decimals) << value;
    return oss.str();
}

bool retryable(const std::error_code& ec) {
    return ec == std::errc::device_or_resource_busy ||
           ec == std::errc::permission_denied ||
           ec == std::errc::no_such_file_or_directory;
}

void discard(const fs::path& temp) {
    std::error_code ec;
    fs::remove(temp, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Can't remove temp artifact: " + temp.string() + " (" + ec.message() + ")",
                    "Commit");
    }
}

} // namespace

ConversionOutcome AcceptanceGate::decide(const AcceptanceInput& input) {
    std::string failed;

    if (!input.size_policy.allows(input.output_size, input.input_size)) {
        failed = "size " + std::to_string(input.output_size) + " not " + input.size_policy.describe() +
                 " input " + std::to_string(input.input_size) + " at " + fmt(input.parameter, 1);
    } else if (input.report && !input.report->passed) {
        const auto& r = *input.report;
        if (r.primary() < r.floor - 1e-12) {
            failed = "quality " + std::string(to_string(r.path)) + " " + fmt(r.primary(), 4) +
                     " < floor " + fmt(r.floor, 4);
        } else if (r.fused_score && r.fused_threshold && *r.fused_score < *r.fused_threshold) {
            failed = "fused score " + fmt(*r.fused_score, 4) + " < threshold " + fmt(*r.fused_threshold, 4);
        } else {
            failed = "quality check failed: " + r.summary();
        }
        failed += " at " + fmt(input.parameter, 1);
    }

    if (failed.empty()) {
        return Accepted{input.parameter, input.report, input.output_size, {}};
    }
    if (input.best_effort_eligible) {
        Logger::log(LogLevel::Warning, "best-effort: accepting despite " + failed, "Commit");
        return BestEffortAccepted{input.parameter, "best-effort: " + failed, input.output_size, {}};
    }
    return Rejected{RejectReason::SizeOrQualityNotMet, failed};
}

fs::path stage_copy(const fs::path& file, const fs::path& destination, std::error_code& ec) {
    const fs::path staged = destination.parent_path() /
                            ("." + destination.filename().string() + "." + RandomUtils::random_suffix() + ".tmp");
    fs::copy_file(file, staged, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        Logger::log(LogLevel::Warning, "Staging copy failed (" + ec.message() + ")", "Commit");
        discard(staged);
        return {};
    }
    return staged;
}

std::optional<fs::path> destination_for(const fs::path& source, const std::string_view extension,
                                        const CommitOptions& options) {
    const fs::path dir = options.output_dir ? *options.output_dir : source.parent_path();
    const std::string stem = source.stem().string();
    const std::string ext(extension);
    const fs::path dest = dir / (stem + ext);

    std::error_code ec;
    if (!fs::exists(dest, ec)) return dest;
    if (fs::equivalent(dest, source, ec)) {
        if (options.in_place) return dest;
        Logger::log(LogLevel::Warning, "Output would replace the source: " + source.string(), "Commit");
        return std::nullopt;
    }

    fs::path candidate = dir / (stem + "_qshift" + ext);
    for (int n = 2; fs::exists(candidate, ec); ++n) {
        candidate = dir / (stem + "_qshift_" + std::to_string(n) + ext);
    }
    return candidate;
}

CommitResult commit_artifact(const fs::path& temp, const fs::path& destination, const CommitOptions& options) {
    CommitResult result;
    std::error_code ec;

    const auto size = fs::file_size(temp, ec);
    if (ec || size == 0) {
        result.error = "temp artifact is missing or empty: " + temp.string();
        Logger::log(LogLevel::Warning, result.error, "Commit");
        discard(temp);
        return result;
    }

    if (options.dry_run) {
        Logger::log(LogLevel::Info, "[DRY-RUN] Would write: " + destination.string(), "Commit");
        discard(temp);
        result.ok = true;
        return result;
    }

    if (!destination.parent_path().empty()) {
        fs::create_directories(destination.parent_path(), ec);
        if (ec) {
            result.error = "cannot create " + destination.parent_path().string() + " (" + ec.message() + ")";
            Logger::log(LogLevel::Error, result.error, "Commit");
            discard(temp);
            return result;
        }
    }

    int retries = options.max_retries;
    fs::path source = temp;
    fs::path staged;
    while (retries > 0) {
        fs::rename(source, destination, ec);
        if (!ec) break;

        if (ec == std::errc::cross_device_link && staged.empty()) {
            // Stage a copy on the destination filesystem so the final step is still a rename.
            staged = stage_copy(source, destination, ec);
            if (ec) break;
            discard(temp);
            source = staged;
            continue;
        }
        if (!retryable(ec)) break;

        Logger::log(LogLevel::Debug, "Rename failed (" + ec.message() + "), retrying in " +
                    std::to_string(options.retry_delay.count()) + "ms...", "Commit");
        std::this_thread::sleep_for(options.retry_delay);
        --retries;
    }

    if (ec) {
        result.error = "rename to " + destination.string() + " failed (" + ec.message() + ")";
        Logger::log(LogLevel::Error, result.error, "Commit");
        discard(source);
        if (source != temp) discard(temp);
        return result;
    }

    Logger::log(LogLevel::Debug, "Committed " + destination.string(), "Commit");
    result.ok = true;
    result.destination = destination;
    return result;
}

} // namespace qshift
