#include "../../include/conversion_executor.hpp"
#include "../../include/errors.hpp"
#include "../../include/events.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include "../../include/mime_detector.hpp"
#include "../../include/quality_verifier.hpp"
#include "../../include/search_engine.hpp"

#include <chrono>
#include <future>

namespace fs = std::filesystem;

namespace qshift {

namespace {

void set_destination(ConversionOutcome& outcome, const fs::path& destination) {
    if (auto* accepted = std::get_if<Accepted>(&outcome)) {
        accepted->destination = destination;
    } else if (auto* best_effort = std::get_if<BestEffortAccepted>(&outcome)) {
        best_effort->destination = destination;
    }
}

Rejected cancelled(const fs::path& path) {
    return Rejected{RejectReason::Cancelled, "interrupted: " + path.filename().string()};
}

} // namespace

ConversionExecutor::ConversionExecutor(Backends backends, ExecutorOptions options, Tuning tuning, EventBus& bus)
    : backends_(backends),
      options_(std::move(options)),
      tuning_(std::move(tuning)),
      predictor_(tuning_.predictor),
      bus_(bus),
      heartbeat_(tuning_.heartbeat, &bus) {
    if (backends_.fast && !backends_.fast->is_fast_path()) {
        throw std::invalid_argument("fast backend '" + std::string(backends_.fast->get_name()) +
                                    "' is not an approximate encoder");
    }
    if (options_.commit.output_dir && !options_.commit.dry_run) {
        std::error_code ec;
        fs::create_directories(*options_.commit.output_dir, ec);
        if (ec) {
            Logger::log(LogLevel::Error, "Failed to create output directory: " +
                        options_.commit.output_dir->string(), "Executor");
            throw std::runtime_error("Failed to create output directory.");
        }
    }
}

void ConversionExecutor::request_stop() {
    if (stop_source_.request_stop()) {
        Logger::log(LogLevel::Warning, "Stop requested, cancelling running conversions", "Executor");
    }
}

std::vector<FileResult> ConversionExecutor::run(const std::vector<fs::path>& inputs) {
    if (!pool_) pool_.emplace(options_.threads);

    std::vector<std::future<ConversionOutcome>> futures;
    futures.reserve(inputs.size());
    for (const auto& file : inputs) {
        futures.push_back(pool_->enqueue([this, file](const std::stop_token& worker_stop) {
            // a file stops on either the batch-wide or the worker's own stop request
            std::stop_source file_stop;
            std::stop_callback on_batch(stop_source_.get_token(), [&file_stop] { file_stop.request_stop(); });
            std::stop_callback on_worker(worker_stop, [&file_stop] { file_stop.request_stop(); });
            return convert(file, file_stop.get_token());
        }));
    }

    std::vector<FileResult> results;
    results.reserve(inputs.size());
    for (size_t i = 0; i < inputs.size(); ++i) {
        results.push_back(FileResult{inputs[i], futures[i].get()});
    }
    return results;
}

ConversionOutcome ConversionExecutor::convert(const fs::path& path, const std::stop_token stop) {
    const auto start = std::chrono::steady_clock::now();
    const auto original_size = file_size_if_exists(path).value_or(0);
    SourceCodec codec = SourceCodec::Unknown;

    ConversionOutcome outcome = Rejected{RejectReason::EncodeFailed, "not started"};
    try {
        outcome = convert_checked(path, stop, codec);
    } catch (const ProbeError& e) {
        outcome = Rejected{RejectReason::ProbeFailed, e.what()};
    } catch (const OperationCancelled&) {
        outcome = cancelled(path);
    } catch (const QualityUnverifiable& e) {
        outcome = Rejected{RejectReason::QualityUnverifiable, e.what()};
    } catch (const EncodeFailure& e) {
        std::string message = std::string("encode failed (") + std::string(to_string(e.kind())) + "): " + e.what();
        if (!e.diagnostic().empty()) message += " | " + e.diagnostic();
        outcome = Rejected{RejectReason::EncodeFailed, message};
    } catch (const std::exception& e) {
        outcome = Rejected{RejectReason::EncodeFailed, e.what()};
    }

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    if (const auto* rejected = std::get_if<Rejected>(&outcome)) {
        const auto level = rejected->reason == RejectReason::Skipped || rejected->reason == RejectReason::NoCompression
                               ? LogLevel::Info
                               : LogLevel::Warning;
        Logger::log(level, path.filename().string() + ": " + describe(outcome), "Executor");
    } else if (std::holds_alternative<BestEffortAccepted>(outcome)) {
        Logger::log(LogLevel::Warning, path.filename().string() + ": " + describe(outcome), "Executor");
    } else {
        Logger::log(LogLevel::Info, path.filename().string() + ": " + describe(outcome), "Executor");
    }

    bus_.publish(FileOutcomeEvent{path, outcome, original_size, codec, duration});
    return outcome;
}

ConversionOutcome ConversionExecutor::convert_checked(const fs::path& path, const std::stop_token& stop,
                                                      SourceCodec& codec) {
    if (stop.stop_requested()) return cancelled(path);

    bus_.publish(FileConvertStartEvent{path});

    if (options_.check_mime) {
        const auto mime = MimeDetector::detect(path);
        if (!mime.empty() && !MimeDetector::is_convertible(mime)) {
            const std::string reason = "unsupported type (" + mime + ")";
            bus_.publish(FileSkippedEvent{path, reason});
            return Rejected{RejectReason::Skipped, reason};
        }
    }

    MediaProbe probe = backends_.prober.probe(path);
    codec = probe.codec;
    if (options_.content) probe.content = options_.content;
    if (options_.film_grain) probe.film_grain = options_.film_grain;

    if (const auto skip = options_.codec_policy.should_skip_source(probe.codec)) {
        bus_.publish(FileSkippedEvent{path, *skip});
        return Rejected{RejectReason::Skipped, *skip};
    }

    const auto prediction = predictor_.predict(probe, options_.target);
    bus_.publish(PredictionEvent{path, prediction.parameter, prediction.confidence_score,
                                 prediction.breakdown.effective_bpp});
    Logger::log(LogLevel::Debug, path.filename().string() + ": predicted " + std::to_string(prediction.parameter) +
                " (" + std::string(to_string(prediction.confidence)) + ")", "Predictor");

    SearchConfig config = options_.search;
    config.initial = std::clamp(prediction.parameter, config.min_param, config.max_param);
    config.best_effort_fallback = options_.codec_policy.best_effort_eligible(probe.codec);

    const ScopedWorkDir work(path, "work", options_.work_base);
    const CallContext ctx{stop, &heartbeat_, path.filename().string()};

    SearchEngine engine(backends_.exact, backends_.fast, backends_.metric, tuning_, &bus_);
    const SearchResult result = engine.run(probe, work.path(), config, ctx);
    if (result.rejection) return *result.rejection;
    if (!result.winner) {
        return Rejected{RejectReason::EncodeFailed, "search finished without a winner"};
    }

    std::optional<QualityReport> report;
    if (requires_verification(config.strategy)) {
        QualityVerifier verifier(backends_.metric, tuning_.verifier, &bus_);
        report = verifier.verify(VerifyRequest{path, result.artifact, probe.palette, probe.duration_secs,
                                               config.strategy, config.quality}, ctx);
    }

    if (stop.stop_requested()) return cancelled(path);

    ConversionOutcome outcome = AcceptanceGate::decide(AcceptanceInput{
        probe.file_size, result.artifact_size, result.winner->parameter, config.size, report,
        options_.codec_policy.best_effort_eligible(probe.codec)});
    if (!is_committed(outcome)) return outcome;

    const auto destination = destination_for(path, backends_.exact.output_extension(), options_.commit);
    if (!destination) {
        return Rejected{RejectReason::CommitFailed,
                        "input and output paths are identical: " + path.string() +
                        " (use an output directory or --in-place)"};
    }
    const auto committed = commit_artifact(result.artifact, *destination, options_.commit);
    if (!committed.ok) {
        return Rejected{RejectReason::CommitFailed, committed.error};
    }
    set_destination(outcome, committed.destination);
    return outcome;
}

} // namespace qshift
