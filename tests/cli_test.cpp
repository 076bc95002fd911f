#include <gtest/gtest.h>
#include <CLI/CLI.hpp>
#include "fakes/fake_backends.hpp"
#include "../libqshift/include/file_utils.hpp"
#include "../qshift_cli/src/cli/cli_parser.hpp"
#include "../qshift_cli/src/report/report_generator.hpp"
#include "../qshift_cli/src/utils/file_scanner.hpp"
#include "../qshift_cli/src/utils/processed_list.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace qshift;
using namespace qshift::testing;
namespace fs = std::filesystem;

class CliParserTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_work_dir_for("cli", "test");
    }

    void TearDown() override {
        cleanup_work_dir(dir_);
    }

    /// Parses `args` followed by the work directory as the only input.
    Settings parse(const std::string& args) {
        Settings settings;
        CLI::App app{"qshift"};
        setup_cli_parser(app, settings);
        app.parse(args + " " + dir_.string(), false);
        return settings;
    }

    fs::path dir_;
};

TEST_F(CliParserTest, DefaultsToExploreOnHevc) {
    const auto settings = parse("");

    EXPECT_EQ(settings.intent, "explore");
    EXPECT_EQ(settings.target, "hevc");
    ASSERT_EQ(settings.inputs.size(), 1u);
    EXPECT_FALSE(settings.precision.has_value());
    EXPECT_FALSE(settings.output_dir.has_value());
    EXPECT_GE(settings.num_threads, 1u);
}

TEST_F(CliParserTest, ReadsSearchAndQualityOptions) {
    const auto settings = parse("--intent ultimate --target av1 --min-ssim 0.97 --min-param 18 "
                                "--max-param 40 --tolerance 2.5 --zero-gains 5 --threads 3");

    EXPECT_EQ(settings.intent, "ultimate");
    EXPECT_EQ(settings.target, "av1");
    EXPECT_DOUBLE_EQ(settings.min_ssim, 0.97);
    EXPECT_DOUBLE_EQ(settings.min_param, 18.0);
    EXPECT_DOUBLE_EQ(settings.max_param, 40.0);
    ASSERT_TRUE(settings.tolerance_pct.has_value());
    EXPECT_DOUBLE_EQ(*settings.tolerance_pct, 2.5);
    EXPECT_EQ(settings.zero_gains, 5u);
    EXPECT_EQ(settings.num_threads, 3u);
}

TEST_F(CliParserTest, TuningConstantsAreOverridable) {
    const auto settings = parse("--calibration-coarse-step 6 --verifier-psnr-norm 45");

    EXPECT_DOUBLE_EQ(settings.tuning.calibration.coarse_step, 6.0);
    EXPECT_DOUBLE_EQ(settings.tuning.verifier.psnr_norm_db, 45.0);
}

TEST_F(CliParserTest, PredictorTablesAreOverridable) {
    const auto settings = parse("--predictor-resolution-floor 0.7 --predictor-complexity-max 1.3");

    EXPECT_DOUBLE_EQ(settings.tuning.predictor.resolution_floor, 0.7);
    EXPECT_DOUBLE_EQ(settings.tuning.predictor.complexity_max_factor, 1.3);
}

TEST_F(CliParserTest, InPlaceIsOptIn) {
    EXPECT_FALSE(parse("").in_place);
    EXPECT_TRUE(parse("--in-place").in_place);
}

TEST_F(CliParserTest, RejectsInvertedRange) {
    EXPECT_THROW(parse("--min-param 40 --max-param 30"), CLI::ValidationError);
}

TEST_F(CliParserTest, RejectsDryRunWithOutputDirectory) {
    EXPECT_THROW(parse("--dry-run -o " + dir_.string()), CLI::ValidationError);
}

TEST_F(CliParserTest, RejectsUnknownNames) {
    EXPECT_THROW(parse("--strategy fastest"), CLI::ValidationError);
    EXPECT_THROW(parse("--target vp9"), CLI::ValidationError);
    EXPECT_THROW(parse("--content cartoon"), CLI::ValidationError);
}

TEST_F(CliParserTest, RejectsSoftwareAsFastPath) {
    EXPECT_THROW(parse("--fast-path software"), CLI::ValidationError);
}

TEST_F(CliParserTest, RejectsKillBeforeWarn) {
    EXPECT_THROW(parse("--heartbeat-warn 60 --heartbeat-kill 30"), CLI::ValidationError);
}

class ExecutorOptionsTest : public ::testing::Test {};

TEST_F(ExecutorOptionsTest, IntentSelectsStrategy) {
    Settings settings;

    settings.intent = "compress";
    EXPECT_TRUE(std::holds_alternative<CompressOnly>(make_executor_options(settings).search.strategy));
    settings.intent = "explore";
    EXPECT_TRUE(std::holds_alternative<PreciseQualityMatch>(make_executor_options(settings).search.strategy));
    settings.intent = "match-quality";
    EXPECT_TRUE(std::holds_alternative<QualityMatch>(make_executor_options(settings).search.strategy));
    settings.intent = "ultimate";
    EXPECT_TRUE(std::holds_alternative<Ultimate>(make_executor_options(settings).search.strategy));
}

TEST_F(ExecutorOptionsTest, ExplicitStrategyOverridesIntent) {
    Settings settings;
    settings.intent = "compress";
    settings.strategy = "precise-quality-compress";

    const auto options = make_executor_options(settings);

    EXPECT_TRUE(std::holds_alternative<PreciseQualityMatchWithCompression>(options.search.strategy));
}

TEST_F(ExecutorOptionsTest, PrecisionDefaultsPerTarget) {
    Settings settings;
    EXPECT_DOUBLE_EQ(make_executor_options(settings).search.precision, 0.5);

    settings.target = "av1";
    const auto av1 = make_executor_options(settings);
    EXPECT_EQ(av1.target, TargetCodec::Av1);
    EXPECT_DOUBLE_EQ(av1.search.precision, 1.0);

    settings.precision = 2.0;
    EXPECT_DOUBLE_EQ(make_executor_options(settings).search.precision, 2.0);
}

TEST_F(ExecutorOptionsTest, CarriesPoliciesAndHints) {
    Settings settings;
    settings.compat = true;
    settings.dry_run = true;
    settings.in_place = true;
    settings.no_mime_check = true;
    settings.relaxed = true;
    settings.content = "animation";
    settings.tolerance_pct = 1.5;
    settings.min_psnr = 40.0;
    settings.num_threads = 4;

    const auto options = make_executor_options(settings);

    EXPECT_TRUE(options.codec_policy.compat);
    EXPECT_TRUE(options.commit.dry_run);
    EXPECT_TRUE(options.commit.in_place);
    EXPECT_FALSE(options.check_mime);
    EXPECT_TRUE(options.search.quality.relaxed);
    ASSERT_TRUE(options.content.has_value());
    EXPECT_EQ(*options.content, ContentType::Animation);
    ASSERT_TRUE(options.search.size.tolerance_pct.has_value());
    EXPECT_DOUBLE_EQ(*options.search.size.tolerance_pct, 1.5);
    EXPECT_DOUBLE_EQ(options.search.quality.min_psnr, 40.0);
    EXPECT_EQ(options.threads, 4u);
    EXPECT_FALSE(options.film_grain.has_value());
}

TEST_F(ExecutorOptionsTest, UnknownNamesThrow) {
    Settings settings;
    settings.target = "mpeg2";
    EXPECT_THROW((void)make_executor_options(settings), std::invalid_argument);

    settings.target = "hevc";
    settings.intent = "shrink";
    EXPECT_THROW((void)make_executor_options(settings), std::invalid_argument);
}

TEST_F(ExecutorOptionsTest, FastPathIsOptional) {
    Settings settings;
    EXPECT_FALSE(make_fast_encoder_options(settings).has_value());

    settings.fast_path = "sample";
    const auto sample = make_fast_encoder_options(settings);
    ASSERT_TRUE(sample.has_value());
    EXPECT_TRUE(sample->fast_path);
    EXPECT_EQ(sample->backend, EncoderBackend::Software);
    EXPECT_EQ(sample->preset, "ultrafast");

    settings.fast_path = "vaapi";
    const auto vaapi = make_fast_encoder_options(settings);
    ASSERT_TRUE(vaapi.has_value());
    EXPECT_EQ(vaapi->backend, EncoderBackend::Vaapi);
    EXPECT_EQ(vaapi->vaapi_device, settings.vaapi_device);

    EXPECT_FALSE(make_exact_encoder_options(settings).fast_path);
}

TEST_F(ExecutorOptionsTest, HeartbeatWindowsComeFromSeconds) {
    Settings settings;
    settings.heartbeat_warn_secs = 1.5;
    settings.heartbeat_kill_secs = 20.0;

    const auto tuning = make_tuning(settings);

    EXPECT_EQ(tuning.heartbeat.warn_after, std::chrono::milliseconds(1500));
    EXPECT_EQ(tuning.heartbeat.kill_after, std::chrono::milliseconds(20000));
}

class FileScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_work_dir_for("scanner", "test");
        fs::create_directories(dir_ / "sub");
        for (const auto* name : {"a.mp4", "b.mkv", ".DS_Store", "._a.mp4", "Thumbs.db"}) {
            make_file(dir_ / name, 16);
        }
        make_file(dir_ / "sub" / "c.mp4", 16);
    }

    void TearDown() override {
        cleanup_work_dir(dir_);
    }

    static std::vector<std::string> names(const std::vector<fs::path>& files) {
        std::vector<std::string> out;
        for (const auto& f : files) out.push_back(f.filename().string());
        return out;
    }

    fs::path dir_;
};

TEST_F(FileScannerTest, SkipsJunkAndSubdirectories) {
    Settings settings;

    const auto files = collect_input_files({dir_}, settings);

    EXPECT_EQ(names(files), (std::vector<std::string>{"a.mp4", "b.mkv"}));
}

TEST_F(FileScannerTest, RecursiveScanDescends) {
    Settings settings;
    settings.recursive = true;

    const auto files = collect_input_files({dir_}, settings);

    EXPECT_EQ(files.size(), 3u);
}

TEST_F(FileScannerTest, IncludeAndExcludePatterns) {
    Settings settings;
    settings.recursive = true;
    settings.exclude_patterns = {"\\.mkv$"};

    EXPECT_EQ(collect_input_files({dir_}, settings).size(), 2u);

    settings.include_patterns = {"/sub/c"};
    EXPECT_EQ(names(collect_input_files({dir_}, settings)), (std::vector<std::string>{"c.mp4"}));
}

TEST_F(FileScannerTest, DuplicatesAndMissingInputsAreDropped) {
    Settings settings;

    const auto files = collect_input_files({dir_ / "a.mp4", dir_ / "sub" / ".." / "a.mp4", dir_ / "missing.mp4"},
                                           settings);

    EXPECT_EQ(names(files), (std::vector<std::string>{"a.mp4"}));
}

class ProcessedListTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_work_dir_for("resume", "test");
        list_ = dir_ / "done.txt";
    }

    void TearDown() override {
        cleanup_work_dir(dir_);
    }

    fs::path dir_;
    fs::path list_;
};

TEST_F(ProcessedListTest, EntriesSurviveReopen) {
    {
        ProcessedList list(list_);
        list.append(dir_ / "a.mp4");
        list.append(dir_ / "a.mp4");
        EXPECT_EQ(list.size(), 1u);
    }

    ProcessedList reopened(list_);
    EXPECT_TRUE(reopened.contains(dir_ / "a.mp4"));
    EXPECT_TRUE(reopened.contains(dir_ / "sub" / ".." / "a.mp4"));
    EXPECT_FALSE(reopened.contains(dir_ / "b.mp4"));
}

TEST_F(ProcessedListTest, FilterKeepsOnlyUnprocessed) {
    ProcessedList list(list_);
    list.append(dir_ / "a.mp4");

    const auto remaining = list.filter({dir_ / "a.mp4", dir_ / "b.mp4"});

    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining.front().filename().string(), "b.mp4");
}

class ReportTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_work_dir_for("report", "test");
    }

    void TearDown() override {
        cleanup_work_dir(dir_);
    }

    static FileOutcomeEvent event(ConversionOutcome outcome) {
        FileOutcomeEvent e;
        e.path = "/videos/clip.mp4";
        e.outcome = std::move(outcome);
        e.original_size = 1000;
        e.source_codec = SourceCodec::H264;
        e.duration = std::chrono::milliseconds(2500);
        return e;
    }

    fs::path dir_;
};

TEST_F(ReportTest, AcceptedRowCarriesParameterAndMetric) {
    QualityReport report;
    report.passed = true;
    report.path = MetricKind::MsSsim;
    report.readings[MetricKind::MsSsim] = 0.97;

    const auto r = make_result(event(Accepted{24.5, report, 600, "/videos/clip.mp4"}));

    EXPECT_EQ(r.outcome, "accepted");
    EXPECT_EQ(r.source_codec, "h264");
    EXPECT_EQ(r.parameter, "24.5");
    EXPECT_EQ(r.metric, "ms-ssim");
    EXPECT_EQ(r.size_after, 600u);
    EXPECT_DOUBLE_EQ(r.seconds, 2.5);
    EXPECT_TRUE(r.reason.empty());
}

TEST_F(ReportTest, RejectedRowCarriesReason) {
    const auto r = make_result(event(Rejected{RejectReason::NoCompression, "no parameter compresses"}));

    EXPECT_EQ(r.outcome, "rejected");
    EXPECT_EQ(r.parameter, "-");
    EXPECT_EQ(r.metric, "-");
    EXPECT_EQ(r.size_after, 0u);
    EXPECT_EQ(r.reason, "no-compression: no parameter compresses");
}

TEST_F(ReportTest, BestEffortRowCarriesWaiver) {
    const auto r = make_result(event(BestEffortAccepted{30.0, "size waived", 1100, "/videos/clip_qshift.mp4"}));

    EXPECT_EQ(r.outcome, "best-effort");
    EXPECT_EQ(r.reason, "size waived");
    EXPECT_EQ(r.destination, "/videos/clip_qshift.mp4");
}

TEST_F(ReportTest, CsvEscapesReasons) {
    const auto csv = dir_ / "report.csv";
    std::vector<Result> results{
        make_result(event(Rejected{RejectReason::SizeOrQualityNotMet, "quality 0.9, floor 0.95"}))};

    ASSERT_TRUE(export_csv_report(results, csv, 3.0));

    std::ifstream in(csv);
    std::stringstream buffer;
    buffer << in.rdbuf();
    const auto text = buffer.str();
    EXPECT_NE(text.find("File,Codec,Before(B),After(B)"), std::string::npos);
    EXPECT_NE(text.find("\"size-or-quality-not-met: quality 0.9, floor 0.95\""), std::string::npos);
    EXPECT_NE(text.find("3.00 seconds"), std::string::npos);
}

TEST_F(ReportTest, CsvFailsOnUnwritablePath) {
    EXPECT_FALSE(export_csv_report({}, dir_ / "missing" / "report.csv", 0.0));
}

class ExitCodeTest : public ::testing::Test {
protected:
    static std::vector<FileResult> one(ConversionOutcome outcome) {
        return {FileResult{"/videos/clip.mp4", std::move(outcome)}};
    }
};

TEST_F(ExitCodeTest, SingleFileMustBeCommitted) {
    EXPECT_EQ(exit_code_for(one(Accepted{24.0, std::nullopt, 600, "/videos/clip_qshift.mp4"}), true), 0);
    EXPECT_EQ(exit_code_for(one(Rejected{RejectReason::NoCompression, "no parameter compresses"}), true), 1);
}

TEST_F(ExitCodeTest, DirectoryWithOneFileFollowsBatchRules) {
    // a merit rejection inside a batch is not a failure of the run
    EXPECT_EQ(exit_code_for(one(Rejected{RejectReason::NoCompression, "no parameter compresses"}), false), 0);
    EXPECT_EQ(exit_code_for(one(Rejected{RejectReason::CommitFailed, "rename failed"}), false), 1);
}

TEST_F(ExitCodeTest, BatchFailsOnlyWhenEveryFileErred) {
    const std::vector<FileResult> mixed{
        {"/videos/a.mp4", Rejected{RejectReason::ProbeFailed, "cannot open"}},
        {"/videos/b.mp4", Rejected{RejectReason::SizeOrQualityNotMet, "quality 0.9"}}};
    const std::vector<FileResult> broken{
        {"/videos/a.mp4", Rejected{RejectReason::ProbeFailed, "cannot open"}},
        {"/videos/b.mp4", Rejected{RejectReason::EncodeFailed, "ffmpeg exited 1"}}};

    EXPECT_EQ(exit_code_for(mixed, false), 0);
    EXPECT_EQ(exit_code_for(broken, false), 1);
    EXPECT_TRUE(is_error(Rejected{RejectReason::Cancelled, "stopped"}));
    EXPECT_FALSE(is_error(Rejected{RejectReason::Skipped, "already modern"}));
}
