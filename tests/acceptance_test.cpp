#include <gtest/gtest.h>
#include "fakes/fake_backends.hpp"
#include "../libqshift/include/acceptance.hpp"
#include "../libqshift/include/file_utils.hpp"

#include <filesystem>
#include <fstream>

using namespace qshift;
using namespace qshift::testing;
namespace fs = std::filesystem;

namespace {

QualityReport report_with(const double primary, const bool passed) {
    QualityReport r;
    r.path = MetricKind::SsimAll;
    r.readings[MetricKind::SsimAll] = primary;
    r.floor = 0.95;
    r.passed = passed;
    return r;
}

} // namespace

class AcceptanceGateTest : public ::testing::Test {
protected:
    static AcceptanceInput input(const std::uintmax_t in, const std::uintmax_t out) {
        AcceptanceInput a;
        a.input_size = in;
        a.output_size = out;
        a.parameter = 24.0;
        return a;
    }
};

TEST_F(AcceptanceGateTest, SmallerOutputWithoutReportIsAccepted) {
    const auto outcome = AcceptanceGate::decide(input(1000, 900));

    ASSERT_TRUE(std::holds_alternative<Accepted>(outcome));
    const auto& a = std::get<Accepted>(outcome);
    EXPECT_EQ(a.output_size, 900u);
    EXPECT_DOUBLE_EQ(a.parameter, 24.0);
    EXPECT_FALSE(a.report.has_value());
}

TEST_F(AcceptanceGateTest, EqualSizeFailsStrictPolicy) {
    const auto outcome = AcceptanceGate::decide(input(1000, 1000));

    ASSERT_TRUE(std::holds_alternative<Rejected>(outcome));
    const auto& r = std::get<Rejected>(outcome);
    EXPECT_EQ(r.reason, RejectReason::SizeOrQualityNotMet);
    EXPECT_NE(r.message.find("size 1000 not < input 1000 at 24.0"), std::string::npos);
}

TEST_F(AcceptanceGateTest, ToleranceAllowsSlightGrowth) {
    auto in = input(1000, 1040);
    in.size_policy.tolerance_pct = 5.0;
    EXPECT_TRUE(std::holds_alternative<Accepted>(AcceptanceGate::decide(in)));

    in.output_size = 1051;
    EXPECT_TRUE(std::holds_alternative<Rejected>(AcceptanceGate::decide(in)));
}

TEST_F(AcceptanceGateTest, FailedQualityNamesTheMetric) {
    auto in = input(1000, 900);
    in.report = report_with(0.9412, false);

    const auto outcome = AcceptanceGate::decide(in);

    ASSERT_TRUE(std::holds_alternative<Rejected>(outcome));
    EXPECT_EQ(std::get<Rejected>(outcome).message, "quality ssim-all 0.9412 < floor 0.9500 at 24.0");
}

TEST_F(AcceptanceGateTest, FailedFusedScoreIsReported) {
    auto in = input(1000, 900);
    auto report = report_with(0.96, false);
    report.fused_score = 0.88;
    report.fused_threshold = 0.90;
    in.report = report;

    const auto outcome = AcceptanceGate::decide(in);

    ASSERT_TRUE(std::holds_alternative<Rejected>(outcome));
    EXPECT_NE(std::get<Rejected>(outcome).message.find("fused score 0.8800 < threshold 0.9000"),
              std::string::npos);
}

TEST_F(AcceptanceGateTest, BestEffortWaivesFailureWhenEligible) {
    auto in = input(1000, 1100);
    in.best_effort_eligible = true;

    const auto outcome = AcceptanceGate::decide(in);

    ASSERT_TRUE(std::holds_alternative<BestEffortAccepted>(outcome));
    const auto& b = std::get<BestEffortAccepted>(outcome);
    EXPECT_EQ(b.reason.rfind("best-effort: size", 0), 0u);
    EXPECT_TRUE(is_committed(outcome));
    EXPECT_EQ(outcome_name(outcome), "best-effort");
}

TEST_F(AcceptanceGateTest, PassingReportIsCarried) {
    auto in = input(1000, 900);
    in.report = report_with(0.97, true);
    in.best_effort_eligible = true;

    const auto outcome = AcceptanceGate::decide(in);

    ASSERT_TRUE(std::holds_alternative<Accepted>(outcome));
    ASSERT_TRUE(std::get<Accepted>(outcome).report.has_value());
    EXPECT_TRUE(std::get<Accepted>(outcome).report->passed);
}

class CommitTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_work_dir_for("commit", "test");
        source_ = dir_ / "clip.mov";
        make_file(source_, 4096);
        temp_ = dir_ / "work" / "candidate.mp4";
        fs::create_directories(temp_.parent_path());
        make_file(temp_, 1024);
    }

    void TearDown() override {
        cleanup_work_dir(dir_);
    }

    fs::path dir_;
    fs::path source_;
    fs::path temp_;
};

TEST_F(CommitTest, DestinationUsesTargetExtension) {
    CommitOptions options;
    EXPECT_EQ(*destination_for(source_, ".mp4", options), dir_ / "clip.mp4");
    options.output_dir = dir_ / "out";
    EXPECT_EQ(*destination_for(source_, ".mp4", options), dir_ / "out" / "clip.mp4");
}

TEST_F(CommitTest, DestinationAvoidsExistingFiles) {
    make_file(dir_ / "clip.mp4", 10);
    EXPECT_EQ(*destination_for(source_, ".mp4", {}), dir_ / "clip_qshift.mp4");
}

TEST_F(CommitTest, DestinationNeverOverwritesAnEarlierOutput) {
    make_file(dir_ / "clip.mp4", 10);
    make_file(dir_ / "clip_qshift.mp4", 20);
    make_file(dir_ / "clip_qshift_2.mp4", 30);

    EXPECT_EQ(*destination_for(source_, ".mp4", {}), dir_ / "clip_qshift_3.mp4");
    EXPECT_EQ(fs::file_size(dir_ / "clip_qshift.mp4"), 20u);
}

TEST_F(CommitTest, DestinationRefusesToReplaceTheSource) {
    EXPECT_FALSE(destination_for(source_, ".mov", {}).has_value());
    EXPECT_TRUE(fs::exists(source_));
}

TEST_F(CommitTest, InPlaceAllowsReplacingTheSource) {
    CommitOptions options;
    options.in_place = true;
    EXPECT_EQ(*destination_for(source_, ".mov", options), source_);
}

TEST_F(CommitTest, FailedStagingCopyLeavesNothingBehind) {
    const auto dest = dir_ / "out" / "clip.mp4";
    fs::create_directories(dest.parent_path());
    std::error_code ec;

    const auto staged = stage_copy(dir_ / "vanished.mp4", dest, ec);

    EXPECT_TRUE(ec);
    EXPECT_TRUE(staged.empty());
    EXPECT_TRUE(fs::is_empty(dest.parent_path()));
}

TEST_F(CommitTest, StagingCopySitsBesideDestination) {
    const auto dest = dir_ / "out" / "clip.mp4";
    fs::create_directories(dest.parent_path());
    std::error_code ec;

    const auto staged = stage_copy(temp_, dest, ec);

    ASSERT_FALSE(ec) << ec.message();
    EXPECT_EQ(staged.parent_path(), dest.parent_path());
    EXPECT_EQ(fs::file_size(staged), 1024u);
    EXPECT_TRUE(fs::exists(temp_));
}

TEST_F(CommitTest, RenamesIntoPlace) {
    const auto dest = dir_ / "nested" / "out" / "clip.mp4";

    const auto result = commit_artifact(temp_, dest, {});

    ASSERT_TRUE(result.ok) << result.error;
    EXPECT_EQ(result.destination, dest);
    EXPECT_EQ(fs::file_size(dest), 1024u);
    EXPECT_FALSE(fs::exists(temp_));
}

TEST_F(CommitTest, DryRunDiscardsTemp) {
    CommitOptions options;
    options.dry_run = true;

    const auto result = commit_artifact(temp_, dir_ / "clip.mp4", options);

    EXPECT_TRUE(result.ok);
    EXPECT_TRUE(result.destination.empty());
    EXPECT_FALSE(fs::exists(temp_));
    EXPECT_FALSE(fs::exists(dir_ / "clip.mp4"));
}

TEST_F(CommitTest, EmptyTempIsAnError) {
    { std::ofstream truncate(temp_, std::ios::trunc); }

    const auto result = commit_artifact(temp_, dir_ / "clip.mp4", {});

    EXPECT_FALSE(result.ok);
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(fs::exists(temp_));
    EXPECT_FALSE(fs::exists(dir_ / "clip.mp4"));
}

TEST_F(CommitTest, MissingTempIsAnError) {
    fs::remove(temp_);

    const auto result = commit_artifact(temp_, dir_ / "clip.mp4", {});

    EXPECT_FALSE(result.ok);
    EXPECT_TRUE(fs::exists(source_));
}
