#include <gtest/gtest.h>
#include "../libqshift/include/errors.hpp"
#include "../libqshift/include/ffmpeg_metric_tool.hpp"
#include "../libqshift/include/file_utils.hpp"

#include <filesystem>
#include <fstream>

using namespace qshift;
namespace fs = std::filesystem;

namespace {

constexpr auto kSsimSummary =
    "frame=  300 fps=120 q=-0.0 Lsize=N/A time=00:00:10.00 bitrate=N/A speed=4.01x\n"
    "[Parsed_ssim_0 @ 0x5581] SSIM Y:0.987654 (19.083) U:0.991000 (20.457) V:0.990000 (20.000) "
    "All:0.989012 (19.594)\n";

constexpr auto kPsnrSummary =
    "[Parsed_psnr_0 @ 0x5581] PSNR y:45.12 u:47.80 v:47.91 average:45.93 min:41.02 max:52.11\n";

} // namespace

TEST(FfmpegMetricParseTest, ReadsSsimSummary) {
    EXPECT_DOUBLE_EQ(*FfmpegMetricTool::parse_ssim_all(kSsimSummary), 0.989012);
    EXPECT_DOUBLE_EQ(*FfmpegMetricTool::parse_ssim_y(kSsimSummary), 0.987654);
}

TEST(FfmpegMetricParseTest, MissingSummaryIsNotAReading) {
    EXPECT_FALSE(FfmpegMetricTool::parse_ssim_all("Conversion failed!\n").has_value());
    EXPECT_FALSE(FfmpegMetricTool::parse_ssim_y("").has_value());
    EXPECT_FALSE(FfmpegMetricTool::parse_psnr("frame=1\n").has_value());
}

TEST(FfmpegMetricParseTest, ReadsPsnrAverage) {
    EXPECT_DOUBLE_EQ(*FfmpegMetricTool::parse_psnr(kPsnrSummary), 45.93);
    EXPECT_DOUBLE_EQ(*FfmpegMetricTool::parse_psnr("PSNR y:inf u:inf v:inf average:inf min:inf max:inf\n"), 100.0);
}

TEST(FfmpegMetricParseTest, AveragesMsSsimColumn) {
    const std::string csv =
        "Frame,float_ms_ssim,integer_motion\n"
        "0,0.950000,0.0\n"
        "1,0.970000,1.2\n"
        "2,nan,1.0\n";
    EXPECT_NEAR(*FfmpegMetricTool::parse_ms_ssim_csv(csv), 0.96, 1e-12);
    EXPECT_FALSE(FfmpegMetricTool::parse_ms_ssim_csv("Frame,psnr_y\n0,40\n").has_value());
    EXPECT_FALSE(FfmpegMetricTool::parse_ms_ssim_csv("Frame,float_ms_ssim\n").has_value());
}

TEST(FfmpegMetricParseTest, SsimGraphsEndWithPlainFilter) {
    const auto graphs = FfmpegMetricTool::ssim_graphs();
    ASSERT_EQ(graphs.size(), 3u);
    EXPECT_EQ(graphs.back(), "ssim");
}

class FfmpegMetricToolTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_work_dir_for("metric", "test");
    }

    void TearDown() override {
        cleanup_work_dir(dir_);
    }

    fs::path fake_ffmpeg(const std::string& body) const {
        const auto path = dir_ / "ffmpeg";
        {
            std::ofstream out(path);
            out << "#!/bin/sh\n" << body << "\n";
        }
        fs::permissions(path, fs::perms::owner_all, fs::perm_options::add);
        return path;
    }

    fs::path dir_;
};

TEST_F(FfmpegMetricToolTest, MeasuresSsimFromStderr) {
    FfmpegMetricTool tool(fake_ffmpeg("echo '[Parsed_ssim_0 @ 0x1] SSIM Y:0.97 (15.2) U:0.98 (17) V:0.98 (17) "
                                      "All:0.975 (16.0)' >&2").string(), dir_);

    EXPECT_DOUBLE_EQ(tool.measure("ref.mov", "cand.mp4", MetricKind::SsimAll, CallContext{}), 0.975);
    EXPECT_DOUBLE_EQ(tool.measure("ref.mov", "cand.mp4", MetricKind::SsimY, CallContext{}), 0.97);
}

TEST_F(FfmpegMetricToolTest, MissingFilterIsToolMissing) {
    FfmpegMetricTool tool(fake_ffmpeg("echo \"No such filter: 'libvmaf'\" >&2\nexit 1").string(), dir_);

    try {
        (void)tool.measure("ref.mov", "cand.mp4", MetricKind::MsSsim, CallContext{});
        FAIL() << "expected MetricUnavailable";
    } catch (const MetricUnavailable& e) {
        EXPECT_EQ(e.reason(), MetricUnavailable::Reason::ToolMissing);
    }
}

TEST_F(FfmpegMetricToolTest, DecodeFailureIsDecodeIncompatible) {
    FfmpegMetricTool tool(fake_ffmpeg("echo 'Error while decoding stream #1:0' >&2\nexit 1").string(), dir_);

    try {
        (void)tool.measure("ref.mov", "cand.mp4", MetricKind::SsimAll, CallContext{});
        FAIL() << "expected MetricUnavailable";
    } catch (const MetricUnavailable& e) {
        EXPECT_EQ(e.reason(), MetricUnavailable::Reason::DecodeIncompatible);
    }
}

TEST_F(FfmpegMetricToolTest, MissingBinaryIsToolMissing) {
    FfmpegMetricTool tool((dir_ / "no-ffmpeg-here").string(), dir_);

    try {
        (void)tool.measure("ref.mov", "cand.mp4", MetricKind::Psnr, CallContext{});
        FAIL() << "expected MetricUnavailable";
    } catch (const MetricUnavailable& e) {
        EXPECT_EQ(e.reason(), MetricUnavailable::Reason::ToolMissing);
    }
}
