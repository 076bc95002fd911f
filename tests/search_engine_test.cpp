#include <gtest/gtest.h>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <map>
#include <vector>
#include "fakes/fake_backends.hpp"
#include "../libqshift/include/errors.hpp"
#include "../libqshift/include/event_bus.hpp"
#include "../libqshift/include/events.hpp"
#include "../libqshift/include/file_utils.hpp"
#include "../libqshift/include/search_engine.hpp"

using namespace qshift;
using namespace qshift::testing;
namespace fs = std::filesystem;

namespace {

constexpr std::uintmax_t MB = 1024 * 1024;

// 20 MB at 10, halving roughly every 14 steps: crosses 10 MB just below 24
std::uintmax_t smooth_size(const double p) {
    return static_cast<std::uintmax_t>(20.0 * MB * std::exp(-0.05 * (p - 10.0)));
}

double falling_quality(const double p) {
    return 1.0 - 0.003 * (p - 10.0);
}

std::uintmax_t scenario_b_size(const double p) {
    return p >= 24.0 ? static_cast<std::uintmax_t>(9.8 * MB) : 11 * MB;
}

} // namespace

class SearchEngineTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = make_work_dir_for("search", "test");
        input_ = dir_ / "input.mkv";
        workdir_ = dir_ / "work";
        fs::create_directories(workdir_);
        set_input_size(10 * MB);
    }

    void TearDown() override {
        cleanup_work_dir(dir_);
    }

    void set_input_size(const std::uintmax_t size) {
        make_file(input_, size);
        probe_ = typical_probe();
        probe_.path = input_;
        probe_.file_size = size;
    }

    static SearchConfig config_for(Strategy strategy, const double initial = 23.0) {
        SearchConfig config;
        config.strategy = strategy;
        config.initial = initial;
        return config;
    }

    SearchResult run(FakeEncoder& exact, const SearchConfig& config, FakeEncoder* fast = nullptr) {
        SearchEngine engine(exact, fast, metric_, tuning_, &bus_);
        return engine.run(probe_, workdir_, config, CallContext{{}, nullptr, "test"});
    }

    // every parameter is encoded at full length at most once, plus the final re-encode of the winner
    static void expect_no_duplicate_encodes(const FakeEncoder& exact, const SearchResult& result) {
        for (const auto& [parameter, count] : exact.full_encode_counts()) {
            const bool reencoded_winner = result.reencoded && result.winner &&
                                          std::abs(result.winner->parameter - parameter) < 1e-9;
            EXPECT_LE(count, reencoded_winner ? 2 : 1) << "parameter " << parameter;
        }
    }

    fs::path dir_;
    fs::path input_;
    fs::path workdir_;
    MediaProbe probe_;
    Tuning tuning_;
    EventBus bus_;
    FakeMetricTool metric_;
};

TEST_F(SearchEngineTest, QualityMatchUsesExactlyOneTrial) {
    set_input_size(100 * MB);
    FakeEncoder exact([](double) { return 95 * MB; });

    const auto result = run(exact, config_for(QualityMatch{}));

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_FALSE(result.rejection.has_value());
    EXPECT_DOUBLE_EQ(result.winner->parameter, 23.0);
    EXPECT_EQ(result.iterations, 1u);
    EXPECT_EQ(exact.calls(), 1u);
    EXPECT_FALSE(result.reencoded);
    EXPECT_EQ(result.artifact_size, 95 * MB);
    EXPECT_EQ(fs::file_size(result.artifact), 95 * MB);
}

TEST_F(SearchEngineTest, CompressOnlyConvergesOnBoundary) {
    FakeEncoder exact(scenario_b_size);

    const auto result = run(exact, config_for(CompressOnly{}));

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_DOUBLE_EQ(result.winner->parameter, 24.0);
    EXPECT_EQ(result.artifact_size, static_cast<std::uintmax_t>(9.8 * MB));
    EXPECT_EQ(fs::file_size(result.artifact), result.artifact_size);
    EXPECT_EQ(FakeMetricTool::parameter_of(result.artifact), 24.0);

    // the last trial was the non-compressing lower neighbour, so the winner is encoded again
    EXPECT_TRUE(result.reencoded);
    EXPECT_EQ(exact.full_encodes_at(24.0), 2);
    EXPECT_EQ(exact.full_encodes_at(23.5), 1);
    expect_no_duplicate_encodes(exact, result);
}

TEST_F(SearchEngineTest, CompressWithQualitySearchesLikeCompressOnly) {
    FakeEncoder exact(scenario_b_size);

    const auto result = run(exact, config_for(CompressWithQuality{}));

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_DOUBLE_EQ(result.winner->parameter, 24.0);
    EXPECT_EQ(metric_.calls(MetricKind::SsimAll), 0);
}

TEST_F(SearchEngineTest, NothingCompressesIsRejected) {
    FakeEncoder exact([](double) { return 12 * MB; });

    const auto result = run(exact, config_for(CompressOnly{}));

    EXPECT_FALSE(result.winner.has_value());
    ASSERT_TRUE(result.rejection.has_value());
    EXPECT_EQ(result.rejection->reason, RejectReason::NoCompression);
    EXPECT_NE(result.rejection->message.find("no parameter compresses below input"), std::string::npos);
    EXPECT_NE(result.rejection->message.find(std::to_string(12 * MB)), std::string::npos);
}

TEST_F(SearchEngineTest, NothingCompressesKeepsSmallestTrialWithFallback) {
    FakeEncoder exact([](const double p) { return p >= 40.0 ? 11 * MB : 12 * MB; });
    auto config = config_for(CompressOnly{});
    config.best_effort_fallback = true;

    const auto result = run(exact, config);

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_FALSE(result.rejection.has_value());
    EXPECT_TRUE(result.below_size_policy);
    EXPECT_DOUBLE_EQ(result.winner->parameter, 51.0);
    EXPECT_EQ(result.artifact_size, 11 * MB);
    EXPECT_EQ(FakeMetricTool::parameter_of(result.artifact), 51.0);
}

TEST_F(SearchEngineTest, SizeOnlyFallbackKeepsUpperBound) {
    FakeEncoder exact([](double) { return 12 * MB; });
    auto config = config_for(SizeOnly{});
    config.best_effort_fallback = true;

    const auto result = run(exact, config);

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_TRUE(result.below_size_policy);
    EXPECT_DOUBLE_EQ(result.winner->parameter, 51.0);
}

TEST_F(SearchEngineTest, SizeOnlyPicksUpperBound) {
    FakeEncoder exact(smooth_size);

    const auto result = run(exact, config_for(SizeOnly{}));

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_DOUBLE_EQ(result.winner->parameter, 51.0);
    EXPECT_EQ(exact.calls(), 1u);
    EXPECT_FALSE(result.reencoded);
}

TEST_F(SearchEngineTest, ReencodingTheWinnerReproducesCachedSize) {
    for (const Strategy strategy : {Strategy{CompressOnly{}}, Strategy{SizeOnly{}}}) {
        FakeEncoder exact(smooth_size);
        const auto result = run(exact, config_for(strategy));
        ASSERT_TRUE(result.winner.has_value()) << strategy_name(strategy);

        const auto again = exact.encode({input_, workdir_ / "again.mp4", result.winner->parameter, std::nullopt},
                                        CallContext{});
        EXPECT_EQ(again.size_bytes, result.winner->size) << strategy_name(strategy);
        EXPECT_EQ(result.artifact_size, result.winner->size) << strategy_name(strategy);
    }
}

TEST_F(SearchEngineTest, NoStrategyEncodesAParameterTwice) {
    metric_.set(MetricKind::SsimAll, falling_quality);

    const std::vector<Strategy> strategies{
        CompressOnly{}, SizeOnly{}, QualityMatch{}, PreciseQualityMatch{},
        PreciseQualityMatchWithCompression{}, CompressWithQuality{}, Ultimate{}};

    for (const auto& strategy : strategies) {
        FakeEncoder exact(smooth_size);
        auto config = config_for(strategy);
        config.max_iterations = 60;

        const auto result = run(exact, config);

        EXPECT_FALSE(result.rejection.has_value()) << strategy_name(strategy);
        expect_no_duplicate_encodes(exact, result);
    }
}

TEST_F(SearchEngineTest, CacheHitsArePublishedWithoutEncoding) {
    size_t cached = 0;
    bus_.subscribe<TrialRecordedEvent>([&](const TrialRecordedEvent& e) {
        if (e.cached) ++cached;
    });
    metric_.set(MetricKind::SsimAll, falling_quality);
    FakeEncoder exact(smooth_size);

    // the walk starts by reading the boundary trial back from the cache
    const auto result = run(exact, config_for(PreciseQualityMatchWithCompression{}));

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_GE(cached, 1u);
    expect_no_duplicate_encodes(exact, result);
}

TEST_F(SearchEngineTest, PreciseQualityPrefersHighestParameterOnPlateau) {
    metric_.set_constant(MetricKind::SsimAll, 0.98);
    FakeEncoder exact(smooth_size);

    const auto result = run(exact, config_for(PreciseQualityMatch{}));

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_DOUBLE_EQ(result.winner->parameter, 51.0);
    EXPECT_EQ(exact.calls(), 2u);
}

TEST_F(SearchEngineTest, PreciseQualityWithCompressionStaysBelowInput) {
    metric_.set(MetricKind::SsimAll, falling_quality);

    for (const double boundary : {12.0, 20.5, 30.0, 44.0}) {
        FakeEncoder exact([boundary](const double p) { return p >= boundary ? 9 * MB : 11 * MB; });
        const auto result = run(exact, config_for(PreciseQualityMatchWithCompression{}, 25.0));

        ASSERT_TRUE(result.winner.has_value()) << boundary;
        EXPECT_DOUBLE_EQ(result.winner->parameter, boundary);
        EXPECT_LT(result.artifact_size, probe_.file_size);
        for (const auto& t : result.trials) {
            if (t.parameter < boundary) EXPECT_GE(t.size, probe_.file_size);
        }
    }
}

TEST_F(SearchEngineTest, UltimateStopsAfterRequiredZeroGains) {
    // min_param compresses, so the walk continues below it toward the absolute minimum
    const std::map<double, double> quality{
        {30.0, 0.900}, {29.0, 0.910}, {28.0, 0.91005}, {27.0, 0.91010},
        {26.0, 0.920}, {25.0, 0.92005}, {24.0, 0.92010}, {23.0, 0.92015}};
    metric_.set(MetricKind::SsimAll, [quality](const double p) {
        const auto it = quality.find(p);
        return it != quality.end() ? it->second : (p > 30.0 ? 0.85 : 0.93);
    });

    auto config = config_for(Ultimate{}, 40.0);
    config.min_param = 30.0;
    config.precision = 1.0;
    config.max_iterations = 60;
    config.required_zero_gains = 3;

    FakeEncoder exact([](double) { return 5 * MB; });
    const auto result = run(exact, config);

    ASSERT_TRUE(result.winner.has_value());
    // two sub-epsilon gains (28, 27) did not end the walk
    EXPECT_EQ(exact.full_encodes_at(26.0), 1);
    // the third consecutive one (25, 24, 23) did
    EXPECT_EQ(exact.full_encodes_at(23.0), 1);
    EXPECT_EQ(exact.full_encodes_at(22.0), 0);
}

TEST_F(SearchEngineTest, UltimateWithLowerThresholdStopsEarlier) {
    const std::map<double, double> quality{
        {30.0, 0.900}, {29.0, 0.910}, {28.0, 0.91005}, {27.0, 0.91010}, {26.0, 0.920}};
    metric_.set(MetricKind::SsimAll, [quality](const double p) {
        const auto it = quality.find(p);
        return it != quality.end() ? it->second : (p > 30.0 ? 0.85 : 0.93);
    });

    auto config = config_for(Ultimate{}, 40.0);
    config.min_param = 30.0;
    config.precision = 1.0;
    config.max_iterations = 60;
    config.required_zero_gains = 2;

    FakeEncoder exact([](double) { return 5 * MB; });
    const auto result = run(exact, config);

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_EQ(exact.full_encodes_at(27.0), 1);
    EXPECT_EQ(exact.full_encodes_at(26.0), 0);
}

TEST_F(SearchEngineTest, IterationCeilingIsARejection) {
    FakeEncoder exact(scenario_b_size);
    auto config = config_for(CompressOnly{});
    config.max_iterations = 3;

    const auto result = run(exact, config);

    EXPECT_FALSE(result.winner.has_value());
    ASSERT_TRUE(result.rejection.has_value());
    EXPECT_EQ(result.rejection->reason, RejectReason::IterationLimitExceeded);
    EXPECT_EQ(result.iterations, 3u);
    EXPECT_EQ(exact.calls(), 3u);
}

TEST_F(SearchEngineTest, SearchMetricFallsBackToLuma) {
    metric_.set(MetricKind::SsimY, falling_quality);
    FakeEncoder exact(smooth_size);

    const auto result = run(exact, config_for(PreciseQualityMatchWithCompression{}));

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_EQ(metric_.calls(MetricKind::SsimAll), 1);
    EXPECT_GE(metric_.calls(MetricKind::SsimY), 1);
}

TEST_F(SearchEngineTest, MetricSwitchRestartsQualityComparison) {
    // full SSIM fails from 51 on; luma readings run lower and must not be ranked against it
    metric_.set(MetricKind::SsimAll, [](const double p) -> double {
        if (p >= 51.0) {
            throw MetricUnavailable(MetricUnavailable::Reason::DecodeIncompatible, "cannot align frames");
        }
        return 0.99;
    });
    metric_.set_constant(MetricKind::SsimY, 0.90);
    FakeEncoder exact(smooth_size);
    auto config = config_for(PreciseQualityMatch{});
    config.max_iterations = 40;

    const auto result = run(exact, config);

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_DOUBLE_EQ(result.winner->parameter, 51.0);
    ASSERT_TRUE(result.winner->metric.has_value());
    EXPECT_EQ(*result.winner->metric, MetricKind::SsimY);
    EXPECT_EQ(metric_.calls(MetricKind::SsimAll), 2);
}

TEST_F(SearchEngineTest, TrialsRecordTheirSearchMetric) {
    metric_.set(MetricKind::SsimAll, falling_quality);
    FakeEncoder exact(smooth_size);

    const auto result = run(exact, config_for(PreciseQualityMatchWithCompression{}));

    ASSERT_FALSE(result.trials.empty());
    for (const auto& t : result.trials) {
        ASSERT_TRUE(t.metric.has_value()) << t.parameter;
        EXPECT_EQ(*t.metric, MetricKind::SsimAll);
    }
}

TEST_F(SearchEngineTest, SearchWithoutAnyMetricIsUnverifiable) {
    FakeEncoder exact(smooth_size);

    EXPECT_THROW(run(exact, config_for(Ultimate{})), QualityUnverifiable);
}

TEST_F(SearchEngineTest, ExactFailureWithoutCalibrationPropagates) {
    FakeEncoder exact(scenario_b_size);
    exact.fail_when([](const EncodeRequest& r) { return r.parameter == 23.5; });

    EXPECT_THROW(run(exact, config_for(CompressOnly{})), EncodeFailure);
}

TEST_F(SearchEngineTest, FastPathCalibrationSeedsExactSearch) {
    std::vector<CalibrationEvent> events;
    bus_.subscribe<CalibrationEvent>([&](const CalibrationEvent& e) { events.push_back(e); });

    FakeEncoder exact(scenario_b_size);
    FakeEncoder fast(scenario_b_size, true, "fake-fast");

    const auto result = run(exact, config_for(CompressOnly{}), &fast);

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_DOUBLE_EQ(result.winner->parameter, 24.0);
    EXPECT_FALSE(result.winner->fast_path);
    ASSERT_TRUE(result.calibration.has_value());
    EXPECT_DOUBLE_EQ(result.calibration->offset, 2.5);
    ASSERT_EQ(events.size(), 1u);
    EXPECT_TRUE(events.front().valid);

    // fast-path encodes are samples only
    for (const auto& r : fast.requests()) {
        EXPECT_TRUE(r.sample_secs.has_value());
    }
    expect_no_duplicate_encodes(exact, result);
}

TEST_F(SearchEngineTest, ExactFailureRetriesOnFastPath) {
    FakeEncoder exact(scenario_b_size);
    exact.fail_when([](const EncodeRequest& r) { return !r.sample_secs && r.parameter == 23.5; });
    FakeEncoder fast(scenario_b_size, true, "fake-fast");

    const auto result = run(exact, config_for(CompressOnly{}), &fast);

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_DOUBLE_EQ(result.winner->parameter, 24.0);
    EXPECT_FALSE(result.winner->fast_path);

    const auto retried = std::find_if(result.trials.begin(), result.trials.end(),
                                      [](const EncodeTrial& t) { return t.parameter == 23.5; });
    ASSERT_NE(retried, result.trials.end());
    EXPECT_TRUE(retried->fast_path);

    // mapped back by the calibration offset, full length
    const auto requests = fast.requests();
    EXPECT_TRUE(std::any_of(requests.begin(), requests.end(), [](const EncodeRequest& r) {
        return !r.sample_secs && r.parameter == 21.0;
    }));
}

TEST_F(SearchEngineTest, UnknownDurationDiscardsCalibration) {
    probe_.duration_secs.reset();
    std::vector<CalibrationEvent> events;
    bus_.subscribe<CalibrationEvent>([&](const CalibrationEvent& e) { events.push_back(e); });

    FakeEncoder exact(scenario_b_size);
    FakeEncoder fast(scenario_b_size, true, "fake-fast");
    const auto result = run(exact, config_for(CompressOnly{}), &fast);

    ASSERT_TRUE(result.winner.has_value());
    EXPECT_DOUBLE_EQ(result.winner->parameter, 24.0);
    EXPECT_FALSE(result.calibration.has_value());
    ASSERT_EQ(events.size(), 1u);
    EXPECT_FALSE(events.front().valid);
    EXPECT_EQ(fast.calls(), 0u);
}

TEST_F(SearchEngineTest, RejectsMismatchedEncoderRoles) {
    FakeEncoder exact(smooth_size);
    FakeEncoder not_fast(smooth_size, false);
    EXPECT_THROW({ SearchEngine engine(exact, &not_fast, metric_, tuning_); }, std::invalid_argument);

    FakeEncoder fast(smooth_size, true);
    EXPECT_THROW({ SearchEngine engine(fast, nullptr, metric_, tuning_); }, std::invalid_argument);
}

TEST_F(SearchEngineTest, RejectsEmptyRange) {
    FakeEncoder exact(smooth_size);
    auto config = config_for(CompressOnly{});
    config.min_param = 40.0;
    config.max_param = 30.0;

    EXPECT_THROW(run(exact, config), std::invalid_argument);
}
