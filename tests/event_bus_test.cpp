#include <gtest/gtest.h>
#include "../libqshift/include/event_bus.hpp"
#include "../libqshift/include/events.hpp"

#include <atomic>
#include <thread>
#include <vector>

using namespace qshift;

class EventBusTest : public ::testing::Test {
protected:
    EventBus bus_;
};

TEST_F(EventBusTest, DeliversByType) {
    std::vector<std::string> starts;
    int skipped = 0;
    bus_.subscribe<FileConvertStartEvent>([&](const FileConvertStartEvent& e) { starts.push_back(e.path.string()); });
    bus_.subscribe<FileSkippedEvent>([&](const FileSkippedEvent&) { ++skipped; });

    bus_.publish(FileConvertStartEvent{"a.mov"});
    bus_.publish(FileConvertStartEvent{"b.mov"});
    bus_.publish(PredictionEvent{"a.mov", 24.0, 0.9, 0.2});

    EXPECT_EQ(starts, (std::vector<std::string>{"a.mov", "b.mov"}));
    EXPECT_EQ(skipped, 0);
}

TEST_F(EventBusTest, HandlersMayPublish) {
    int outcomes = 0;
    bus_.subscribe<FileSkippedEvent>([this](const FileSkippedEvent& e) {
        bus_.publish(FileOutcomeEvent{e.path, Rejected{RejectReason::Skipped, e.reason}});
    });
    bus_.subscribe<FileOutcomeEvent>([&](const FileOutcomeEvent& e) {
        ++outcomes;
        EXPECT_FALSE(is_committed(e.outcome));
    });

    bus_.publish(FileSkippedEvent{"c.mkv", "already modern codec (hevc)"});

    EXPECT_EQ(outcomes, 1);
}

TEST_F(EventBusTest, ConcurrentPublishers) {
    std::atomic<int> seen{0};
    bus_.subscribe<TrialRecordedEvent>([&](const TrialRecordedEvent&) { ++seen; });

    std::vector<std::jthread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([this] {
            for (int i = 0; i < 250; ++i) bus_.publish(TrialRecordedEvent{});
        });
    }
    threads.clear();

    EXPECT_EQ(seen.load(), 2000);
}
