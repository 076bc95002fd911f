#include <gtest/gtest.h>
#include "../libqshift/include/event_bus.hpp"
#include "../libqshift/include/events.hpp"
#include "../libqshift/include/heartbeat.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace qshift;
using namespace std::chrono_literals;

class HeartbeatTest : public ::testing::Test {
protected:
    void SetUp() override {
        tuning_.warn_after = 50ms;
        tuning_.kill_after = 200ms;
        tuning_.tick = 10ms;
        bus_.subscribe<HeartbeatWarningEvent>([this](const HeartbeatWarningEvent& e) {
            if (e.killed) ++kills_; else ++warnings_;
        });
    }

    /// Waits up to `limit` for the handle to be declared stuck.
    static bool wait_stuck(const HeartbeatSupervisor::Handle& h, const std::chrono::milliseconds limit) {
        const auto deadline = std::chrono::steady_clock::now() + limit;
        while (!h.stuck() && std::chrono::steady_clock::now() < deadline) std::this_thread::sleep_for(5ms);
        return h.stuck();
    }

    HeartbeatTuning tuning_;
    EventBus bus_;
    std::atomic<int> warnings_{0};
    std::atomic<int> kills_{0};
};

TEST_F(HeartbeatTest, RegistersActiveCalls) {
    HeartbeatSupervisor hb(tuning_, &bus_);
    {
        auto a = hb.begin("a.mov: boundary@24.0");
        auto b = hb.begin("b.mov: refine@30.0");
        EXPECT_EQ(hb.active().size(), 2u);
    }
    EXPECT_TRUE(hb.active().empty());
}

TEST_F(HeartbeatTest, SilentCallWarnsThenDies) {
    HeartbeatSupervisor hb(tuning_, &bus_);
    auto handle = hb.begin("silent");

    EXPECT_TRUE(wait_stuck(handle, 5s));
    EXPECT_GE(warnings_.load(), 1);
    EXPECT_EQ(kills_.load(), 1);
    EXPECT_TRUE(handle.stuck_token().stop_requested());
}

TEST_F(HeartbeatTest, ProgressResetsTheClock) {
    HeartbeatSupervisor hb(tuning_, &bus_);
    auto handle = hb.begin("chatty");

    const auto until = std::chrono::steady_clock::now() + 600ms;
    while (std::chrono::steady_clock::now() < until) {
        handle.progress();
        std::this_thread::sleep_for(20ms);
    }

    EXPECT_FALSE(handle.stuck());
    EXPECT_EQ(kills_.load(), 0);
}

TEST_F(HeartbeatTest, MovedHandleKeepsRegistration) {
    HeartbeatSupervisor hb(tuning_, &bus_);
    auto first = hb.begin("moved");
    HeartbeatSupervisor::Handle second(std::move(first));

    EXPECT_EQ(hb.active().size(), 1u);
    EXPECT_TRUE(wait_stuck(second, 5s));
}
