#include "engine_loop.h"

#include "test_fakes.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <thread>
#include <vector>

namespace bbd {
namespace {

using std::chrono::seconds;

class EngineLoopTest : public ::testing::Test {
protected:
    EngineLoopTest()
        : gate_(matcher_, state_), clock_(state_), engine_(frames_, gate_, sink_, state_, actions_, &clock_) {
        state_.Set(Field::Connected, true);
        t0_ = Clock::now();
    }

    Clock::time_point At(int sec) const { return t0_ + seconds(sec); }

    testing::FakeFrameSource frames_;
    testing::CountingMatcher matcher_;
    testing::RecordingCommandSink sink_;
    SharedState state_;
    ActionQueue actions_;
    EventGate gate_;
    SessionClock clock_;
    EngineLoop engine_;
    Clock::time_point t0_;
};

TEST_F(EngineLoopTest, DetectionSubmitsDeath) {
    engine_.Tick(At(0));
    EXPECT_EQ(sink_.Commands(), (std::vector<CommandType>{CommandType::Death}));
    EXPECT_EQ(engine_.EventCount(), 1u);
    EXPECT_EQ(frames_.Grabs(), 1);
}

TEST_F(EngineLoopTest, BossModeSubmitsBossDeath) {
    state_.Set(Field::BossMode, true);
    engine_.Tick(At(0));
    EXPECT_EQ(sink_.Commands(), (std::vector<CommandType>{CommandType::BossDeath}));
}

TEST_F(EngineLoopTest, CooldownYieldsOneCommandPerDeath) {
    for (int t = 0; t < 5; ++t) {
        engine_.Tick(At(t));
    }
    EXPECT_EQ(sink_.Commands().size(), 1u);
    EXPECT_EQ(engine_.TickCount(), 5u);
}

TEST_F(EngineLoopTest, NoGrabWhenNotArmed) {
    state_.Set(Field::Connected, false);
    engine_.Tick(At(0));
    EXPECT_EQ(frames_.Grabs(), 0);
    EXPECT_EQ(matcher_.Calls(), 0);
    EXPECT_TRUE(sink_.Commands().empty());
}

TEST_F(EngineLoopTest, EmptyFrameIsSkipped) {
    frames_.SetAvailable(false);
    engine_.Tick(At(0));
    EXPECT_EQ(matcher_.Calls(), 0);
    EXPECT_TRUE(sink_.Commands().empty());
}

TEST_F(EngineLoopTest, RegionOptionUsesRegionGrab) {
    EngineLoop::Options options;
    options.use_region = true;
    options.region_x = 10;
    options.region_y = 20;
    options.region_width = 300;
    options.region_height = 80;
    engine_.SetOptions(options);

    engine_.Tick(At(0));
    EXPECT_EQ(frames_.Grabs(), 0);
    EXPECT_EQ(frames_.RegionGrabs(), 1);
    EXPECT_EQ(frames_.LastRegion(), cv::Rect(10, 20, 300, 80));
}

TEST_F(EngineLoopTest, ManualDeathFollowsBossMode) {
    matcher_.SetMatched(false);
    actions_.Post(EngineAction::Of(EngineAction::Kind::ManualDeath));
    engine_.Tick(At(0));
    state_.Set(Field::BossMode, true);
    actions_.Post(EngineAction::Of(EngineAction::Kind::ManualDeath));
    engine_.Tick(At(1));
    EXPECT_EQ(sink_.Commands(), (std::vector<CommandType>{CommandType::Death, CommandType::BossDeath}));
}

TEST_F(EngineLoopTest, ManualDeathIgnoredWhileDisconnected) {
    state_.Set(Field::Connected, false);
    actions_.Post(EngineAction::Of(EngineAction::Kind::ManualDeath));
    engine_.Tick(At(0));
    EXPECT_TRUE(sink_.Commands().empty());
}

TEST_F(EngineLoopTest, ToggleBossStartsOrCancels) {
    matcher_.SetMatched(false);
    actions_.Post(EngineAction::Of(EngineAction::Kind::ToggleBoss));
    engine_.Tick(At(0));
    state_.Set(Field::BossMode, true);
    actions_.Post(EngineAction::Of(EngineAction::Kind::ToggleBoss));
    engine_.Tick(At(1));
    EXPECT_EQ(sink_.Commands(), (std::vector<CommandType>{CommandType::BossStart, CommandType::BossCancel}));
    // Boss mode itself only changes when the server says so.
    EXPECT_TRUE(state_.GetBool(Field::BossMode));
}

TEST_F(EngineLoopTest, ToggleDetectionFlipsLocalFlag) {
    ASSERT_TRUE(state_.GetBool(Field::DetectionEnabled));
    actions_.Post(EngineAction::Of(EngineAction::Kind::ToggleDetection));
    engine_.Tick(At(0));
    EXPECT_FALSE(state_.GetBool(Field::DetectionEnabled));
    EXPECT_EQ(matcher_.Calls(), 0);

    actions_.Post(EngineAction::Of(EngineAction::Kind::ToggleDetection));
    engine_.Tick(At(1));
    EXPECT_TRUE(state_.GetBool(Field::DetectionEnabled));
    EXPECT_EQ(matcher_.Calls(), 1);
}

TEST_F(EngineLoopTest, DisplayModeInvokesCallback) {
    int calls = 0;
    engine_.SetDisplayModeCallback([&calls] { ++calls; });
    actions_.Post(EngineAction::Of(EngineAction::Kind::ToggleDisplayMode));
    actions_.Post(EngineAction::Of(EngineAction::Kind::ToggleDisplayMode));
    engine_.Tick(At(0));
    EXPECT_EQ(calls, 2);
}

TEST_F(EngineLoopTest, SendCommandIsForwarded) {
    matcher_.SetMatched(false);
    actions_.Post(EngineAction::Send(Command::Of(CommandType::StartTimer)));
    engine_.Tick(At(0));
    EXPECT_EQ(sink_.Commands(), (std::vector<CommandType>{CommandType::StartTimer}));
}

TEST_F(EngineLoopTest, TickRefreshesSessionClock) {
    clock_.Anchor(1000, true, At(0));
    matcher_.SetMatched(false);
    engine_.Tick(At(2));
    EXPECT_EQ(clock_.DisplayElapsedMs(), 3000);
}

TEST_F(EngineLoopTest, StartRunsTicksAndStopHalts) {
    matcher_.SetMatched(false);
    EngineLoop::Options options;
    options.fps = 30;
    engine_.SetOptions(options);

    EXPECT_TRUE(engine_.Start());
    EXPECT_FALSE(engine_.Start());
    EXPECT_TRUE(engine_.IsRunning());
    EXPECT_TRUE(testing::WaitUntil([this] { return engine_.TickCount() >= 3; }));

    const auto stop_begin = std::chrono::steady_clock::now();
    engine_.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - stop_begin, std::chrono::milliseconds(500));
    EXPECT_FALSE(engine_.IsRunning());

    const auto ticks = engine_.TickCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(engine_.TickCount(), ticks);
}

TEST_F(EngineLoopTest, SlowTickIsCountedAsOverrunAndLoopKeepsGoing) {
    matcher_.SetMatched(false);
    frames_.SetGrabDelay(60);
    EngineLoop::Options options;
    options.fps = 30;
    engine_.SetOptions(options);

    const auto begin = std::chrono::steady_clock::now();
    ASSERT_TRUE(engine_.Start());
    EXPECT_TRUE(testing::WaitUntil([this] { return engine_.TickCount() >= 4; }));
    EXPECT_GT(engine_.OverrunCount(), 0u);

    const auto stop_begin = std::chrono::steady_clock::now();
    engine_.Stop();
    EXPECT_LT(std::chrono::steady_clock::now() - stop_begin, std::chrono::milliseconds(500));

    // Every tick waited out one slow grab: no spinning while behind schedule.
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin).count();
    EXPECT_LE(engine_.TickCount(), static_cast<std::uint64_t>(elapsed_ms / 60 + 1));
    EXPECT_EQ(static_cast<std::uint64_t>(frames_.Grabs()), engine_.TickCount());
}

TEST_F(EngineLoopTest, ActionsPostedWhileRunningAreHandled) {
    matcher_.SetMatched(false);
    ASSERT_TRUE(engine_.Start());
    actions_.Post(EngineAction::Send(Command::Of(CommandType::ResetTimer)));
    EXPECT_TRUE(testing::WaitUntil([this] { return sink_.Commands().size() == 1; }));
    engine_.Stop();
    EXPECT_EQ(sink_.Commands(), (std::vector<CommandType>{CommandType::ResetTimer}));
}

} // namespace
} // namespace bbd
