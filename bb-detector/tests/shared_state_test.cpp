#include "shared_state.h"

#include "session_clock.h"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace bbd {
namespace {

TEST(SharedStateTest, StartsWithDefaults) {
    SharedState state;
    const SessionState s = state.Snapshot();
    EXPECT_EQ(s.death_count, 0);
    EXPECT_EQ(s.elapsed_ms, 0);
    EXPECT_FALSE(s.running);
    EXPECT_FALSE(s.boss_mode);
    EXPECT_FALSE(s.connected);
    EXPECT_FALSE(s.can_edit);
    EXPECT_TRUE(s.detection_enabled);
    EXPECT_TRUE(s.profile_id.empty());
}

TEST(SharedStateTest, SetThenGetReturnsValue) {
    SharedState state;
    state.Set(Field::DeathCount, std::int64_t{12});
    EXPECT_EQ(state.GetInt(Field::DeathCount), 12);
    state.Set("profileDisplayName", std::string("Hunter"));
    EXPECT_EQ(std::get<std::string>(state.Get("profileDisplayName")), "Hunter");
}

TEST(SharedStateTest, UnknownNameFailsFast) {
    SharedState state;
    EXPECT_THROW(state.Set("deathcount", std::int64_t{1}), UnknownFieldError);
    EXPECT_THROW(state.Get("bogus"), UnknownFieldError);
    try {
        FieldFromName("nope");
        FAIL() << "expected UnknownFieldError";
    } catch (const UnknownFieldError& e) {
        EXPECT_EQ(e.name(), "nope");
    }
}

TEST(SharedStateTest, WrongKindIsRejected) {
    SharedState state;
    EXPECT_THROW(state.Set(Field::DeathCount, true), FieldTypeError);
    EXPECT_THROW(state.Set(Field::Connected, std::string("yes")), FieldTypeError);
    EXPECT_THROW(state.GetBool(Field::DeathCount), FieldTypeError);
    EXPECT_EQ(state.GetInt(Field::DeathCount), 0);
}

TEST(SharedStateTest, SameValueTwiceNotifiesOnce) {
    SharedState state;
    int calls = 0;
    state.Subscribe([&](Field field, const StateValue& value) {
        EXPECT_EQ(field, Field::BossMode);
        EXPECT_TRUE(std::get<bool>(value));
        ++calls;
    });
    state.Set(Field::BossMode, true);
    state.Set(Field::BossMode, true);
    EXPECT_EQ(calls, 1);
}

TEST(SharedStateTest, MergeOfCurrentValueIsSilent) {
    SharedState state;
    state.Set(Field::DeathCount, std::int64_t{7});
    int calls = 0;
    state.Subscribe([&](Field, const StateValue&) { ++calls; });
    state.Merge(StatePatch{{Field::DeathCount, std::int64_t{7}}});
    EXPECT_EQ(calls, 0);
}

TEST(SharedStateTest, MergeNotifiesEachChangedKeyOnce) {
    SharedState state;
    state.Set(Field::BossDeathCount, std::int64_t{3});
    std::vector<Field> seen;
    state.Subscribe([&](Field field, const StateValue&) { seen.push_back(field); });

    state.Merge(StatePatch{
        {Field::DeathCount, std::int64_t{4}},
        {Field::BossDeathCount, std::int64_t{3}},
        {Field::Running, true},
        {Field::DeathCount, std::int64_t{5}},
    });

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], Field::DeathCount);
    EXPECT_EQ(seen[1], Field::Running);
    EXPECT_EQ(state.GetInt(Field::DeathCount), 5);
}

TEST(SharedStateTest, FieldWrittenBackToOriginalStaysSilent) {
    SharedState state;
    int calls = 0;
    state.Subscribe([&](Field, const StateValue&) { ++calls; });
    state.Merge(StatePatch{{Field::Running, true}, {Field::Running, false}});
    EXPECT_EQ(calls, 0);
}

TEST(SharedStateTest, MergeWithBadKindChangesNothing) {
    SharedState state;
    EXPECT_THROW(state.Merge(StatePatch{{Field::DeathCount, std::int64_t{1}}, {Field::Running, std::int64_t{1}}}),
                 FieldTypeError);
    EXPECT_EQ(state.GetInt(Field::DeathCount), 0);
}

TEST(SharedStateTest, ListenersRunInSubscriptionOrder) {
    SharedState state;
    std::vector<int> order;
    state.Subscribe([&](Field, const StateValue&) { order.push_back(1); });
    state.Subscribe([&](Field, const StateValue&) { order.push_back(2); });
    state.Subscribe([&](Field, const StateValue&) { order.push_back(3); });
    state.Set(Field::Connected, true);
    EXPECT_EQ(order, (std::vector<int>{1, 2, 3}));
}

TEST(SharedStateTest, ThrowingListenerIsIsolatedAndReported) {
    SharedState state;
    std::vector<std::string> errors;
    state.SetListenerErrorHook([&](Field field, const std::string& what) {
        EXPECT_EQ(field, Field::CanEdit);
        errors.push_back(what);
    });
    int later_calls = 0;
    state.Subscribe([](Field, const StateValue&) { throw std::runtime_error("renderer gone"); });
    state.Subscribe([&](Field, const StateValue&) { ++later_calls; });

    EXPECT_NO_THROW(state.Set(Field::CanEdit, true));
    EXPECT_EQ(later_calls, 1);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "renderer gone");
}

TEST(SharedStateTest, UnsubscribeStopsNotifications) {
    SharedState state;
    int calls = 0;
    const auto id = state.Subscribe([&](Field, const StateValue&) { ++calls; });
    state.Set(Field::Running, true);
    state.Unsubscribe(id);
    state.Set(Field::Running, false);
    EXPECT_EQ(calls, 1);
}

// Flags any call that arrives after its owner has unsubscribed.
class TrackedSubscriber {
public:
    TrackedSubscriber(SharedState& state, std::atomic<int>& late_calls)
        : state_(state), alive_(std::make_shared<std::atomic<bool>>(true)) {
        auto alive = alive_;
        id_ = state_.Subscribe([alive, &late_calls](Field, const StateValue&) {
            if (!alive->load()) {
                late_calls.fetch_add(1);
            }
        });
    }
    ~TrackedSubscriber() {
        state_.Unsubscribe(id_);
        alive_->store(false);
    }

private:
    SharedState& state_;
    std::shared_ptr<std::atomic<bool>> alive_;
    SharedState::SubscriptionId id_ = 0;
};

TEST(SharedStateTest, UnsubscribeWaitsForNotificationOnAnotherThread) {
    SharedState state;
    std::atomic<bool> slow_started{false};
    state.Subscribe([&slow_started](Field field, const StateValue&) {
        if (field == Field::ElapsedMs) {
            slow_started.store(true);
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });
    std::atomic<int> late_calls{0};
    auto subscriber = std::make_unique<TrackedSubscriber>(state, late_calls);
    auto clock = std::make_unique<SessionClock>(state);

    std::thread writer([&state] { state.Set(Field::ElapsedMs, std::int64_t{42}); });
    while (!slow_started.load()) {
        std::this_thread::yield();
    }
    clock.reset();
    subscriber.reset();
    writer.join();

    EXPECT_EQ(late_calls.load(), 0);
    EXPECT_EQ(state.GetInt(Field::ElapsedMs), 42);
}

TEST(SharedStateTest, ListenerRemovedDuringNotificationIsSkipped) {
    SharedState state;
    int second_calls = 0;
    SharedState::SubscriptionId second = 0;
    state.Subscribe([&state, &second](Field, const StateValue&) { state.Unsubscribe(second); });
    second = state.Subscribe([&second_calls](Field, const StateValue&) { ++second_calls; });
    state.Set(Field::Running, true);
    EXPECT_EQ(second_calls, 0);
}

TEST(SharedStateTest, ListenerMayWriteState) {
    SharedState state;
    state.Subscribe([&](Field field, const StateValue& value) {
        if (field == Field::Connected && !std::get<bool>(value)) {
            state.Set(Field::CanEdit, false);
        }
    });
    state.Merge(StatePatch{{Field::Connected, true}, {Field::CanEdit, true}});
    state.Set(Field::Connected, false);
    EXPECT_FALSE(state.GetBool(Field::CanEdit));
}

TEST(SharedStateTest, ConcurrentWritersNeverTearSnapshots) {
    SharedState state;
    std::atomic<bool> stop{false};
    std::atomic<int> torn{0};

    std::thread reader([&] {
        while (!stop.load()) {
            const SessionState s = state.Snapshot();
            if (s.death_count != s.boss_death_count) {
                torn.fetch_add(1);
            }
        }
    });
    std::vector<std::thread> writers;
    for (int w = 0; w < 4; ++w) {
        writers.emplace_back([&state, w] {
            for (int i = 0; i < 500; ++i) {
                const std::int64_t v = w * 1000 + i;
                state.Merge(StatePatch{{Field::DeathCount, v}, {Field::BossDeathCount, v}});
            }
        });
    }
    for (auto& t : writers) {
        t.join();
    }
    stop.store(true);
    reader.join();
    EXPECT_EQ(torn.load(), 0);
}

TEST(SharedStateTest, FieldNamesRoundTrip) {
    EXPECT_STREQ(FieldName(Field::ElapsedMs), "elapsedMs");
    EXPECT_EQ(FieldFromName("bossDeathCount"), Field::BossDeathCount);
    EXPECT_EQ(DescribeValue(StateValue(true)), "true");
    EXPECT_EQ(DescribeValue(StateValue(std::int64_t{42})), "42");
    EXPECT_EQ(DescribeValue(StateValue(std::string("x"))), "\"x\"");
}

} // namespace
} // namespace bbd
