#include <gtest/gtest.h>
#include <incidentguard/incidentguard.hpp>

#include <atomic>
#include <thread>
#include <vector>

using namespace incidentguard;
using namespace std::chrono_literals;

// ===========================================================================
// Fixture: a breaker that opens after 3 failures with a 10s cooldown
// ===========================================================================

class CircuitBreakerTest : public ::testing::Test {
protected:
    BreakerConfig cfg;
    std::unique_ptr<CircuitBreaker> breaker;
    Timestamp t0;

    void SetUp() override {
        cfg.failure_threshold = 3;
        cfg.cooldown = 10s;
        t0 = Clock::now();
        breaker = std::make_unique<CircuitBreaker>(AgentRole::Diagnosis, cfg);
    }

    void trip() {
        for (std::size_t i = 0; i < cfg.failure_threshold; ++i) {
            breaker->record_failure(t0);
        }
    }
};

// ===========================================================================
// Closed state
// ===========================================================================

TEST_F(CircuitBreakerTest, StartsClosedAndAllowsDispatch) {
    EXPECT_EQ(breaker->state(), BreakerState::Closed);
    EXPECT_TRUE(breaker->allow_dispatch(t0));
    EXPECT_EQ(breaker->role(), AgentRole::Diagnosis);
}

TEST_F(CircuitBreakerTest, StaysClosedBelowThreshold) {
    EXPECT_FALSE(breaker->record_failure(t0).has_value());
    EXPECT_FALSE(breaker->record_failure(t0).has_value());
    EXPECT_EQ(breaker->state(), BreakerState::Closed);
    EXPECT_EQ(breaker->stats().consecutive_failures, 2u);
}

TEST_F(CircuitBreakerTest, SuccessResetsConsecutiveFailures) {
    breaker->record_failure(t0);
    breaker->record_failure(t0);
    EXPECT_FALSE(breaker->record_success(t0).has_value());
    breaker->record_failure(t0);
    breaker->record_failure(t0);
    EXPECT_EQ(breaker->state(), BreakerState::Closed);
}

TEST_F(CircuitBreakerTest, OpensAtThreshold) {
    breaker->record_failure(t0);
    breaker->record_failure(t0);
    auto change = breaker->record_failure(t0);
    ASSERT_TRUE(change.has_value());
    EXPECT_EQ(*change, BreakerState::Open);
    EXPECT_EQ(breaker->state(), BreakerState::Open);
}

// ===========================================================================
// Open and HalfOpen
// ===========================================================================

TEST_F(CircuitBreakerTest, OpenRejectsDuringCooldown) {
    trip();
    EXPECT_FALSE(breaker->allow_dispatch(t0 + 5s));
    EXPECT_EQ(breaker->state(), BreakerState::Open);
}

TEST_F(CircuitBreakerTest, CooldownMovesToHalfOpen) {
    trip();
    EXPECT_TRUE(breaker->allow_dispatch(t0 + 10s));
    EXPECT_EQ(breaker->state(), BreakerState::HalfOpen);
}

TEST_F(CircuitBreakerTest, PermitReportsHalfOpenMoveOnce) {
    trip();
    auto denied = breaker->try_dispatch(t0 + 5s);
    EXPECT_FALSE(denied.allowed);
    EXPECT_FALSE(denied.transition.has_value());

    auto first = breaker->try_dispatch(t0 + 10s);
    EXPECT_TRUE(first.allowed);
    ASSERT_TRUE(first.transition.has_value());
    EXPECT_EQ(*first.transition, BreakerState::HalfOpen);

    auto second = breaker->try_dispatch(t0 + 10s);
    EXPECT_TRUE(second.allowed);
    EXPECT_FALSE(second.transition.has_value());
}

TEST_F(CircuitBreakerTest, HalfOpenSuccessCloses) {
    trip();
    ASSERT_TRUE(breaker->allow_dispatch(t0 + 11s));
    auto change = breaker->record_success(t0 + 11s);
    ASSERT_TRUE(change.has_value());
    EXPECT_EQ(*change, BreakerState::Closed);
    EXPECT_EQ(breaker->stats().consecutive_failures, 0u);
}

TEST_F(CircuitBreakerTest, HalfOpenFailureReopens) {
    trip();
    ASSERT_TRUE(breaker->allow_dispatch(t0 + 11s));
    auto change = breaker->record_failure(t0 + 11s);
    ASSERT_TRUE(change.has_value());
    EXPECT_EQ(*change, BreakerState::Open);

    // Cooldown restarts from the reopen
    EXPECT_FALSE(breaker->allow_dispatch(t0 + 15s));
    EXPECT_TRUE(breaker->allow_dispatch(t0 + 21s));
}

// ===========================================================================
// Stats and reset
// ===========================================================================

TEST_F(CircuitBreakerTest, StatsCountOutcomesAndTransitions) {
    breaker->record_success(t0);
    trip();
    auto s = breaker->stats();
    EXPECT_EQ(s.total_successes, 1u);
    EXPECT_EQ(s.total_failures, 3u);
    EXPECT_EQ(s.state_changes, 1u);
    EXPECT_DOUBLE_EQ(s.failure_rate(), 0.75);
    ASSERT_TRUE(s.last_failure.has_value());
    ASSERT_TRUE(s.last_success.has_value());
}

TEST_F(CircuitBreakerTest, ResetReturnsToClosed) {
    trip();
    breaker->reset(t0);
    EXPECT_EQ(breaker->state(), BreakerState::Closed);
    EXPECT_EQ(breaker->stats().total_failures, 0u);
}

TEST(CircuitBreakerConfigTest, ZeroThresholdThrows) {
    BreakerConfig cfg;
    cfg.failure_threshold = 0;
    EXPECT_THROW(CircuitBreaker(AgentRole::Detection, cfg), InvalidConfigurationException);
}

TEST(CircuitBreakerConcurrencyTest, ConcurrentFailuresOpenExactlyOnce) {
    BreakerConfig cfg;
    cfg.failure_threshold = 5;
    CircuitBreaker breaker(AgentRole::Prediction, cfg);

    std::atomic<int> opened{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            for (int j = 0; j < 10; ++j) {
                auto change = breaker.record_failure();
                if (change && *change == BreakerState::Open) opened++;
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(opened.load(), 1);
    EXPECT_EQ(breaker.stats().total_failures, 80u);
}

TEST(CircuitBreakerConcurrencyTest, ConcurrentDispatchAfterCooldownHalfOpensOnce) {
    BreakerConfig cfg;
    cfg.failure_threshold = 1;
    cfg.cooldown = 1ms;
    CircuitBreaker breaker(AgentRole::Resolution, cfg);
    breaker.record_failure();
    std::this_thread::sleep_for(5ms);

    std::atomic<int> half_opened{0};
    std::atomic<int> allowed{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&]() {
            auto permit = breaker.try_dispatch();
            if (permit) allowed++;
            if (permit.transition && *permit.transition == BreakerState::HalfOpen) half_opened++;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(half_opened.load(), 1);
    EXPECT_EQ(allowed.load(), 8);
    EXPECT_EQ(breaker.stats().state_changes, 2u);
}

// ===========================================================================
// Registry
// ===========================================================================

TEST(CircuitBreakerRegistryTest, HoldsOneBreakerPerRole) {
    CircuitBreakerRegistry registry({AgentRole::Detection, AgentRole::Diagnosis}, BreakerConfig{});
    EXPECT_TRUE(registry.contains(AgentRole::Detection));
    EXPECT_TRUE(registry.contains(AgentRole::Diagnosis));
    EXPECT_FALSE(registry.contains(AgentRole::Resolution));
    EXPECT_EQ(registry.breaker(AgentRole::Diagnosis).role(), AgentRole::Diagnosis);
}

TEST(CircuitBreakerRegistryTest, UnknownRoleThrows) {
    CircuitBreakerRegistry registry({AgentRole::Detection}, BreakerConfig{});
    EXPECT_THROW(registry.breaker(AgentRole::Communication), InvalidConfigurationException);
}

TEST(CircuitBreakerRegistryTest, TrippingOneRoleLeavesOthersClosed) {
    BreakerConfig cfg;
    cfg.failure_threshold = 1;
    CircuitBreakerRegistry registry({AgentRole::Detection, AgentRole::Diagnosis}, cfg);

    registry.breaker(AgentRole::Diagnosis).record_failure();

    auto snapshot = registry.snapshot();
    ASSERT_EQ(snapshot.size(), 2u);
    EXPECT_EQ(snapshot[0].role, AgentRole::Detection);
    EXPECT_EQ(snapshot[0].state, BreakerState::Closed);
    EXPECT_EQ(snapshot[1].role, AgentRole::Diagnosis);
    EXPECT_EQ(snapshot[1].state, BreakerState::Open);

    registry.reset_all();
    EXPECT_EQ(registry.breaker(AgentRole::Diagnosis).state(), BreakerState::Closed);
}
