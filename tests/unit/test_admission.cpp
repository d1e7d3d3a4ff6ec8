/**
 * @file test_admission.cpp
 * @brief Unit tests for AdmissionController and CapacityToken.
 * @author Dimitris Kafetzis
 */

#include "admission/admission_controller.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

using namespace sandbox_runner;
using namespace std::chrono_literals;

namespace {

AdmissionOptions options(uint32_t capacity, uint32_t backlog,
                         std::chrono::milliseconds wait = 2000ms) {
    return AdmissionOptions{.capacity = capacity, .backlog = backlog, .max_queue_wait = wait};
}

/// Spin until the controller reports @p queued waiters (bounded).
void wait_for_queued(const AdmissionController& ac, uint32_t queued) {
    for (int i = 0; i < 500 && ac.stats().queued < queued; ++i) {
        std::this_thread::sleep_for(2ms);
    }
}

}  // namespace

// ═══════════════════════════════════════════════
// Capacity
// ═══════════════════════════════════════════════

TEST(AdmissionControllerTest, AdmitsUpToCapacity) {
    AdmissionController ac(options(2, 0));
    auto a = ac.acquire();
    auto b = ac.acquire();
    ASSERT_TRUE(a.has_value());
    ASSERT_TRUE(b.has_value());
    EXPECT_TRUE(a->held());
    EXPECT_EQ(ac.stats().active, 2u);

    auto c = ac.acquire();
    ASSERT_FALSE(c.has_value());
    EXPECT_EQ(c.error().kind, ErrorKind::AdmissionRejected);
    EXPECT_EQ(c.error().reason, admission_reason::kCapacityExhausted);
    EXPECT_EQ(ac.stats().rejected_capacity, 1u);
}

TEST(AdmissionControllerTest, ZeroCapacityIsRaisedToOne) {
    AdmissionController ac(options(0, 0));
    EXPECT_EQ(ac.capacity(), 1u);
    EXPECT_TRUE(ac.acquire().has_value());
}

TEST(AdmissionControllerTest, TokenReleasedOnDestruction) {
    AdmissionController ac(options(1, 0));
    {
        auto token = ac.acquire();
        ASSERT_TRUE(token.has_value());
        EXPECT_EQ(ac.stats().active, 1u);
    }
    EXPECT_EQ(ac.stats().active, 0u);
    EXPECT_TRUE(ac.acquire().has_value());
}

TEST(AdmissionControllerTest, ExplicitReleaseIsIdempotent) {
    AdmissionController ac(options(1, 0));
    auto token = ac.acquire();
    ASSERT_TRUE(token.has_value());
    token->release();
    token->release();
    EXPECT_FALSE(token->held());
    EXPECT_EQ(ac.stats().active, 0u);
}

TEST(AdmissionControllerTest, MovedTokenReleasesOnce) {
    AdmissionController ac(options(2, 0));
    auto first = ac.acquire();
    ASSERT_TRUE(first.has_value());
    CapacityToken moved = std::move(*first);
    EXPECT_FALSE(first->held());
    EXPECT_TRUE(moved.held());
    EXPECT_EQ(ac.stats().active, 1u);
    moved.release();
    EXPECT_EQ(ac.stats().active, 0u);
}

TEST(AdmissionControllerTest, TryAcquireNeverWaits) {
    AdmissionController ac(options(1, 8));
    auto held = ac.try_acquire();
    ASSERT_TRUE(held.has_value());
    auto start = std::chrono::steady_clock::now();
    auto second = ac.try_acquire();
    EXPECT_FALSE(second.has_value());
    EXPECT_LT(std::chrono::steady_clock::now() - start, 100ms);
}

// ═══════════════════════════════════════════════
// Backlog
// ═══════════════════════════════════════════════

TEST(AdmissionControllerTest, QueuedRequestAdmittedOnRelease) {
    AdmissionController ac(options(1, 4));
    auto held = ac.acquire();
    ASSERT_TRUE(held.has_value());

    auto waiter = std::async(std::launch::async, [&] { return ac.acquire(); });
    wait_for_queued(ac, 1);
    EXPECT_EQ(ac.stats().queued, 1u);

    std::this_thread::sleep_for(20ms);
    held->release();

    auto admitted = waiter.get();
    ASSERT_TRUE(admitted.has_value());
    EXPECT_GT(admitted->queue_wait().count(), 0);
    // Hand-off keeps the count steady
    EXPECT_EQ(ac.stats().active, 1u);
    EXPECT_EQ(ac.stats().peak_active, 1u);
}

TEST(AdmissionControllerTest, QueueTimeout) {
    AdmissionController ac(options(1, 4, 50ms));
    auto held = ac.acquire();
    ASSERT_TRUE(held.has_value());

    auto start = std::chrono::steady_clock::now();
    auto waited = ac.acquire();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_FALSE(waited.has_value());
    EXPECT_EQ(waited.error().kind, ErrorKind::AdmissionRejected);
    EXPECT_EQ(waited.error().reason, admission_reason::kQueueTimeout);
    EXPECT_GE(elapsed, 45ms);
    EXPECT_EQ(ac.stats().queued, 0u);
    EXPECT_EQ(ac.stats().rejected_timeout, 1u);
}

TEST(AdmissionControllerTest, FullBacklogRejectsImmediately) {
    AdmissionController ac(options(1, 1));
    auto held = ac.acquire();
    ASSERT_TRUE(held.has_value());

    std::stop_source cancel;
    auto queued = std::async(std::launch::async, [&] { return ac.acquire(0, cancel.get_token()); });
    wait_for_queued(ac, 1);

    auto overflow = ac.acquire();
    ASSERT_FALSE(overflow.has_value());
    EXPECT_EQ(overflow.error().reason, admission_reason::kCapacityExhausted);

    cancel.request_stop();
    auto cancelled = queued.get();
    ASSERT_FALSE(cancelled.has_value());
    EXPECT_EQ(cancelled.error().kind, ErrorKind::Internal);
    EXPECT_EQ(cancelled.error().reason, admission_reason::kCancelled);
    EXPECT_EQ(ac.stats().cancelled, 1u);
}

TEST(AdmissionControllerTest, HigherPriorityAdmittedFirst) {
    AdmissionController ac(options(1, 8));
    auto held = ac.acquire();
    ASSERT_TRUE(held.has_value());

    std::mutex order_mutex;
    std::vector<int> order;
    auto enqueue = [&](int priority) {
        return std::async(std::launch::async, [&, priority] {
            auto token = ac.acquire(priority);
            if (token) {
                std::lock_guard lock(order_mutex);
                order.push_back(priority);
            }
            return token.has_value();
        });
    };

    auto low = enqueue(0);
    wait_for_queued(ac, 1);
    auto high = enqueue(10);
    wait_for_queued(ac, 2);
    auto mid = enqueue(5);
    wait_for_queued(ac, 3);

    held->release();
    EXPECT_TRUE(high.get());
    EXPECT_TRUE(mid.get());
    EXPECT_TRUE(low.get());

    ASSERT_EQ(order.size(), 3u);
    EXPECT_EQ(order[0], 10);
    EXPECT_EQ(order[1], 5);
    EXPECT_EQ(order[2], 0);
}

TEST(AdmissionControllerTest, FifoAmongEqualPriority) {
    AdmissionController ac(options(1, 8));
    auto held = ac.acquire();
    ASSERT_TRUE(held.has_value());

    std::mutex order_mutex;
    std::vector<int> order;
    std::vector<std::future<void>> waiters;
    for (int i = 0; i < 3; ++i) {
        waiters.push_back(std::async(std::launch::async, [&, i] {
            auto token = ac.acquire();
            std::lock_guard lock(order_mutex);
            order.push_back(i);
        }));
        wait_for_queued(ac, static_cast<uint32_t>(i + 1));
    }

    held->release();
    for (auto& w : waiters) w.get();
    EXPECT_EQ(order, (std::vector<int>{0, 1, 2}));
}

// ═══════════════════════════════════════════════
// Shutdown
// ═══════════════════════════════════════════════

TEST(AdmissionControllerTest, ShutdownRejectsQueuedAndNew) {
    AdmissionController ac(options(1, 4));
    auto held = ac.acquire();
    ASSERT_TRUE(held.has_value());

    auto queued = std::async(std::launch::async, [&] { return ac.acquire(); });
    wait_for_queued(ac, 1);
    ac.shutdown();

    auto rejected = queued.get();
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().reason, admission_reason::kShuttingDown);

    auto late = ac.acquire();
    ASSERT_FALSE(late.has_value());
    EXPECT_EQ(late.error().reason, admission_reason::kShuttingDown);

    // Held tokens stay valid through shutdown
    EXPECT_TRUE(held->held());
    EXPECT_TRUE(ac.stats().shutting_down);
}

TEST(AdmissionControllerTest, WaitIdle) {
    AdmissionController ac(options(2, 0));
    auto token = ac.acquire();
    ASSERT_TRUE(token.has_value());
    EXPECT_FALSE(ac.wait_idle(20ms));

    std::jthread releaser([&] {
        std::this_thread::sleep_for(30ms);
        token->release();
    });
    EXPECT_TRUE(ac.wait_idle(2000ms));
}

TEST(AdmissionControllerTest, ConcurrentCeilingHolds) {
    constexpr uint32_t kCapacity = 3;
    AdmissionController ac(options(kCapacity, 64, 5000ms));
    std::atomic<int> inside{0};
    std::atomic<int> max_inside{0};

    std::vector<std::jthread> threads;
    for (int i = 0; i < 24; ++i) {
        threads.emplace_back([&] {
            auto token = ac.acquire();
            if (!token) return;
            int now = ++inside;
            int seen = max_inside.load();
            while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {}
            std::this_thread::sleep_for(5ms);
            --inside;
        });
    }
    threads.clear();

    EXPECT_LE(max_inside.load(), static_cast<int>(kCapacity));
    EXPECT_LE(ac.stats().peak_active, kCapacity);
    EXPECT_EQ(ac.stats().admitted, 24u);
    EXPECT_EQ(ac.stats().active, 0u);
}
