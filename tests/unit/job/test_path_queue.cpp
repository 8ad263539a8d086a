/**
 * @file test_path_queue.cpp
 * @brief Unit tests for the job work queue
 */

#include <gtest/gtest.h>

#include <kcenon/bulk_transfer/job/path_queue.h>

#include <atomic>
#include <thread>
#include <vector>

namespace kcenon::bulk_transfer::test {

using namespace std::chrono_literals;

class PathQueueTest : public ::testing::Test {
protected:
    static auto entry(const std::string& source, uint32_t attempt = 1) -> queued_path {
        return queued_path{std::make_shared<const transfer_path>(source), attempt};
    }
};

TEST_F(PathQueueTest, PushPop_IsFifo) {
    path_queue queue(4);
    ASSERT_TRUE(queue.push(entry("/a"), {}, 10ms).has_value());
    ASSERT_TRUE(queue.push(entry("/b"), {}, 10ms).has_value());
    EXPECT_EQ(queue.size(), 2u);

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->path->source_path, "/a");
    EXPECT_EQ(queue.in_flight(), 1u);
    queue.task_done();
    EXPECT_EQ(queue.in_flight(), 0u);
}

TEST_F(PathQueueTest, Push_FailsWithQueueFullAfterWait) {
    path_queue queue(1);
    ASSERT_TRUE(queue.push(entry("/a"), {}, 10ms).has_value());

    auto start = std::chrono::steady_clock::now();
    auto pushed = queue.push(entry("/b"), {}, 60ms);
    ASSERT_FALSE(pushed.has_value());
    EXPECT_EQ(pushed.error().code, error_code::queue_full);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST_F(PathQueueTest, Push_SucceedsWhenSpaceFreesUp) {
    path_queue queue(1);
    ASSERT_TRUE(queue.push(entry("/a"), {}, 10ms).has_value());

    std::thread consumer([&] {
        std::this_thread::sleep_for(30ms);
        auto popped = queue.pop();
        if (popped) {
            queue.task_done();
        }
    });
    EXPECT_TRUE(queue.push(entry("/b"), {}, 2s).has_value());
    consumer.join();
}

TEST_F(PathQueueTest, Push_CanceledWhileWaiting) {
    path_queue queue(1);
    ASSERT_TRUE(queue.push(entry("/a"), {}, 10ms).has_value());

    cancellation_source source;
    std::thread canceler([&] {
        std::this_thread::sleep_for(20ms);
        source.cancel();
    });
    auto pushed = queue.push(entry("/b"), source.token(), 5s);
    canceler.join();
    ASSERT_FALSE(pushed.has_value());
    EXPECT_EQ(pushed.error().code, error_code::operation_canceled);
}

TEST_F(PathQueueTest, Push_AfterCloseIsInvalidState) {
    path_queue queue(4);
    queue.close();
    auto pushed = queue.push(entry("/a"), {}, 10ms);
    ASSERT_FALSE(pushed.has_value());
    EXPECT_EQ(pushed.error().code, error_code::invalid_state);
    EXPECT_FALSE(queue.push_unbounded(entry("/b")).has_value());
}

TEST_F(PathQueueTest, PushUnbounded_IgnoresCapacity) {
    path_queue queue(1);
    ASSERT_TRUE(queue.push(entry("/a"), {}, 10ms).has_value());
    ASSERT_TRUE(queue.push_unbounded(entry("/b")).has_value());
    EXPECT_EQ(queue.size(), 2u);
}

TEST_F(PathQueueTest, Delayed_BecomesReadyAfterDeadline) {
    path_queue queue(4);
    auto start = std::chrono::steady_clock::now();
    queue.push_delayed(entry("/retry", 2), start + 50ms);
    EXPECT_EQ(queue.delayed_count(), 1u);

    auto popped = queue.pop();
    ASSERT_TRUE(popped.has_value());
    EXPECT_EQ(popped->attempt, 2u);
    EXPECT_GE(std::chrono::steady_clock::now() - start, 45ms);
    queue.task_done();
}

TEST_F(PathQueueTest, Delayed_AcceptedAfterClose) {
    path_queue queue(4);
    queue.close();
    queue.push_delayed(entry("/retry", 2), std::chrono::steady_clock::now());
    auto popped = queue.pop();
    ASSERT_TRUE(popped.has_value());
    queue.task_done();
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(PathQueueTest, Abort_DropsWorkAndWakesConsumers) {
    path_queue queue(8);
    ASSERT_TRUE(queue.push(entry("/a"), {}, 10ms).has_value());
    ASSERT_TRUE(queue.push(entry("/b"), {}, 10ms).has_value());
    queue.push_delayed(entry("/c"), std::chrono::steady_clock::now() + 1h);

    EXPECT_EQ(queue.abort(), 3u);
    EXPECT_TRUE(queue.is_aborted());
    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_TRUE(queue.wait_idle(std::chrono::steady_clock::now() + 100ms));
}

TEST_F(PathQueueTest, WaitIdle_WaitsForInFlightWork) {
    path_queue queue(4);
    ASSERT_TRUE(queue.push(entry("/a"), {}, 10ms).has_value());
    queue.close();

    auto popped = queue.pop();
    ASSERT_TRUE(popped.has_value());
    EXPECT_FALSE(queue.wait_idle(std::chrono::steady_clock::now() + 30ms));

    queue.task_done();
    EXPECT_TRUE(queue.wait_idle(std::chrono::steady_clock::now() + 1s));
}

TEST_F(PathQueueTest, Pop_ReturnsNulloptWhenClosedAndDrained) {
    path_queue queue(4);
    std::atomic<int> finished{0};
    std::vector<std::thread> workers;
    for (int i = 0; i < 3; ++i) {
        workers.emplace_back([&] {
            while (auto item = queue.pop()) {
                queue.task_done();
            }
            ++finished;
        });
    }
    for (int i = 0; i < 10; ++i) {
        ASSERT_TRUE(queue.push(entry("/p" + std::to_string(i)), {}, 1s).has_value());
    }
    queue.close();
    for (auto& worker : workers) {
        worker.join();
    }
    EXPECT_EQ(finished.load(), 3);
    EXPECT_EQ(queue.size(), 0u);
}

}  // namespace kcenon::bulk_transfer::test
