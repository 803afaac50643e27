/**
 * @file test_job_queue.cpp
 * @brief Unit tests for the transfer job queue
 */

#include <gtest/gtest.h>

#include <kcenon/file_ripper/core/job_queue.h>

#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::file_ripper::test {

class JobQueueTest : public ::testing::Test {
protected:
    static auto make_job(int n) -> transfer_job {
        return transfer_job{
            "/src/file_" + std::to_string(n),
            "dst/file_" + std::to_string(n),
            transfer_direction::upload};
    }
};

TEST_F(JobQueueTest, EmptyQueuePopsNothing) {
    job_queue queue;

    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.count(), 0u);
    EXPECT_FALSE(queue.pop().has_value());
    EXPECT_EQ(queue.popped_count(), 0u);
}

TEST_F(JobQueueTest, PopsInInsertionOrder) {
    job_queue queue;
    for (int i = 0; i < 5; ++i) {
        queue.add(make_job(i));
    }

    for (int i = 0; i < 5; ++i) {
        auto job = queue.pop();
        ASSERT_TRUE(job.has_value());
        EXPECT_EQ(*job, make_job(i));
    }
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(JobQueueTest, CountersStayBalanced) {
    job_queue queue;
    for (int i = 0; i < 10; ++i) {
        queue.add(make_job(i));
    }
    for (int i = 0; i < 4; ++i) {
        (void)queue.pop();
    }

    EXPECT_EQ(queue.added_count(), 10u);
    EXPECT_EQ(queue.popped_count(), 4u);
    EXPECT_EQ(queue.count(), 6u);
    EXPECT_EQ(queue.popped_count() + queue.count(), queue.added_count());
}

TEST_F(JobQueueTest, ConcurrentDrainDeliversEachJobOnce) {
    constexpr int job_count = 2000;
    constexpr int worker_count = 8;

    job_queue queue;
    for (int i = 0; i < job_count; ++i) {
        queue.add(make_job(i));
    }

    std::mutex seen_mutex;
    std::multiset<std::string> seen;
    std::vector<std::thread> workers;
    for (int w = 0; w < worker_count; ++w) {
        workers.emplace_back([&]() {
            while (auto job = queue.pop()) {
                std::lock_guard<std::mutex> lock(seen_mutex);
                seen.insert(job->remote_path);
            }
        });
    }
    for (auto& t : workers) {
        t.join();
    }

    EXPECT_EQ(seen.size(), static_cast<std::size_t>(job_count));
    for (int i = 0; i < job_count; ++i) {
        EXPECT_EQ(seen.count("dst/file_" + std::to_string(i)), 1u);
    }
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.popped_count(), static_cast<std::size_t>(job_count));
}

}  // namespace kcenon::file_ripper::test
