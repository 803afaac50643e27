/**
 * @file test_directory_plan.cpp
 * @brief Unit tests for directory ordering and the directory phase
 */

#include <gtest/gtest.h>

#include "integration/test_fixtures.h"

#include <kcenon/file_ripper/engine/directory_plan.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <string>
#include <vector>

namespace kcenon::file_ripper::test {

class DirectoryPlanSortTest : public ::testing::Test {};

TEST_F(DirectoryPlanSortTest, ParentsBeforeChildren) {
    std::vector<std::string> plan{
        "dst/src/a/b/c", "dst/src", "dst/src/a/b", "dst/src/z", "dst/src/a"};

    sort_directory_plan(plan);

    for (std::size_t i = 0; i < plan.size(); ++i) {
        auto parent = remote_path::parent(plan[i]);
        auto it = std::find(plan.begin(), plan.end(), parent);
        if (it != plan.end()) {
            EXPECT_LT(static_cast<std::size_t>(it - plan.begin()), i) << plan[i];
        }
    }
    EXPECT_EQ(plan.front(), "dst/src");
}

TEST_F(DirectoryPlanSortTest, EqualLengthKeepsScanOrder) {
    std::vector<std::string> plan{"r/bb", "r/aa", "r", "r/cc"};

    sort_directory_plan(plan);

    EXPECT_EQ(plan, (std::vector<std::string>{"r", "r/bb", "r/aa", "r/cc"}));
}

class DirectoryPhaseTest : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();
        session_ = std::make_shared<fault_injecting_transport>(
            std::make_shared<local_transport>(remote_dir_));
    }

    std::shared_ptr<fault_injecting_transport> session_;
    std::atomic<bool> cancelled_{false};
};

TEST_F(DirectoryPhaseTest, CreatesEveryPlannedDirectory) {
    std::vector<std::string> plan;
    for (int i = 0; i < 30; ++i) {
        plan.push_back("root/d" + std::to_string(i));
    }
    plan.insert(plan.begin(), "root");

    auto outcome = create_directories(*session_, plan, 8, cancelled_);

    EXPECT_EQ(outcome.planned, 31u);
    EXPECT_EQ(outcome.created, 31u);
    EXPECT_TRUE(outcome.failures.empty());
    EXPECT_FALSE(outcome.cancelled);
    for (const auto& dir : plan) {
        EXPECT_TRUE(std::filesystem::is_directory(remote_dir_ / dir)) << dir;
    }
}

TEST_F(DirectoryPhaseTest, FailuresReportedWithoutStoppingOthers) {
    std::vector<std::string> plan{"a", "b", "c"};
    session_->fail_mkdir("b");

    std::vector<std::string> reported;
    std::mutex reported_mutex;
    auto outcome = create_directories(*session_, plan, 2, cancelled_,
                                      [&](const std::string& dir, const error& err) {
                                          std::lock_guard<std::mutex> lock(reported_mutex);
                                          reported.push_back(dir);
                                          EXPECT_EQ(err.code,
                                                    error_code::remote_permission_denied);
                                      });

    EXPECT_EQ(outcome.created, 2u);
    ASSERT_EQ(outcome.failures.size(), 1u);
    EXPECT_EQ(outcome.failures[0].path, "b");
    EXPECT_EQ(reported, (std::vector<std::string>{"b"}));
    EXPECT_TRUE(std::filesystem::is_directory(remote_dir_ / "a"));
    EXPECT_TRUE(std::filesystem::is_directory(remote_dir_ / "c"));
}

TEST_F(DirectoryPhaseTest, ExistingDirectoriesCountAsCreated) {
    std::filesystem::create_directories(remote_dir_ / "already");

    auto outcome = create_directories(*session_, {"already"}, 8, cancelled_);

    EXPECT_EQ(outcome.created, 1u);
    EXPECT_TRUE(outcome.failures.empty());
}

TEST_F(DirectoryPhaseTest, CancelledPhaseCreatesNothing) {
    cancelled_.store(true);

    auto outcome = create_directories(*session_, {"x", "y"}, 4, cancelled_);

    EXPECT_EQ(outcome.created, 0u);
    EXPECT_TRUE(outcome.cancelled);
    EXPECT_TRUE(session_->events().empty());
}

TEST_F(DirectoryPhaseTest, EmptyPlanIsNoop) {
    auto outcome = create_directories(*session_, {}, 8, cancelled_);

    EXPECT_EQ(outcome.planned, 0u);
    EXPECT_EQ(outcome.created, 0u);
}

}  // namespace kcenon::file_ripper::test
