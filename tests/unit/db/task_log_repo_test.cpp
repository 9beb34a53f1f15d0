#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "../../common/utilities_test.hpp"

namespace batch_core {

class TaskLogRepoTest : public batch_tests::DatabaseTestBase {
 protected:
  void SetUp() override {
    batch_tests::DatabaseTestBase::SetUp();
    task_ = task_repo_->create_task(batch_tests::TestUtilities::create_test_new_task("logged"));
    other_ = task_repo_->create_task(
        batch_tests::TestUtilities::create_test_new_task("other", TaskType::COVER_COMPRESS));
  }

  Task task_;
  Task other_;
};

TEST_F(TaskLogRepoTest, AddLog_ReturnsStoredLine) {
  TaskLog log = log_repo_->add_log(task_.id, LogLevel::Warning, "disk almost full",
                                   std::string("raw output"));

  EXPECT_GT(log.id, 0);
  EXPECT_EQ(log.task_id, task_.id);
  EXPECT_EQ(log.level, LogLevel::Warning);
  EXPECT_EQ(log.message, "disk almost full");
  EXPECT_EQ(log.raw, "raw output");
}

TEST_F(TaskLogRepoTest, GetTaskLogs_OldestFirstWithPaging) {
  for (int i = 0; i < 5; ++i) {
    log_repo_->add_log(task_.id, LogLevel::Info, "line " + std::to_string(i));
  }
  log_repo_->add_log(other_.id, LogLevel::Info, "not mine");

  auto all = log_repo_->get_task_logs(task_.id);
  ASSERT_EQ(all.size(), 5u);
  EXPECT_EQ(all.front().message, "line 0");
  EXPECT_EQ(all.back().message, "line 4");

  auto page = log_repo_->get_task_logs(task_.id, 2, 1);
  ASSERT_EQ(page.size(), 2u);
  EXPECT_EQ(page[0].message, "line 1");
  EXPECT_EQ(page[1].message, "line 2");
}

TEST_F(TaskLogRepoTest, GetRecentLogs_NewestWindowReturnedOldestFirst) {
  log_repo_->add_log(task_.id, LogLevel::Info, "a");
  log_repo_->add_log(other_.id, LogLevel::Error, "b");
  log_repo_->add_log(task_.id, LogLevel::Success, "c");

  auto recent = log_repo_->get_recent_logs(2);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].message, "b");
  EXPECT_EQ(recent[1].message, "c");
  EXPECT_EQ(recent[0].task_type, "cover_compress");
  EXPECT_EQ(recent[1].task_type, "video_merge");
}

TEST_F(TaskLogRepoTest, Counts_PerTaskAndOverall) {
  log_repo_->add_log(task_.id, LogLevel::Info, "one");
  log_repo_->add_log(task_.id, LogLevel::Debug, "two");
  log_repo_->add_log(other_.id, LogLevel::Info, "three");

  EXPECT_EQ(log_repo_->get_log_count(task_.id), 2);
  EXPECT_EQ(log_repo_->get_log_count(), 3);
  EXPECT_GT(log_repo_->get_log_size_bytes(), 0);
}

TEST_F(TaskLogRepoTest, ClearLogs_ReturnsRemovedCount) {
  log_repo_->add_log(task_.id, LogLevel::Info, "one");
  log_repo_->add_log(task_.id, LogLevel::Info, "two");
  log_repo_->add_log(other_.id, LogLevel::Info, "three");

  EXPECT_EQ(log_repo_->clear_task_logs(task_.id), 2);
  EXPECT_EQ(log_repo_->get_log_count(task_.id), 0);
  EXPECT_EQ(log_repo_->get_log_count(other_.id), 1);

  EXPECT_EQ(log_repo_->clear_all_logs(), 1);
  EXPECT_EQ(log_repo_->get_log_count(), 0);
}

TEST_F(TaskLogRepoTest, AddLog_UnknownTaskRejected) {
  try {
    log_repo_->add_log(999999, LogLevel::Info, "orphan");
    FAIL() << "Expected NotFoundError";
  } catch (const NotFoundError& e) {
    EXPECT_EQ(e.task_id(), 999999);
  }
  EXPECT_EQ(log_repo_->get_log_count(), 0);
}

}  // namespace batch_core
