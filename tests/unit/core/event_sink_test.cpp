#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>
#include <stdexcept>

#include "batch_core/async/event_sink.hpp"
#include "mocks_test.hpp"

namespace batch_tests {

using namespace batch_core;
using namespace batch_core::async;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::Throw;

namespace {

TaskEvent progress_event(long long task_id, int percent) {
  TaskEvent event;
  event.kind = TaskEventKind::Progress;
  event.task_id = task_id;
  event.progress = percent;
  event.current_step = "encoding";
  return event;
}

TaskEvent log_event(long long task_id, const std::string& message) {
  TaskLog log;
  log.task_id = task_id;
  log.level = LogLevel::Error;
  log.message = message;
  TaskEvent event;
  event.kind = TaskEventKind::Log;
  event.task_id = task_id;
  event.log = log;
  return event;
}

}  // namespace

TEST(ConsoleEventSinkTest, PrintsOneLinePerEvent) {
  std::ostringstream out;
  ConsoleEventSink sink(out);

  sink.notify(progress_event(4, 35));
  sink.notify(log_event(4, "disk full"));

  EXPECT_EQ(out.str(), "[Task 4] progress 35% encoding\n[Task 4] log [error] disk full\n");
}

TEST(ConsoleEventSinkTest, FailedEventShowsErrorCode) {
  std::ostringstream out;
  ConsoleEventSink sink(out);

  Task task;
  task.id = 9;
  task.status = TaskStatus::FAILED;
  TaskError error;
  error.code = "PROCESS_EXIT";
  error.message = "Process exited with code 1";
  task.error = error;

  TaskEvent event;
  event.kind = TaskEventKind::Failed;
  event.task_id = 9;
  event.task = task;
  sink.notify(event);

  EXPECT_THAT(out.str(), HasSubstr("[Task 9] failed: PROCESS_EXIT Process exited with code 1"));
}

TEST(ConsoleEventSinkTest, LogLinesCanBeHidden) {
  std::ostringstream out;
  ConsoleEventSink sink(out, /*show_logs*/ false);

  sink.notify(log_event(1, "noise"));
  EXPECT_TRUE(out.str().empty());
}

TEST(BroadcastEventSinkTest, ThrowingSinkDoesNotStopOthers) {
  auto failing = std::make_shared<MockEventSink>();
  auto recording = std::make_shared<RecordingEventSink>();
  EXPECT_CALL(*failing, notify(_)).WillOnce(Throw(std::runtime_error("listener gone")));

  BroadcastEventSink broadcast;
  broadcast.add_sink(failing);
  broadcast.add_sink(recording);
  EXPECT_EQ(broadcast.size(), 2u);

  EXPECT_NO_THROW(broadcast.notify(progress_event(2, 10)));
  EXPECT_EQ(recording->count(TaskEventKind::Progress, 2), 1);
}

TEST(EventJsonTest, IncludesOnlyPresentFields) {
  nlohmann::json j = to_json(progress_event(5, 60));
  EXPECT_EQ(j["event"], "progress");
  EXPECT_EQ(j["taskId"], 5);
  EXPECT_EQ(j["progress"], 60);
  EXPECT_EQ(j["currentStep"], "encoding");
  EXPECT_FALSE(j.contains("task"));
  EXPECT_FALSE(j.contains("log"));
}

}  // namespace batch_tests
