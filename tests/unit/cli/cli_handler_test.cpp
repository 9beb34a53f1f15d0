#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <sstream>
#include <string>
#include <vector>

#include "batch_cli/cli_handler.hpp"
#include "batch_core/errors.hpp"

using namespace batch_cli;
using ::testing::HasSubstr;

namespace {

CliOptions parse(std::vector<std::string> args) {
  std::vector<char*> argv;
  static char program[] = "batchctl";
  argv.push_back(program);
  for (auto& arg : args) {
    argv.push_back(arg.data());
  }
  return parse_arguments(static_cast<int>(argv.size()), argv.data());
}

} // namespace

TEST(CliParseTest, NoArgumentsShowsHelp) {
  EXPECT_EQ(parse({}).command, Command::Help);
  EXPECT_EQ(parse({"--help"}).command, Command::Help);
}

TEST(CliParseTest, SubmitBuildsNewTask) {
  CliOptions options = parse({"submit", "video_merge", "/out", "/in/a.mp4", "/in/b.mp4",
                              "--name", "Merge clips", "--priority", "5", "--max-retry", "1",
                              "--config-json", R"({"command": ["ffmpeg"]})"});

  EXPECT_EQ(options.command, Command::Submit);
  EXPECT_EQ(options.new_task.type, batch_core::TaskType::VIDEO_MERGE);
  EXPECT_EQ(options.new_task.output_dir, "/out");
  EXPECT_EQ(options.new_task.name, "Merge clips");
  EXPECT_EQ(options.new_task.priority, 5);
  EXPECT_EQ(options.new_task.max_retry, 1);
  EXPECT_EQ(options.new_task.config["command"][0], "ffmpeg");
  ASSERT_EQ(options.new_task.files.size(), 2u);
  EXPECT_EQ(options.new_task.files[1].path, "/in/b.mp4");
  EXPECT_EQ(options.new_task.files[0].category, "input");
}

TEST(CliParseTest, SubmitRejectsBadInput) {
  EXPECT_THROW(parse({"submit", "video_merge"}), CliError);
  EXPECT_THROW(parse({"submit", "not_a_type", "/out", "/in/a.mp4"}), batch_core::ValidationError);
  EXPECT_THROW(parse({"submit", "video_merge", "/out", "--priority", "high"}), CliError);
  EXPECT_THROW(parse({"submit", "video_merge", "/out", "--config-json", "{oops"}), CliError);
  EXPECT_THROW(parse({"submit", "video_merge", "/out", "--name"}), CliError);
}

TEST(CliParseTest, ListFiltersAndPaging) {
  CliOptions options = parse({"ls", "--status", "failed,cancelled", "--type", "cover_format",
                              "--search", "holiday", "--page", "2", "--page-size", "10",
                              "--sort", "priority", "--asc"});

  EXPECT_EQ(options.command, Command::List);
  const auto& list = options.list_options;
  ASSERT_EQ(list.filter.statuses.size(), 2u);
  EXPECT_EQ(list.filter.statuses[0], batch_core::TaskStatus::FAILED);
  EXPECT_EQ(list.filter.statuses[1], batch_core::TaskStatus::CANCELLED);
  ASSERT_EQ(list.filter.types.size(), 1u);
  EXPECT_EQ(list.filter.search, "holiday");
  EXPECT_EQ(list.page, 2);
  EXPECT_EQ(list.page_size, 10);
  EXPECT_EQ(list.sort.field, batch_core::TaskSortField::PRIORITY);
  EXPECT_EQ(list.sort.order, batch_core::SortOrder::ASC);

  EXPECT_THROW(parse({"list", "--page", "0"}), CliError);
  EXPECT_THROW(parse({"list", "--bogus"}), CliError);
}

TEST(CliParseTest, TaskIdCommands) {
  EXPECT_EQ(parse({"get", "12"}).task_id, 12);
  EXPECT_EQ(parse({"rm", "3"}).command, Command::Delete);
  EXPECT_THROW(parse({"cancel"}), CliError);
  EXPECT_THROW(parse({"retry", "abc"}), CliError);
  EXPECT_THROW(parse({"start", "-4"}), CliError);
}

TEST(CliParseTest, LogsAndRecentDefaults) {
  CliOptions logs = parse({"logs", "7", "--limit", "50", "--offset", "10"});
  EXPECT_EQ(logs.command, Command::Logs);
  EXPECT_EQ(logs.task_id, 7);
  EXPECT_EQ(logs.limit, 50);
  EXPECT_EQ(logs.offset, 10);

  CliOptions recent = parse({"recent"});
  EXPECT_EQ(recent.limit, 100);
  EXPECT_THROW(parse({"recent", "--limit", "0"}), CliError);
}

TEST(CliParseTest, ConfigSubcommands) {
  EXPECT_EQ(parse({"config"}).command, Command::ConfigGet);
  EXPECT_EQ(parse({"config", "reset"}).command, Command::ConfigReset);

  CliOptions number = parse({"config", "set", "maxConcurrentTasks", "3"});
  EXPECT_EQ(number.command, Command::ConfigSet);
  EXPECT_EQ(number.config_key, "maxConcurrentTasks");
  EXPECT_EQ(number.config_value, 3);

  CliOptions word = parse({"config", "set", "theme", "dark"});
  EXPECT_EQ(word.config_value, "dark");

  EXPECT_THROW(parse({"config", "set", "maxConcurrentTasks"}), CliError);
  EXPECT_THROW(parse({"config", "frobnicate"}), CliError);
}

TEST(CliParseTest, GlobalConfigFlagAnywhere) {
  CliOptions options = parse({"status", "--config", "/etc/batchrc.json"});
  EXPECT_EQ(options.command, Command::Status);
  EXPECT_EQ(options.config_path, "/etc/batchrc.json");

  EXPECT_EQ(parse({"-c", "x.json", "clear-completed", "14"}).days, 14);
  EXPECT_THROW(parse({"clear-completed", "-1"}), CliError);
  EXPECT_THROW(parse({"status", "--config"}), CliError);
  EXPECT_THROW(parse({"launch"}), CliError);
}

TEST(CliParseTest, HelpListsEveryTaskType) {
  std::ostringstream out;
  print_help(out);
  EXPECT_THAT(out.str(), HasSubstr("batchctl run"));
  for (batch_core::TaskType type : batch_core::all_task_types()) {
    EXPECT_THAT(out.str(), HasSubstr(batch_core::to_string(type)));
  }
}
