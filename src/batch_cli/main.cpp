#include <iostream>

#include "batch_cli/app_config.hpp"
#include "batch_cli/cli_handler.hpp"
#include "batch_core/async/event_sink.hpp"
#include "batch_core/async/process_execution_adapter.hpp"
#include "batch_core/db/database_manager.hpp"
#include "batch_core/services/encryption_key_service.hpp"
#include "batch_core/services/task_center.hpp"

int main(int argc, char *argv[]) {
  try {
    batch_cli::CliOptions options = batch_cli::parse_arguments(argc, argv);
    if (options.command == batch_cli::Command::Help) {
      batch_cli::print_help(std::cout);
      return 0;
    }

    batch_cli::AppConfig config = batch_cli::AppConfig::load(options.config_path);

    const std::string db_key =
        batch_core::EncryptionKeyService::get_database_key(config.resolved_key_file());
    auto &db_manager = batch_core::DatabaseManager::get_instance();
    db_manager.initialize(config.database_path, db_key, config.pool_size);

    // Events go to stderr so stdout stays machine readable
    batch_core::async::ConsoleEventSink events(std::cerr,
                                               options.command == batch_cli::Command::Run);
    batch_core::async::ProcessExecutionAdapter adapter;
    {
      batch_core::TaskCenter center(db_manager, adapter, events);
      batch_cli::CliHandler handler(center, config);
      handler.execute_command(options);
      center.shutdown();
    }

    db_manager.shutdown();
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
