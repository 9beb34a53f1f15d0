#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <system_error>

#include "batch_core/db/database_manager.hpp"

namespace {

// Keeps the developer's shell from leaking a database key into the suite and
// sweeps the scratch directory the fixtures create databases in.
class BatchForgeEnvironment : public ::testing::Environment {
 public:
  void SetUp() override {
    unsetenv("BATCHFORGE_DB_KEY");
  }

  void TearDown() override {
    batch_core::DatabaseManager::get_instance().shutdown();
    std::error_code ec;
    std::filesystem::remove_all(std::filesystem::temp_directory_path() / "batchforge_tests", ec);
  }
};

}  // namespace

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  ::testing::AddGlobalTestEnvironment(new BatchForgeEnvironment);
  return RUN_ALL_TESTS();
}
