#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include <unistd.h>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"

namespace {

namespace fs = std::filesystem;

using namespace mediaflow::observability;

std::string ReadAll(const fs::path& path) {
  std::ifstream in(path);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void TestFileSinkReceivesStructuredFields() {
  ::unsetenv("MEDIAFLOW_LOG_LEVEL");
  ::unsetenv("MEDIAFLOW_LOG_PATTERN");
  ::unsetenv("MEDIAFLOW_LOG_FILE");

  const auto dir = fs::temp_directory_path() / ("mediaflow_logging_test_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  const auto log_path = dir / "uploader.log";

  mediaflow::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("info");
  config.mutable_logging()->set_pattern("%l %v");
  config.mutable_logging()->set_file_path(log_path.string());
  InitializeLogging(config);

  MEDIAFLOW_LOG_DEBUG("hidden below level", {StringField("task_id", "t_0")});
  MEDIAFLOW_LOG_WARN("upload failed", {StringField("session_id", "upl_1"), StringField("message", "Upload stalled: no \"progress\""),
                                       IntField("elapsed_ms", 900), BoolField("retryable", true), StringField("caption", "")});
  ShutdownLogging();

  const auto contents = ReadAll(log_path);
  assert(contents.find("hidden below level") == std::string::npos);
  assert(contents.find("warning upload failed session_id=upl_1") != std::string::npos);
  assert(contents.find(R"(message="Upload stalled: no \"progress\"")") != std::string::npos);
  assert(contents.find("elapsed_ms=900 retryable=true caption=\"\"") != std::string::npos);

  fs::remove_all(dir);
}

void TestEnvironmentOverridesLevel() {
  const auto dir = fs::temp_directory_path() / ("mediaflow_logging_env_" + std::to_string(::getpid()));
  fs::remove_all(dir);
  fs::create_directories(dir);
  const auto log_path = dir / "env.log";

  ::setenv("MEDIAFLOW_LOG_LEVEL", "error", 1);
  ::setenv("MEDIAFLOW_LOG_FILE", log_path.string().c_str(), 1);

  mediaflow::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("debug");
  config.mutable_logging()->set_pattern("%v");
  InitializeLogging(config);

  MEDIAFLOW_LOG_WARN("below override");
  MEDIAFLOW_LOG_ERROR("placeholder creation failed", {DoubleField("ratio", 0.5)});
  ShutdownLogging();

  ::unsetenv("MEDIAFLOW_LOG_LEVEL");
  ::unsetenv("MEDIAFLOW_LOG_FILE");

  const auto contents = ReadAll(log_path);
  assert(contents.find("below override") == std::string::npos);
  assert(contents.find("placeholder creation failed ratio=0.500") != std::string::npos);

  fs::remove_all(dir);
}

} // namespace

int main() {
  TestFileSinkReceivesStructuredFields();
  TestEnvironmentOverridesLevel();

  std::cout << "mediaflow_unit_logging: pass\n";
  return 0;
}
