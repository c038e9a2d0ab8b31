#include "core/logging/logger.hpp"

#include <catch2/catch.hpp>

#include <chrono>
#include <sstream>
#include <string>

using diststage::core::logging::LogLevel;
using diststage::core::logging::Logger;

TEST_CASE("Log lines carry level, goal, message and fields", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kInfo, out);
  logger.SetGoal("stage");
  logger.Info("Committed revision 42", {{"staging_url", "https://svn.example/dev"}});

  const std::string line = out.str();
  REQUIRE(line.rfind("ts_utc=", 0) == 0U);
  REQUIRE(line.find(" level=INFO") != std::string::npos);
  REQUIRE(line.find(" goal=\"stage\"") != std::string::npos);
  REQUIRE(line.find(" msg=\"Committed revision 42\"") != std::string::npos);
  REQUIRE(line.find(" staging_url=\"https://svn.example/dev\"") != std::string::npos);
  REQUIRE(line.back() == '\n');
}

TEST_CASE("Messages below the minimum level are dropped", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kWarn, out);
  logger.Debug("debug line");
  logger.Info("info line");
  REQUIRE(out.str().empty());

  logger.Warn("warn line");
  logger.Error("error line");
  REQUIRE(out.str().find("warn line") != std::string::npos);
  REQUIRE(out.str().find("error line") != std::string::npos);

  logger.SetMinLevel(LogLevel::kDebug);
  REQUIRE(logger.ShouldLog(LogLevel::kDebug));
}

TEST_CASE("Quoted values are escaped", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kDebug, out);
  logger.Error("failed", {{"error", "line1\nsaid \"no\""}});
  REQUIRE(out.str().find("error=\"line1\\nsaid \\\"no\\\"\"") != std::string::npos);
}

TEST_CASE("Log levels parse from CLI and config spellings", "[core][logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;
  REQUIRE(diststage::core::logging::ParseLogLevel("debug", level, error));
  REQUIRE(level == LogLevel::kDebug);
  REQUIRE(diststage::core::logging::ParseLogLevel("WARN", level, error));
  REQUIRE(level == LogLevel::kWarn);
  REQUIRE_FALSE(diststage::core::logging::ParseLogLevel("loud", level, error));
  REQUIRE(error.find("debug|info|warn|error") != std::string::npos);
}

TEST_CASE("Registered secrets never reach the sink", "[core][logging]") {
  std::ostringstream out;
  Logger logger(LogLevel::kInfo, out);
  logger.RedactSecret("hunter2");
  logger.RedactSecret("");
  logger.Info("auth with hunter2", {{"command", "svn --password hunter2 checkout"}});

  const std::string line = out.str();
  REQUIRE(line.find("hunter2") == std::string::npos);
  REQUIRE(line.find("msg=\"auth with ********\"") != std::string::npos);
  REQUIRE(line.find("command=\"svn --password ******** checkout\"") != std::string::npos);
}

TEST_CASE("Timestamps are UTC with millisecond precision", "[core][logging]") {
  // 2024-05-01T12:00:00.250Z
  const std::chrono::system_clock::time_point pinned{std::chrono::milliseconds(1714564800250LL)};
  REQUIRE(diststage::core::logging::FormatUtcTimestamp(pinned) == "2024-05-01T12:00:00.250Z");

  std::ostringstream out;
  Logger logger(LogLevel::kInfo, out);
  logger.SetClock([pinned] { return pinned; });
  logger.Info("pinned");
  REQUIRE(out.str().rfind("ts_utc=2024-05-01T12:00:00.250Z level=INFO goal=\"-\"", 0) == 0U);
}
