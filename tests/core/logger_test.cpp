#include "core/logging/logger.hpp"

#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <thread>

using camctl::core::logging::CurrentThreadTag;
using camctl::core::logging::Logger;
using camctl::core::logging::LogLevel;
using camctl::core::logging::ParseLogLevel;
using camctl::core::logging::ScopedThreadTag;

TEST_CASE("records carry level, device, thread and quoted fields", "[logging]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kDebug, sink);
  logger.SetDevice("/dev/video0");
  logger.Info("frame dropped", {{"queue", "recorder"}, {"detail", "a \"b\"\nc"}});

  const std::string line = sink.str();
  CHECK(line.find("level=INFO") != std::string::npos);
  CHECK(line.find("device=\"/dev/video0\"") != std::string::npos);
  CHECK(line.find("thread=\"main\"") != std::string::npos);
  CHECK(line.find("msg=\"frame dropped\"") != std::string::npos);
  CHECK(line.find("queue=\"recorder\"") != std::string::npos);
  CHECK(line.find("detail=\"a \\\"b\\\"\\nc\"") != std::string::npos);
  CHECK(line.back() == '\n');
  CHECK(line.find('\n') == line.size() - 1U);
  CHECK(logger.RecordCount() == 1U);
}

TEST_CASE("records below the minimum level are filtered", "[logging]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kWarn, sink);
  logger.Debug("hidden");
  logger.Info("hidden");
  logger.Warn("shown");
  CHECK(sink.str().find("hidden") == std::string::npos);
  CHECK(sink.str().find("level=WARN") != std::string::npos);
  CHECK(logger.RecordCount() == 1U);

  logger.SetMinLevel(LogLevel::kDebug);
  logger.Debug("now shown");
  CHECK(logger.RecordCount() == 2U);
}

TEST_CASE("an empty device path is reported as a dash", "[logging]") {
  std::ostringstream sink;
  Logger logger(LogLevel::kInfo, sink);
  logger.SetDevice("/dev/video2");
  logger.SetDevice("");
  CHECK(logger.Device() == "-");
}

TEST_CASE("thread tags are scoped and per-thread", "[logging]") {
  CHECK(CurrentThreadTag() == "main");
  {
    const ScopedThreadTag outer("producer");
    CHECK(CurrentThreadTag() == "producer");
    {
      const ScopedThreadTag inner("probe");
      CHECK(CurrentThreadTag() == "probe");
    }
    CHECK(CurrentThreadTag() == "producer");

    std::string seen;
    std::thread worker([&seen] { seen = CurrentThreadTag(); });
    worker.join();
    CHECK(seen == "main");
  }
  CHECK(CurrentThreadTag() == "main");
}

TEST_CASE("log levels parse case-insensitively", "[logging]") {
  LogLevel level = LogLevel::kInfo;
  std::string error;
  CHECK(ParseLogLevel("DEBUG", level, error));
  CHECK(level == LogLevel::kDebug);
  CHECK(ParseLogLevel("Warning", level, error));
  CHECK(level == LogLevel::kWarn);
  CHECK_FALSE(ParseLogLevel("verbose", level, error));
  CHECK(error.find("verbose") != std::string::npos);
  CHECK_FALSE(ParseLogLevel("", level, error));
}
