#include "config/service_config.hpp"

#include "../common/temp_dir.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using camctl::config::ServiceConfig;

TEST_CASE("Empty object yields defaults", "[config]") {
  ServiceConfig config;
  std::string error;
  REQUIRE(camctl::config::ParseServiceConfigText("{}", config, error));
  REQUIRE(config.image_output == "timelapse");
  REQUIRE(config.video_output == "videos");
  REQUIRE_FALSE(config.device.has_value());
  REQUIRE_FALSE(config.resolution.has_value());
  REQUIRE(config.controls.empty());
  REQUIRE(config.read_failure_threshold == 10U);
  REQUIRE(config.preview_jpeg_quality == 70);
  REQUIRE(config.recording_fps == 15.0);
  REQUIRE(config.timelapse_interval_seconds == 5.0);
  REQUIRE(config.consumer_queue_capacity == 32U);
  REQUIRE(config.reopen_delay_ms == 300U);
}

TEST_CASE("Known keys are parsed and unknown keys ignored", "[config]") {
  ServiceConfig config;
  std::string error;
  const char* text = R"({
    "image_output": "stills",
    "video_output": "clips",
    "device": "/dev/video2",
    "resolution": {"width": 640, "height": 480, "format": "MJPG"},
    "controls": {"brightness": -10, "gain": 40},
    "read_failure_threshold": 3,
    "timelapse_interval_seconds": 0.5,
    "theme": "dark"
  })";
  REQUIRE(camctl::config::ParseServiceConfigText(text, config, error));
  REQUIRE(config.image_output == "stills");
  REQUIRE(config.video_output == "clips");
  REQUIRE(config.device.value() == "/dev/video2");
  REQUIRE(config.resolution.has_value());
  REQUIRE(config.resolution->width == 640U);
  REQUIRE(config.resolution->height == 480U);
  REQUIRE(config.resolution->format == "MJPG");
  REQUIRE(config.controls.at("brightness") == -10);
  REQUIRE(config.controls.at("gain") == 40);
  REQUIRE(config.read_failure_threshold == 3U);
  REQUIRE(config.timelapse_interval_seconds == 0.5);
}

TEST_CASE("Wrong-typed keys fail with the key name", "[config]") {
  ServiceConfig config;
  std::string error;

  REQUIRE_FALSE(camctl::config::ParseServiceConfigText(R"({"recording_fps": "fast"})", config,
                                                       error));
  REQUIRE(error.find("recording_fps") != std::string::npos);

  REQUIRE_FALSE(camctl::config::ParseServiceConfigText(R"({"controls": {"gain": 1.5}})", config,
                                                       error));
  REQUIRE(error.find("controls.gain") != std::string::npos);

  REQUIRE_FALSE(camctl::config::ParseServiceConfigText(R"({"resolution": {"width": 640}})",
                                                       config, error));
  REQUIRE(error.find("resolution") != std::string::npos);

  REQUIRE_FALSE(camctl::config::ParseServiceConfigText(R"({"preview_jpeg_quality": 101})",
                                                       config, error));
  REQUIRE(error.find("preview_jpeg_quality") != std::string::npos);

  REQUIRE_FALSE(camctl::config::ParseServiceConfigText("[1,2]", config, error));
  REQUIRE_FALSE(camctl::config::ParseServiceConfigText("{", config, error));
}

TEST_CASE("Saved config loads back and creates output directories", "[config]") {
  const camctl::tests::common::ScopedTempDir temp("camctl-config");
  const std::filesystem::path config_path = temp.path() / "nested" / "config.json";

  ServiceConfig saved;
  saved.image_output = (temp.path() / "images").string();
  saved.video_output = (temp.path() / "videos").string();
  saved.device = "/dev/video0";
  saved.resolution = camctl::camera::CaptureFormat{"YUYV", 320U, 240U};
  saved.controls = {{"brightness", 4}, {"contrast", 47}};
  saved.recording_fps = 12.5;

  std::string error;
  REQUIRE(camctl::config::SaveServiceConfig(config_path.string(), saved, error));
  REQUIRE(std::filesystem::is_directory(saved.image_output));
  REQUIRE(std::filesystem::is_directory(saved.video_output));

  ServiceConfig loaded;
  REQUIRE(camctl::config::LoadServiceConfig(config_path.string(), loaded, error));
  REQUIRE(loaded.device == saved.device);
  REQUIRE(loaded.resolution.value() == saved.resolution.value());
  REQUIRE(loaded.controls == saved.controls);
  REQUIRE(loaded.recording_fps == 12.5);

  // Only the final file remains; no temp siblings.
  std::size_t entries = 0U;
  for (const auto& entry : std::filesystem::directory_iterator(config_path.parent_path())) {
    (void)entry;
    ++entries;
  }
  REQUIRE(entries == 1U);
}

TEST_CASE("Missing config file yields defaults", "[config]") {
  const camctl::tests::common::ScopedTempDir temp("camctl-config-missing");
  const std::filesystem::path previous = std::filesystem::current_path();
  std::filesystem::current_path(temp.path());

  ServiceConfig config;
  std::string error;
  const bool loaded = camctl::config::LoadServiceConfig("absent.json", config, error);
  std::filesystem::current_path(previous);

  REQUIRE(loaded);
  REQUIRE(config.image_output == "timelapse");
  REQUIRE(std::filesystem::is_directory(temp.path() / "timelapse"));
  REQUIRE(std::filesystem::is_directory(temp.path() / "videos"));
}
