#pragma once

#include "camera/control_descriptor.hpp"
#include "camera/frame.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace camctl::config {

inline constexpr const char* kDefaultConfigPath = "config.json";

// Persistent service settings.
//
// `resolution` and `controls` are the timelapse override: applied when a
// timelapse starts and rolled back when it stops. They are not applied at
// session open.
struct ServiceConfig {
  std::string image_output = "timelapse";
  std::string video_output = "videos";
  std::optional<std::string> device;

  std::optional<camera::CaptureFormat> resolution;
  camera::ControlValues controls;

  std::uint32_t read_failure_threshold = 10U;
  int preview_jpeg_quality = 70;
  double recording_fps = 15.0;
  double timelapse_interval_seconds = 5.0;
  double capture_fps = 15.0;
  std::uint32_t consumer_queue_capacity = 32U;
  std::uint32_t reopen_delay_ms = 300U;
};

// Parses config text. Unknown keys are ignored; a known key with the wrong
// type or an out-of-range value fails with an error naming the key.
bool ParseServiceConfigText(std::string_view json_text, ServiceConfig& config, std::string& error);

// Missing file yields defaults. Output directories are created on success.
bool LoadServiceConfig(const std::string& path, ServiceConfig& config, std::string& error);

// Pretty-printed JSON with stable key order.
std::string ToJson(const ServiceConfig& config);

// Atomic temp-file + rename write; also creates the output directories.
bool SaveServiceConfig(const std::string& path, const ServiceConfig& config, std::string& error);

} // namespace camctl::config
