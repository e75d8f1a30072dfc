#include "config/service_config.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cmath>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace camctl::config {

namespace {

using JsonValue = core::json::Value;

bool ReadString(const JsonValue& root, std::string_view key, std::string& out,
                std::string& error) {
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr) {
    return true;
  }
  if (value->type != JsonValue::Type::kString || value->string_value.empty()) {
    error = "config key '" + std::string(key) + "' must be a non-empty string (got " +
            core::json::TypeName(value->type) + ")";
    return false;
  }
  out = value->string_value;
  return true;
}

bool ReadPositiveNumber(const JsonValue& root, std::string_view key, double& out,
                        std::string& error) {
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr) {
    return true;
  }
  if (value->type != JsonValue::Type::kNumber || !std::isfinite(value->number_value) ||
      value->number_value <= 0.0) {
    error = "config key '" + std::string(key) + "' must be a positive number";
    return false;
  }
  out = value->number_value;
  return true;
}

bool ReadBoundedInteger(const JsonValue& root, std::string_view key, std::int64_t min_value,
                        std::int64_t max_value, std::int64_t& out, std::string& error) {
  const JsonValue* value = core::json::FindMember(root, key);
  if (value == nullptr) {
    return true;
  }
  std::int64_t parsed = 0;
  if (!core::json::TryGetInt64(*value, parsed) || parsed < min_value || parsed > max_value) {
    error = "config key '" + std::string(key) + "' must be an integer in [" +
            std::to_string(min_value) + "," + std::to_string(max_value) + "]";
    return false;
  }
  out = parsed;
  return true;
}

template <typename T>
bool ReadUnsigned(const JsonValue& root, std::string_view key, std::int64_t min_value, T& out,
                  std::string& error) {
  std::int64_t parsed = static_cast<std::int64_t>(out);
  if (!ReadBoundedInteger(root, key, min_value,
                          static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max()),
                          parsed, error)) {
    return false;
  }
  out = static_cast<T>(parsed);
  return true;
}

bool ReadResolution(const JsonValue& root, ServiceConfig& config, std::string& error) {
  const JsonValue* value = core::json::FindMember(root, "resolution");
  if (value == nullptr || value->type == JsonValue::Type::kNull) {
    return true;
  }
  if (value->type != JsonValue::Type::kObject) {
    error = "config key 'resolution' must be an object with width, height and format";
    return false;
  }

  std::int64_t width = 0;
  std::int64_t height = 0;
  const JsonValue* width_value = core::json::FindMember(*value, "width");
  const JsonValue* height_value = core::json::FindMember(*value, "height");
  const JsonValue* format_value = core::json::FindMember(*value, "format");
  if (width_value == nullptr || height_value == nullptr || format_value == nullptr ||
      !core::json::TryGetInt64(*width_value, width) ||
      !core::json::TryGetInt64(*height_value, height) || width <= 0 || height <= 0 ||
      format_value->type != JsonValue::Type::kString || format_value->string_value.empty()) {
    error = "config key 'resolution' must be an object with width, height and format";
    return false;
  }

  camera::CaptureFormat format;
  format.format = format_value->string_value;
  format.width = static_cast<std::uint32_t>(width);
  format.height = static_cast<std::uint32_t>(height);
  config.resolution = format;
  return true;
}

bool ReadControls(const JsonValue& root, ServiceConfig& config, std::string& error) {
  const JsonValue* value = core::json::FindMember(root, "controls");
  if (value == nullptr) {
    return true;
  }
  if (value->type != JsonValue::Type::kObject) {
    error = "config key 'controls' must be an object of integer values";
    return false;
  }
  for (const auto& [name, control_value] : value->object_value) {
    std::int64_t parsed = 0;
    if (!core::json::TryGetInt64(control_value, parsed)) {
      error = "config key 'controls." + name + "' must be an integer";
      return false;
    }
    config.controls[name] = parsed;
  }
  return true;
}

std::string FormatNumber(const double value) {
  std::ostringstream out;
  out << std::setprecision(12) << value;
  return out.str();
}

bool EnsureOutputDirectories(const ServiceConfig& config, std::string& error) {
  return core::EnsureDirectory(config.image_output, error) &&
         core::EnsureDirectory(config.video_output, error);
}

} // namespace

bool ParseServiceConfigText(std::string_view json_text, ServiceConfig& config, std::string& error) {
  config = ServiceConfig{};
  error.clear();

  JsonValue root;
  std::string parse_error;
  if (!core::json::Parse(json_text, root, parse_error)) {
    error = "invalid config JSON: " + parse_error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "config root must be a JSON object";
    return false;
  }

  if (!ReadString(root, "image_output", config.image_output, error) ||
      !ReadString(root, "video_output", config.video_output, error)) {
    return false;
  }
  std::string device;
  if (!ReadString(root, "device", device, error)) {
    return false;
  }
  if (!device.empty()) {
    config.device = device;
  }

  if (!ReadResolution(root, config, error) || !ReadControls(root, config, error)) {
    return false;
  }

  std::int64_t quality = config.preview_jpeg_quality;
  if (!ReadUnsigned(root, "read_failure_threshold", 1, config.read_failure_threshold, error) ||
      !ReadBoundedInteger(root, "preview_jpeg_quality", 1, 100, quality, error) ||
      !ReadPositiveNumber(root, "recording_fps", config.recording_fps, error) ||
      !ReadPositiveNumber(root, "timelapse_interval_seconds", config.timelapse_interval_seconds,
                          error) ||
      !ReadPositiveNumber(root, "capture_fps", config.capture_fps, error) ||
      !ReadUnsigned(root, "consumer_queue_capacity", 1, config.consumer_queue_capacity, error) ||
      !ReadUnsigned(root, "reopen_delay_ms", 0, config.reopen_delay_ms, error)) {
    return false;
  }
  config.preview_jpeg_quality = static_cast<int>(quality);
  return true;
}

bool LoadServiceConfig(const std::string& path, ServiceConfig& config, std::string& error) {
  config = ServiceConfig{};
  error.clear();

  std::error_code ec;
  if (!fs::exists(fs::path(path), ec)) {
    return EnsureOutputDirectories(config, error);
  }

  std::ifstream file(fs::path(path), std::ios::binary);
  if (!file) {
    error = "unable to read config file: " + path;
    return false;
  }
  const std::string contents((std::istreambuf_iterator<char>(file)),
                             std::istreambuf_iterator<char>());
  if (!ParseServiceConfigText(contents, config, error)) {
    error = path + ": " + error;
    return false;
  }
  return EnsureOutputDirectories(config, error);
}

std::string ToJson(const ServiceConfig& config) {
  std::ostringstream out;
  out << "{\n";
  out << "  \"image_output\": " << core::json::Quote(config.image_output) << ",\n";
  out << "  \"video_output\": " << core::json::Quote(config.video_output) << ",\n";
  if (config.device.has_value()) {
    out << "  \"device\": " << core::json::Quote(config.device.value()) << ",\n";
  }
  if (config.resolution.has_value()) {
    const camera::CaptureFormat& format = config.resolution.value();
    out << "  \"resolution\": {\"width\": " << format.width << ", \"height\": " << format.height
        << ", \"format\": " << core::json::Quote(format.format) << "},\n";
  }
  out << "  \"controls\": {";
  bool first = true;
  for (const auto& [name, value] : config.controls) {
    out << (first ? "\n" : ",\n") << "    " << core::json::Quote(name) << ": " << value;
    first = false;
  }
  out << (first ? "},\n" : "\n  },\n");
  out << "  \"read_failure_threshold\": " << config.read_failure_threshold << ",\n";
  out << "  \"preview_jpeg_quality\": " << config.preview_jpeg_quality << ",\n";
  out << "  \"recording_fps\": " << FormatNumber(config.recording_fps) << ",\n";
  out << "  \"timelapse_interval_seconds\": " << FormatNumber(config.timelapse_interval_seconds)
      << ",\n";
  out << "  \"capture_fps\": " << FormatNumber(config.capture_fps) << ",\n";
  out << "  \"consumer_queue_capacity\": " << config.consumer_queue_capacity << ",\n";
  out << "  \"reopen_delay_ms\": " << config.reopen_delay_ms << "\n";
  out << "}\n";
  return out.str();
}

bool SaveServiceConfig(const std::string& path, const ServiceConfig& config, std::string& error) {
  error.clear();
  if (!EnsureOutputDirectories(config, error)) {
    return false;
  }
  return core::WriteTextFileAtomic(fs::path(path), ToJson(config), error);
}

} // namespace camctl::config
