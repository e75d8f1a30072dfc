#include "camctl/cli/router.hpp"

#include "backends/device_backend.hpp"
#include "backends/sim/sim_device_backend.hpp"
#include "backends/v4l2/v4l2_device_backend.hpp"
#include "camera/camera_service.hpp"
#include "config/service_config.hpp"
#include "core/errors/camera_errors.hpp"
#include "media/opencv_codec.hpp"

#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace camctl::cli {

namespace {

constexpr std::string_view kBackendV4l2 = "v4l2";
constexpr std::string_view kBackendSim = "sim";

// Local names for the shared core exit contract.
constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitSessionFaulted = core::errors::ToInt(core::errors::ExitCode::kSessionFaulted);

constexpr auto kFaultPollInterval = std::chrono::milliseconds(100);

using CameraCommand = std::function<int(camera::CameraService& service)>;

// One usage text source for help and error paths.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  camctl list-devices [common]\n"
      << "  camctl status [common]\n"
      << "  camctl snapshot --out <file> [common]\n"
      << "  camctl timelapse --interval <s> --duration <s> [common]\n"
      << "  camctl record --duration <s> [--fps <n>] [--out <file>] [common]\n"
      << "  camctl set-control <name> <value> [common]\n"
      << "  camctl set-resolution <width> <height> [<format>] [common]\n"
      << "  camctl reset-controls [common]\n"
      << "  camctl save-config [common]\n"
      << "  camctl version\n"
      << "common:\n"
      << "  --backend <v4l2|sim> --device <path> --config <file> "
         "--log-level <debug|info|warn|error>\n";
}

bool ParseInt64(std::string_view text, std::int64_t& out) {
  if (text.empty()) {
    return false;
  }
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, out);
  return ec == std::errc() && ptr == end;
}

bool ParseDimension(std::string_view text, std::uint32_t& out) {
  std::int64_t parsed = 0;
  if (!ParseInt64(text, parsed) || parsed <= 0 || parsed > 65535) {
    return false;
  }
  out = static_cast<std::uint32_t>(parsed);
  return true;
}

bool ParsePositiveNumber(std::string_view text, double& out) {
  if (text.empty()) {
    return false;
  }
  const std::string value_text(text);
  char* parse_end = nullptr;
  const double parsed = std::strtod(value_text.c_str(), &parse_end);
  if (parse_end != value_text.c_str() + value_text.size() || !std::isfinite(parsed) ||
      parsed <= 0.0) {
    return false;
  }
  out = parsed;
  return true;
}

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i, std::string_view& value,
               std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(args[i]);
    return false;
  }
  value = args[i + 1];
  ++i;
  return true;
}

// Strips common flags; every other token is left for the subcommand.
bool ParseCommonOptions(const std::vector<std::string_view>& args, CommonOptions& options,
                        std::vector<std::string_view>& remaining, std::string& error) {
  remaining.clear();
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--backend") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (value != kBackendV4l2 && value != kBackendSim) {
        error = "unknown backend: " + std::string(value) + " (expected v4l2 or sim)";
        return false;
      }
      options.backend = std::string(value);
      continue;
    }
    if (token == "--device") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.device = std::string(value);
      continue;
    }
    if (token == "--config") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      options.config_path = std::string(value);
      continue;
    }
    if (token == "--log-level") {
      if (!TakeValue(args, i, value, error)) {
        return false;
      }
      if (!core::logging::ParseLogLevel(value, options.log_level, error)) {
        return false;
      }
      continue;
    }
    remaining.push_back(token);
  }
  return true;
}

std::unique_ptr<backends::IDeviceBackend> MakeBackend(std::string_view name) {
  if (name == kBackendSim) {
    return std::make_unique<backends::sim::SimDeviceBackend>();
  }
  return std::make_unique<backends::v4l2::V4l2DeviceBackend>();
}

int ExitCodeForError(std::string_view error) {
  return core::errors::ToInt(core::errors::ExitCodeFor(core::errors::ParseCameraErrorCode(error)));
}

// Sleeps for `seconds`, returning early when the session faults.
void WaitWhileStreaming(const camera::CameraService& service, const double seconds) {
  const auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::duration_cast<std::chrono::steady_clock::duration>(
                            std::chrono::duration<double>(seconds));
  while (std::chrono::steady_clock::now() < deadline) {
    if (service.State() == camera::SessionState::kFaulted) {
      return;
    }
    const auto remaining = deadline - std::chrono::steady_clock::now();
    std::this_thread::sleep_for(remaining < kFaultPollInterval
                                    ? std::chrono::duration_cast<std::chrono::milliseconds>(
                                          remaining)
                                    : kFaultPollInterval);
  }
}

// Opens the selected camera, runs `command`, and tears the camera down.
int RunWithCamera(const CommonOptions& options, const CameraCommand& command) {
  core::logging::Logger logger(options.log_level);

  config::ServiceConfig config;
  std::string error;
  if (!config::LoadServiceConfig(options.config_path, config, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  const std::unique_ptr<backends::IDeviceBackend> backend = MakeBackend(options.backend);
  media::OpenCvImageEncoder encoder;
  camera::CameraService service(*backend, encoder, media::MakeOpenCvVideoWriterFactory(), logger,
                                config, options.config_path);

  if (!service.Initialize(options.device, error)) {
    std::cerr << "error: camera initialization failed: " << error << '\n';
    return ExitCodeForError(error);
  }

  int exit_code = command(service);
  if (service.State() == camera::SessionState::kFaulted) {
    std::cerr << "error: camera session faulted: " << service.FaultReason() << '\n';
    exit_code = kExitSessionFaulted;
  }
  service.Shutdown();
  return exit_code;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << "camctl 0.1.0\n";
  std::cout << "codec: " << media::OpenCvCodecDetail() << '\n';
  return kExitSuccess;
}

int CommandListDevices(const CommonOptions& options, const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: list-devices does not accept arguments\n";
    return kExitUsage;
  }

  core::logging::Logger logger(options.log_level);
  const std::unique_ptr<backends::IDeviceBackend> backend = MakeBackend(options.backend);
  std::vector<backends::DeviceEntry> devices;
  std::string error;
  if (!backend->ListDevices(devices, error)) {
    std::cerr << "error: device discovery failed: " << error << '\n';
    return kExitFailure;
  }
  logger.Debug("devices listed", {{"backend", backend->Name()},
                                  {"count", std::to_string(devices.size())}});

  for (const backends::DeviceEntry& device : devices) {
    std::cout << device.device_path << '\t' << device.display_name << '\n';
  }
  std::cout << "devices: " << devices.size() << '\n';
  return kExitSuccess;
}

int CommandStatus(const CommonOptions& options, const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: status does not accept arguments\n";
    return kExitUsage;
  }
  return RunWithCamera(options, [](camera::CameraService& service) {
    std::string json;
    std::string error;
    if (!service.StatusJson(json, error)) {
      std::cerr << "error: " << error << '\n';
      return ExitCodeForError(error);
    }
    std::cout << json << '\n';
    return kExitSuccess;
  });
}

int CommandSnapshot(const CommonOptions& options, const std::vector<std::string_view>& args) {
  std::string out_path;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view value;
    if (args[i] == "--out") {
      if (!TakeValue(args, i, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      out_path = std::string(value);
      continue;
    }
    std::cerr << "error: unknown snapshot argument: " << args[i] << '\n';
    return kExitUsage;
  }
  if (out_path.empty()) {
    std::cerr << "error: snapshot requires --out <file>\n";
    return kExitUsage;
  }

  return RunWithCamera(options, [&out_path](camera::CameraService& service) {
    std::string command_error;
    if (!service.CapturePhoto(out_path, command_error)) {
      std::cerr << "error: snapshot failed: " << command_error << '\n';
      return ExitCodeForError(command_error);
    }
    std::cout << "snapshot: " << out_path << '\n';
    return kExitSuccess;
  });
}

int CommandTimelapse(const CommonOptions& options, const std::vector<std::string_view>& args) {
  double interval_s = 0.0;
  double duration_s = 0.0;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view value;
    if (args[i] == "--interval" || args[i] == "--duration") {
      const bool is_interval = args[i] == "--interval";
      if (!TakeValue(args, i, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      if (!ParsePositiveNumber(value, is_interval ? interval_s : duration_s)) {
        std::cerr << "error: " << (is_interval ? "--interval" : "--duration")
                  << " must be a positive number of seconds\n";
        return kExitUsage;
      }
      continue;
    }
    std::cerr << "error: unknown timelapse argument: " << args[i] << '\n';
    return kExitUsage;
  }
  if (interval_s <= 0.0 || duration_s <= 0.0) {
    std::cerr << "error: timelapse requires --interval <s> and --duration <s>\n";
    return kExitUsage;
  }

  return RunWithCamera(options, [interval_s, duration_s](camera::CameraService& service) {
    std::string command_error;
    if (!service.StartTimelapse(interval_s, command_error)) {
      std::cerr << "error: timelapse start failed: " << command_error << '\n';
      return ExitCodeForError(command_error);
    }
    WaitWhileStreaming(service, duration_s);
    if (!service.StopTimelapse(command_error)) {
      std::cerr << "error: timelapse stop failed: " << command_error << '\n';
      return kExitFailure;
    }
    std::cout << "timelapse: captured=" << service.TimelapseCapturedCount()
              << " dir=" << service.Config().image_output << '\n';
    return kExitSuccess;
  });
}

int CommandRecord(const CommonOptions& options, const std::vector<std::string_view>& args) {
  double duration_s = 0.0;
  std::optional<double> fps;
  std::optional<std::string> out_path;
  std::string error;
  for (std::size_t i = 0; i < args.size(); ++i) {
    std::string_view value;
    const std::string_view token = args[i];
    if (token == "--duration" || token == "--fps" || token == "--out") {
      if (!TakeValue(args, i, value, error)) {
        std::cerr << "error: " << error << '\n';
        return kExitUsage;
      }
      if (token == "--out") {
        out_path = std::string(value);
        continue;
      }
      double parsed = 0.0;
      if (!ParsePositiveNumber(value, parsed)) {
        std::cerr << "error: " << token << " must be a positive number\n";
        return kExitUsage;
      }
      if (token == "--fps") {
        fps = parsed;
      } else {
        duration_s = parsed;
      }
      continue;
    }
    std::cerr << "error: unknown record argument: " << token << '\n';
    return kExitUsage;
  }
  if (duration_s <= 0.0) {
    std::cerr << "error: record requires --duration <s>\n";
    return kExitUsage;
  }

  return RunWithCamera(options, [&](camera::CameraService& service) {
    std::string command_error;
    if (!service.StartRecording(out_path, fps, command_error)) {
      std::cerr << "error: recording start failed: " << command_error << '\n';
      return ExitCodeForError(command_error);
    }
    WaitWhileStreaming(service, duration_s);
    std::string path;
    if (!service.StopRecording(path, command_error)) {
      std::cerr << "error: recording stop failed: " << command_error << '\n';
      return kExitFailure;
    }
    std::cout << "recording: " << path << '\n';
    return kExitSuccess;
  });
}

int CommandSetControl(const CommonOptions& options, const std::vector<std::string_view>& args) {
  std::int64_t value = 0;
  if (args.size() != 2U || !ParseInt64(args[1], value)) {
    std::cerr << "error: set-control requires <name> <integer value>\n";
    return kExitUsage;
  }
  const std::string name(args[0]);

  return RunWithCamera(options, [&name, value](camera::CameraService& service) {
    std::string command_error;
    if (!service.SetControlValue(name, value, command_error)) {
      std::cerr << "error: " << command_error << '\n';
      return ExitCodeForError(command_error);
    }
    std::cout << "control: " << name << "=" << value << '\n';
    return kExitSuccess;
  });
}

int CommandSetResolution(const CommonOptions& options, const std::vector<std::string_view>& args) {
  camera::CaptureFormat requested;
  if ((args.size() != 2U && args.size() != 3U) || !ParseDimension(args[0], requested.width) ||
      !ParseDimension(args[1], requested.height)) {
    std::cerr << "error: set-resolution requires <width> <height> [<format>]\n";
    return kExitUsage;
  }
  if (args.size() == 3U) {
    requested.format = std::string(args[2]);
  }

  return RunWithCamera(options, [requested](camera::CameraService& service) mutable {
    // Without an explicit format, take the first advertised one at that size.
    if (requested.format.empty()) {
      for (const camera::CaptureFormat& format : service.SupportedFormats()) {
        if (format.width == requested.width && format.height == requested.height) {
          requested.format = format.format;
          break;
        }
      }
    }
    std::string command_error;
    if (!service.SetResolution(requested, command_error)) {
      std::cerr << "error: " << command_error << '\n';
      return ExitCodeForError(command_error);
    }
    std::cout << "resolution: " << camera::ToString(service.CurrentFormat()) << '\n';
    return kExitSuccess;
  });
}

int CommandResetControls(const CommonOptions& options, const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: reset-controls does not accept arguments\n";
    return kExitUsage;
  }
  return RunWithCamera(options, [](camera::CameraService& service) {
    std::string command_error;
    if (!service.ResetToStoredDefaults(command_error)) {
      std::cerr << "error: " << command_error << '\n';
      return ExitCodeForError(command_error);
    }
    for (const auto& [name, value] : service.CurrentValues()) {
      std::cout << "control: " << name << "=" << value << '\n';
    }
    return kExitSuccess;
  });
}

int CommandSaveConfig(const CommonOptions& options, const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: save-config does not accept arguments\n";
    return kExitUsage;
  }
  return RunWithCamera(options, [&options](camera::CameraService& service) {
    std::string command_error;
    if (!service.SaveConfig(command_error)) {
      std::cerr << "error: " << command_error << '\n';
      return kExitFailure;
    }
    std::cout << "config: " << options.config_path << '\n';
    return kExitSuccess;
  });
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> raw_args(argv + 2, argv + argc);

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }
  if (command == "version") {
    return CommandVersion(raw_args);
  }

  CommonOptions options;
  std::vector<std::string_view> args;
  std::string error;
  if (!ParseCommonOptions(raw_args, options, args, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  if (command == "list-devices") {
    return CommandListDevices(options, args);
  }
  if (command == "status") {
    return CommandStatus(options, args);
  }
  if (command == "snapshot") {
    return CommandSnapshot(options, args);
  }
  if (command == "timelapse") {
    return CommandTimelapse(options, args);
  }
  if (command == "record") {
    return CommandRecord(options, args);
  }
  if (command == "set-control") {
    return CommandSetControl(options, args);
  }
  if (command == "set-resolution") {
    return CommandSetResolution(options, args);
  }
  if (command == "reset-controls") {
    return CommandResetControls(options, args);
  }
  if (command == "save-config") {
    return CommandSaveConfig(options, args);
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace camctl::cli
