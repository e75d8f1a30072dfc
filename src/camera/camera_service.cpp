#include "camera/camera_service.hpp"

#include "camera/timelapse_sampler.hpp"
#include "camera/video_recorder.hpp"
#include "core/errors/camera_errors.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/time_utils.hpp"

#include <iomanip>
#include <sstream>
#include <utility>

namespace camctl::camera {

namespace {

using core::errors::CameraErrorCode;
using core::errors::FormatCameraError;

DeviceSessionOptions SessionOptionsFromConfig(const config::ServiceConfig& config) {
  DeviceSessionOptions options;
  options.read_failure_threshold = config.read_failure_threshold;
  options.capture_fps = config.capture_fps;
  options.consumer_queue_capacity = config.consumer_queue_capacity;
  options.reopen_delay = std::chrono::milliseconds(config.reopen_delay_ms);
  return options;
}

TimelapseOverride OverrideFromConfig(const config::ServiceConfig& config) {
  TimelapseOverride override_settings;
  override_settings.format = config.resolution;
  override_settings.controls = config.controls;
  return override_settings;
}

void AppendFormatJson(std::ostringstream& out, const CaptureFormat& format) {
  out << "{\"format\":" << core::json::Quote(format.format) << ",\"width\":" << format.width
      << ",\"height\":" << format.height << "}";
}

void AppendValuesJson(std::ostringstream& out, const ControlValues& values) {
  out << "{";
  bool first = true;
  for (const auto& [name, value] : values) {
    out << (first ? "" : ",") << core::json::Quote(name) << ":" << value;
    first = false;
  }
  out << "}";
}

} // namespace

struct CameraService::ActiveCamera {
  ActiveCamera(backends::IDeviceBackend& backend, media::IImageEncoder& encoder,
               media::VideoWriterFactory writer_factory, core::logging::Logger& logger,
               const config::ServiceConfig& config)
      : session(backend, logger, SessionOptionsFromConfig(config)),
        preview(session.Hub(), encoder, logger, config.preview_jpeg_quality),
        timelapse(session, encoder, logger, config.image_output),
        recorder(session, std::move(writer_factory), logger, config.video_output) {
    timelapse.SetOverride(OverrideFromConfig(config));
  }

  // Consumers first so every queue is detached before the handle goes away.
  void TearDown() {
    (void)recorder.Stop();
    timelapse.Stop();
    preview.Stop();
    session.Close();
  }

  // Destroyed in reverse: consumers before the session they reference.
  DeviceSession session;
  PreviewEncoder preview;
  TimelapseSampler timelapse;
  VideoRecorder recorder;
};

CameraService::CameraService(backends::IDeviceBackend& backend, media::IImageEncoder& encoder,
                             media::VideoWriterFactory writer_factory,
                             core::logging::Logger& logger, config::ServiceConfig config,
                             std::string config_path)
    : backend_(backend), encoder_(encoder), writer_factory_(std::move(writer_factory)),
      logger_(logger), config_path_(std::move(config_path)), config_(std::move(config)) {}

CameraService::~CameraService() {
  Shutdown();
}

bool CameraService::DiscoverCameras(std::vector<backends::DeviceEntry>& devices,
                                    std::string& error) {
  devices.clear();
  error.clear();
  if (!backend_.ListDevices(devices, error)) {
    return false;
  }
  logger_.Debug("cameras discovered", {{"backend", backend_.Name()},
                                       {"count", std::to_string(devices.size())}});
  return true;
}

bool CameraService::Initialize(const std::optional<std::string>& device_path,
                               std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  if (IsInitialized()) {
    return true;
  }
  std::string resolved;
  if (!ResolveDevicePath(device_path, resolved, error)) {
    return false;
  }
  return OpenLocked(resolved, error);
}

bool CameraService::SwitchCamera(const std::string& device_path, std::string& error) {
  error.clear();
  if (device_path.empty()) {
    error = FormatCameraError(CameraErrorCode::kInvalidArgument, "device path is empty");
    return false;
  }
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  const std::string previous = DevicePath();
  ShutdownLocked();
  logger_.Info("switching camera", {{"from", previous}, {"to", device_path}});
  return OpenLocked(device_path, error);
}

void CameraService::Shutdown() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  ShutdownLocked();
}

bool CameraService::IsInitialized() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_ != nullptr;
}

std::string CameraService::DevicePath() const {
  const std::shared_ptr<ActiveCamera> active = Active();
  return active ? active->session.DevicePath() : std::string();
}

SessionState CameraService::State() const {
  const std::shared_ptr<ActiveCamera> active = Active();
  return active ? active->session.State() : SessionState::kClosed;
}

std::string CameraService::FaultReason() const {
  const std::shared_ptr<ActiveCamera> active = Active();
  return active ? active->session.FaultReason() : std::string();
}

CaptureFormat CameraService::CurrentFormat() const {
  const std::shared_ptr<ActiveCamera> active = Active();
  return active ? active->session.CurrentFormat() : CaptureFormat{};
}

std::vector<CaptureFormat> CameraService::SupportedFormats() const {
  const std::shared_ptr<ActiveCamera> active = Active();
  return active ? active->session.SupportedFormats() : std::vector<CaptureFormat>{};
}

ControlValues CameraService::CurrentValues() const {
  const std::shared_ptr<ActiveCamera> active = Active();
  return active ? active->session.CurrentValues() : ControlValues{};
}

bool CameraService::SetResolution(const CaptureFormat& format, std::string& error) {
  std::shared_ptr<ActiveCamera> active;
  return RequireActive(active, error) && active->session.SetResolution(format, error);
}

bool CameraService::SetControlValue(const std::string& name, const std::int64_t value,
                                    std::string& error) {
  std::shared_ptr<ActiveCamera> active;
  return RequireActive(active, error) && active->session.SetControlValue(name, value, error);
}

bool CameraService::ResetToStoredDefaults(std::string& error) {
  std::shared_ptr<ActiveCamera> active;
  return RequireActive(active, error) && active->session.ResetToStoredDefaults(error);
}

bool CameraService::Reinitialize(std::string& error) {
  std::shared_ptr<ActiveCamera> active;
  return RequireActive(active, error) && active->session.Reinitialize(error);
}

bool CameraService::CurrentPreviewFrame(EncodedFramePtr& frame, std::string& error) const {
  frame.reset();
  std::shared_ptr<ActiveCamera> active;
  if (!RequireActive(active, error)) {
    return false;
  }
  frame = active->preview.CurrentFrame();
  return true;
}

bool CameraService::WaitForPreviewFrame(const std::optional<std::uint64_t> after_sequence,
                                        const std::chrono::milliseconds timeout,
                                        EncodedFramePtr& frame, std::string& error) const {
  frame.reset();
  std::shared_ptr<ActiveCamera> active;
  if (!RequireActive(active, error)) {
    return false;
  }
  frame = active->preview.WaitForNewerFrame(after_sequence, timeout);
  return true;
}

bool CameraService::StartTimelapse(const std::optional<double> interval_seconds,
                                   std::string& error) {
  std::shared_ptr<ActiveCamera> active;
  if (!RequireActive(active, error)) {
    return false;
  }
  const double interval = interval_seconds.value_or(Config().timelapse_interval_seconds);
  return active->timelapse.Start(interval, error);
}

bool CameraService::StopTimelapse(std::string& error) {
  std::shared_ptr<ActiveCamera> active;
  if (!RequireActive(active, error)) {
    return false;
  }
  active->timelapse.Stop();
  return true;
}

bool CameraService::IsTimelapseRunning() const {
  const std::shared_ptr<ActiveCamera> active = Active();
  return active && active->timelapse.IsRunning();
}

std::uint64_t CameraService::TimelapseCapturedCount() const {
  const std::shared_ptr<ActiveCamera> active = Active();
  return active ? active->timelapse.CapturedCount() : 0U;
}

bool CameraService::StartRecording(const std::optional<std::string>& filename,
                                   const std::optional<double> fps, std::string& error) {
  std::shared_ptr<ActiveCamera> active;
  if (!RequireActive(active, error)) {
    return false;
  }
  return active->recorder.Start(filename, fps.value_or(Config().recording_fps), error);
}

bool CameraService::StopRecording(std::string& path, std::string& error) {
  path.clear();
  std::shared_ptr<ActiveCamera> active;
  if (!RequireActive(active, error)) {
    return false;
  }
  path = active->recorder.Stop();
  return true;
}

bool CameraService::IsRecording() const {
  const std::shared_ptr<ActiveCamera> active = Active();
  return active && active->recorder.IsRecording();
}

bool CameraService::CapturePhoto(const std::string& path, std::string& error) {
  std::shared_ptr<ActiveCamera> active;
  if (!RequireActive(active, error)) {
    return false;
  }
  if (path.empty()) {
    error = FormatCameraError(CameraErrorCode::kInvalidArgument, "photo path is empty");
    return false;
  }
  if (!core::EnsureParentDirectory(path, error)) {
    return false;
  }

  FrameHub& hub = active->session.Hub();
  const DeliveryHandle probe = hub.Attach(ConsumerKind::kProbe);
  if (!probe) {
    error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "frame hub is closed");
    return false;
  }
  FramePtr frame;
  const PopStatus status = probe->Pop(frame, kPhotoTimeout);
  hub.Detach(probe);
  if (status != PopStatus::kFrame) {
    error = FormatCameraError(
        status == PopStatus::kClosed ? CameraErrorCode::kSessionNotOpen
                                     : CameraErrorCode::kTransientReadFailure,
        "no frame delivered within " + std::to_string(kPhotoTimeout.count()) + "ms");
    return false;
  }

  if (!encoder_.WriteImage(*frame, path, error)) {
    return false;
  }
  logger_.Info("photo captured", {{"path", path}, {"sequence", std::to_string(frame->sequence)}});
  return true;
}

bool CameraService::StatusJson(std::string& json, std::string& error) const {
  json.clear();
  std::shared_ptr<ActiveCamera> active;
  if (!RequireActive(active, error)) {
    return false;
  }
  const DeviceSession& session = active->session;

  std::ostringstream out;
  out << "{";
  out << "\"device\":" << core::json::Quote(session.DevicePath());
  out << ",\"state\":" << core::json::Quote(ToString(session.State()));
  out << ",\"fault_reason\":" << core::json::Quote(session.FaultReason());

  const CaptureFormat current = session.CurrentFormat();
  out << ",\"current_resolution\":";
  AppendFormatJson(out, current);

  out << ",\"supported_resolutions\":[";
  bool first = true;
  for (const CaptureFormat& format : session.SupportedFormats()) {
    out << (first ? "" : ",");
    AppendFormatJson(out, format);
    first = false;
  }
  out << "]";

  out << ",\"controls\":{";
  first = true;
  for (const auto& [name, control] : session.ListControls()) {
    out << (first ? "" : ",") << core::json::Quote(name) << ":{\"type\":"
        << core::json::Quote(ToString(control.kind)) << ",\"min\":" << control.minimum
        << ",\"max\":" << control.maximum << ",\"step\":" << control.step
        << ",\"default\":" << control.default_value << ",\"value\":" << control.current << "}";
    first = false;
  }
  out << "}";

  out << ",\"stored_defaults\":";
  AppendValuesJson(out, session.StoredDefaults());
  out << ",\"original_hardware_defaults\":";
  AppendValuesJson(out, session.OriginalHardwareDefaults());

  const TimelapseSampler& timelapse = active->timelapse;
  out << ",\"timelapse\":{\"running\":" << (timelapse.IsRunning() ? "true" : "false")
      << ",\"interval_s\":" << timelapse.IntervalSeconds()
      << ",\"output_dir\":" << core::json::Quote(timelapse.OutputDir())
      << ",\"next_index\":" << timelapse.NextImageIndex()
      << ",\"captured\":" << timelapse.CapturedCount()
      << ",\"last_image\":" << core::json::Quote(timelapse.LastImagePath()) << "}";

  const VideoRecorder& recorder = active->recorder;
  out << ",\"recording\":{\"active\":" << (recorder.IsRecording() ? "true" : "false")
      << ",\"path\":" << core::json::Quote(recorder.CurrentPath())
      << ",\"output_dir\":" << core::json::Quote(recorder.OutputDir())
      << ",\"frames\":" << recorder.FramesWritten() << "}";

  const EncodedFramePtr preview = active->preview.CurrentFrame();
  out << ",\"preview\":{\"running\":" << (active->preview.IsRunning() ? "true" : "false")
      << ",\"encoded\":" << active->preview.EncodedCount() << ",\"latest_sequence\":";
  if (preview) {
    out << preview->sequence;
  } else {
    out << "null";
  }
  out << "}";

  out << ",\"reinitialize_count\":" << session.ReinitializeCount();
  out << ",\"timestamp\":" << std::fixed << std::setprecision(3)
      << core::ToUnixSeconds(std::chrono::system_clock::now());
  out << "}";

  json = out.str();
  return true;
}

bool CameraService::SetOutputDirectories(const std::string& image_output,
                                         const std::string& video_output, std::string& error) {
  error.clear();
  if (!core::EnsureDirectory(image_output, error) || !core::EnsureDirectory(video_output, error)) {
    return false;
  }
  std::shared_ptr<ActiveCamera> active;
  {
    std::lock_guard<std::mutex> lock(mu_);
    config_.image_output = image_output;
    config_.video_output = video_output;
    active = active_;
  }
  if (active) {
    active->timelapse.SetOutputDir(image_output);
    active->recorder.SetOutputDir(video_output);
  }
  return true;
}

bool CameraService::SaveConfig(std::string& error) {
  std::shared_ptr<ActiveCamera> active;
  if (!RequireActive(active, error)) {
    return false;
  }

  config::ServiceConfig snapshot;
  {
    std::lock_guard<std::mutex> lock(mu_);
    config_.device = active->session.DevicePath();
    config_.resolution = active->session.CurrentFormat();
    config_.controls = active->session.CurrentValues();
    snapshot = config_;
  }
  if (!config::SaveServiceConfig(config_path_, snapshot, error)) {
    logger_.Error("config save failed", {{"path", config_path_}, {"error", error}});
    return false;
  }

  active->timelapse.SetOutputDir(snapshot.image_output);
  active->timelapse.SetOverride(OverrideFromConfig(snapshot));
  active->recorder.SetOutputDir(snapshot.video_output);
  logger_.Info("config saved", {{"path", config_path_},
                                {"controls", std::to_string(snapshot.controls.size())}});
  return true;
}

config::ServiceConfig CameraService::Config() const {
  std::lock_guard<std::mutex> lock(mu_);
  return config_;
}

std::shared_ptr<CameraService::ActiveCamera> CameraService::Active() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_;
}

bool CameraService::RequireActive(std::shared_ptr<ActiveCamera>& active,
                                  std::string& error) const {
  error.clear();
  active = Active();
  if (!active) {
    error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "camera not initialized");
    return false;
  }
  return true;
}

bool CameraService::ResolveDevicePath(const std::optional<std::string>& requested,
                                      std::string& device_path, std::string& error) {
  if (requested.has_value() && !requested->empty()) {
    device_path = requested.value();
    return true;
  }
  const config::ServiceConfig config = Config();
  if (config.device.has_value()) {
    device_path = config.device.value();
    return true;
  }

  std::vector<backends::DeviceEntry> devices;
  if (!DiscoverCameras(devices, error)) {
    return false;
  }
  if (devices.empty()) {
    error = FormatCameraError(CameraErrorCode::kDeviceUnavailable, "no capture devices found");
    return false;
  }
  device_path = devices.front().device_path;
  return true;
}

bool CameraService::OpenLocked(const std::string& device_path, std::string& error) {
  auto active =
      std::make_shared<ActiveCamera>(backend_, encoder_, writer_factory_, logger_, Config());
  if (!active->session.Open(device_path, error)) {
    logger_.Error("camera initialization failed", {{"device", device_path}, {"error", error}});
    return false;
  }
  if (!active->preview.Start(error)) {
    active->TearDown();
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    active_ = std::move(active);
  }
  logger_.SetDevice(device_path);
  logger_.Info("camera initialized", {{"device", device_path}, {"backend", backend_.Name()}});
  return true;
}

void CameraService::ShutdownLocked() {
  std::shared_ptr<ActiveCamera> active;
  {
    std::lock_guard<std::mutex> lock(mu_);
    active.swap(active_);
  }
  if (!active) {
    return;
  }
  const std::string device_path = active->session.DevicePath();
  active->TearDown();
  logger_.Info("camera shut down", {{"device", device_path}});
  logger_.SetDevice("");
}

} // namespace camctl::camera
