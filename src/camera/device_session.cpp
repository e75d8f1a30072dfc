#include "camera/device_session.hpp"

#include "core/errors/camera_errors.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace camctl::camera {

namespace {

using core::errors::CameraErrorCode;
using core::errors::FormatCameraError;
using core::errors::ParseCameraErrorCode;

constexpr auto kReadFailureBackoff = std::chrono::milliseconds(5);

std::string JoinNames(const std::vector<std::string>& names) {
  std::string joined;
  for (const std::string& name : names) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += name;
  }
  return joined;
}

// Keeps backend text that already carries a stable code; wraps anything else.
std::string EnsureCode(const CameraErrorCode code, const std::string& error) {
  if (ParseCameraErrorCode(error) != CameraErrorCode::kUnknown) {
    return error;
  }
  return FormatCameraError(code, error);
}

} // namespace

const char* ToString(const SessionState state) {
  switch (state) {
  case SessionState::kClosed:
    return "closed";
  case SessionState::kStreaming:
    return "streaming";
  case SessionState::kFaulted:
    return "faulted";
  }
  return "closed";
}

// Device-lock guard for administrative calls. While one is waiting the
// producer does not start another read.
class DeviceSession::AdminLock {
public:
  explicit AdminLock(DeviceSession& session) : session_(session) {
    session_.admin_waiters_.fetch_add(1U);
    lock_ = std::unique_lock<std::mutex>(session_.device_mutex_);
    session_.admin_waiters_.fetch_sub(1U);
  }

  ~AdminLock() {
    lock_.unlock();
    session_.admin_idle_cv_.notify_all();
  }

  AdminLock(const AdminLock&) = delete;
  AdminLock& operator=(const AdminLock&) = delete;

private:
  DeviceSession& session_;
  std::unique_lock<std::mutex> lock_;
};

DeviceSession::DeviceSession(backends::IDeviceBackend& backend, core::logging::Logger& logger,
                             DeviceSessionOptions options)
    : backend_(backend), logger_(logger), options_(std::move(options)),
      hub_(logger, options_.consumer_queue_capacity) {}

DeviceSession::~DeviceSession() {
  Close();
}

bool DeviceSession::Open(const std::string& device_path, std::string& error) {
  error.clear();
  if (device_path.empty()) {
    error = FormatCameraError(CameraErrorCode::kInvalidArgument, "device path cannot be empty");
    return false;
  }

  {
    std::lock_guard<std::mutex> info_lock(info_mu_);
    if (state_ != SessionState::kClosed || !device_path_.empty()) {
      error = FormatCameraError(CameraErrorCode::kInvalidArgument,
                                "a device session opens exactly once");
      return false;
    }
    device_path_ = device_path;
  }
  logger_.SetDevice(device_path);

  {
    AdminLock lock(*this);
    if (!InitializeDeviceLocked(device_path, std::nullopt, error)) {
      ReleaseHandleLocked();
      logger_.Error("device session open failed", {{"device", device_path}, {"error", error}});
      return false;
    }
  }

  if (!hub_.StartProduction([this](FramePtr& frame) { return ProduceOnce(frame); }, error)) {
    Close();
    return false;
  }

  const CaptureFormat format = CurrentFormat();
  logger_.Info("device session open", {{"device", device_path},
                                       {"format", ToString(format)},
                                       {"controls", std::to_string(registry_.Size())}});
  return true;
}

ReadFrameResult DeviceSession::ReadFrame() {
  ReadFrameResult result;
  std::unique_lock<std::mutex> lock(device_mutex_);
  admin_idle_cv_.wait(lock, [this] { return admin_waiters_.load() == 0U; });

  if (!source_ || !source_->IsOpen()) {
    result.error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "no open device handle");
    return result;
  }

  Frame frame;
  std::string error;
  if (!source_->ReadFrame(frame, options_.read_timeout, error)) {
    result.error = FormatCameraError(CameraErrorCode::kTransientReadFailure, error);
    return result;
  }
  if (frame.data.empty()) {
    result.error = FormatCameraError(CameraErrorCode::kTransientReadFailure, "empty frame");
    return result;
  }

  frame.sequence = next_sequence_++;
  frame.format_generation = format_generation_;
  frame.timestamp = std::chrono::system_clock::now();
  result.frame = std::make_shared<const Frame>(std::move(frame));
  result.ok = true;
  return result;
}

bool DeviceSession::SetResolution(const CaptureFormat& format, std::string& error) {
  error.clear();
  AdminLock lock(*this);

  CaptureFormat previous;
  {
    std::lock_guard<std::mutex> info_lock(info_mu_);
    if (state_ != SessionState::kStreaming || !source_) {
      error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "camera not initialized");
      return false;
    }
    if (recording_active_) {
      error = FormatCameraError(CameraErrorCode::kResolutionLocked,
                                "stop the recording before changing resolution");
      return false;
    }
    if (std::find(supported_formats_.begin(), supported_formats_.end(), format) ==
        supported_formats_.end()) {
      error = FormatCameraError(CameraErrorCode::kResolutionUnsupported, ToString(format));
      return false;
    }
    previous = current_format_;
  }

  CaptureFormat applied;
  std::string apply_error;
  if (!source_->SetFormat(format, options_.capture_fps, applied, apply_error)) {
    error = FormatCameraError(CameraErrorCode::kResolutionUnsupported,
                              ToString(format) + " rejected by device: " + apply_error);
    CaptureFormat restored;
    std::string restore_error;
    if (!source_->SetFormat(previous, options_.capture_fps, restored, restore_error)) {
      logger_.Error("failed to restore previous format",
                    {{"format", ToString(previous)}, {"error", restore_error}});
    }
    logger_.Warn("resolution change rejected", {{"error", error}});
    return false;
  }

  hub_.DrainStale(++format_generation_);
  {
    std::lock_guard<std::mutex> info_lock(info_mu_);
    current_format_ = applied;
  }
  logger_.Info("resolution changed",
               {{"from", ToString(previous)}, {"to", ToString(applied)}});
  return true;
}

bool DeviceSession::SetControlValue(const std::string& name, const std::int64_t value,
                                    std::string& error) {
  error.clear();
  if (!registry_.Validate(name, value, error)) {
    logger_.Warn("control write rejected", {{"control", name},
                                            {"value", std::to_string(value)},
                                            {"error", error}});
    return false;
  }

  AdminLock lock(*this);
  const std::string device_path = DevicePath();
  if (!IsOpen() || !source_) {
    error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "camera not initialized");
    return false;
  }

  std::string apply_error;
  if (!backend_.ApplyControl(device_path, name, value, apply_error)) {
    error = EnsureCode(CameraErrorCode::kControlApplyFailed, apply_error);
    logger_.Warn("control write failed", {{"control", name},
                                          {"value", std::to_string(value)},
                                          {"error", error}});
    return false;
  }

  registry_.RecordApplied(name, value);
  logger_.Debug("control set", {{"control", name}, {"value", std::to_string(value)}});
  return true;
}

bool DeviceSession::Reinitialize(std::string& error) {
  error.clear();
  bool was_faulted = false;
  {
    AdminLock lock(*this);
    if (DevicePath().empty() || State() == SessionState::kClosed) {
      error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "camera not initialized");
      return false;
    }
    if (IsRecordingActive()) {
      error = FormatCameraError(CameraErrorCode::kResolutionLocked,
                                "stop the recording before reinitializing");
      return false;
    }
    was_faulted = State() == SessionState::kFaulted;
    if (!ReinitializeLocked(error)) {
      return false;
    }
  }
  return RestartProductionIfStopped(was_faulted, error);
}

bool DeviceSession::ResetToStoredDefaults(std::string& error) {
  error.clear();
  if (!IsOpen()) {
    error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "camera not initialized");
    return false;
  }
  if (IsRecordingActive()) {
    error = FormatCameraError(CameraErrorCode::kResolutionLocked,
                              "stop the recording before resetting controls");
    return false;
  }

  std::size_t failed = 0U;
  for (const auto& [name, value] : registry_.StoredDefaults()) {
    std::string write_error;
    if (!SetControlValue(name, value, write_error)) {
      ++failed;
    }
  }
  if (failed > 0U) {
    logger_.Warn("stored defaults partially applied", {{"failed", std::to_string(failed)}});
  }
  return Reinitialize(error);
}

void DeviceSession::Close() {
  hub_.CloseAll();
  hub_.StopProduction();

  AdminLock lock(*this);
  const bool was_open = source_ != nullptr;
  ReleaseHandleLocked();
  bool was_active = false;
  {
    std::lock_guard<std::mutex> info_lock(info_mu_);
    was_active = state_ != SessionState::kClosed;
    state_ = SessionState::kClosed;
    recording_active_ = false;
  }
  if (was_open || was_active) {
    logger_.Info("device session closed", {{"device", DevicePath()}});
  }
}

bool DeviceSession::BeginRecording(CaptureFormat& format, std::string& error) {
  error.clear();
  AdminLock lock(*this);
  std::lock_guard<std::mutex> info_lock(info_mu_);
  if (state_ != SessionState::kStreaming) {
    error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "camera not initialized");
    return false;
  }
  recording_active_ = true;
  format = current_format_;
  return true;
}

void DeviceSession::EndRecording() {
  std::lock_guard<std::mutex> info_lock(info_mu_);
  recording_active_ = false;
}

bool DeviceSession::IsRecordingActive() const {
  std::lock_guard<std::mutex> info_lock(info_mu_);
  return recording_active_;
}

std::string DeviceSession::DevicePath() const {
  std::lock_guard<std::mutex> info_lock(info_mu_);
  return device_path_;
}

CaptureFormat DeviceSession::CurrentFormat() const {
  std::lock_guard<std::mutex> info_lock(info_mu_);
  return current_format_;
}

std::vector<CaptureFormat> DeviceSession::SupportedFormats() const {
  std::lock_guard<std::mutex> info_lock(info_mu_);
  return supported_formats_;
}

SessionState DeviceSession::State() const {
  std::lock_guard<std::mutex> info_lock(info_mu_);
  return state_;
}

bool DeviceSession::IsOpen() const {
  return State() == SessionState::kStreaming;
}

std::string DeviceSession::FaultReason() const {
  std::lock_guard<std::mutex> info_lock(info_mu_);
  return fault_reason_;
}

ControlMap DeviceSession::ListControls() const {
  return registry_.Snapshot();
}

ControlValues DeviceSession::CurrentValues() const {
  return registry_.CurrentValues();
}

ControlValues DeviceSession::StoredDefaults() const {
  return registry_.StoredDefaults();
}

ControlValues DeviceSession::OriginalHardwareDefaults() const {
  return registry_.OriginalHardwareDefaults();
}

std::uint64_t DeviceSession::ReinitializeCount() const {
  return reinitialize_count_.load();
}

std::uint32_t DeviceSession::ConsecutiveReadFailures() const {
  return consecutive_read_failures_.load();
}

const DeviceSessionOptions& DeviceSession::Options() const {
  return options_;
}

FrameHub& DeviceSession::Hub() {
  return hub_;
}

bool DeviceSession::InitializeDeviceLocked(const std::string& device_path,
                                           const std::optional<CaptureFormat>& restore,
                                           std::string& error) {
  if (source_) {
    ReleaseHandleLocked();
    std::this_thread::sleep_for(options_.reopen_delay);
  }

  std::unique_ptr<backends::IFrameSource> source = backend_.OpenCapture(device_path, error);
  if (!source) {
    error = EnsureCode(CameraErrorCode::kDeviceUnavailable, error);
    return false;
  }

  std::vector<CaptureFormat> formats;
  if (!backend_.ListFormats(device_path, formats, error)) {
    error = EnsureCode(CameraErrorCode::kNoSupportedFormats, error);
    return false;
  }
  if (formats.empty()) {
    error = FormatCameraError(CameraErrorCode::kNoSupportedFormats, device_path);
    return false;
  }
  SortCaptureFormats(formats);

  std::vector<RawControlRecord> raw_controls;
  if (!backend_.ListControls(device_path, raw_controls, error)) {
    error = EnsureCode(CameraErrorCode::kNoControlsFound, error);
    return false;
  }
  if (!registry_.Replace(ClassifyControls(raw_controls), error)) {
    return false;
  }

  const ApplyDefaultsResult defaults = registry_.ApplyDefaults(
      [this, &device_path](const std::string& name, const std::int64_t value,
                           std::string& apply_error) {
        return backend_.ApplyControl(device_path, name, value, apply_error);
      });
  if (!defaults.failed.empty()) {
    logger_.Warn("some control defaults were not applied",
                 {{"failed_count", std::to_string(defaults.failed.size())},
                  {"failed", JoinNames(defaults.failed)}});
  }
  logger_.Info("control defaults applied", {{"applied", std::to_string(defaults.applied)},
                                            {"attempted", std::to_string(defaults.attempted)}});

  // Re-read so current values reflect what the hardware accepted.
  raw_controls.clear();
  std::string refresh_error;
  if (backend_.ListControls(device_path, raw_controls, refresh_error)) {
    if (!registry_.Replace(ClassifyControls(raw_controls), refresh_error)) {
      logger_.Warn("control refresh ignored", {{"error", refresh_error}});
    }
  } else {
    logger_.Warn("control refresh failed", {{"error", refresh_error}});
  }

  // An active recording pins the format its writer was sized to.
  const bool pinned = restore.has_value() && IsRecordingActive();
  CaptureFormat target = formats.front();
  if (restore.has_value() &&
      std::find(formats.begin(), formats.end(), restore.value()) != formats.end()) {
    target = restore.value();
  } else if (pinned) {
    error = FormatCameraError(CameraErrorCode::kResolutionLocked,
                              "recording format " + ToString(restore.value()) +
                                  " is no longer supported");
    return false;
  }

  CaptureFormat applied;
  std::string format_error;
  if (!source->SetFormat(target, options_.capture_fps, applied, format_error)) {
    if (pinned || target == formats.front() ||
        !source->SetFormat(formats.front(), options_.capture_fps, applied, format_error)) {
      error = FormatCameraError(CameraErrorCode::kDeviceUnavailable,
                                "failed to apply " + ToString(target) + ": " + format_error);
      return false;
    }
  }

  source_ = std::move(source);
  std::lock_guard<std::mutex> info_lock(info_mu_);
  supported_formats_ = std::move(formats);
  current_format_ = applied;
  state_ = SessionState::kStreaming;
  fault_reason_.clear();
  return true;
}

bool DeviceSession::ReinitializeLocked(std::string& error) {
  const std::string device_path = DevicePath();
  const std::optional<CaptureFormat> restore = CurrentFormat();

  logger_.Info("reinitializing device", {{"device", device_path}});
  const bool ok = InitializeDeviceLocked(device_path, restore, error);
  consecutive_read_failures_.store(0U);
  if (!ok) {
    ReleaseHandleLocked();
    error = FormatCameraError(CameraErrorCode::kReinitializationFailed, error);
    MarkFaulted(error);
    return false;
  }

  reinitialize_count_.fetch_add(1U);
  hub_.DrainStale(++format_generation_);
  logger_.Info("device reinitialized",
               {{"device", device_path},
                {"format", ToString(CurrentFormat())},
                {"reinitialize_count", std::to_string(reinitialize_count_.load())}});
  return true;
}

void DeviceSession::ReleaseHandleLocked() {
  if (!source_) {
    return;
  }
  std::string close_error;
  if (!source_->Close(close_error)) {
    logger_.Warn("device handle close reported an error", {{"error", close_error}});
  }
  source_.reset();
}

bool DeviceSession::RestartProductionIfStopped(const bool was_faulted, std::string& error) {
  // A faulted session's loop has returned kStop even if it has not exited
  // yet, so it is always joined and replaced.
  if (!was_faulted && hub_.IsProducing()) {
    return true;
  }
  hub_.StopProduction();
  return hub_.StartProduction([this](FramePtr& frame) { return ProduceOnce(frame); }, error);
}

FrameHub::ProduceResult DeviceSession::ProduceOnce(FramePtr& frame) {
  if (State() != SessionState::kStreaming) {
    return FrameHub::ProduceResult::kStop;
  }

  ReadFrameResult read = ReadFrame();
  if (read.ok) {
    consecutive_read_failures_.store(0U);
    frame = std::move(read.frame);
    return FrameHub::ProduceResult::kFrame;
  }

  const std::uint32_t failures = consecutive_read_failures_.fetch_add(1U) + 1U;
  logger_.Debug("frame read failed",
                {{"consecutive", std::to_string(failures)}, {"error", read.error}});

  if (failures > options_.read_failure_threshold) {
    logger_.Warn("read failure threshold exceeded",
                 {{"consecutive", std::to_string(failures)},
                  {"threshold", std::to_string(options_.read_failure_threshold)}});
    std::string error;
    AdminLock lock(*this);
    if (State() != SessionState::kStreaming) {
      return FrameHub::ProduceResult::kStop;
    }
    // A caller's reinitialize may have run while this thread waited.
    if (consecutive_read_failures_.load() <= options_.read_failure_threshold) {
      return FrameHub::ProduceResult::kNoFrame;
    }
    if (!ReinitializeLocked(error)) {
      return FrameHub::ProduceResult::kStop;
    }
    return FrameHub::ProduceResult::kNoFrame;
  }

  std::this_thread::sleep_for(kReadFailureBackoff);
  return FrameHub::ProduceResult::kNoFrame;
}

void DeviceSession::MarkFaulted(const std::string& reason) {
  {
    std::lock_guard<std::mutex> info_lock(info_mu_);
    state_ = SessionState::kFaulted;
    fault_reason_ = reason;
  }
  logger_.Error("device session faulted", {{"error", reason}});
}

} // namespace camctl::camera
