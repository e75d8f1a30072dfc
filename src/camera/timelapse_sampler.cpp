#include "camera/timelapse_sampler.hpp"

#include "core/errors/camera_errors.hpp"
#include "core/fs_utils.hpp"

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <utility>

namespace camctl::camera {

namespace {

using core::errors::CameraErrorCode;
using core::errors::FormatCameraError;

constexpr auto kPopTimeout = std::chrono::milliseconds(200);

} // namespace

TimelapseSampler::TimelapseSampler(DeviceSession& session, media::IImageEncoder& encoder,
                                   core::logging::Logger& logger, std::string output_dir)
    : session_(session), encoder_(encoder), logger_(logger), output_dir_(std::move(output_dir)) {}

TimelapseSampler::~TimelapseSampler() {
  Stop();
}

std::string TimelapseSampler::ImageFileName(const std::uint64_t index) {
  char name[32];
  std::snprintf(name, sizeof(name), "frame_%05llu.jpg", static_cast<unsigned long long>(index));
  return name;
}

bool TimelapseSampler::Start(const double interval_seconds, std::string& error) {
  error.clear();
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (running_.load()) {
    return true;
  }
  if (!(interval_seconds > 0.0) || !std::isfinite(interval_seconds)) {
    error = FormatCameraError(CameraErrorCode::kInvalidArgument,
                              "timelapse interval must be a positive number of seconds");
    return false;
  }
  if (!session_.IsOpen()) {
    error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "camera not initialized");
    return false;
  }
  if (!core::EnsureDirectory(output_dir_, error)) {
    return false;
  }

  snapshot_format_ = session_.CurrentFormat();
  snapshot_controls_ = session_.CurrentValues();

  if (override_.format.has_value() && override_.format.value() != snapshot_format_) {
    std::string override_error;
    if (!session_.SetResolution(override_.format.value(), override_error)) {
      logger_.Warn("timelapse resolution override not applied", {{"error", override_error}});
    }
  }
  for (const auto& [name, value] : override_.controls) {
    std::string override_error;
    if (!session_.SetControlValue(name, value, override_error)) {
      logger_.Warn("timelapse control override not applied",
                   {{"control", name}, {"error", override_error}});
    }
  }

  queue_ = session_.Hub().Attach(ConsumerKind::kTimelapse);
  if (!queue_) {
    RestoreSnapshot();
    error = FormatCameraError(CameraErrorCode::kSessionNotOpen, "frame hub is closed");
    return false;
  }

  interval_seconds_ = interval_seconds;
  const auto interval = std::chrono::duration_cast<std::chrono::nanoseconds>(
      std::chrono::duration<double>(interval_seconds));
  stop_requested_.store(false);
  running_.store(true);
  worker_ = std::thread([this, queue = queue_, interval, dir = output_dir_]() {
    Loop(queue, interval, dir);
  });

  logger_.Info("timelapse started", {{"interval_s", std::to_string(interval_seconds)},
                                     {"output_dir", output_dir_},
                                     {"format", ToString(session_.CurrentFormat())}});
  return true;
}

void TimelapseSampler::Stop() {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  if (!running_.load() && !worker_.joinable()) {
    return;
  }

  stop_requested_.store(true);
  if (worker_.joinable()) {
    worker_.join();
  }
  session_.Hub().Detach(queue_);
  queue_.reset();
  running_.store(false);

  RestoreSnapshot();
  logger_.Info("timelapse stopped", {{"captured", std::to_string(captured_.load())}});
}

bool TimelapseSampler::IsRunning() const {
  return running_.load();
}

void TimelapseSampler::SetOutputDir(std::string output_dir) {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  output_dir_ = std::move(output_dir);
}

void TimelapseSampler::SetOverride(TimelapseOverride override_settings) {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  override_ = std::move(override_settings);
}

std::string TimelapseSampler::OutputDir() const {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  return output_dir_;
}

double TimelapseSampler::IntervalSeconds() const {
  std::lock_guard<std::mutex> lock(lifecycle_mu_);
  return interval_seconds_;
}

std::uint64_t TimelapseSampler::NextImageIndex() const {
  return next_index_.load();
}

std::uint64_t TimelapseSampler::CapturedCount() const {
  return captured_.load();
}

std::string TimelapseSampler::LastImagePath() const {
  std::lock_guard<std::mutex> lock(last_path_mu_);
  return last_image_path_;
}

void TimelapseSampler::Loop(DeliveryHandle queue, const std::chrono::nanoseconds interval,
                            std::string output_dir) {
  const core::logging::ScopedThreadTag tag("timelapse");
  auto next_deadline = std::chrono::steady_clock::now();
  while (!stop_requested_.load()) {
    FramePtr frame;
    const PopStatus status = queue->Pop(frame, kPopTimeout);
    if (status == PopStatus::kClosed) {
      break;
    }
    if (status == PopStatus::kTimeout) {
      continue;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now < next_deadline) {
      continue;
    }

    const std::uint64_t index = next_index_.load();
    const std::string path = (std::filesystem::path(output_dir) / ImageFileName(index)).string();
    std::string error;
    if (encoder_.WriteImage(*frame, path, error)) {
      next_index_.store(index + 1U);
      captured_.fetch_add(1U);
      {
        std::lock_guard<std::mutex> lock(last_path_mu_);
        last_image_path_ = path;
      }
      logger_.Debug("timelapse image written",
                    {{"path", path}, {"sequence", std::to_string(frame->sequence)}});
    } else {
      logger_.Warn("timelapse image write failed", {{"path", path}, {"error", error}});
    }

    while (next_deadline <= now) {
      next_deadline += interval;
    }
  }
  running_.store(false);
}

void TimelapseSampler::RestoreSnapshot() {
  if (!session_.IsOpen()) {
    logger_.Warn("timelapse restore skipped; session is not streaming");
    return;
  }

  if (snapshot_format_.width != 0U && session_.CurrentFormat() != snapshot_format_) {
    std::string error;
    if (!session_.SetResolution(snapshot_format_, error)) {
      logger_.Warn("timelapse resolution restore failed", {{"error", error}});
    }
  }

  std::size_t failed = 0U;
  for (const auto& [name, value] : snapshot_controls_) {
    std::string error;
    if (!session_.SetControlValue(name, value, error)) {
      ++failed;
    }
  }
  if (failed > 0U) {
    logger_.Warn("timelapse control restore incomplete", {{"failed", std::to_string(failed)}});
  }
}

} // namespace camctl::camera
