#pragma once

#include "backends/device_backend.hpp"
#include "camera/device_session.hpp"
#include "camera/frame.hpp"
#include "camera/preview_encoder.hpp"
#include "config/service_config.hpp"
#include "core/logging/logger.hpp"
#include "media/image_codec.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace camctl::camera {

// Owner of the single active camera and its consumers.
//
// Holds at most one `DeviceSession` with its preview encoder, timelapse
// sampler and video recorder. Switching cameras tears the old set down
// synchronously before the new device is opened. Every pass-through fails
// with `SESSION_NOT_OPEN` while no camera is initialized.
//
// Calls may come from any thread. Lifecycle changes (initialize, switch,
// shutdown) are serialized; other calls run against a snapshot of the active
// set and so never block on a lifecycle change in progress.
class CameraService {
public:
  static constexpr std::chrono::milliseconds kPhotoTimeout{2000};

  CameraService(backends::IDeviceBackend& backend, media::IImageEncoder& encoder,
                media::VideoWriterFactory writer_factory, core::logging::Logger& logger,
                config::ServiceConfig config,
                std::string config_path = config::kDefaultConfigPath);
  ~CameraService();

  CameraService(const CameraService&) = delete;
  CameraService& operator=(const CameraService&) = delete;

  bool DiscoverCameras(std::vector<backends::DeviceEntry>& devices, std::string& error);

  // Opens `device_path`, else the configured device, else the first
  // discovered one. No-op when a camera is already initialized.
  bool Initialize(const std::optional<std::string>& device_path, std::string& error);
  bool SwitchCamera(const std::string& device_path, std::string& error);
  void Shutdown();
  bool IsInitialized() const;

  std::string DevicePath() const;
  SessionState State() const;
  std::string FaultReason() const;
  CaptureFormat CurrentFormat() const;
  std::vector<CaptureFormat> SupportedFormats() const;
  ControlValues CurrentValues() const;

  bool SetResolution(const CaptureFormat& format, std::string& error);
  bool SetControlValue(const std::string& name, std::int64_t value, std::string& error);
  bool ResetToStoredDefaults(std::string& error);
  bool Reinitialize(std::string& error);

  // Latest encoded preview frame; repeated calls return the same frame until
  // a newer one is encoded.
  bool CurrentPreviewFrame(EncodedFramePtr& frame, std::string& error) const;
  bool WaitForPreviewFrame(std::optional<std::uint64_t> after_sequence,
                           std::chrono::milliseconds timeout, EncodedFramePtr& frame,
                           std::string& error) const;

  // Interval defaults to the configured `timelapse_interval_seconds`.
  bool StartTimelapse(std::optional<double> interval_seconds, std::string& error);
  bool StopTimelapse(std::string& error);
  bool IsTimelapseRunning() const;
  std::uint64_t TimelapseCapturedCount() const;

  // fps defaults to the configured `recording_fps`.
  bool StartRecording(const std::optional<std::string>& filename, std::optional<double> fps,
                      std::string& error);
  // `path` receives the finished file, or stays empty when nothing was
  // recording.
  bool StopRecording(std::string& path, std::string& error);
  bool IsRecording() const;

  // Writes the next delivered frame to `path`, waiting at most
  // `kPhotoTimeout`.
  bool CapturePhoto(const std::string& path, std::string& error);

  bool StatusJson(std::string& json, std::string& error) const;

  // Retargets image/video output for subsequent runs.
  bool SetOutputDirectories(const std::string& image_output, const std::string& video_output,
                            std::string& error);

  // Persists output directories plus the current resolution and control
  // values, which become the timelapse override.
  bool SaveConfig(std::string& error);

  config::ServiceConfig Config() const;

private:
  struct ActiveCamera;

  std::shared_ptr<ActiveCamera> Active() const;
  bool RequireActive(std::shared_ptr<ActiveCamera>& active, std::string& error) const;
  bool ResolveDevicePath(const std::optional<std::string>& requested, std::string& device_path,
                         std::string& error);
  bool OpenLocked(const std::string& device_path, std::string& error);
  void ShutdownLocked();

  backends::IDeviceBackend& backend_;
  media::IImageEncoder& encoder_;
  media::VideoWriterFactory writer_factory_;
  core::logging::Logger& logger_;
  const std::string config_path_;

  // Serializes initialize/switch/shutdown.
  std::mutex lifecycle_mu_;

  // Guards `active_` and `config_`.
  mutable std::mutex mu_;
  std::shared_ptr<ActiveCamera> active_;
  config::ServiceConfig config_;
};

} // namespace camctl::camera
