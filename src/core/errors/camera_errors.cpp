#include "core/errors/camera_errors.hpp"

#include <array>
#include <cctype>
#include <string>

namespace camctl::core::errors {

namespace {

constexpr std::array<CameraErrorCode, 14> kKnownCodes = {
    CameraErrorCode::kDeviceUnavailable,     CameraErrorCode::kNoSupportedFormats,
    CameraErrorCode::kNoControlsFound,       CameraErrorCode::kControlOutOfRange,
    CameraErrorCode::kControlUnknown,        CameraErrorCode::kControlApplyFailed,
    CameraErrorCode::kTransientReadFailure,  CameraErrorCode::kReinitializationFailed,
    CameraErrorCode::kWriterOpenFailed,      CameraErrorCode::kSessionNotOpen,
    CameraErrorCode::kResolutionUnsupported, CameraErrorCode::kResolutionLocked,
    CameraErrorCode::kInvalidArgument,       CameraErrorCode::kCodecNotAvailable,
};

std::string CollapseWhitespace(std::string_view text) {
  std::string normalized;
  normalized.reserve(text.size());
  bool previous_was_space = true;
  for (const char c : text) {
    if (std::isspace(static_cast<unsigned char>(c)) != 0) {
      if (!previous_was_space) {
        normalized.push_back(' ');
      }
      previous_was_space = true;
      continue;
    }
    normalized.push_back(c);
    previous_was_space = false;
  }
  if (!normalized.empty() && normalized.back() == ' ') {
    normalized.pop_back();
  }
  return normalized;
}

} // namespace

std::string_view ToStableErrorCode(const CameraErrorCode code) {
  switch (code) {
  case CameraErrorCode::kDeviceUnavailable:
    return "DEVICE_UNAVAILABLE";
  case CameraErrorCode::kNoSupportedFormats:
    return "NO_SUPPORTED_FORMATS";
  case CameraErrorCode::kNoControlsFound:
    return "NO_CONTROLS_FOUND";
  case CameraErrorCode::kControlOutOfRange:
    return "CONTROL_OUT_OF_RANGE";
  case CameraErrorCode::kControlUnknown:
    return "CONTROL_UNKNOWN";
  case CameraErrorCode::kControlApplyFailed:
    return "CONTROL_APPLY_FAILED";
  case CameraErrorCode::kTransientReadFailure:
    return "TRANSIENT_READ_FAILURE";
  case CameraErrorCode::kReinitializationFailed:
    return "REINITIALIZATION_FAILED";
  case CameraErrorCode::kWriterOpenFailed:
    return "WRITER_OPEN_FAILED";
  case CameraErrorCode::kSessionNotOpen:
    return "SESSION_NOT_OPEN";
  case CameraErrorCode::kResolutionUnsupported:
    return "RESOLUTION_UNSUPPORTED";
  case CameraErrorCode::kResolutionLocked:
    return "RESOLUTION_LOCKED";
  case CameraErrorCode::kInvalidArgument:
    return "INVALID_ARGUMENT";
  case CameraErrorCode::kCodecNotAvailable:
    return "CODEC_NOT_AVAILABLE";
  case CameraErrorCode::kUnknown:
  default:
    return "UNKNOWN_ERROR";
  }
}

std::string_view DescribeCameraError(const CameraErrorCode code) {
  switch (code) {
  case CameraErrorCode::kDeviceUnavailable:
    return "camera device could not be opened; check the device path and permissions";
  case CameraErrorCode::kNoSupportedFormats:
    return "camera reported no usable capture formats";
  case CameraErrorCode::kNoControlsFound:
    return "camera reported no usable controls";
  case CameraErrorCode::kControlOutOfRange:
    return "control value rejected by local bounds check";
  case CameraErrorCode::kControlUnknown:
    return "control is not exposed by the active camera";
  case CameraErrorCode::kControlApplyFailed:
    return "camera rejected the control write; previous value kept";
  case CameraErrorCode::kTransientReadFailure:
    return "frame read failed";
  case CameraErrorCode::kReinitializationFailed:
    return "camera could not be reopened; streaming halted";
  case CameraErrorCode::kWriterOpenFailed:
    return "output writer could not be opened";
  case CameraErrorCode::kSessionNotOpen:
    return "camera not initialized";
  case CameraErrorCode::kResolutionUnsupported:
    return "requested resolution is not supported by the camera";
  case CameraErrorCode::kResolutionLocked:
    return "resolution cannot change while a recording is active";
  case CameraErrorCode::kInvalidArgument:
    return "invalid argument";
  case CameraErrorCode::kCodecNotAvailable:
    return "OpenCV codec support is not compiled into this build";
  case CameraErrorCode::kUnknown:
  default:
    return "unexpected camera failure";
  }
}

std::string FormatCameraError(const CameraErrorCode code, std::string_view detail) {
  std::string formatted =
      std::string(ToStableErrorCode(code)) + ": " + std::string(DescribeCameraError(code));
  const std::string collapsed = CollapseWhitespace(detail);
  if (!collapsed.empty()) {
    formatted += " detail: " + collapsed;
  }
  return formatted;
}

CameraErrorCode ParseCameraErrorCode(std::string_view error_text) {
  for (const CameraErrorCode code : kKnownCodes) {
    const std::string_view stable = ToStableErrorCode(code);
    if (error_text.size() > stable.size() && error_text.substr(0, stable.size()) == stable &&
        error_text[stable.size()] == ':') {
      return code;
    }
  }
  return CameraErrorCode::kUnknown;
}

ExitCode ExitCodeFor(const CameraErrorCode code) {
  switch (code) {
  case CameraErrorCode::kDeviceUnavailable:
  case CameraErrorCode::kNoSupportedFormats:
  case CameraErrorCode::kNoControlsFound:
    return ExitCode::kDeviceUnavailable;
  case CameraErrorCode::kReinitializationFailed:
    return ExitCode::kSessionFaulted;
  default:
    return ExitCode::kFailure;
  }
}

} // namespace camctl::core::errors
