#pragma once

#include <string>
#include <string_view>

namespace camctl::core::errors {

// Stable classification for camera-core failures.
//
// Every error string produced by the session, the consumers and the backends
// starts with one of these codes so the driver layer can branch on the code
// and show the remainder verbatim.
enum class CameraErrorCode {
  kDeviceUnavailable,
  kNoSupportedFormats,
  kNoControlsFound,
  kControlOutOfRange,
  kControlUnknown,
  kControlApplyFailed,
  kTransientReadFailure,
  kReinitializationFailed,
  kWriterOpenFailed,
  kSessionNotOpen,
  kResolutionUnsupported,
  kResolutionLocked,
  kInvalidArgument,
  kCodecNotAvailable,
  kUnknown,
};

std::string_view ToStableErrorCode(CameraErrorCode code);

// Short operator-facing explanation for one code.
std::string_view DescribeCameraError(CameraErrorCode code);

// Returns single-line contract text:
//   "<STABLE_CODE>: <description> detail: <raw_detail>"
// The detail suffix is omitted when raw detail is empty.
std::string FormatCameraError(CameraErrorCode code, std::string_view detail);

// Recovers the code from text produced by `FormatCameraError`. Text without a
// recognized prefix maps to `kUnknown`.
CameraErrorCode ParseCameraErrorCode(std::string_view error_text);

// Process exit status of the `camctl` driver. 0, 1 and 2 keep their usual
// shell meanings; the device-level values let a supervisor alert on a dead
// camera without reading stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kDeviceUnavailable = 20,
  kSessionFaulted = 21,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

// Open-time failures map to kDeviceUnavailable, a failed reinitialization
// to kSessionFaulted, everything else to kFailure.
ExitCode ExitCodeFor(CameraErrorCode code);

} // namespace camctl::core::errors
