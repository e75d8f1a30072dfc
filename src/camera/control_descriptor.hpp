#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace camctl::camera {

// Value-shape classification for one hardware control.
//
// - `kInteger`: ranged integer with a step (brightness, exposure time)
// - `kBoolean`: 0/1 switch (white_balance_automatic)
// - `kMenu`: enumerated indices between min and max (auto_exposure)
enum class ControlKind {
  kInteger = 0,
  kBoolean,
  kMenu,
};

const char* ToString(ControlKind kind);

// One row exactly as a backend reported it, before validation.
//
// `type_tag` uses the `v4l2-ctl` spelling (`int`, `bool`, `menu`, ...).
// Fields a backend could not read stay empty.
struct RawControlRecord {
  std::string name;
  std::string type_tag;
  std::optional<std::int64_t> minimum;
  std::optional<std::int64_t> maximum;
  std::optional<std::int64_t> step;
  std::optional<std::int64_t> default_value;
  std::optional<std::int64_t> current_value;
};

// Metadata plus live value for one adjustable control.
//
// `default_value` starts as the hardware-reported default and is replaced by
// the working default once defaults have been applied.
struct ControlDescriptor {
  std::string name;
  ControlKind kind = ControlKind::kInteger;
  std::int64_t minimum = 0;
  std::int64_t maximum = 0;
  std::int64_t step = 1;
  std::int64_t default_value = 0;
  std::int64_t current = 0;
};

using ControlMap = std::map<std::string, ControlDescriptor>;
using ControlValues = std::map<std::string, std::int64_t>;

// Builds a descriptor from a raw record.
//
// Rules:
// - unknown type tags are dropped
// - default and current values are required for every kind
// - integer controls additionally require min, max and step
// - boolean controls are normalized to min=0, max=1, step=1
// - menu controls require min and max; step is forced to 1
std::optional<ControlDescriptor> ClassifyControl(const RawControlRecord& record);

// Classifies every record; rows failing the rules above are skipped.
ControlMap ClassifyControls(const std::vector<RawControlRecord>& records);

// Converts a driver label to the `v4l2-ctl` identifier form:
// `Exposure Time, Absolute` -> `exposure_time_absolute`.
std::string NormalizeControlName(std::string_view label);

// Exposure-mode control (`auto_exposure`, older kernels `exposure_auto`).
bool IsExposureModeControl(std::string_view name);

// Absolute exposure-time control that is inert unless the mode is manual.
bool IsExposureTimeControl(std::string_view name);

// Working default used to force manual exposure.
constexpr std::int64_t kManualExposureMode = 1;

// Deterministic defaults derived from bounds:
// - integer: floor((min + max) / 2)
// - boolean: min
// - menu: min, except the exposure-mode control which gets manual mode (1)
//   when its max allows it
ControlValues CalculateDefaults(const ControlMap& controls);

} // namespace camctl::camera
