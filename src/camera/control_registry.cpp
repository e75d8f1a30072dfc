#include "camera/control_registry.hpp"

#include "core/errors/camera_errors.hpp"

#include <utility>

namespace camctl::camera {

namespace {

using core::errors::CameraErrorCode;
using core::errors::FormatCameraError;

struct PlannedWrite {
  std::string name;
  std::int64_t value = 0;
};

} // namespace

bool ControlRegistry::Replace(ControlMap controls, std::string& error) {
  error.clear();
  if (controls.empty()) {
    error = FormatCameraError(CameraErrorCode::kNoControlsFound,
                              "device reported no usable controls");
    return false;
  }

  const ControlValues calculated = CalculateDefaults(controls);

  std::lock_guard<std::mutex> lock(mu_);
  if (!defaults_captured_) {
    for (const auto& [name, control] : controls) {
      original_hardware_defaults_[name] = control.default_value;
    }
    stored_defaults_ = calculated;
    defaults_captured_ = true;
  }
  controls_ = std::move(controls);
  OverwriteDescriptorDefaultsLocked(calculated);
  return true;
}

bool ControlRegistry::Validate(const std::string& name, const std::int64_t value,
                               std::string& error) const {
  error.clear();
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = controls_.find(name);
  if (it == controls_.end()) {
    error = FormatCameraError(CameraErrorCode::kControlUnknown, "no control named '" + name + "'");
    return false;
  }
  const ControlDescriptor& control = it->second;
  if (value < control.minimum || value > control.maximum) {
    error = FormatCameraError(CameraErrorCode::kControlOutOfRange,
                              name + "=" + std::to_string(value) + " outside [" +
                                  std::to_string(control.minimum) + ", " +
                                  std::to_string(control.maximum) + "]");
    return false;
  }
  return true;
}

void ControlRegistry::RecordApplied(const std::string& name, const std::int64_t value) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = controls_.find(name);
  if (it != controls_.end()) {
    it->second.current = value;
  }
}

ApplyDefaultsResult ControlRegistry::ApplyDefaults(const ApplyFn& apply) {
  ApplyDefaultsResult result;

  ControlValues calculated;
  std::vector<PlannedWrite> independent;
  std::optional<PlannedWrite> exposure_mode;
  std::optional<PlannedWrite> exposure_time;
  {
    std::lock_guard<std::mutex> lock(mu_);
    calculated = CalculateDefaults(controls_);
    for (const auto& [name, value] : calculated) {
      if (IsExposureModeControl(name)) {
        exposure_mode = PlannedWrite{.name = name, .value = value};
      } else if (IsExposureTimeControl(name)) {
        exposure_time = PlannedWrite{.name = name, .value = value};
      } else {
        independent.push_back(PlannedWrite{.name = name, .value = value});
      }
    }
  }

  auto write = [&](const PlannedWrite& planned) {
    ++result.attempted;
    std::string error;
    if (!Validate(planned.name, planned.value, error) ||
        !apply(planned.name, planned.value, error)) {
      result.failed.push_back(planned.name);
      return false;
    }
    RecordApplied(planned.name, planned.value);
    ++result.applied;
    return true;
  };

  for (const PlannedWrite& planned : independent) {
    (void)write(planned);
  }

  bool exposure_time_allowed = true;
  if (exposure_mode.has_value()) {
    exposure_time_allowed = write(exposure_mode.value());
    if (exposure_time_allowed) {
      std::lock_guard<std::mutex> lock(mu_);
      stored_defaults_[exposure_mode->name] = exposure_mode->value;
    }
  }

  if (exposure_time.has_value()) {
    if (exposure_time_allowed) {
      (void)write(exposure_time.value());
    } else {
      ++result.attempted;
      result.failed.push_back(exposure_time->name);
    }
  }

  std::lock_guard<std::mutex> lock(mu_);
  OverwriteDescriptorDefaultsLocked(calculated);
  return result;
}

ControlMap ControlRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return controls_;
}

std::optional<ControlDescriptor> ControlRegistry::Find(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = controls_.find(name);
  if (it == controls_.end()) {
    return std::nullopt;
  }
  return it->second;
}

ControlValues ControlRegistry::CurrentValues() const {
  std::lock_guard<std::mutex> lock(mu_);
  ControlValues values;
  for (const auto& [name, control] : controls_) {
    values[name] = control.current;
  }
  return values;
}

ControlValues ControlRegistry::StoredDefaults() const {
  std::lock_guard<std::mutex> lock(mu_);
  return stored_defaults_;
}

ControlValues ControlRegistry::OriginalHardwareDefaults() const {
  std::lock_guard<std::mutex> lock(mu_);
  return original_hardware_defaults_;
}

std::size_t ControlRegistry::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return controls_.size();
}

void ControlRegistry::OverwriteDescriptorDefaultsLocked(const ControlValues& calculated) {
  for (auto& [name, control] : controls_) {
    if (const auto stored = stored_defaults_.find(name); stored != stored_defaults_.end()) {
      control.default_value = stored->second;
      continue;
    }
    if (const auto computed = calculated.find(name); computed != calculated.end()) {
      control.default_value = computed->second;
    }
  }
}

} // namespace camctl::camera
