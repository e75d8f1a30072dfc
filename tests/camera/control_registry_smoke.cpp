#include "../common/assertions.hpp"
#include "camera/control_registry.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace {

using camctl::camera::ControlDescriptor;
using camctl::camera::ControlKind;
using camctl::camera::ControlMap;

ControlDescriptor MakeControl(const std::string& name, const ControlKind kind,
                              const std::int64_t minimum, const std::int64_t maximum,
                              const std::int64_t hardware_default) {
  ControlDescriptor control;
  control.name = name;
  control.kind = kind;
  control.minimum = minimum;
  control.maximum = maximum;
  control.step = 1;
  control.default_value = hardware_default;
  control.current = hardware_default;
  return control;
}

ControlMap UvcLikeControls() {
  ControlMap controls;
  controls["brightness"] = MakeControl("brightness", ControlKind::kInteger, -64, 64, 0);
  controls["gain"] = MakeControl("gain", ControlKind::kInteger, 0, 100, 0);
  controls["auto_exposure"] = MakeControl("auto_exposure", ControlKind::kMenu, 0, 3, 3);
  controls["exposure_time_absolute"] =
      MakeControl("exposure_time_absolute", ControlKind::kInteger, 1, 5000, 157);
  return controls;
}

struct RecordedWrites {
  std::vector<std::pair<std::string, std::int64_t>> writes;
  std::string reject;

  bool Apply(const std::string& name, const std::int64_t value, std::string& error) {
    if (name == reject) {
      error = "Input/output error";
      return false;
    }
    writes.emplace_back(name, value);
    return true;
  }
};

} // namespace

int main() {
  using camctl::camera::ControlRegistry;
  using camctl::core::errors::CameraErrorCode;
  using camctl::tests::common::AssertErrorCode;
  using camctl::tests::common::Fail;

  {
    ControlRegistry registry;
    std::string error;
    if (registry.Replace({}, error)) {
      Fail("expected empty control set to be rejected");
    }
    AssertErrorCode(error, CameraErrorCode::kNoControlsFound);
    if (registry.Size() != 0U) {
      Fail("rejected replace must leave the registry empty");
    }
  }

  {
    ControlRegistry registry;
    std::string error;
    if (!registry.Replace(UvcLikeControls(), error)) {
      Fail("replace failed: " + error);
    }

    if (registry.Validate("focus_absolute", 10, error)) {
      Fail("expected unknown control to fail validation");
    }
    AssertErrorCode(error, CameraErrorCode::kControlUnknown);

    if (registry.Validate("brightness", 65, error)) {
      Fail("expected value above maximum to fail validation");
    }
    AssertErrorCode(error, CameraErrorCode::kControlOutOfRange);
    if (registry.Validate("brightness", -65, error)) {
      Fail("expected value below minimum to fail validation");
    }
    if (!registry.Validate("brightness", 64, error) || !registry.Validate("brightness", -64, error)) {
      Fail("bounds are inclusive");
    }

    RecordedWrites recorder;
    const auto result = registry.ApplyDefaults(
        [&recorder](const std::string& name, const std::int64_t value, std::string& apply_error) {
          return recorder.Apply(name, value, apply_error);
        });
    if (result.attempted != 4U || result.applied != 4U || !result.failed.empty()) {
      Fail("expected all four defaults to apply");
    }
    if (recorder.writes.size() != 4U) {
      Fail("expected four hardware writes");
    }
    if (recorder.writes[2] != std::make_pair(std::string("auto_exposure"), std::int64_t{1})) {
      Fail("exposure mode must be written after independent controls, as manual");
    }
    if (recorder.writes[3] !=
        std::make_pair(std::string("exposure_time_absolute"), std::int64_t{2500})) {
      Fail("exposure time must be written last at its midpoint");
    }

    const auto current = registry.CurrentValues();
    if (current.at("gain") != 50 || current.at("auto_exposure") != 1) {
      Fail("applied defaults must be reflected in current values");
    }

    const auto original = registry.OriginalHardwareDefaults();
    if (original.at("auto_exposure") != 3 || original.at("exposure_time_absolute") != 157) {
      Fail("original hardware defaults must keep the driver-reported values");
    }
    if (registry.StoredDefaults().at("gain") != 50) {
      Fail("stored defaults must hold the calculated values");
    }

    // A later introspection pass never moves the original defaults.
    ControlMap refreshed = UvcLikeControls();
    refreshed["gain"].default_value = 77;
    if (!registry.Replace(std::move(refreshed), error)) {
      Fail("second replace failed: " + error);
    }
    if (registry.OriginalHardwareDefaults().at("gain") != 0) {
      Fail("original hardware defaults changed after a second replace");
    }
    const auto gain = registry.Find("gain");
    if (!gain.has_value() || gain->default_value != 50) {
      Fail("descriptor default must report the working default");
    }
  }

  {
    ControlRegistry registry;
    std::string error;
    if (!registry.Replace(UvcLikeControls(), error)) {
      Fail("replace failed: " + error);
    }

    RecordedWrites recorder;
    recorder.reject = "auto_exposure";
    const auto result = registry.ApplyDefaults(
        [&recorder](const std::string& name, const std::int64_t value, std::string& apply_error) {
          return recorder.Apply(name, value, apply_error);
        });
    if (result.attempted != 4U || result.applied != 2U || result.failed.size() != 2U) {
      Fail("expected mode rejection to also skip exposure time");
    }
    for (const auto& [name, value] : recorder.writes) {
      (void)value;
      if (name == "exposure_time_absolute") {
        Fail("exposure time must not be written when the mode write failed");
      }
    }
    if (registry.CurrentValues().at("auto_exposure") != 3) {
      Fail("rejected write must not change the current value");
    }
  }

  return 0;
}
