#pragma once

#include "camera/control_descriptor.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace camctl::camera {

// Outcome of one defaults pass. Partial failure is reported, never fatal.
struct ApplyDefaultsResult {
  std::size_t attempted = 0U;
  std::size_t applied = 0U;
  std::vector<std::string> failed;
};

// Authoritative name -> descriptor map for one device session.
//
// Contract:
// - `current` of every descriptor stays within [minimum, maximum]; writes are
//   validated here before any hardware round-trip and rejected, not clamped
// - original hardware defaults are captured by the first `Replace` and never
//   change afterwards, across any number of reinitializations
// - stored (working) defaults are computed by the first `Replace`; only the
//   exposure-dependency step of `ApplyDefaults` overwrites entries
// - the map has its own mutex, narrower than the device lock; hardware writes
//   run outside it so readers never wait on an ioctl
class ControlRegistry {
public:
  // Hardware write collaborator. Returns false with error text on rejection.
  using ApplyFn =
      std::function<bool(const std::string& name, std::int64_t value, std::string& error)>;

  // Installs a freshly introspected control set. Fails with
  // `NO_CONTROLS_FOUND` when `controls` is empty and leaves state unchanged.
  bool Replace(ControlMap controls, std::string& error);

  // Local bounds check; `CONTROL_UNKNOWN` or `CONTROL_OUT_OF_RANGE` on failure.
  bool Validate(const std::string& name, std::int64_t value, std::string& error) const;

  // Records a value the hardware accepted.
  void RecordApplied(const std::string& name, std::int64_t value);

  // Applies calculated defaults in dependency order:
  // 1. every control except exposure mode / exposure time
  // 2. exposure mode (manual when available); on success its stored default
  //    becomes the applied value
  // 3. exposure time, only when step 2 succeeded or no mode control exists;
  //    otherwise it is reported as failed without a write
  ApplyDefaultsResult ApplyDefaults(const ApplyFn& apply);

  ControlMap Snapshot() const;
  std::optional<ControlDescriptor> Find(const std::string& name) const;
  ControlValues CurrentValues() const;
  ControlValues StoredDefaults() const;
  ControlValues OriginalHardwareDefaults() const;
  std::size_t Size() const;

private:
  // Sets each descriptor's `default_value` to its working default. Caller
  // holds `mu_`.
  void OverwriteDescriptorDefaultsLocked(const ControlValues& calculated);

  mutable std::mutex mu_;
  ControlMap controls_;
  ControlValues stored_defaults_;
  ControlValues original_hardware_defaults_;
  bool defaults_captured_ = false;
};

} // namespace camctl::camera
