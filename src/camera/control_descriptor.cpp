#include "camera/control_descriptor.hpp"

#include <cctype>
#include <vector>

namespace camctl::camera {

namespace {

// Floor division; integer `/` truncates toward zero for negative sums.
std::int64_t FloorHalf(const std::int64_t sum) {
  std::int64_t half = sum / 2;
  if (sum % 2 != 0 && sum < 0) {
    --half;
  }
  return half;
}

} // namespace

const char* ToString(const ControlKind kind) {
  switch (kind) {
  case ControlKind::kInteger:
    return "int";
  case ControlKind::kBoolean:
    return "bool";
  case ControlKind::kMenu:
    return "menu";
  }
  return "int";
}

std::optional<ControlDescriptor> ClassifyControl(const RawControlRecord& record) {
  if (record.name.empty()) {
    return std::nullopt;
  }
  if (!record.default_value.has_value() || !record.current_value.has_value()) {
    return std::nullopt;
  }

  ControlDescriptor descriptor;
  descriptor.name = record.name;
  descriptor.default_value = record.default_value.value();
  descriptor.current = record.current_value.value();

  if (record.type_tag == "int") {
    if (!record.minimum.has_value() || !record.maximum.has_value() || !record.step.has_value()) {
      return std::nullopt;
    }
    descriptor.kind = ControlKind::kInteger;
    descriptor.minimum = record.minimum.value();
    descriptor.maximum = record.maximum.value();
    descriptor.step = record.step.value();
    return descriptor;
  }

  if (record.type_tag == "bool") {
    descriptor.kind = ControlKind::kBoolean;
    descriptor.minimum = 0;
    descriptor.maximum = 1;
    descriptor.step = 1;
    return descriptor;
  }

  if (record.type_tag == "menu") {
    if (!record.minimum.has_value() || !record.maximum.has_value()) {
      return std::nullopt;
    }
    descriptor.kind = ControlKind::kMenu;
    descriptor.minimum = record.minimum.value();
    descriptor.maximum = record.maximum.value();
    descriptor.step = 1;
    return descriptor;
  }

  return std::nullopt;
}

ControlMap ClassifyControls(const std::vector<RawControlRecord>& records) {
  ControlMap controls;
  for (const RawControlRecord& record : records) {
    std::optional<ControlDescriptor> descriptor = ClassifyControl(record);
    if (!descriptor.has_value()) {
      continue;
    }
    controls[descriptor->name] = std::move(descriptor.value());
  }
  return controls;
}

std::string NormalizeControlName(std::string_view label) {
  std::string name;
  name.reserve(label.size());
  for (const char c : label) {
    const unsigned char ascii = static_cast<unsigned char>(c);
    if (std::isalnum(ascii) != 0) {
      name.push_back(static_cast<char>(std::tolower(ascii)));
      continue;
    }
    if (!name.empty() && name.back() != '_') {
      name.push_back('_');
    }
  }
  while (!name.empty() && name.back() == '_') {
    name.pop_back();
  }
  return name;
}

bool IsExposureModeControl(std::string_view name) {
  return name == "auto_exposure" || name == "exposure_auto";
}

bool IsExposureTimeControl(std::string_view name) {
  return name == "exposure_time_absolute" || name == "exposure_absolute";
}

ControlValues CalculateDefaults(const ControlMap& controls) {
  ControlValues defaults;
  for (const auto& [name, control] : controls) {
    switch (control.kind) {
    case ControlKind::kInteger:
      defaults[name] = FloorHalf(control.minimum + control.maximum);
      break;
    case ControlKind::kBoolean:
      defaults[name] = control.minimum;
      break;
    case ControlKind::kMenu:
      if (IsExposureModeControl(name) && control.maximum >= kManualExposureMode) {
        defaults[name] = kManualExposureMode;
      } else {
        defaults[name] = control.minimum;
      }
      break;
    }
  }
  return defaults;
}

} // namespace camctl::camera
