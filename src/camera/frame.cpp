#include "camera/frame.hpp"

#include <algorithm>
#include <tuple>

namespace camctl::camera {

std::string ToString(const CaptureFormat& format) {
  return format.format + " " + std::to_string(format.width) + "x" + std::to_string(format.height);
}

void SortCaptureFormats(std::vector<CaptureFormat>& formats) {
  std::stable_sort(formats.begin(), formats.end(),
                   [](const CaptureFormat& left, const CaptureFormat& right) {
                     return std::tie(left.width, left.height, left.format) <
                            std::tie(right.width, right.height, right.format);
                   });
}

} // namespace camctl::camera
