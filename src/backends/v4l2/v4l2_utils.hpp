#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace camctl::backends::v4l2 {

std::string Trim(std::string_view input);

// `MJPG` -> little-endian fourcc. Requires exactly four characters.
std::optional<std::uint32_t> ParseFourcc(std::string_view text);

// Printable fourcc with trailing blanks trimmed; non-printable codes are
// rendered as hex.
std::string FourccToString(std::uint32_t fourcc);

std::string FormatCapabilitiesHex(std::uint32_t caps);

// `video12` -> 12. Any other node name yields nullopt.
std::optional<std::size_t> ParseVideoIndex(std::string_view node_name);

} // namespace camctl::backends::v4l2
