#include "backends/v4l2/v4l2_utils.hpp"

#include <cctype>
#include <charconv>
#include <iomanip>
#include <sstream>

namespace camctl::backends::v4l2 {

std::string Trim(std::string_view input) {
  std::size_t begin = 0U;
  while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin])) != 0) {
    ++begin;
  }

  std::size_t end = input.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1U])) != 0) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

std::optional<std::uint32_t> ParseFourcc(std::string_view text) {
  if (text.size() != 4U) {
    return std::nullopt;
  }
  const std::uint32_t value =
      static_cast<std::uint32_t>(static_cast<unsigned char>(text[0])) |
      (static_cast<std::uint32_t>(static_cast<unsigned char>(text[1])) << 8U) |
      (static_cast<std::uint32_t>(static_cast<unsigned char>(text[2])) << 16U) |
      (static_cast<std::uint32_t>(static_cast<unsigned char>(text[3])) << 24U);
  return value;
}

std::string FourccToString(const std::uint32_t fourcc) {
  std::string text(4, ' ');
  text[0] = static_cast<char>(fourcc & 0xFFU);
  text[1] = static_cast<char>((fourcc >> 8U) & 0xFFU);
  text[2] = static_cast<char>((fourcc >> 16U) & 0xFFU);
  text[3] = static_cast<char>((fourcc >> 24U) & 0xFFU);

  bool printable = true;
  for (const char c : text) {
    const unsigned char ascii = static_cast<unsigned char>(c);
    if (ascii < 32U || ascii > 126U) {
      printable = false;
      break;
    }
  }

  if (printable) {
    const std::string trimmed = Trim(text);
    if (!trimmed.empty()) {
      return trimmed;
    }
  }
  return FormatCapabilitiesHex(fourcc);
}

std::string FormatCapabilitiesHex(const std::uint32_t caps) {
  std::ostringstream out;
  out << "0x" << std::uppercase << std::hex << std::setw(8) << std::setfill('0') << caps;
  return out.str();
}

std::optional<std::size_t> ParseVideoIndex(std::string_view node_name) {
  constexpr std::string_view kPrefix = "video";
  if (node_name.size() <= kPrefix.size() || node_name.substr(0, kPrefix.size()) != kPrefix) {
    return std::nullopt;
  }
  const std::string_view suffix = node_name.substr(kPrefix.size());

  std::size_t parsed = 0;
  const char* begin = suffix.data();
  const char* end = begin + suffix.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return parsed;
}

} // namespace camctl::backends::v4l2
