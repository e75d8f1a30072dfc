#include "core/fs_utils.hpp"

#include <atomic>
#include <cstdint>
#include <fstream>
#include <system_error>

#include <unistd.h>

namespace camctl::core {

namespace fs = std::filesystem;

bool EnsureDirectory(const fs::path& dir, std::string& error) {
  if (dir.empty()) {
    error = "directory path cannot be empty";
    return false;
  }

  std::error_code ec;
  if (fs::exists(dir, ec) && !fs::is_directory(dir, ec)) {
    error = "'" + dir.string() + "' exists and is not a directory";
    return false;
  }
  fs::create_directories(dir, ec);
  if (ec) {
    error = "failed to create directory '" + dir.string() + "': " + ec.message();
    return false;
  }
  return true;
}

bool EnsureParentDirectory(const fs::path& output_path, std::string& error) {
  if (output_path.empty()) {
    error = "output path cannot be empty";
    return false;
  }
  const fs::path parent = output_path.parent_path();
  return parent.empty() || EnsureDirectory(parent, error);
}

fs::path UniqueFilePath(const fs::path& dir, std::string_view stem, std::string_view extension) {
  const std::string base(stem);
  const std::string ext(extension);
  fs::path candidate = dir / (base + ext);
  std::error_code ec;
  for (std::uint32_t n = 1U; fs::exists(candidate, ec); ++n) {
    candidate = dir / (base + "_" + std::to_string(n) + ext);
  }
  return candidate;
}

bool WriteTextFileAtomic(const fs::path& output_path, std::string_view text, std::string& error) {
  if (!EnsureParentDirectory(output_path, error)) {
    return false;
  }

  static std::atomic<std::uint32_t> counter{0U};
  fs::path temp_path = output_path;
  temp_path.replace_filename("." + output_path.filename().string() + ".tmp-" +
                             std::to_string(::getpid()) + "-" +
                             std::to_string(counter.fetch_add(1U)));
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      error = "failed to open '" + temp_path.string() + "' for writing";
      return false;
    }
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out) {
      out.close();
      std::error_code cleanup_ec;
      fs::remove(temp_path, cleanup_ec);
      error = "failed while writing '" + temp_path.string() + "'";
      return false;
    }
  }

  std::error_code ec;
  fs::rename(temp_path, output_path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    fs::remove(temp_path, cleanup_ec);
    error = "failed to replace '" + output_path.string() + "': " + ec.message();
    return false;
  }
  return true;
}

} // namespace camctl::core
