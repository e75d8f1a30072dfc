#ifndef CAMCTL_CORE_FS_UTILS_HPP_
#define CAMCTL_CORE_FS_UTILS_HPP_

#include <filesystem>
#include <string>
#include <string_view>

namespace camctl::core {

// Creates `dir` and its parents. Fails when the path exists but is not a
// directory.
bool EnsureDirectory(const std::filesystem::path& dir, std::string& error);

// Creates the parent of `output_path`; a bare file name needs nothing.
bool EnsureParentDirectory(const std::filesystem::path& output_path, std::string& error);

// `<dir>/<stem><extension>` when free, otherwise the first free
// `<dir>/<stem>_<n><extension>`. Two recordings started within the same
// second therefore never share a file.
std::filesystem::path UniqueFilePath(const std::filesystem::path& dir, std::string_view stem,
                                     std::string_view extension);

// Writes `text` to a hidden sibling and renames it over `output_path`, so a
// reader sees either the old file or the complete new one.
bool WriteTextFileAtomic(const std::filesystem::path& output_path, std::string_view text,
                         std::string& error);

} // namespace camctl::core

#endif // CAMCTL_CORE_FS_UTILS_HPP_
