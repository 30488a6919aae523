#pragma once

#include <ferry/result.hpp>

#include <filesystem>
#include <string>

namespace ferry {

// Whole file as bytes. IO error naming the path when unreadable.
Result<std::string> read_file(const std::filesystem::path& path);

// Writes `<path>.tmp.<pid>.<n>` then renames it over `path`, creating
// parent directories. Readers see either the old or the new content.
Status write_file_atomic(const std::filesystem::path& path, const std::string& content);

// Suffix used for in-progress writes, for sweeping leftovers
bool is_temp_file(const std::filesystem::path& path);

} // namespace ferry
