#pragma once

#include <filesystem>
#include <string>

namespace exitforge {
namespace utils {

// Writes through <path>.tmp and renames over the target.
// Creates parent directories. Returns false on any I/O failure.
bool writeFileAtomic(const std::filesystem::path& path, const std::string& content);

} // namespace utils
} // namespace exitforge
