#pragma once

#include <string>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Replace `path` with `content` so that a crash at any point leaves either the
// old file or the new one, never a mix: write a sibling temp file, fsync it,
// rename over the target, fsync the directory.
Result<void> write_file_atomic(const std::filesystem::path& path, const std::string& content);

// Read a whole file. Errors carry the path and errno text.
Result<std::string> read_file(const std::filesystem::path& path);

// Make a rename/unlink inside `dir` durable.
Result<void> fsync_dir(const std::filesystem::path& dir);

// Remove a file and fsync its directory. Missing file is not an error.
Result<void> remove_durable(const std::filesystem::path& path);

// Rename and fsync the destination directory.
Result<void> rename_durable(const std::filesystem::path& from, const std::filesystem::path& to);

} // namespace platform
