#pragma once

#include <filesystem>
#include <string>

namespace modelseal {

// Writes `content` to a temporary file in the target's directory, flushes it
// and renames it over `target`. On any failure the temporary file is removed,
// `target` is left untouched and SealError(kIoError) is thrown.
void write_file_atomic(const std::filesystem::path& target,
                       const std::string& content,
                       std::filesystem::perms permissions = std::filesystem::perms::owner_read |
                                                            std::filesystem::perms::owner_write |
                                                            std::filesystem::perms::group_read |
                                                            std::filesystem::perms::others_read);

// Reads a whole file; throws SealError(kIoError) when it cannot be read.
std::string read_file_bytes(const std::filesystem::path& path, size_t max_size);

}  // namespace modelseal
