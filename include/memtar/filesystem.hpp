#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "archive.hpp"

// Bridge between the in-memory archive and the real filesystem.
// Only the public Archive API is used here; the archive itself never touches
// the disk.

namespace memtar {

// Read a file from disk and append it as a regular file entry
// Returns true on success, false on failure (error in outError if provided)
bool loadFile(Archive &archive, const std::filesystem::path &sourcePath,
              const std::string &archiveName, std::string *outError = nullptr);

// Append every subdirectory and regular file below rootDir.
// Names are relative to rootDir with forward slashes, visited in
// lexicographic order so a directory always precedes its children.
// Other file kinds are skipped.
// Returns true on success, false on failure (error in outError if provided)
bool loadTree(Archive &archive, const std::filesystem::path &rootDir,
              std::string *outError = nullptr);

// Write one entry to destPath: file data for regular files, a directory for
// directory entries. Symlink placeholders cannot be extracted.
// Returns true on success, false on failure (error in outError if provided)
bool extractEntry(const Entry &entry, const std::filesystem::path &destPath,
                  std::string *outError = nullptr);

// Extract every entry in archive order below destDir.
// Names that are empty, absolute or contain ".." are rejected before anything
// is written. Symlink placeholders are skipped.
// Returns the number of entries written, std::nullopt on failure
std::optional<size_t> extractAll(const Archive &archive, const std::filesystem::path &destDir,
                                 std::string *outError = nullptr);

} // namespace memtar
