#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace memtar {

// Entry type tag. Symlink is a placeholder only: it carries no target.
enum class FileType : uint8_t {
  Normal,
  Directory,
  Symlink,
};

constexpr std::string_view toString(FileType type) noexcept {
  switch (type) {
  case FileType::Normal:
    return "normal";
  case FileType::Directory:
    return "directory";
  case FileType::Symlink:
    return "symlink";
  }
  return "unknown";
}

// Metadata of an entry, independent of its payload
struct EntryHeader {
  std::string name;
  uint64_t size = 0; // Always data.size() for Normal entries, 0 otherwise
  FileType fileType = FileType::Normal;

  bool operator==(const EntryHeader &) const = default;
};

// One named unit held by an Archive.
// Only the named constructors build entries, so header().size always matches
// the payload and cannot be changed afterwards.
class Entry {
public:
  static Entry file(std::string name, std::string content);
  static Entry directory(std::string name);
  static Entry symlink(std::string name);

  const EntryHeader &header() const { return header_; }

  // Empty for directories and symlinks
  const std::string &data() const { return data_; }

  bool isFile() const { return header_.fileType == FileType::Normal; }
  bool isDirectory() const { return header_.fileType == FileType::Directory; }

  bool operator==(const Entry &) const = default;

private:
  Entry() = default;

  EntryHeader header_;
  std::string data_;
};

// Summary of an archive, computed on demand
struct ArchiveStats {
  size_t totalEntries = 0;
  size_t fileCount = 0;
  size_t directoryCount = 0;
  uint64_t totalSize = 0; // Sum of Normal entry sizes

  bool operator==(const ArchiveStats &) const = default;
};

} // namespace memtar
