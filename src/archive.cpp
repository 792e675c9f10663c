#include <utility>

#include <memtar/archive.hpp>

namespace memtar {

Entry Entry::file(std::string name, std::string content) {
  Entry entry;
  entry.header_.name = std::move(name);
  entry.header_.size = content.size();
  entry.header_.fileType = FileType::Normal;
  entry.data_ = std::move(content);
  return entry;
}

Entry Entry::directory(std::string name) {
  Entry entry;
  entry.header_.name = std::move(name);
  entry.header_.fileType = FileType::Directory;
  return entry;
}

Entry Entry::symlink(std::string name) {
  Entry entry;
  entry.header_.name = std::move(name);
  entry.header_.fileType = FileType::Symlink;
  return entry;
}

// Moved-from archives are left empty
Archive::Archive(Archive &&other) noexcept : entries_(std::exchange(other.entries_, {})) {}

Archive &Archive::operator=(Archive &&other) noexcept {
  if (this != &other) {
    entries_ = std::exchange(other.entries_, {});
  }
  return *this;
}

void Archive::addFile(std::string name, std::string content) {
  entries_.push_back(Entry::file(std::move(name), std::move(content)));
}

void Archive::addDirectory(std::string name) {
  entries_.push_back(Entry::directory(std::move(name)));
}

void Archive::addSymlink(std::string name) {
  entries_.push_back(Entry::symlink(std::move(name)));
}

void Archive::addEntry(Entry entry) {
  entries_.push_back(std::move(entry));
}

std::vector<std::string> Archive::listNames() const {
  std::vector<std::string> names;
  names.reserve(entries_.size());
  for (const auto &entry : entries_) {
    names.push_back(entry.header().name);
  }
  return names;
}

const Entry *Archive::findEntry(std::string_view name) const {
  for (const auto &entry : entries_) {
    if (entry.header().name == name) {
      return &entry;
    }
  }
  return nullptr;
}

ArchiveStats Archive::stats() const {
  ArchiveStats stats;
  stats.totalEntries = entries_.size();

  for (const auto &entry : entries_) {
    switch (entry.header().fileType) {
    case FileType::Normal:
      ++stats.fileCount;
      stats.totalSize += entry.header().size;
      break;
    case FileType::Directory:
      ++stats.directoryCount;
      break;
    case FileType::Symlink:
      // Counted in totalEntries only
      break;
    }
  }

  return stats;
}

} // namespace memtar
