#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"

namespace memtar {

// Ordered, append-only collection of entries.
// Entries are only added through the add functions and are
// never removed, reordered or modified afterwards.
class Archive {
public:
  Archive() = default;
  ~Archive() = default;

  Archive(const Archive &) = default;
  Archive &operator=(const Archive &) = default;
  Archive(Archive &&other) noexcept;
  Archive &operator=(Archive &&other) noexcept;

  // Create new empty archive
  static Archive create() { return Archive(); }

  // Append a regular file; size is taken from content
  void addFile(std::string name, std::string content);

  // Append a directory with no content
  void addDirectory(std::string name);

  // Append a symlink placeholder (no target, no content)
  void addSymlink(std::string name);

  // Append an entry built with one of the Entry named constructors
  void addEntry(Entry entry);

  // Get number of entries
  size_t count() const { return entries_.size(); }

  bool empty() const { return entries_.empty(); }

  // Read-only view of all entries in insertion order
  std::span<const Entry> entries() const { return entries_; }

  // Owning copy of all entries in insertion order
  std::vector<Entry> snapshot() const { return entries_; }

  // Names of all entries in insertion order
  std::vector<std::string> listNames() const;

  // Exact, case-sensitive lookup of the first entry with this name
  // Returns nullptr if no entry matches. The pointer is invalidated by the
  // next add call.
  const Entry *findEntry(std::string_view name) const;

  // Recomputed from the current entries on every call
  ArchiveStats stats() const;

private:
  std::vector<Entry> entries_;
};

} // namespace memtar
