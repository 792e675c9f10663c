#include <memtar/simple.hpp>

namespace memtar {

Archive createSimpleArchive(const std::vector<SimpleFile> &files) {
  Archive archive;
  for (const auto &[name, content] : files) {
    archive.addFile(name, content);
  }
  return archive;
}

std::vector<SimpleFile> extractSimpleArchive(const Archive &archive) {
  std::vector<SimpleFile> files;
  for (const auto &entry : archive.entries()) {
    switch (entry.header().fileType) {
    case FileType::Normal:
      files.emplace_back(entry.header().name, entry.data());
      break;
    case FileType::Directory:
    case FileType::Symlink:
      break;
    }
  }
  return files;
}

} // namespace memtar
