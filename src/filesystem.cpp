#include <algorithm>
#include <format>
#include <fstream>
#include <utility>
#include <vector>

#include <memtar/filesystem.hpp>

namespace memtar {

namespace {

// Entry names must stay inside the extraction directory
bool isSafeName(const std::string &name) {
  if (name.empty()) {
    return false;
  }

  std::filesystem::path path(name);
  if (path.has_root_path()) {
    return false;
  }

  for (const auto &part : path) {
    if (part == "..") {
      return false;
    }
  }
  return true;
}

std::optional<std::string> readFile(const std::filesystem::path &sourcePath,
                                    std::string *outError) {
  std::ifstream inFile(sourcePath, std::ios::binary);
  if (!inFile) {
    if (outError) {
      *outError = std::format("Failed to open source file: {}", sourcePath.string());
    }
    return std::nullopt;
  }

  // Read in chunks; the reported file size is not trusted (procfs reports 0)
  std::string content;
  std::vector<char> buffer(64 * 1024);
  while (inFile.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) ||
         inFile.gcount() > 0) {
    content.append(buffer.data(), static_cast<size_t>(inFile.gcount()));
  }

  if (inFile.bad()) {
    if (outError) {
      *outError = std::format("Failed to read source file: {}", sourcePath.string());
    }
    return std::nullopt;
  }

  return content;
}

} // namespace

bool loadFile(Archive &archive, const std::filesystem::path &sourcePath,
              const std::string &archiveName, std::string *outError) {
  std::error_code ec;
  if (!std::filesystem::exists(sourcePath, ec)) {
    if (outError) {
      *outError = std::format("Source file does not exist: {}", sourcePath.string());
    }
    return false;
  }

  if (!std::filesystem::is_regular_file(sourcePath, ec)) {
    if (outError) {
      *outError = std::format("Source is not a regular file: {}", sourcePath.string());
    }
    return false;
  }

  auto content = readFile(sourcePath, outError);
  if (!content) {
    return false;
  }

  archive.addFile(archiveName, std::move(*content));
  return true;
}

bool loadTree(Archive &archive, const std::filesystem::path &rootDir, std::string *outError) {
  std::error_code ec;
  if (!std::filesystem::is_directory(rootDir, ec)) {
    if (outError) {
      *outError = std::format("Source directory does not exist: {}", rootDir.string());
    }
    return false;
  }

  // Collect first so the archive order does not depend on iteration order
  std::vector<std::filesystem::path> paths;
  std::filesystem::recursive_directory_iterator it(rootDir, ec);
  const std::filesystem::recursive_directory_iterator end;
  while (!ec && it != end) {
    paths.push_back(it->path());
    it.increment(ec);
  }
  if (ec) {
    if (outError) {
      *outError = std::format("Failed to walk directory {}: {}", rootDir.string(), ec.message());
    }
    return false;
  }

  std::sort(paths.begin(), paths.end());

  // Nothing is appended until every entry has been read
  std::vector<Entry> loaded;
  loaded.reserve(paths.size());
  for (const auto &path : paths) {
    std::string name = path.lexically_relative(rootDir).generic_string();

    auto status = std::filesystem::symlink_status(path, ec);
    if (ec) {
      if (outError) {
        *outError = std::format("Failed to stat {}: {}", path.string(), ec.message());
      }
      return false;
    }

    if (std::filesystem::is_directory(status)) {
      loaded.push_back(Entry::directory(std::move(name)));
    } else if (std::filesystem::is_regular_file(status)) {
      auto content = readFile(path, outError);
      if (!content) {
        return false;
      }
      loaded.push_back(Entry::file(std::move(name), std::move(*content)));
    }
  }

  for (auto &entry : loaded) {
    archive.addEntry(std::move(entry));
  }
  return true;
}

bool extractEntry(const Entry &entry, const std::filesystem::path &destPath,
                  std::string *outError) {
  std::error_code ec;

  switch (entry.header().fileType) {
  case FileType::Directory:
    std::filesystem::create_directories(destPath, ec);
    if (ec) {
      if (outError) {
        *outError = std::format("Failed to create directory {}: {}", destPath.string(),
                                ec.message());
      }
      return false;
    }
    return true;

  case FileType::Symlink:
    if (outError) {
      *outError = std::format("Cannot extract symlink placeholder: {}", entry.header().name);
    }
    return false;

  case FileType::Normal:
    break;
  }

  // Create parent directories if needed
  if (destPath.has_parent_path()) {
    std::filesystem::create_directories(destPath.parent_path(), ec);
    if (ec) {
      if (outError) {
        *outError = std::format("Failed to create directory {}: {}",
                                destPath.parent_path().string(), ec.message());
      }
      return false;
    }
  }

  std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
  if (!out) {
    if (outError) {
      *outError = std::format("Failed to create output file: {}", destPath.string());
    }
    return false;
  }

  out.write(entry.data().data(), static_cast<std::streamsize>(entry.data().size()));
  if (!out) {
    if (outError) {
      *outError = std::format("Failed to write to output file: {}", destPath.string());
    }
    return false;
  }

  return true;
}

std::optional<size_t> extractAll(const Archive &archive, const std::filesystem::path &destDir,
                                 std::string *outError) {
  for (const auto &entry : archive.entries()) {
    if (!isSafeName(entry.header().name)) {
      if (outError) {
        *outError = std::format("Unsafe entry name: '{}'", entry.header().name);
      }
      return std::nullopt;
    }
  }

  size_t written = 0;
  for (const auto &entry : archive.entries()) {
    // Placeholders have nothing to materialize
    if (entry.header().fileType == FileType::Symlink) {
      continue;
    }
    if (!extractEntry(entry, destDir / entry.header().name, outError)) {
      return std::nullopt;
    }
    ++written;
  }

  return written;
}

} // namespace memtar
