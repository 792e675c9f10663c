#include <iostream>

#include <memtar/memtar.hpp>

int main(int argc, char *argv[]) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <directory>\n";
    return 1;
  }

  std::string error;
  auto archive = memtar::Archive::create();

  if (!memtar::loadTree(archive, argv[1], &error)) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  auto stats = archive.stats();
  std::cout << "Source: " << argv[1] << "\n";
  std::cout << "Entries: " << stats.totalEntries << " (" << stats.fileCount << " files, "
            << stats.directoryCount << " directories, " << stats.totalSize << " bytes)\n\n";

  for (const auto &entry : archive.entries()) {
    std::cout << "  " << entry.header().name << " [" << memtar::toString(entry.header().fileType)
              << "] (" << entry.header().size << " bytes)\n";
  }

  return 0;
}
