#include <filesystem>
#include <iostream>

#include <memtar/memtar.hpp>

// Load a directory tree into memory and write it out somewhere else
int main(int argc, char *argv[]) {
  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <source_dir> <output_dir>\n";
    return 1;
  }

  std::string error;
  auto archive = memtar::Archive::create();

  if (!memtar::loadTree(archive, argv[1], &error)) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::filesystem::path outputDir = argv[2];
  auto written = memtar::extractAll(archive, outputDir, &error);
  if (!written) {
    std::cerr << "Error: " << error << "\n";
    return 1;
  }

  std::cout << "Extracted " << *written << " entries to " << outputDir << "\n";
  return 0;
}
