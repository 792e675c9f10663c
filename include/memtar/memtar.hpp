#pragma once

// memtar
// A small C++20 library that models archive contents in memory: an ordered
// collection of named files and directories, loosely inspired by TAR.
// It does not read or write the TAR byte format.

#include "archive.hpp"
#include "filesystem.hpp"
#include "simple.hpp"
#include "types.hpp"

// The library provides three levels of abstraction:
//
// 1. Core: Archive class
//    - Append entries with addFile() / addDirectory()
//    - Query with count(), listNames(), findEntry(), stats()
//
// 2. Bulk conversion: createSimpleArchive() / extractSimpleArchive()
//    - Convert between an Archive and an ordered list of (name, content) pairs
//
// 3. Filesystem bridge: loadFile() / loadTree() / extractAll()
//    - Fill an Archive from disk and write it back out
//
// Example usage:
//
//   // Building an archive
//   auto archive = memtar::Archive::create();
//   archive.addFile("a.txt", "hi");
//   archive.addDirectory("d");
//   archive.addFile("b.txt", "bye");
//
//   // Querying it
//   const auto *entry = archive.findEntry("a.txt");
//   if (entry) {
//     std::cout << entry->data() << std::endl;
//   }
//   auto stats = archive.stats(); // {3, 2, 1, 5}
//
//   // Round-trip through (name, content) pairs
//   auto files = memtar::extractSimpleArchive(archive);

namespace memtar {}
