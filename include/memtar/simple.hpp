#pragma once

#include <string>
#include <utility>
#include <vector>

#include "archive.hpp"

namespace memtar {

// (name, content) pair of a regular file
using SimpleFile = std::pair<std::string, std::string>;

// Build a new archive with one regular file per pair, in the given order
Archive createSimpleArchive(const std::vector<SimpleFile> &files);

// Collect (name, content) of every regular file in archive order.
// Directories and symlinks are skipped.
std::vector<SimpleFile> extractSimpleArchive(const Archive &archive);

} // namespace memtar
