#pragma once

#include <confbind/result.hpp>
#include <filesystem>
#include <string>
#include <unordered_map>

namespace confbind {

// Base file name -> full path of a regular file under a config directory.
using FileIndex = std::unordered_map<std::string, std::filesystem::path>;

// Recursively index the regular files under `root`. When two files share a
// base name, the first one in sorted path order wins.
// An empty or nonexistent root yields an empty index.
Result<FileIndex> index_directory(const std::filesystem::path& root);

// Whole contents of `path`, unmodified.
// Errors: NotFound if the file does not exist. SourceRead if it is not a
// regular file or cannot be read. An empty file reads as "".
Result<std::string> read_file(const std::filesystem::path& path);

} // namespace confbind
