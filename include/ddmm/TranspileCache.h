#pragma once

#include <filesystem>
#include <string>

namespace ddmm {

// Keeps the transformed text of a .ddmm file next to it under
// __ddmmcache__/<stem>.ddmm.py. An entry is valid only while the source's
// modification time matches the one recorded in its header line.
class TranspileCache {
public:
  bool load(const std::string &sourcePath, std::string &python, std::string &error, bool *cacheHit = nullptr) const;

  static std::filesystem::path cachePathFor(const std::filesystem::path &sourcePath);
};

} // namespace ddmm
