#include "ddmm/TranspileCache.h"

#include "ddmm/Transpiler.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace ddmm {
namespace {

constexpr const char *kCacheDir = "__ddmmcache__";
constexpr const char *kCacheHeader = "# ddmm-cache ";

bool readFile(const std::filesystem::path &path, std::string &out) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  out = buffer.str();
  return true;
}

bool writeFile(const std::filesystem::path &path, const std::string &contents) {
  std::ofstream file(path, std::ios::binary);
  if (!file) {
    return false;
  }
  file << contents;
  return file.good();
}

std::string headerFor(long long ticks) {
  return std::string(kCacheHeader) + std::to_string(ticks) + "\n";
}

} // namespace

std::filesystem::path TranspileCache::cachePathFor(const std::filesystem::path &sourcePath) {
  std::filesystem::path name = sourcePath.stem();
  name += ".ddmm.py";
  return sourcePath.parent_path() / kCacheDir / name;
}

bool TranspileCache::load(const std::string &sourcePath, std::string &python, std::string &error, bool *cacheHit) const {
  if (cacheHit != nullptr) {
    *cacheHit = false;
  }
  std::error_code ec;
  const auto modified = std::filesystem::last_write_time(sourcePath, ec);
  if (ec) {
    error = "failed to read module: " + sourcePath;
    return false;
  }
  const std::string header = headerFor(static_cast<long long>(modified.time_since_epoch().count()));
  const std::filesystem::path cachePath = cachePathFor(sourcePath);

  std::string cached;
  if (readFile(cachePath, cached) && cached.compare(0, header.size(), header) == 0) {
    python = cached.substr(header.size());
    if (cacheHit != nullptr) {
      *cacheHit = true;
    }
    return true;
  }

  std::string source;
  if (!readFile(sourcePath, source)) {
    error = "failed to read module: " + sourcePath;
    return false;
  }
  python = transform(source);

  std::filesystem::create_directories(cachePath.parent_path(), ec);
  if (!ec && !writeFile(cachePath, header + python)) {
    std::filesystem::remove(cachePath, ec);
  }
  return true;
}

} // namespace ddmm
