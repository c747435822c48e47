#include "ddmm/TranspileCache.h"

#include <doctest/doctest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

namespace {
std::filesystem::path makeTempRoot(const std::string &name) {
  auto dir = std::filesystem::temp_directory_path() / "ddmm_tests" / name;
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  return dir;
}

std::string writeFile(const std::filesystem::path &path, const std::string &contents) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream file(path);
  CHECK(file.good());
  file << contents;
  CHECK(file.good());
  return path.string();
}

std::string readFile(const std::filesystem::path &path) {
  std::ifstream file(path);
  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}
} // namespace

TEST_SUITE_BEGIN("ddmm.cache");

TEST_CASE("cache path sits beside the source") {
  CHECK(ddmm::TranspileCache::cachePathFor("/src/pkg/mod.ddmm") ==
        std::filesystem::path("/src/pkg/__ddmmcache__/mod.ddmm.py"));
  CHECK(ddmm::TranspileCache::cachePathFor("mod.ddmm") == std::filesystem::path("__ddmmcache__/mod.ddmm.py"));
}

TEST_CASE("first load transforms and writes the cache") {
  auto root = makeTempRoot("cache_miss");
  const std::string source = writeFile(root / "greet.ddmm", "print drake 'hi' maye\n");
  ddmm::TranspileCache cache;
  std::string python;
  std::string error;
  bool hit = true;
  REQUIRE(cache.load(source, python, error, &hit));
  CHECK_FALSE(hit);
  CHECK(python == "print ( 'hi' )\n");
  const auto cachePath = ddmm::TranspileCache::cachePathFor(source);
  REQUIRE(std::filesystem::exists(cachePath));
  const std::string cached = readFile(cachePath);
  CHECK(cached.rfind("# ddmm-cache ", 0) == 0);
  CHECK(cached.substr(cached.find('\n') + 1) == python);
}

TEST_CASE("second load reuses the cache") {
  auto root = makeTempRoot("cache_hit");
  const std::string source = writeFile(root / "mod.ddmm", "x = DRAKE 1 MAYE\n");
  ddmm::TranspileCache cache;
  std::string python;
  std::string error;
  REQUIRE(cache.load(source, python, error));
  bool hit = false;
  REQUIRE(cache.load(source, python, error, &hit));
  CHECK(hit);
  CHECK(python == "x = [ 1 ]\n");
}

TEST_CASE("a newer source invalidates the cache") {
  auto root = makeTempRoot("cache_stale");
  const std::string source = writeFile(root / "mod.ddmm", "x = DRAKE 1 MAYE\n");
  ddmm::TranspileCache cache;
  std::string python;
  std::string error;
  REQUIRE(cache.load(source, python, error));

  writeFile(source, "x = Drake Maye\n");
  const auto stamp = std::filesystem::last_write_time(source);
  std::filesystem::last_write_time(source, stamp + std::chrono::seconds(5));
  bool hit = true;
  REQUIRE(cache.load(source, python, error, &hit));
  CHECK_FALSE(hit);
  CHECK(python == "x = { }\n");
}

TEST_CASE("a corrupt cache entry is replaced") {
  auto root = makeTempRoot("cache_corrupt");
  const std::string source = writeFile(root / "mod.ddmm", "f drake maye\n");
  writeFile(ddmm::TranspileCache::cachePathFor(source), "garbage\n");
  ddmm::TranspileCache cache;
  std::string python;
  std::string error;
  bool hit = true;
  REQUIRE(cache.load(source, python, error, &hit));
  CHECK_FALSE(hit);
  CHECK(python == "f ( )\n");
  CHECK(readFile(ddmm::TranspileCache::cachePathFor(source)).rfind("# ddmm-cache ", 0) == 0);
}

TEST_CASE("missing sources report an error") {
  auto root = makeTempRoot("cache_missing");
  ddmm::TranspileCache cache;
  std::string python;
  std::string error;
  const std::string missing = (root / "absent.ddmm").string();
  CHECK_FALSE(cache.load(missing, python, error));
  CHECK(error == "failed to read module: " + missing);
}

TEST_SUITE_END();
