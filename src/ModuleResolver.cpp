#include "ddmm/ModuleResolver.h"

#include <array>
#include <string_view>
#include <system_error>
#include <utility>

namespace ddmm {
namespace {

constexpr std::string_view kSourceExtension = ".ddmm";
constexpr std::string_view kPackageInit = "__init__.ddmm";
constexpr std::string_view kSelfPackage = "ddmm";

bool isAsciiAlpha(char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

bool isAsciiDigit(char c) {
  return c >= '0' && c <= '9';
}

bool isSegmentStart(char c) {
  return isAsciiAlpha(c) || c == '_';
}

bool isSegmentChar(char c) {
  return isAsciiAlpha(c) || isAsciiDigit(c) || c == '_';
}

bool isReservedKeyword(const std::string &text) {
  static constexpr std::array<std::string_view, 35> kKeywords = {
      "False", "None",   "True",    "and",      "as",       "assert", "async",  "await",    "break",
      "class", "continue", "def",   "del",      "elif",     "else",   "except", "finally",  "for",
      "from",  "global", "if",      "import",   "in",       "is",     "lambda", "nonlocal", "not",
      "or",    "pass",   "raise",   "return",   "try",      "while",  "with",   "yield",
  };
  for (const auto &keyword : kKeywords) {
    if (text == keyword) {
      return true;
    }
  }
  return false;
}

bool isRegularFile(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_regular_file(path, ec);
}

} // namespace

bool splitModuleName(const std::string &name, std::vector<std::string> &segments, std::string &error) {
  segments.clear();
  if (name.empty()) {
    error = "module name cannot be empty";
    return false;
  }
  size_t start = 0;
  while (start <= name.size()) {
    size_t end = name.find('.', start);
    std::string segment = name.substr(start, end == std::string::npos ? std::string::npos : end - start);
    if (segment.empty() || !isSegmentStart(segment[0])) {
      error = "invalid module name: " + name;
      return false;
    }
    for (size_t i = 1; i < segment.size(); ++i) {
      if (!isSegmentChar(segment[i])) {
        error = "invalid module name: " + name;
        return false;
      }
    }
    if (isReservedKeyword(segment)) {
      error = "reserved keyword cannot be used as module name: " + segment;
      return false;
    }
    segments.push_back(std::move(segment));
    if (end == std::string::npos) {
      break;
    }
    start = end + 1;
  }
  return true;
}

ModuleResolver::ModuleResolver(std::vector<std::string> searchPaths) : searchPaths_(std::move(searchPaths)) {}

void ModuleResolver::addSearchPath(const std::string &path) {
  for (const auto &existing : searchPaths_) {
    if (existing == path) {
      return;
    }
  }
  searchPaths_.push_back(path);
}

const std::vector<std::string> &ModuleResolver::searchPaths() const {
  return searchPaths_;
}

bool ModuleResolver::resolve(const std::string &moduleName, ResolvedModule &out, std::string &error) const {
  std::vector<std::string> segments;
  if (!splitModuleName(moduleName, segments, error)) {
    return false;
  }
  if (segments.front() == kSelfPackage) {
    error = "module name is reserved for the transpiler itself: " + moduleName;
    return false;
  }
  std::filesystem::path relative;
  for (const auto &segment : segments) {
    relative /= segment;
  }
  for (const auto &root : searchPaths_) {
    std::filesystem::path base = std::filesystem::path(root) / relative;
    std::filesystem::path packageInit = base / kPackageInit;
    if (isRegularFile(packageInit)) {
      out.name = moduleName;
      out.path = packageInit;
      out.isPackage = true;
      out.packageDir = base;
      return true;
    }
    std::filesystem::path moduleFile = base;
    moduleFile += kSourceExtension;
    if (isRegularFile(moduleFile)) {
      out.name = moduleName;
      out.path = moduleFile;
      out.isPackage = false;
      out.packageDir.clear();
      return true;
    }
  }
  error = "no module named " + moduleName;
  return false;
}

} // namespace ddmm
