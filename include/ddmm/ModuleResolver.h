#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace ddmm {

struct ResolvedModule {
  std::string name;
  std::filesystem::path path;
  bool isPackage = false;
  std::filesystem::path packageDir;
};

bool splitModuleName(const std::string &name, std::vector<std::string> &segments, std::string &error);

class ModuleResolver {
public:
  explicit ModuleResolver(std::vector<std::string> searchPaths = {});

  void addSearchPath(const std::string &path);
  const std::vector<std::string> &searchPaths() const;

  // Maps "pkg.mod" to <root>/pkg/mod/__init__.ddmm or <root>/pkg/mod.ddmm,
  // trying the roots in order. Packages win over modules within one root.
  bool resolve(const std::string &moduleName, ResolvedModule &out, std::string &error) const;

private:
  std::vector<std::string> searchPaths_;
};

} // namespace ddmm
