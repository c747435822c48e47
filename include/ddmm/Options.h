#pragma once

#include <string>
#include <vector>

namespace ddmm {

enum class RunMode { Console, File, Code, Module, Stdin, ShowTransform, Convert, Check, LoadModule, Help, Version };

struct Options {
  RunMode mode = RunMode::Console;
  std::string inputPath;
  std::string moduleName;
  std::string code;
  std::vector<std::string> programArgs;
  std::vector<std::string> textFilters = {"check-brackets", "to-python"};
  std::vector<std::string> modulePaths;
  bool inspect = false;
  bool unbuffered = false;
  bool ignoreEnvironment = false;
};

} // namespace ddmm
