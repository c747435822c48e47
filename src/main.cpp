#include "ddmm/BracketChecker.h"
#include "ddmm/Console.h"
#include "ddmm/ModuleResolver.h"
#include "ddmm/Options.h"
#include "ddmm/PythonRunner.h"
#include "ddmm/TextFilterPipeline.h"
#include "ddmm/TransformRegistry.h"
#include "ddmm/TranspileCache.h"
#include "ddmm/Transpiler.h"
#include "ddmm/Version.h"

#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace {
constexpr const char *kHelpText = R"(Usage: ddmm [option] ... [-c cmd | -m mod | file | -] [arg] ...

Options:
  -c cmd    : program passed in as string (terminates option list)
  -m mod    : run library module as a script (terminates option list)
  -i        : inspect interactively after running script
  -u        : force unbuffered stdout and stderr
  -E        : ignore DDMM_* environment variables
  -V, --version : print version and exit
  -h, --help    : print this help message and exit

Drake Maye options:
  --show-transform <file.ddmm> : print the transformed Python source
  --convert <file.py>          : convert a .py file to .ddmm (prints to stdout)
  --to-python <file.ddmm>      : convert a .ddmm file to .py (prints to stdout)
  --check <file.ddmm>          : validate bracket matching
  --load-module <file.ddmm>    : print the cached transform used for imports
  --text-filters <list>        : filters applied before running (default: check-brackets,to-python)
  --no-check                   : do not validate brackets before running

Bracket mapping:
  drake / maye  ->  ( )   parentheses
  Drake / Maye  ->  { }   curly braces
  DRAKE / MAYE  ->  [ ]   square brackets
)";

constexpr const char *kBanner = R"(
     _     _
  __| | __| |_ __ ___  _ __ ___
 / _` |/ _` | '_ ` _ \| '_ ` _ \
| (_| | (_| | | | | | | | | | | |
 \__,_|\__,_|_| |_| |_|_| |_| |_|

  Where every bracket tells a story.

  Bracket Reference:
    drake / maye   ->  ( )   parentheses
    Drake / Maye   ->  { }   curly braces
    DRAKE / MAYE   ->  [ ]   square brackets

  Type 'exit drake maye' or Ctrl-D to quit.
)";

std::vector<std::string> defaultTextFilters() {
  return {"check-brackets", "to-python"};
}

std::string trimWhitespace(const std::string &text) {
  size_t start = 0;
  while (start < text.size() && std::isspace(static_cast<unsigned char>(text[start]))) {
    ++start;
  }
  size_t end = text.size();
  while (end > start && std::isspace(static_cast<unsigned char>(text[end - 1]))) {
    --end;
  }
  return text.substr(start, end - start);
}

void addUniqueFilter(std::vector<std::string> &list, const std::string &name) {
  for (const auto &existing : list) {
    if (existing == name) {
      return;
    }
  }
  list.push_back(name);
}

bool parseTextFilterList(const std::string &text, std::vector<std::string> &out, std::string &error) {
  out.clear();
  size_t start = 0;
  while (start <= text.size()) {
    size_t end = text.find(',', start);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string token = trimWhitespace(text.substr(start, end - start));
    if (!token.empty()) {
      if (token == "default") {
        for (const auto &name : defaultTextFilters()) {
          addUniqueFilter(out, name);
        }
      } else if (token == "none") {
        out.clear();
      } else {
        if (!ddmm::isTextFilterName(token)) {
          error = "unknown text filter: " + token;
          return false;
        }
        addUniqueFilter(out, token);
      }
    }
    if (end == text.size()) {
      break;
    }
    start = end + 1;
  }
  return true;
}

bool takeValue(int argc, char **argv, int &i, const std::string &option, std::string &out, std::string &error) {
  if (i + 1 >= argc) {
    error = "expected argument for " + option;
    return false;
  }
  out = argv[++i];
  return true;
}

void collectRemaining(int argc, char **argv, int start, std::vector<std::string> &out) {
  for (int i = start; i < argc; ++i) {
    out.push_back(argv[i]);
  }
}

bool parseArgs(int argc, char **argv, ddmm::Options &out, std::string &error) {
  bool noCheck = false;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      out.mode = ddmm::RunMode::Help;
      return true;
    }
    if (arg == "-V" || arg == "--version") {
      out.mode = ddmm::RunMode::Version;
      return true;
    }
    if (arg == "-i") {
      out.inspect = true;
    } else if (arg == "-u") {
      out.unbuffered = true;
    } else if (arg == "-E") {
      out.ignoreEnvironment = true;
    } else if (arg == "--no-check") {
      noCheck = true;
    } else if (arg == "--text-filters") {
      std::string list;
      if (!takeValue(argc, argv, i, arg, list, error) || !parseTextFilterList(list, out.textFilters, error)) {
        return false;
      }
    } else if (arg.rfind("--text-filters=", 0) == 0) {
      if (!parseTextFilterList(arg.substr(std::string("--text-filters=").size()), out.textFilters, error)) {
        return false;
      }
    } else if (arg == "-c") {
      if (!takeValue(argc, argv, i, "the -c option", out.code, error)) {
        return false;
      }
      out.mode = ddmm::RunMode::Code;
      collectRemaining(argc, argv, i + 1, out.programArgs);
      break;
    } else if (arg == "-m") {
      if (!takeValue(argc, argv, i, "the -m option", out.moduleName, error)) {
        return false;
      }
      out.mode = ddmm::RunMode::Module;
      collectRemaining(argc, argv, i + 1, out.programArgs);
      break;
    } else if (arg == "--show-transform" || arg == "--to-python") {
      if (!takeValue(argc, argv, i, arg, out.inputPath, error)) {
        return false;
      }
      out.mode = ddmm::RunMode::ShowTransform;
      return true;
    } else if (arg == "--convert") {
      if (!takeValue(argc, argv, i, arg, out.inputPath, error)) {
        return false;
      }
      out.mode = ddmm::RunMode::Convert;
      return true;
    } else if (arg == "--check") {
      if (!takeValue(argc, argv, i, arg, out.inputPath, error)) {
        return false;
      }
      out.mode = ddmm::RunMode::Check;
      return true;
    } else if (arg == "--load-module") {
      if (!takeValue(argc, argv, i, arg, out.inputPath, error)) {
        return false;
      }
      out.mode = ddmm::RunMode::LoadModule;
      return true;
    } else if (arg == "-") {
      out.mode = ddmm::RunMode::Stdin;
      collectRemaining(argc, argv, i + 1, out.programArgs);
      break;
    } else if (!arg.empty() && arg[0] == '-') {
      error = "unknown option: " + arg;
      return false;
    } else {
      out.mode = ddmm::RunMode::File;
      out.inputPath = arg;
      collectRemaining(argc, argv, i + 1, out.programArgs);
      break;
    }
  }
  if (noCheck) {
    std::vector<std::string> filters;
    for (const auto &filter : out.textFilters) {
      if (filter != "check-brackets") {
        filters.push_back(filter);
      }
    }
    out.textFilters = std::move(filters);
  }
  if (!out.ignoreEnvironment) {
    if (const char *pathList = std::getenv("DDMM_PATH"); pathList != nullptr) {
      std::string text = pathList;
      size_t start = 0;
      while (start <= text.size()) {
        size_t end = text.find(':', start);
        if (end == std::string::npos) {
          end = text.size();
        }
        std::string entry = trimWhitespace(text.substr(start, end - start));
        if (!entry.empty()) {
          out.modulePaths.push_back(entry);
        }
        if (end == text.size()) {
          break;
        }
        start = end + 1;
      }
    }
  }
  return true;
}

bool readFile(const std::string &path, std::string &out, std::string &error) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    error = "No such file or directory";
    return false;
  }
  std::ostringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    error = "read failed";
    return false;
  }
  out = buffer.str();
  return true;
}

bool readSourceFile(const std::string &path, std::string &out) {
  std::string error;
  if (!readFile(path, out, error)) {
    std::cerr << "Error reading " << path << ": " << error << "\n";
    return false;
  }
  return true;
}

int runCheck(const std::string &path) {
  std::string source;
  if (!readSourceFile(path, source)) {
    return 1;
  }
  std::vector<ddmm::Diagnostic> diagnostics = ddmm::checkBracketMatching(source, path);
  if (diagnostics.empty()) {
    std::cout << path << ": All brackets match!\n";
    return 0;
  }
  ddmm::attachSourceLines(diagnostics, source);
  for (const auto &diagnostic : diagnostics) {
    std::cerr << ddmm::formatDiagnostic(diagnostic) << "\n";
  }
  return 1;
}

bool filterSource(const ddmm::Options &options,
                  const std::string &source,
                  const std::string &sourceName,
                  std::string &python) {
  ddmm::TextFilterPipeline pipeline;
  ddmm::TextFilterOptions filterOptions;
  filterOptions.enabledFilters = options.textFilters;
  filterOptions.sourceName = sourceName;
  std::string error;
  if (!pipeline.apply(source, python, error, filterOptions)) {
    std::cerr << "Transform error: " << error << "\n";
    return false;
  }
  return true;
}

int runConsole(const ddmm::Options &options, ddmm::InteractiveSession &session) {
  std::string error;
  if (!session.start(error)) {
    std::cerr << "Console error: " << error << "\n";
    return 1;
  }
  std::cout << kBanner << "  ddmm v" << ddmm::kVersion << "\n\n";

  ddmm::TextFilterPipeline pipeline;
  ddmm::TextFilterOptions filterOptions;
  filterOptions.enabledFilters.clear();
  for (const auto &filter : options.textFilters) {
    if (filter == "check-brackets") {
      filterOptions.enabledFilters.push_back(filter);
    }
  }
  filterOptions.sourceName = "<ddmm-console>";
  ddmm::TransformHook hook;
  hook.install(filterOptions);

  ddmm::ConsoleInput input;
  std::string line;
  while (true) {
    std::cout << input.prompt() << std::flush;
    if (!std::getline(std::cin, line)) {
      std::cout << "\n";
      break;
    }
    if (input.pushLine(line) == ddmm::ConsoleStatus::NeedMore) {
      continue;
    }
    const std::string source = input.takeSource();
    if (trimWhitespace(source).empty()) {
      continue;
    }
    std::string python;
    if (!pipeline.apply(source, python, error, filterOptions)) {
      std::cerr << error << "\n";
      continue;
    }
    if (!session.feed(python, error)) {
      std::cerr << "Console error: " << error << "\n";
      break;
    }
  }
  hook.uninstall(filterOptions);
  const int status = session.close();
  std::cout << "Goodbye!\n";
  return status;
}

int runPython(const ddmm::Options &options,
              const std::string &python,
              const std::string &sourceName,
              const std::string &interpreter,
              const ddmm::ImportSetup &imports) {
  std::string error;
  if (options.inspect) {
    ddmm::InteractiveSession session(interpreter, imports);
    if (!session.start(error) || !session.runFile(python, sourceName, options.programArgs, error)) {
      std::cerr << "Run error: " << error << "\n";
      return 1;
    }
    return runConsole(options, session);
  }
  ddmm::PythonRunner runner(interpreter, imports);
  int exitCode = 0;
  if (!runner.run(python, sourceName, options.programArgs, exitCode, error)) {
    std::cerr << "Run error: " << error << "\n";
    return 1;
  }
  return exitCode;
}

int runModule(const ddmm::Options &options, const std::string &interpreter, const ddmm::ImportSetup &imports) {
  std::vector<std::string> segments;
  std::string error;
  if (!ddmm::splitModuleName(options.moduleName, segments, error)) {
    std::cerr << "Module error: " << error << "\n";
    return 2;
  }
  std::vector<std::string> roots = {std::filesystem::current_path().string()};
  roots.insert(roots.end(), options.modulePaths.begin(), options.modulePaths.end());
  ddmm::ModuleResolver resolver(roots);
  ddmm::ImportSetup moduleImports = imports;
  moduleImports.searchRoots = roots;
  ddmm::ResolvedModule module;
  if (!resolver.resolve(options.moduleName, module, error) || module.isPackage) {
    // Packages run their __main__ after __init__, and plain Python modules are
    // only found by the interpreter, so both go through its module runner.
    ddmm::PythonRunner runner(interpreter, moduleImports);
    int exitCode = 0;
    if (!runner.runModule(options.moduleName, options.programArgs, exitCode, error)) {
      std::cerr << "Run error: " << error << "\n";
      return 1;
    }
    return exitCode;
  }
  ddmm::TranspileCache cache;
  std::string python;
  if (!cache.load(module.path.string(), python, error)) {
    std::cerr << "Module error: " << error << "\n";
    return 1;
  }
  return runPython(options, python, module.path.string(), interpreter, moduleImports);
}

int runLoadModule(const std::string &path) {
  ddmm::TranspileCache cache;
  std::string python;
  std::string error;
  if (!cache.load(path, python, error)) {
    std::cerr << "Module error: " << error << "\n";
    return 1;
  }
  std::cout << python;
  return 0;
}

std::string executablePath(const char *argv0) {
  std::error_code ec;
  std::filesystem::path self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (!ec) {
    return self.string();
  }
  self = std::filesystem::absolute(argv0, ec);
  return ec ? std::string(argv0) : self.string();
}
} // namespace

int main(int argc, char **argv) {
  ddmm::Options options;
  std::string argError;
  if (!parseArgs(argc, argv, options, argError)) {
    std::cerr << "Argument error: " << argError << "\n";
    std::cerr << "Usage: ddmm [option] ... [-c cmd | -m mod | file | -] [arg] ...\n"
                 "Try 'ddmm --help' for more information.\n";
    return 2;
  }
  if (options.unbuffered) {
    std::setvbuf(stdout, nullptr, _IONBF, 0);
    std::setvbuf(stderr, nullptr, _IONBF, 0);
    std::cout << std::unitbuf;
    setenv("PYTHONUNBUFFERED", "1", 1);
  }
  const std::string interpreter = ddmm::PythonRunner::defaultInterpreter(options.ignoreEnvironment);
  const ddmm::ImportSetup imports{executablePath(argv[0]), options.modulePaths};

  switch (options.mode) {
  case ddmm::RunMode::Help:
    std::cout << kHelpText << "\n";
    return 0;
  case ddmm::RunMode::Version:
    std::cout << "ddmm " << ddmm::kVersion << "\n";
    return 0;
  case ddmm::RunMode::ShowTransform: {
    std::string source;
    if (!readSourceFile(options.inputPath, source)) {
      return 1;
    }
    std::cout << ddmm::transform(source) << "\n";
    return 0;
  }
  case ddmm::RunMode::Convert: {
    std::string source;
    if (!readSourceFile(options.inputPath, source)) {
      return 1;
    }
    std::cout << ddmm::reverseTransform(source) << "\n";
    return 0;
  }
  case ddmm::RunMode::Check:
    return runCheck(options.inputPath);
  case ddmm::RunMode::LoadModule:
    return runLoadModule(options.inputPath);
  case ddmm::RunMode::Code: {
    std::string python;
    if (!filterSource(options, options.code, "<string>", python)) {
      return 1;
    }
    return runPython(options, python, "<string>", interpreter, imports);
  }
  case ddmm::RunMode::Stdin: {
    const std::string source((std::istreambuf_iterator<char>(std::cin)), std::istreambuf_iterator<char>());
    std::string python;
    if (!filterSource(options, source, "<stdin>", python)) {
      return 1;
    }
    return runPython(options, python, "<stdin>", interpreter, imports);
  }
  case ddmm::RunMode::File: {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(options.inputPath, ec)) {
      std::cerr << "ddmm: can't open file '" << options.inputPath << "': No such file or directory\n";
      return 2;
    }
    std::string source;
    if (!readSourceFile(options.inputPath, source)) {
      return 1;
    }
    std::string python;
    if (!filterSource(options, source, options.inputPath, python)) {
      return 1;
    }
    return runPython(options, python, options.inputPath, interpreter, imports);
  }
  case ddmm::RunMode::Module:
    return runModule(options, interpreter, imports);
  case ddmm::RunMode::Console: {
    ddmm::InteractiveSession session(interpreter, imports);
    return runConsole(options, session);
  }
  }
  return 0;
}
