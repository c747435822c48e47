#pragma once

#include <cstdio>
#include <string>
#include <vector>

namespace ddmm {

// Runs transformed text under the name of the file it came from and reports
// the program's exit status. Positioned syntax and runtime errors are the
// interpreter's to print.
class CompileService {
public:
  virtual ~CompileService() = default;

  virtual bool run(const std::string &pythonSource,
                   const std::string &sourceName,
                   const std::vector<std::string> &args,
                   int &exitCode,
                   std::string &error) = 0;
};

// Where the interpreter finds .ddmm modules imported by a running program.
// moduleLoader is the ddmm executable that serves cached transforms through
// --load-module; an empty loader leaves the import system untouched.
struct ImportSetup {
  std::string moduleLoader;
  std::vector<std::string> searchRoots;
};

class PythonRunner : public CompileService {
public:
  explicit PythonRunner(std::string interpreter, ImportSetup imports = {});

  bool run(const std::string &pythonSource,
           const std::string &sourceName,
           const std::vector<std::string> &args,
           int &exitCode,
           std::string &error) override;

  // Runs a dotted module the way `python -m` does, with .ddmm imports
  // enabled. Packages run their __main__ module.
  bool runModule(const std::string &moduleName,
                 const std::vector<std::string> &args,
                 int &exitCode,
                 std::string &error);

  const std::string &interpreter() const;

  // DDMM_PYTHON when set (and not ignored), python3 otherwise.
  static std::string defaultInterpreter(bool ignoreEnvironment);

private:
  std::string interpreter_;
  ImportSetup imports_;
};

// One long-lived interpreter fed complete chunks from the console.
class InteractiveSession {
public:
  explicit InteractiveSession(std::string interpreter, ImportSetup imports = {});
  ~InteractiveSession();
  InteractiveSession(const InteractiveSession &) = delete;
  InteractiveSession &operator=(const InteractiveSession &) = delete;

  bool start(std::string &error);
  bool feed(const std::string &pythonSource, std::string &error);
  bool runFile(const std::string &pythonSource,
               const std::string &sourceName,
               const std::vector<std::string> &args,
               std::string &error);
  // Temporary sources staged by runFile are removed once the interpreter
  // has exited.
  int close();
  bool running() const;
  const std::vector<std::string> &stagedFiles() const;

private:
  std::string interpreter_;
  ImportSetup imports_;
  FILE *pipe_ = nullptr;
  std::vector<std::string> stagedFiles_;
};

std::string quoteShellArg(const std::string &value);
std::string joinSearchRoots(const std::vector<std::string> &roots);
bool writeTempSource(const std::string &sourceName,
                     const std::string &contents,
                     std::string &pathOut,
                     std::string &error);

} // namespace ddmm
