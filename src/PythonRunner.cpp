#include "ddmm/PythonRunner.h"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>

#if defined(__unix__) || defined(__APPLE__)
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace ddmm {
namespace {

// Meta path finder for .ddmm sources. Packages (<entry>/<name>/__init__.ddmm)
// win over modules (<entry>/<name>.ddmm); the loader asks the ddmm executable
// for the cached transform of each file.
constexpr const char *kImportHook =
    "import importlib.abc, importlib.machinery, importlib.util, os, subprocess, sys\n"
    "class _DdmmLoader(importlib.abc.Loader):\n"
    "    def __init__(self, command, origin):\n"
    "        self.command = command\n"
    "        self.origin = origin\n"
    "    def create_module(self, spec):\n"
    "        return None\n"
    "    def get_source(self, fullname):\n"
    "        with open(self.origin, encoding=\"utf-8\") as handle:\n"
    "            return handle.read()\n"
    "    def get_code(self, fullname):\n"
    "        result = subprocess.run([self.command, \"--load-module\", self.origin],\n"
    "                                stdout=subprocess.PIPE, stderr=subprocess.PIPE)\n"
    "        if result.returncode != 0:\n"
    "            message = result.stderr.decode(\"utf-8\", \"replace\").strip()\n"
    "            raise ImportError(message, name=fullname, path=self.origin)\n"
    "        return compile(result.stdout.decode(\"utf-8\"), self.origin, \"exec\")\n"
    "    def exec_module(self, module):\n"
    "        exec(self.get_code(module.__name__), module.__dict__)\n"
    "class _DdmmFinder(importlib.abc.MetaPathFinder):\n"
    "    def __init__(self, command):\n"
    "        self.command = command\n"
    "    def find_spec(self, fullname, path, target=None):\n"
    "        if fullname == \"ddmm\" or fullname.startswith(\"ddmm.\"):\n"
    "            return None\n"
    "        tail = fullname.rpartition(\".\")[2]\n"
    "        for entry in path if path else sys.path:\n"
    "            entry = str(entry)\n"
    "            init = os.path.join(entry, tail, \"__init__.ddmm\")\n"
    "            if os.path.isfile(init):\n"
    "                spec = importlib.machinery.ModuleSpec(\n"
    "                    fullname, _DdmmLoader(self.command, init), origin=init, is_package=True)\n"
    "                spec.submodule_search_locations = [os.path.join(entry, tail)]\n"
    "                spec.has_location = True\n"
    "                return spec\n"
    "            module = os.path.join(entry, tail + \".ddmm\")\n"
    "            if os.path.isfile(module):\n"
    "                spec = importlib.machinery.ModuleSpec(\n"
    "                    fullname, _DdmmLoader(self.command, module), origin=module)\n"
    "                spec.has_location = True\n"
    "                return spec\n"
    "        return None\n"
    "def _install_ddmm_hook(command, roots):\n"
    "    if command:\n"
    "        sys.meta_path.insert(0, _DdmmFinder(command))\n"
    "    sys.path[1:1] = [root for root in roots.split(os.pathsep) if root]\n";

// Executes a file under a chosen display name so tracebacks point at the
// .ddmm source rather than the temporary copy.
constexpr const char *kScriptBootstrap =
    "path = sys.argv.pop(1)\n"
    "name = sys.argv.pop(1)\n"
    "command = sys.argv.pop(1)\n"
    "roots = sys.argv.pop(1)\n"
    "sys.argv[0] = name\n"
    "if os.path.isfile(name):\n"
    "    sys.path.insert(0, os.path.dirname(os.path.abspath(name)))\n"
    "_install_ddmm_hook(command, roots)\n"
    "with open(path, encoding=\"utf-8\") as handle:\n"
    "    code = compile(handle.read(), name, \"exec\")\n"
    "exec(code, {\"__name__\": \"__main__\", \"__file__\": name})\n";

constexpr const char *kModuleBootstrap =
    "name = sys.argv.pop(1)\n"
    "command = sys.argv.pop(1)\n"
    "roots = sys.argv.pop(1)\n"
    "sys.argv[0] = name\n"
    "_install_ddmm_hook(command, roots)\n"
    "try:\n"
    "    found = importlib.util.find_spec(name)\n"
    "except ImportError:\n"
    "    found = None\n"
    "if found is None:\n"
    "    sys.exit(\"No module named \" + name)\n"
    "import runpy\n"
    "runpy.run_module(name, run_name=\"__main__\", alter_sys=True)\n";

constexpr const char *kSessionPrompts = "sys.ps1 = \"\"\nsys.ps2 = \"\"\n";

int decodeExitStatus(int status) {
#if defined(__unix__) || defined(__APPLE__)
  if (status == -1) {
    return -1;
  }
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return -1;
#else
  return status;
#endif
}

int processId() {
#if defined(__unix__) || defined(__APPLE__)
  return static_cast<int>(getpid());
#else
  return 0;
#endif
}

std::string sanitizedStem(const std::string &sourceName) {
  std::string stem = std::filesystem::path(sourceName).stem().string();
  for (char &c : stem) {
    const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
    if (!keep) {
      c = '_';
    }
  }
  return stem.empty() ? std::string("source") : stem;
}

std::string pythonStringLiteral(const std::string &text) {
  std::string literal = "\"";
  for (char c : text) {
    if (c == '\\' || c == '"') {
      literal.push_back('\\');
    }
    literal.push_back(c);
  }
  literal.push_back('"');
  return literal;
}

std::string appendArgs(std::string command, const std::vector<std::string> &args) {
  for (const auto &arg : args) {
    command += " " + quoteShellArg(arg);
  }
  return command;
}

} // namespace

std::string quoteShellArg(const std::string &value) {
  std::string quoted = "'";
  for (char c : value) {
    if (c == '\'') {
      quoted += "'\\''";
    } else {
      quoted += c;
    }
  }
  quoted += "'";
  return quoted;
}

std::string joinSearchRoots(const std::vector<std::string> &roots) {
  std::string joined;
  for (const auto &root : roots) {
    if (!joined.empty()) {
      joined.push_back(':');
    }
    joined += root;
  }
  return joined;
}

bool writeTempSource(const std::string &sourceName,
                     const std::string &contents,
                     std::string &pathOut,
                     std::string &error) {
  static int sequence = 0;
  std::error_code ec;
  const auto dir = std::filesystem::temp_directory_path(ec) / "ddmm_run";
  if (ec) {
    error = "failed to locate temporary directory";
    return false;
  }
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    error = "failed to create temporary directory: " + dir.string();
    return false;
  }
  const auto path = dir / (sanitizedStem(sourceName) + "_" + std::to_string(processId()) + "_" +
                           std::to_string(sequence++) + ".py");
  std::ofstream file(path, std::ios::binary);
  if (!file) {
    error = "failed to write temporary source: " + path.string();
    return false;
  }
  file << contents;
  if (!file.good()) {
    error = "failed to write temporary source: " + path.string();
    return false;
  }
  pathOut = path.string();
  return true;
}

PythonRunner::PythonRunner(std::string interpreter, ImportSetup imports)
    : interpreter_(std::move(interpreter)), imports_(std::move(imports)) {}

const std::string &PythonRunner::interpreter() const {
  return interpreter_;
}

std::string PythonRunner::defaultInterpreter(bool ignoreEnvironment) {
  if (!ignoreEnvironment) {
    if (const char *fromEnv = std::getenv("DDMM_PYTHON"); fromEnv != nullptr && *fromEnv != '\0') {
      return fromEnv;
    }
  }
  return "python3";
}

bool PythonRunner::run(const std::string &pythonSource,
                       const std::string &sourceName,
                       const std::vector<std::string> &args,
                       int &exitCode,
                       std::string &error) {
  std::string tempPath;
  if (!writeTempSource(sourceName, pythonSource, tempPath, error)) {
    return false;
  }
  const std::string script = std::string(kImportHook) + kScriptBootstrap;
  const std::string command =
      appendArgs(interpreter_ + " -c " + quoteShellArg(script) + " " + quoteShellArg(tempPath) + " " +
                     quoteShellArg(sourceName) + " " + quoteShellArg(imports_.moduleLoader) + " " +
                     quoteShellArg(joinSearchRoots(imports_.searchRoots)),
                 args);
  const int status = std::system(command.c_str());
  std::error_code ec;
  std::filesystem::remove(tempPath, ec);
  if (status == -1) {
    error = "failed to launch interpreter: " + interpreter_;
    return false;
  }
  exitCode = decodeExitStatus(status);
  return true;
}

bool PythonRunner::runModule(const std::string &moduleName,
                             const std::vector<std::string> &args,
                             int &exitCode,
                             std::string &error) {
  const std::string script = std::string(kImportHook) + kModuleBootstrap;
  const std::string command =
      appendArgs(interpreter_ + " -c " + quoteShellArg(script) + " " + quoteShellArg(moduleName) + " " +
                     quoteShellArg(imports_.moduleLoader) + " " +
                     quoteShellArg(joinSearchRoots(imports_.searchRoots)),
                 args);
  const int status = std::system(command.c_str());
  if (status == -1) {
    error = "failed to launch interpreter: " + interpreter_;
    return false;
  }
  exitCode = decodeExitStatus(status);
  return true;
}

InteractiveSession::InteractiveSession(std::string interpreter, ImportSetup imports)
    : interpreter_(std::move(interpreter)), imports_(std::move(imports)) {}

InteractiveSession::~InteractiveSession() {
  close();
}

bool InteractiveSession::start(std::string &error) {
  if (pipe_ != nullptr) {
    return true;
  }
  const std::string setup = std::string(kImportHook) + kSessionPrompts + "_install_ddmm_hook(" +
                            pythonStringLiteral(imports_.moduleLoader) + ", " +
                            pythonStringLiteral(joinSearchRoots(imports_.searchRoots)) + ")\n";
  const std::string command = interpreter_ + " -q -u -i -c " + quoteShellArg(setup);
  pipe_ = popen(command.c_str(), "w");
  if (pipe_ == nullptr) {
    error = "failed to launch interpreter: " + interpreter_;
    return false;
  }
  return true;
}

bool InteractiveSession::feed(const std::string &pythonSource, std::string &error) {
  if (pipe_ == nullptr) {
    error = "interpreter session is not running";
    return false;
  }
  std::string chunk = pythonSource;
  if (chunk.empty() || chunk.back() != '\n') {
    chunk.push_back('\n');
  }
  // A blank line closes any compound statement in the chunk.
  chunk.push_back('\n');
  if (std::fwrite(chunk.data(), 1, chunk.size(), pipe_) != chunk.size() || std::fflush(pipe_) != 0) {
    error = "interpreter session closed";
    return false;
  }
  return true;
}

bool InteractiveSession::runFile(const std::string &pythonSource,
                                 const std::string &sourceName,
                                 const std::vector<std::string> &args,
                                 std::string &error) {
  std::string tempPath;
  if (!writeTempSource(sourceName, pythonSource, tempPath, error)) {
    return false;
  }
  stagedFiles_.push_back(tempPath);

  std::string argv = "[" + pythonStringLiteral(sourceName);
  for (const auto &arg : args) {
    argv += ", " + pythonStringLiteral(arg);
  }
  argv += "]";
  std::string statement = "import sys as _ddmm_sys; _ddmm_sys.argv = " + argv + "; ";
  std::error_code ec;
  if (std::filesystem::is_regular_file(sourceName, ec)) {
    const std::string dir = std::filesystem::absolute(sourceName, ec).parent_path().string();
    if (!ec) {
      statement += "_ddmm_sys.path.insert(0, " + pythonStringLiteral(dir) + "); ";
    }
  }
  statement += "exec(compile(open(" + pythonStringLiteral(tempPath) + ", encoding=\"utf-8\").read(), " +
               pythonStringLiteral(sourceName) + ", \"exec\"))";
  return feed(statement, error);
}

int InteractiveSession::close() {
  if (pipe_ == nullptr) {
    return 0;
  }
  const int status = pclose(pipe_);
  pipe_ = nullptr;
  std::error_code ec;
  for (const auto &path : stagedFiles_) {
    std::filesystem::remove(path, ec);
  }
  stagedFiles_.clear();
  return decodeExitStatus(status);
}

bool InteractiveSession::running() const {
  return pipe_ != nullptr;
}

const std::vector<std::string> &InteractiveSession::stagedFiles() const {
  return stagedFiles_;
}

} // namespace ddmm
