#pragma once

#include <string>

namespace ddmm {

enum class ConsoleStatus { NeedMore, Complete };

constexpr const char *kPrimaryPrompt = "ddmm>>> ";
constexpr const char *kContinuationPrompt = "ddmm... ";

// True while the text ends inside a triple-quoted string, with an open
// keyword bracket, or on a backslash continuation.
bool needsMoreInput(const std::string &source);

// Collects console lines until they form a complete chunk of ddmm source.
class ConsoleInput {
public:
  ConsoleStatus pushLine(const std::string &line);
  std::string takeSource();
  void reset();

  bool empty() const;
  const std::string &buffer() const;
  const char *prompt() const;

private:
  std::string buffer_;
  bool inBlock_ = false;
};

} // namespace ddmm
