#include "process/process_runner.hpp"

#include <string_view>

namespace picam::process {

namespace {

bool NeedsQuoting(std::string_view arg) {
  if (arg.empty()) {
    return true;
  }
  for (const char c : arg) {
    if (c == ' ' || c == '\t' || c == '"' || c == '\'' || c == '\\') {
      return true;
    }
  }
  return false;
}

void AppendQuoted(std::string_view arg, std::string& out) {
  out.push_back('"');
  for (const char c : arg) {
    if (c == '"' || c == '\\') {
      out.push_back('\\');
    }
    out.push_back(c);
  }
  out.push_back('"');
}

} // namespace

// Human-readable rendering for logs only; never fed back to a shell.
std::string FormatCommandLine(const ProcessCommand& command) {
  std::string line = command.command;
  for (const auto& arg : command.args) {
    line.push_back(' ');
    if (NeedsQuoting(arg)) {
      AppendQuoted(arg, line);
    } else {
      line += arg;
    }
  }
  return line;
}

} // namespace picam::process
