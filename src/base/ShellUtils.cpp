#include "ShellUtils.hpp"

#include <cctype>

namespace ot {
string escapeShellArgument(const string& arg) {
  if (arg.empty()) {
    return "''";
  }
  string escaped = arg;
  replaceAll(escaped, "'", "'\"'\"'");
  return "'" + escaped + "'";
}

bool isCommandSafe(const string& command) {
  static const vector<string> forbiddenPatterns = {
      ":(){ :|:& };:",  // fork bomb
  };
  string lower = command;
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  for (const auto& pattern : forbiddenPatterns) {
    if (lower.find(pattern) != string::npos) {
      LOG(WARNING) << "Refusing command matching forbidden pattern " << pattern;
      return false;
    }
  }
  if (command.length() > MAX_COMMAND_LENGTH) {
    LOG(WARNING) << "Refusing command of " << command.length() << " bytes";
    return false;
  }
  return true;
}

string wrapAsUser(const string& command, const string& user) {
  string quotedUser = escapeShellArgument(user);
  string quotedCommand = escapeShellArgument(command);
  return "if command -v sudo >/dev/null 2>&1; then sudo -u " + quotedUser +
         " bash -c " + quotedCommand + "; else su - " + quotedUser + " -c " +
         quotedCommand + "; fi";
}

string wrapInShell(const string& command, bool useBash) {
  return string(useBash ? "bash -lc " : "sh -c ") +
         escapeShellArgument(command);
}
}  // namespace ot
