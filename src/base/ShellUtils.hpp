#ifndef __OT_SHELL_UTILS__
#define __OT_SHELL_UTILS__

#include "Headers.hpp"

namespace ot {
/** @brief Commands longer than this are refused. */
const size_t MAX_COMMAND_LENGTH = 256 * 1024;

/**
 * @brief Quotes `arg` for a POSIX shell: `''` when empty, otherwise wrapped
 * in single quotes with each `'` written as `'"'"'`.
 */
string escapeShellArgument(const string& arg);

/**
 * @brief Screens out the classic fork bomb and oversized commands.
 */
bool isCommandSafe(const string& command);

/**
 * @brief Runs `command` as `user` through sudo, falling back to su when sudo
 * is not installed.
 */
string wrapAsUser(const string& command, const string& user);

/**
 * @brief `bash -lc <command>` when `useBash`, `sh -c <command>` otherwise.
 */
string wrapInShell(const string& command, bool useBash);
}  // namespace ot

#endif  // __OT_SHELL_UTILS__
