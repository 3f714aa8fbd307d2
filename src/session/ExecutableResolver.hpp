#ifndef __WT_EXECUTABLE_RESOLVER__
#define __WT_EXECUTABLE_RESOLVER__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Finds the program to run for each terminal kind.
 *
 * The agent kinds run their configured binary.  The shell kind tries the
 * preferred shell (or $SHELL when none is configured), then bash, then sh.
 */
class ExecutableResolver {
 public:
  ExecutableResolver(const string &_primaryBinary,
                     const string &_secondaryBinary,
                     const string &_preferredShell);
  virtual ~ExecutableResolver() {}

  /** @brief Absolute path to run for `kind`, or nullopt if none resolves. */
  virtual optional<string> resolve(TerminalKind kind) const;

  /** @brief Candidates tried for `kind`, in order. */
  vector<string> getCandidates(TerminalKind kind) const;

  /**
   * @brief Resolves a program name the way execvp does: names containing a
   * slash are checked directly, others are searched in `searchPath`.
   */
  static optional<string> findExecutable(const string &name,
                                         const string &searchPath);

 protected:
  string primaryBinary;
  string secondaryBinary;
  string preferredShell;
};
}  // namespace wt

#endif  // __WT_EXECUTABLE_RESOLVER__
