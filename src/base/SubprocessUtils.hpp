#ifndef __VT_SUBPROCESS_UTILS__
#define __VT_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace vt {
/**
 * @brief Launches external programs without a shell.
 *
 * Virtual so that handlers can be tested with a recording fake.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Starts `command args...` in its own session with stdio on
   * /dev/null and returns once exec has succeeded.  The child is reparented
   * to init and never waited on by the caller.
   * @throws std::runtime_error if fork or exec fails.
   */
  virtual void spawnDetached(const string& command, const vector<string>& args);
};
}  // namespace vt

#endif  // __VT_SUBPROCESS_UTILS__
