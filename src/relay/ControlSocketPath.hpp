#ifndef __VT_CONTROL_SOCKET_PATH__
#define __VT_CONTROL_SOCKET_PATH__

#include "Headers.hpp"

namespace vt {

/**
 * A helper class to compute and prepare the control socket location.
 *
 * The default location is $HOME/.vibetunnel/control.sock.  If $HOME is unset
 * or is not an absolute path, /tmp stands in for it.  The location may also be
 * overridden from the command line or the config file.
 *
 * To use:
 * - Create the class, and optionally call \ref setPathOverride.
 * - Call \ref createDirectoriesIfRequired, then \ref getEndpoint.
 */
class ControlSocketPath {
 public:
  ControlSocketPath();

  /**
   * Overrides the socket path.
   *
   * @param path User-specified path, must not be empty.
   */
  void setPathOverride(const string& path);

  /**
   * Creates the parent directory of the socket with mkdir -p semantics.
   * Directories created here get mode 0700.
   *
   * @throws std::runtime_error if a component cannot be created or is not a
   * directory.
   */
  void createDirectoriesIfRequired();

  /** @brief The override if set, otherwise the default location. */
  string getPath() const;

  SocketEndpoint getEndpoint() const;

  /** @brief $HOME/.vibetunnel/control.sock, with the /tmp fallback. */
  static string getDefaultPath();

 private:
  optional<string> pathOverride;
};

}  // namespace vt

#endif  // __VT_CONTROL_SOCKET_PATH__
