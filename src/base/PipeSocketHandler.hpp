#ifndef __VT_PIPE_SOCKET_HANDLER__
#define __VT_PIPE_SOCKET_HANDLER__

#include "UnixSocketHandler.hpp"

namespace vt {
/**
 * @brief Handles UNIX domain stream sockets addressed by filesystem path.
 *
 * Listening sockets are restricted to the owning user (mode 0600) as soon as
 * they are bound.
 */
class PipeSocketHandler : public UnixSocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  /**
   * @brief Connects to a socket identified by the endpoint name.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Removes any stale socket file, binds, restricts permissions and
   * starts listening.
   * @throws std::runtime_error if the path cannot be bound or secured.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  /**
   * @brief Closes the listening fd and unlinks the socket file.  A file that
   * is already gone is not an error.
   */
  virtual void stopListening(const SocketEndpoint& endpoint);

 protected:
  /** @brief Tracks path -> listening socket descriptors. */
  map<string, set<int>> pipeServerSockets;
};
}  // namespace vt

#endif  // __VT_PIPE_SOCKET_HANDLER__
