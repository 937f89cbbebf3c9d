#ifndef __VT_SOCKET_HANDLER__
#define __VT_SOCKET_HANDLER__

#include "Headers.hpp"

namespace vt {
/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Reads up to count bytes from fd.  Returns -1 with errno set to
   * EAGAIN when nothing is available on a non-blocking socket.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Performs a single non-blocking write of up to count bytes.
   * @return Bytes accepted by the kernel, or -1 with errno set.  EAGAIN means
   * the kernel send buffer is full.
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   * @throws std::runtime_error when the endpoint cannot be bound.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   * @return The new descriptor, or -1 with errno EAGAIN when nobody is
   * waiting.
   */
  virtual int accept(int fd) = 0;
  /**
   * @brief Stops accepting new connections on the given endpoint.
   */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
  /** @brief Returns all currently active (read/write) sockets. */
  virtual vector<int> getActiveSockets() = 0;
};
}  // namespace vt

#endif  // __VT_SOCKET_HANDLER__
