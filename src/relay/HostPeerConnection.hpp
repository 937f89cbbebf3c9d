#ifndef __VT_HOST_PEER_CONNECTION_H__
#define __VT_HOST_PEER_CONNECTION_H__

#include "FrameCodec.hpp"
#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "WriteBuffer.hpp"

namespace vt {
/**
 * @brief One accepted host peer: its descriptor, its frame decoder and its
 * outbound backlog.
 *
 * Not thread safe on its own.  ControlUnixServer serializes access.
 */
class HostPeerConnection {
 public:
  HostPeerConnection(shared_ptr<SocketHandler> _socketHandler, int _fd,
                     size_t maxWriteBacklog);
  ~HostPeerConnection();

  int getFd() const { return fd; }
  bool isOpen() const { return fd >= 0; }

  /**
   * @brief Drains the socket and returns the messages that completed.  EOF or
   * a read error closes the connection; messages decoded before that are still
   * returned.
   */
  vector<ControlMessage> readAvailable();

  /**
   * @brief Writes a frame, queueing whatever the kernel does not take.
   * @return false if the connection failed and has been closed.
   */
  bool send(const string& frame);

  /**
   * @brief Pushes queued bytes to the socket.
   * @return false if the connection failed and has been closed.
   */
  bool flush();

  bool hasBacklog() const { return writeBuffer.hasPendingData(); }
  size_t backlogSize() const { return writeBuffer.size(); }
  const FrameDecoder& getDecoder() const { return decoder; }

  void close();

 protected:
  /** @brief Sends the front of the backlog until EAGAIN or empty. */
  bool drainBacklog();

  shared_ptr<SocketHandler> socketHandler;
  int fd;
  FrameDecoder decoder;
  WriteBuffer writeBuffer;
};
}  // namespace vt

#endif  // __VT_HOST_PEER_CONNECTION_H__
