#ifndef __VT_CONTROL_UNIX_SERVER_H__
#define __VT_CONTROL_UNIX_SERVER_H__

#include "ControlMessage.hpp"
#include "Headers.hpp"
#include "HostPeerConnection.hpp"
#include "PipeSocketHandler.hpp"

namespace vt {
/**
 * @brief Owns the control socket and the single privileged host peer.
 *
 * Only the most recently accepted connection is authoritative: accepting a
 * new peer force-closes the previous one.  Every accepted peer is greeted
 * with a system:ready event.
 */
class ControlUnixServer {
 public:
  /** @brief Receives decoded peer traffic from poll(). */
  class PeerListener {
   public:
    virtual ~PeerListener() {}
    virtual void onPeerMessage(const ControlMessage& message) = 0;
    /** @brief The live peer went away (EOF, read or write failure). */
    virtual void onPeerDisconnected() = 0;
  };

  ControlUnixServer(shared_ptr<PipeSocketHandler> _socketHandler,
                    const SocketEndpoint& _endpoint, int _receiveBufferSize,
                    size_t _maxWriteBacklog);
  virtual ~ControlUnixServer();

  void setListener(PeerListener* _listener) { listener = _listener; }

  /**
   * @brief Removes a stale socket file, binds with mode 0600 and listens.
   * @throws std::runtime_error if the socket cannot be bound.
   */
  void start();
  /** @brief Drops the peer, closes the listener and unlinks the socket. */
  void stop();

  bool isListening();
  bool isPeerConnected();

  /**
   * @brief Frames and writes a message to the live peer.
   * @return false if there is no peer or the write failed.  A failed write
   * tears the peer down and the listener hears about it on the next poll().
   */
  bool send(const ControlMessage& message);

  /** @brief Accepts one pending connection, replacing any live peer. */
  void pollAccept();

  /**
   * @brief Waits up to timeoutMs for socket activity, then accepts, reads,
   * flushes and delivers messages to the listener.
   */
  void poll(int timeoutMs);

  const SocketEndpoint& getEndpoint() const { return endpoint; }
  int64_t getAcceptCount() { return acceptCount; }
  /** @brief Bytes waiting in the live peer's backlog, or 0. */
  size_t getPeerBacklog();

 protected:
  /** @brief Closes the peer without notifying the listener. */
  void dropPeerLocked(const string& reason);
  void notifyDisconnect();

  shared_ptr<PipeSocketHandler> socketHandler;
  SocketEndpoint endpoint;
  int receiveBufferSize;
  size_t maxWriteBacklog;
  PeerListener* listener;

  recursive_mutex peerMutex;
  int serverFd;
  shared_ptr<HostPeerConnection> peer;
  bool peerLostPendingNotice;
  atomic<int64_t> acceptCount;
};
}  // namespace vt

#endif  // __VT_CONTROL_UNIX_SERVER_H__
