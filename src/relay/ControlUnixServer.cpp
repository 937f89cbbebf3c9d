#include "ControlUnixServer.hpp"

namespace vt {
ControlUnixServer::ControlUnixServer(shared_ptr<PipeSocketHandler> _socketHandler,
                                     const SocketEndpoint& _endpoint,
                                     int _receiveBufferSize,
                                     size_t _maxWriteBacklog)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      receiveBufferSize(_receiveBufferSize),
      maxWriteBacklog(_maxWriteBacklog),
      listener(NULL),
      serverFd(-1),
      peerLostPendingNotice(false),
      acceptCount(0) {}

ControlUnixServer::~ControlUnixServer() { stop(); }

void ControlUnixServer::start() {
  lock_guard<recursive_mutex> guard(peerMutex);
  if (serverFd >= 0) {
    LOG(WARNING) << "Control socket already listening on " << endpoint;
    return;
  }
  LOG(INFO) << "Starting control socket at " << endpoint;
  serverFd = *(socketHandler->listen(endpoint).begin());
}

void ControlUnixServer::stop() {
  lock_guard<recursive_mutex> guard(peerMutex);
  if (peer) {
    dropPeerLocked("server stopping");
  }
  peerLostPendingNotice = false;
  if (serverFd >= 0) {
    socketHandler->stopListening(endpoint);
    serverFd = -1;
    LOG(INFO) << "Control socket at " << endpoint << " stopped";
  }
}

bool ControlUnixServer::isListening() {
  lock_guard<recursive_mutex> guard(peerMutex);
  return serverFd >= 0;
}

bool ControlUnixServer::isPeerConnected() {
  lock_guard<recursive_mutex> guard(peerMutex);
  return peer.get() != NULL && peer->isOpen();
}

size_t ControlUnixServer::getPeerBacklog() {
  lock_guard<recursive_mutex> guard(peerMutex);
  return peer ? peer->backlogSize() : 0;
}

void ControlUnixServer::dropPeerLocked(const string& reason) {
  LOG(INFO) << "Closing host peer " << peer->getFd() << ": " << reason;
  peer->close();
  peer.reset();
}

bool ControlUnixServer::send(const ControlMessage& message) {
  string frame;
  try {
    frame = encodeFrame(message);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Cannot send " << message << ": " << re.what();
    return false;
  }

  lock_guard<recursive_mutex> guard(peerMutex);
  if (!peer || !peer->isOpen()) {
    LOG(WARNING) << "Cannot send " << message << ": no host peer connection";
    return false;
  }
  VLOG(1) << "Sending to host peer: " << message << " (" << frame.size()
          << " bytes)";
  if (!peer->send(frame)) {
    peer.reset();
    peerLostPendingNotice = true;
    return false;
  }
  return true;
}

void ControlUnixServer::pollAccept() {
  lock_guard<recursive_mutex> guard(peerMutex);
  if (serverFd < 0) {
    return;
  }
  int fd = socketHandler->accept(serverFd);
  if (fd < 0) {
    // Nothing to accept
    return;
  }
  ++acceptCount;
  LOG(INFO) << "New host peer connection on fd " << fd;

  if (peer) {
    // Only the newest connection is authoritative.
    dropPeerLocked("replaced by a newer connection");
  }

  if (!socketHandler->setReceiveBufferSize(fd, receiveBufferSize)) {
    LOG(WARNING) << "Could not set a " << receiveBufferSize
                 << " byte receive buffer on fd " << fd;
  }
  peer.reset(new HostPeerConnection(socketHandler, fd, maxWriteBacklog));
  // Replacement is quiet: a loss of the old peer that has not been reported
  // yet must not be blamed on the new one.
  peerLostPendingNotice = false;

  auto ready = ControlMessage::createEvent(ControlCategory::SYSTEM,
                                           toString(SystemAction::READY));
  LOG(INFO) << "Sending system:ready to host peer " << fd;
  if (!peer->send(encodeFrame(ready))) {
    peer.reset();
    peerLostPendingNotice = true;
  }
}

void ControlUnixServer::notifyDisconnect() {
  if (listener) {
    listener->onPeerDisconnected();
  }
}

void ControlUnixServer::poll(int timeoutMs) {
  bool lostBeforePoll = false;
  int listenFd;
  shared_ptr<HostPeerConnection> currentPeer;
  bool wantWrite = false;
  {
    lock_guard<recursive_mutex> guard(peerMutex);
    lostBeforePoll = peerLostPendingNotice;
    peerLostPendingNotice = false;
    listenFd = serverFd;
    currentPeer = peer;
    if (currentPeer) {
      wantWrite = currentPeer->hasBacklog();
    }
  }
  if (lostBeforePoll) {
    notifyDisconnect();
  }
  if (listenFd < 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(timeoutMs));
    return;
  }

  int peerFd = currentPeer ? currentPeer->getFd() : -1;
  fd_set rfd;
  fd_set wfd;
  FD_ZERO(&rfd);
  FD_ZERO(&wfd);
  FD_SET(listenFd, &rfd);
  int maxFd = listenFd;
  if (peerFd >= 0) {
    FD_SET(peerFd, &rfd);
    if (wantWrite) {
      FD_SET(peerFd, &wfd);
    }
    maxFd = max(maxFd, peerFd);
  }
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  int rc = select(maxFd + 1, &rfd, &wfd, NULL, &tv);
  if (rc < 0) {
    if (GetErrno() != EINTR) {
      LOG(ERROR) << "select failed on control socket: " << strerror(GetErrno());
    }
    return;
  }
  if (rc == 0) {
    return;
  }

  vector<ControlMessage> messages;
  bool lost = false;
  if (peerFd >= 0) {
    lock_guard<recursive_mutex> guard(peerMutex);
    // The peer may have been replaced or dropped since the snapshot.
    if (peer == currentPeer && peer->isOpen()) {
      if (FD_ISSET(peerFd, &wfd) && !peer->flush()) {
        peer.reset();
        lost = true;
      }
      if (peer && FD_ISSET(peerFd, &rfd)) {
        messages = peer->readAvailable();
        if (!peer->isOpen()) {
          peer.reset();
          lost = true;
        }
      }
    }
  }

  for (const auto& message : messages) {
    if (listener) {
      listener->onPeerMessage(message);
    }
  }
  if (lost) {
    LOG(INFO) << "Host peer disconnected";
    notifyDisconnect();
  }

  if (FD_ISSET(listenFd, &rfd)) {
    pollAccept();
  }
}
}  // namespace vt
