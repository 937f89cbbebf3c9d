#include "HostPeerConnection.hpp"

namespace vt {
namespace {
const size_t READ_CHUNK_SIZE = 64 * 1024;
}

HostPeerConnection::HostPeerConnection(shared_ptr<SocketHandler> _socketHandler,
                                       int _fd, size_t maxWriteBacklog)
    : socketHandler(_socketHandler), fd(_fd), writeBuffer(maxWriteBacklog) {}

HostPeerConnection::~HostPeerConnection() { close(); }

void HostPeerConnection::close() {
  if (fd < 0) {
    return;
  }
  if (writeBuffer.hasPendingData()) {
    LOG(WARNING) << "Dropping " << writeBuffer.size()
                 << " unsent bytes to host peer " << fd;
  }
  socketHandler->close(fd);
  fd = -1;
  writeBuffer.clear();
  decoder.clear();
}

vector<ControlMessage> HostPeerConnection::readAvailable() {
  vector<ControlMessage> messages;
  if (fd < 0) {
    return messages;
  }
  string chunk(READ_CHUNK_SIZE, '\0');
  while (true) {
    ssize_t bytesRead = socketHandler->read(fd, &chunk[0], chunk.size());
    if (bytesRead > 0) {
      auto decoded = decoder.feed(chunk.data(), size_t(bytesRead));
      messages.insert(messages.end(), decoded.begin(), decoded.end());
      continue;
    }
    if (bytesRead == 0) {
      LOG(INFO) << "Host peer " << fd << " closed the connection";
      close();
      break;
    }
    auto localErrno = GetErrno();
    if (localErrno == EAGAIN || localErrno == EWOULDBLOCK) {
      break;
    }
    if (localErrno == EINTR) {
      continue;
    }
    LOG(ERROR) << "Host peer " << fd << " read failed: " << strerror(localErrno);
    close();
    break;
  }
  return messages;
}

bool HostPeerConnection::send(const string& frame) {
  if (fd < 0) {
    return false;
  }
  if (writeBuffer.hasPendingData()) {
    // Keep frames in order behind the existing backlog.
    writeBuffer.enqueue(frame);
  } else {
    size_t written = 0;
    while (written < frame.size()) {
      ssize_t w =
          socketHandler->write(fd, frame.data() + written, frame.size() - written);
      if (w > 0) {
        written += w;
        continue;
      }
      auto localErrno = GetErrno();
      if (w < 0 && localErrno == EINTR) {
        continue;
      }
      if (w < 0 && (localErrno == EAGAIN || localErrno == EWOULDBLOCK)) {
        break;
      }
      LOG(ERROR) << "Error writing to host peer " << fd << ": "
                 << (w == 0 ? string("connection closed")
                            : string(strerror(localErrno)));
      close();
      return false;
    }
    if (written == frame.size()) {
      return true;
    }
    writeBuffer.enqueue(frame.substr(written));
    LOG(WARNING) << "Host peer write buffered, backpressure detected ("
                 << writeBuffer.size() << " bytes queued)";
  }

  if (!writeBuffer.withinLimit()) {
    LOG(ERROR) << "Host peer backlog of " << writeBuffer.size()
               << " bytes exceeds " << writeBuffer.getMaxBacklog()
               << ", dropping connection";
    close();
    return false;
  }
  return true;
}

bool HostPeerConnection::flush() {
  if (fd < 0) {
    return false;
  }
  return drainBacklog();
}

bool HostPeerConnection::drainBacklog() {
  while (writeBuffer.hasPendingData()) {
    size_t count;
    const char* data = writeBuffer.peekData(&count);
    ssize_t w = socketHandler->write(fd, data, count);
    if (w > 0) {
      writeBuffer.consume(size_t(w));
      continue;
    }
    auto localErrno = GetErrno();
    if (w < 0 && localErrno == EINTR) {
      continue;
    }
    if (w < 0 && (localErrno == EAGAIN || localErrno == EWOULDBLOCK)) {
      return true;
    }
    LOG(ERROR) << "Error flushing to host peer " << fd << ": "
               << (w == 0 ? string("connection closed")
                          : string(strerror(localErrno)));
    close();
    return false;
  }
  VLOG(1) << "Host peer " << fd << " drained";
  return true;
}
}  // namespace vt
