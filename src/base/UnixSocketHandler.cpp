#include "UnixSocketHandler.hpp"

namespace vt {
UnixSocketHandler::UnixSocketHandler() {}

bool UnixSocketHandler::waitForData(int fd, int64_t sec, int64_t usec) {
  fd_set input;
  FD_ZERO(&input);
  FD_SET(fd, &input);
  struct timeval timeout;
  timeout.tv_sec = sec;
  timeout.tv_usec = usec;
  int n = select(fd + 1, &input, NULL, NULL, &timeout);
  if (n == -1) {
    VLOG(4) << "socket select failed: " << strerror(GetErrno());
    return false;
  } else if (n == 0) {
    return false;
  }
  VLOG(4) << "socket " << fd << " has data";
  return FD_ISSET(fd, &input);
}

ssize_t UnixSocketHandler::read(int fd, void *buf, size_t count) {
  if (fd <= 0) {
    STFATAL << "Tried to read from an invalid socket: " << fd;
  }
  shared_ptr<recursive_mutex> socketMutex;
  {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    auto it = activeSocketMutexes.find(fd);
    if (it == activeSocketMutexes.end()) {
      LOG(INFO) << "Tried to read from a socket that has been closed: " << fd;
      SetErrno(EPIPE);
      return -1;
    }
    socketMutex = it->second;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
  VLOG(4) << "Unixsocket handler read from fd: " << fd;
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = GetErrno();
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  SetErrno(localErrno);
  return readBytes;
}

ssize_t UnixSocketHandler::write(int fd, const void *buf, size_t count) {
  VLOG(4) << "Unixsocket handler write to fd: " << fd;
  if (fd <= 0) {
    STFATAL << "Tried to write to an invalid socket: " << fd;
  }
  shared_ptr<recursive_mutex> socketMutex;
  {
    lock_guard<std::recursive_mutex> guard(globalMutex);
    auto it = activeSocketMutexes.find(fd);
    if (it == activeSocketMutexes.end()) {
      LOG(INFO) << "Tried to write to a socket that has been closed: " << fd;
      SetErrno(EPIPE);
      return -1;
    }
    socketMutex = it->second;
  }
  lock_guard<recursive_mutex> guard(*socketMutex);
#ifdef MSG_NOSIGNAL
  ssize_t w = ::send(fd, buf, count, MSG_NOSIGNAL);
#else
  ssize_t w = ::write(fd, buf, count);
#endif
  return w;
}

void UnixSocketHandler::addToActiveSockets(int fd) {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  if (activeSocketMutexes.find(fd) != activeSocketMutexes.end()) {
    STFATAL << "Tried to insert an fd that already exists: " << fd;
  }
  activeSocketMutexes.insert(
      make_pair(fd, shared_ptr<recursive_mutex>(new recursive_mutex())));
}

int UnixSocketHandler::accept(int sockFd) {
  sockaddr_un client;
  socklen_t c = sizeof(sockaddr_un);
  int client_sock = ::accept(sockFd, (sockaddr *)&client, &c);
  auto acceptErrno = GetErrno();

  lock_guard<std::recursive_mutex> guard(globalMutex);
  VLOG(3) << "Socket " << sockFd
          << " accepted, returned client_sock: " << client_sock;
  if (client_sock >= 0) {
    addToActiveSockets(client_sock);
    initSocket(client_sock);
    return client_sock;
  } else if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error accepting on " << sockFd << ": "
                 << strerror(acceptErrno);
  }

  SetErrno(acceptErrno);
  return -1;
}

void UnixSocketHandler::close(int fd) {
  lock_guard<std::recursive_mutex> globalGuard(globalMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSocketMutexes.find(fd);
  if (it == activeSocketMutexes.end()) {
    // Connection was already killed.
    LOG(WARNING) << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  auto m = it->second;
  lock_guard<std::recursive_mutex> guard(*m);
  VLOG(1) << "Closing connection: " << fd;
  FATAL_FAIL(::close(fd));
  activeSocketMutexes.erase(it);
}

vector<int> UnixSocketHandler::getActiveSockets() {
  lock_guard<std::recursive_mutex> guard(globalMutex);
  vector<int> fds;
  for (auto &it : activeSocketMutexes) {
    fds.push_back(it.first);
  }
  return fds;
}

bool UnixSocketHandler::setReceiveBufferSize(int fd, int bytes) {
  if (::setsockopt(fd, SOL_SOCKET, SO_RCVBUF, (void *)&bytes, sizeof(bytes)) ==
      -1) {
    LOG(WARNING) << "Failed to set receive buffer on " << fd << " to " << bytes
                 << ": " << strerror(GetErrno());
    return false;
  }
  VLOG(1) << "Set receive buffer on " << fd << " to " << bytes << " bytes";
  return true;
}

void UnixSocketHandler::initSocket(int fd) {
#if !defined(MSG_NOSIGNAL)
  {
    // If we don't have MSG_NOSIGNAL, use SO_NOSIGPIPE
    int val = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, (void *)&val, sizeof(val)) ==
        -1) {
      ::signal(SIGPIPE, SIG_IGN);
    }
  }
#endif
  int opts;
  opts = fcntl(fd, F_GETFL);
  FATAL_FAIL_UNLESS_EINVAL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFL, opts));
  FATAL_FAIL_UNLESS_EINVAL(fcntl(fd, F_SETFD, FD_CLOEXEC));
}

void UnixSocketHandler::initServerSocket(int fd) { initSocket(fd); }
}  // namespace vt
