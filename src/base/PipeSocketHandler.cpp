#include "PipeSocketHandler.hpp"

namespace vt {
namespace {
void fillAddress(const string& pipePath, sockaddr_un* address) {
  memset(address, 0, sizeof(sockaddr_un));
  address->sun_family = AF_UNIX;
  if (pipePath.length() >= sizeof(address->sun_path)) {
    throw std::runtime_error("Socket path is too long: " + pipePath);
  }
  strncpy(address->sun_path, pipePath.c_str(), sizeof(address->sun_path) - 1);
}
}  // namespace

PipeSocketHandler::PipeSocketHandler() {}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> mutexGuard(globalMutex);

  string pipePath = endpoint.name();
  sockaddr_un remote;
  fillAddress(pipePath, &remote);

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);

  VLOG(3) << "Connecting to " << endpoint << " with fd " << sockFd;
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  auto localErrno = GetErrno();
  if (result < 0) {
    LOG(INFO) << "Error connecting to " << endpoint << ": " << localErrno
              << " " << strerror(localErrno);
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }

  initSocket(sockFd);
  addToActiveSockets(sockFd);
  LOG(INFO) << "Connected to endpoint " << endpoint << " with fd " << sockFd;
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local;
  fillAddress(pipePath, &local);

  // Clean up any stale socket file left behind by a previous run.
  if (::unlink(local.sun_path) == 0) {
    LOG(INFO) << "Removed stale socket file " << pipePath;
  } else if (GetErrno() != ENOENT) {
    LOG(WARNING) << "Failed to remove stale socket file " << pipePath << ": "
                 << strerror(GetErrno());
  }

  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initServerSocket(fd);

  if (::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    throw runtime_error("Failed to bind " + pipePath + ": " +
                        strerror(localErrno));
  }
  // Only the owner may connect.
  if (::chmod(local.sun_path, S_IRUSR | S_IWUSR) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    ::unlink(local.sun_path);
    throw runtime_error("Failed to restrict permissions on " + pipePath +
                        ": " + strerror(localErrno));
  }
  if (::listen(fd, 5) == -1) {
    auto localErrno = GetErrno();
    FATAL_FAIL(::close(fd));
    ::unlink(local.sun_path);
    throw runtime_error("Failed to listen on " + pipePath + ": " +
                        strerror(localErrno));
  }
  LOG(INFO) << "Listening on " << pipePath << " (fd " << fd << ", mode 0600)";

  pipeServerSockets[pipePath] = set<int>({fd});
  return pipeServerSockets[pipePath];
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<std::recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    LOG(WARNING) << "Tried to stop listening on a path we weren't listening on: "
                 << pipePath;
    return;
  }
  for (int sockFd : it->second) {
    FATAL_FAIL(::close(sockFd));
  }
  pipeServerSockets.erase(it);
  if (::unlink(pipePath.c_str()) == -1 && GetErrno() != ENOENT) {
    VLOG(1) << "Could not unlink " << pipePath << ": " << strerror(GetErrno());
  }
}
}  // namespace vt
