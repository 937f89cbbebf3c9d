#include "ControlSocketPath.hpp"

namespace vt {

namespace {

const string SOCKET_DIRECTORY_NAME = ".vibetunnel";
const string SOCKET_BASENAME = "control.sock";
const string FALLBACK_HOME = "/tmp";

bool IsAbsolutePath(const string& path) {
  return (!path.empty() && path[0] == '/');
}

string GetHome() {
  const char* home = getenv("HOME");
  if (home == NULL || !IsAbsolutePath(home)) {
    return FALLBACK_HOME;
  }
  return string(home);
}

void TryCreateDirectory(const string& dir, mode_t mode) {
  if (::mkdir(dir.c_str(), mode) == 0) {
    LOG(INFO) << "Created directory " << dir;
    return;
  }
  if (errno != EEXIST) {
    throw std::runtime_error("Unable to create " + dir + ": " +
                             strerror(errno));
  }
  struct stat dirStat;
  if (::stat(dir.c_str(), &dirStat) != 0 || !S_ISDIR(dirStat.st_mode)) {
    throw std::runtime_error(dir + " exists and is not a directory");
  }
}

}  // namespace

ControlSocketPath::ControlSocketPath() = default;

void ControlSocketPath::setPathOverride(const string& path) {
  if (path.empty()) {
    throw std::runtime_error("Control socket path must not be empty");
  }
  pathOverride = path;
}

string ControlSocketPath::getDefaultPath() {
  return GetHome() + "/" + SOCKET_DIRECTORY_NAME + "/" + SOCKET_BASENAME;
}

string ControlSocketPath::getPath() const {
  if (pathOverride) {
    return pathOverride.value();
  }
  return getDefaultPath();
}

SocketEndpoint ControlSocketPath::getEndpoint() const {
  SocketEndpoint endpoint;
  endpoint.set_name(getPath());
  return endpoint;
}

void ControlSocketPath::createDirectoriesIfRequired() {
  string path = getPath();
  size_t slash = path.rfind('/');
  if (slash == string::npos || slash == 0) {
    // Relative to the working directory, or directly under /.
    return;
  }
  string parent = path.substr(0, slash);

  // Walk the components like mkdir -p.
  size_t pos = 0;
  while (pos != string::npos) {
    pos = parent.find('/', pos + 1);
    string component = parent.substr(0, pos);
    if (component.empty()) {
      continue;
    }
    TryCreateDirectory(component, 0700);
  }
}

}  // namespace vt
