#include "SubprocessUtils.hpp"

namespace vt {
namespace {
// Runs in the forked child only: no allocation, no logging.
void redirectStdioToDevNull() {
  int devNull = ::open("/dev/null", O_RDWR);
  if (devNull < 0) {
    return;
  }
  dup2(devNull, STDIN_FILENO);
  dup2(devNull, STDOUT_FILENO);
  dup2(devNull, STDERR_FILENO);
  if (devNull > STDERR_FILENO) {
    ::close(devNull);
  }
}
}  // namespace

void SubprocessUtils::spawnDetached(const string& command,
                                    const vector<string>& args) {
  // Build argv before forking.
  vector<char*> argv;
  argv.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  // The child reports an exec failure by writing errno into this pipe.  On a
  // successful exec the write end is closed by FD_CLOEXEC and the parent reads
  // EOF.
  int errorPipe[2];
  if (pipe(errorPipe) == -1) {
    throw std::runtime_error(string("pipe failed: ") + strerror(GetErrno()));
  }
  FATAL_FAIL(fcntl(errorPipe[1], F_SETFD, FD_CLOEXEC));

  pid_t pid = fork();
  if (pid < 0) {
    auto localErrno = GetErrno();
    ::close(errorPipe[0]);
    ::close(errorPipe[1]);
    throw std::runtime_error(string("fork failed: ") + strerror(localErrno));
  }

  if (pid == 0) {
    // Intermediate child: new session, then fork again so the launched
    // process is never our zombie.
    ::close(errorPipe[0]);
    setsid();
    pid_t grandchild = fork();
    if (grandchild < 0) {
      int err = errno;
      ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
      (void)ignored;
      _exit(1);
    }
    if (grandchild > 0) {
      _exit(0);
    }
    redirectStdioToDevNull();
    execvp(command.c_str(), argv.data());
    int err = errno;
    ssize_t ignored = ::write(errorPipe[1], &err, sizeof(err));
    (void)ignored;
    _exit(127);
  }

  ::close(errorPipe[1]);
  int status = 0;
  while (waitpid(pid, &status, 0) == -1) {
    if (GetErrno() != EINTR) {
      LOG(WARNING) << "waitpid failed for launcher " << pid << ": "
                   << strerror(GetErrno());
      break;
    }
  }

  int childErrno = 0;
  ssize_t bytesRead;
  do {
    bytesRead = ::read(errorPipe[0], &childErrno, sizeof(childErrno));
  } while (bytesRead == -1 && GetErrno() == EINTR);
  ::close(errorPipe[0]);

  if (bytesRead == sizeof(childErrno)) {
    throw std::runtime_error("Failed to launch " + command + ": " +
                             strerror(childErrno));
  }
  LOG(INFO) << "Launched " << command << " with " << args.size()
            << " arguments";
}
}  // namespace vt
