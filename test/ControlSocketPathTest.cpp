#include <ftw.h>

#include "ControlSocketPath.hpp"
#include "TestHeaders.hpp"

using namespace vt;

namespace {

struct FileInfo {
  bool exists = false;
  mode_t mode = 0;

  mode_t fileMode() const { return mode & 0777; }

  // Codespaces and similar environments may enforce additional ACLs, so verify
  // that the permissions are less than a certain maximum.
  void requireFileModeLessPrivilegedThan(mode_t highestMode) const {
    INFO("fileMode()=" << fileMode() << ", highestMode=" << highestMode);
    REQUIRE(exists);
    REQUIRE((fileMode() & highestMode) == fileMode());
  }
};

int RemoveDirectory(const char* path) {
  // Use posix file tree walk to traverse the directory and remove the contents.
  return nftw(
      path,
      [](const char* fpath, const struct stat* sb, int typeflag,
         struct FTW* ftwbuf) { return ::remove(fpath); },
      64,  // Maximum open fds.
      FTW_DEPTH | FTW_PHYS);
}

class TestEnvironment {
 public:
  string createTempDir() {
    string tmpPath = GetTempDirectory() + string("vt_test_XXXXXXXX");
    const string dir = string(mkdtemp(&tmpPath[0]));

    temporaryDirs.push_back(dir);
    return dir;
  }

  FileInfo getFileInfo(const string& name) {
    struct stat fileStat;
    if (::stat(name.c_str(), &fileStat) != 0) {
      return FileInfo{};
    }

    FileInfo result;
    result.exists = true;
    result.mode = fileStat.st_mode;
    return result;
  }

  void setEnv(const char* name, const string& value) {
    saveEnv(name);
    ::setenv(name, value.c_str(), 1);
  }

  void unsetEnv(const char* name) {
    saveEnv(name);
    ::unsetenv(name);
  }

  ~TestEnvironment() {
    for (const string& dir : temporaryDirs) {
      const int removeResult = RemoveDirectory(dir.c_str());
      if (removeResult == -1) {
        LOG(ERROR) << "Error when removing dir: " << dir;
        FATAL_FAIL(removeResult);
      }
    }

    // Restore env.
    for (const auto& [key, value] : savedEnvs) {
      if (value) {
        ::setenv(key.c_str(), value->c_str(), 1);
      } else {
        ::unsetenv(key.c_str());
      }
    }
  }

 private:
  void saveEnv(const char* name) {
    if (!savedEnvs.count(name)) {
      const char* previousValue = ::getenv(name);
      if (previousValue) {
        savedEnvs[name] = string(previousValue);
      } else {
        savedEnvs[name] = std::nullopt;
      }
    }
  }

  vector<string> temporaryDirs;
  map<string, optional<string>> savedEnvs;
};

}  // namespace

TEST_CASE("Default location", "[ControlSocketPath]") {
  TestEnvironment env;

  const string homeDir = env.createTempDir();
  env.setEnv("HOME", homeDir);
  INFO("homeDir = " << homeDir);

  const string expectedPath = homeDir + "/.vibetunnel/control.sock";

  ControlSocketPath socketPath;
  REQUIRE(socketPath.getPath() == expectedPath);
  REQUIRE(socketPath.getEndpoint().name() == expectedPath);
  REQUIRE_FALSE(socketPath.getEndpoint().has_port());

  SECTION("Create the directory") {
    REQUIRE(!env.getFileInfo(homeDir + "/.vibetunnel").exists);
    socketPath.createDirectoriesIfRequired();
    env.getFileInfo(homeDir + "/.vibetunnel")
        .requireFileModeLessPrivilegedThan(0700);
  }

  SECTION("Directory already exists") {
    const mode_t existingMode = 0750;
    const int oldMask = ::umask(0);
    FATAL_FAIL(::mkdir((homeDir + "/.vibetunnel").c_str(), existingMode));
    ::umask(oldMask);

    socketPath.createDirectoriesIfRequired();
    env.getFileInfo(homeDir + "/.vibetunnel")
        .requireFileModeLessPrivilegedThan(existingMode);
  }

  SECTION("A file is in the way") {
    std::ofstream blocker(homeDir + "/.vibetunnel");
    blocker << "not a directory";
    blocker.close();
    REQUIRE_THROWS_AS(socketPath.createDirectoriesIfRequired(),
                      std::runtime_error);
  }
}

TEST_CASE("Fallback without a usable HOME", "[ControlSocketPath]") {
  TestEnvironment env;

  SECTION("HOME unset") {
    env.unsetEnv("HOME");
    REQUIRE(ControlSocketPath::getDefaultPath() ==
            "/tmp/.vibetunnel/control.sock");
  }

  SECTION("HOME relative") {
    env.setEnv("HOME", "relative/home");
    REQUIRE(ControlSocketPath::getDefaultPath() ==
            "/tmp/.vibetunnel/control.sock");
  }
}

TEST_CASE("Override", "[ControlSocketPath]") {
  TestEnvironment env;

  const string homeDir = env.createTempDir();
  env.setEnv("HOME", homeDir);

  ControlSocketPath socketPath;
  REQUIRE_THROWS_AS(socketPath.setPathOverride(""), std::runtime_error);

  const string pathOverride =
      env.createTempDir() + "/nested/deeper/control.sock";
  socketPath.setPathOverride(pathOverride);
  REQUIRE(socketPath.getPath() == pathOverride);
  REQUIRE(socketPath.getEndpoint().name() == pathOverride);

  socketPath.createDirectoriesIfRequired();
  const string parent = pathOverride.substr(0, pathOverride.rfind('/'));
  env.getFileInfo(parent).requireFileModeLessPrivilegedThan(0700);
  REQUIRE(!env.getFileInfo(homeDir + "/.vibetunnel").exists);
}
