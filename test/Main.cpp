#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace vt;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0 ||
        strcmp(argv[i], "--list-test-names-only") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      vt::LogHandler::setupLogHandler(&argc, &argv);
  vt::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  vt::HandleTerminate();

  if (sodium_init() == -1) {
    CLOG(INFO, "stdout") << "libsodium failed to initialize" << endl;
    return 1;
  }

  string logDirectoryPattern = GetTempDirectory() + string("vt_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  vt::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log", true, true);

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  fs::remove_all(logDirectory);
  return result;
}
