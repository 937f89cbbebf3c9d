#include <cxxopts.hpp>

#include "ControlUnixHandler.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "RelayConfig.hpp"
#include "SubprocessUtils.hpp"

using namespace vt;

namespace {
ControlUnixHandler* activeHandler = NULL;

void StopSignalHandler(int sig) {
  if (activeHandler) {
    activeHandler->requestStop();
  }
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  vt::HandleTerminate();

  cxxopts::Options options("vtrelay",
                           "Control socket relay between the VibeTunnel host "
                           "app and browser clients");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("socket", "Path of the control socket",
         cxxopts::value<std::string>())  //
        ("port", "WebSocket port for browsers (0 disables)",
         cxxopts::value<int>())  //
        ("bindip", "IP the WebSocket listener binds to",
         cxxopts::value<std::string>())  //
        ("launcher", "Executable used for terminal:spawn",
         cxxopts::value<std::string>())  //
        ("logtostdout", "log to stdout")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "vtrelay version " << VT_RELAY_VERSION << endl;
      exit(0);
    }

    RelayConfig config;
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      string cfgfilename = result["cfgfile"].as<string>();
      try {
        config.loadFromIni(cfgfilename);
      } catch (const std::runtime_error& re) {
        CLOG(INFO, "stdout") << re.what() << endl;
        exit(1);
      }
    }

    // Command line wins over the config file.
    if (result.count("socket")) {
      config.socketPath = result["socket"].as<string>();
    }
    if (result.count("port")) {
      config.websocketPort = result["port"].as<int>();
    }
    if (result.count("bindip")) {
      config.websocketBindAddress = result["bindip"].as<string>();
    }
    if (result.count("launcher")) {
      config.terminalLauncher = result["launcher"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }

    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;
    if (sodium_init() == -1) {
      CLOG(INFO, "stdout") << "libsodium failed to initialize" << endl;
      exit(1);
    }

    LogHandler::setupLogFiles(&defaultConf, GetTempDirectory() + "vtrelay",
                              "vtrelay", result.count("logtostdout") > 0,
                              false, true, config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("vtrelay-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    shared_ptr<PipeSocketHandler> pipeSocketHandler(new PipeSocketHandler());
    shared_ptr<SubprocessUtils> subprocessUtils(new SubprocessUtils());

    try {
      ControlUnixHandler handler(config, pipeSocketHandler, subprocessUtils);
      handler.start();

      activeHandler = &handler;
      ::signal(SIGINT, StopSignalHandler);
      ::signal(SIGTERM, StopSignalHandler);
      ::signal(SIGPIPE, SIG_IGN);

      LOG(INFO) << "Control relay running on "
                << handler.getSocketEndpoint();
      handler.run();
      activeHandler = NULL;
      LOG(INFO) << "Control relay stopped";
    } catch (const std::runtime_error& re) {
      activeHandler = NULL;
      STERROR << "Control relay failed: " << re.what();
      CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
      el::Helpers::uninstallPreRollOutCallback();
      exit(1);
    }
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  google::protobuf::ShutdownProtobufLibrary();
  return 0;
}
