#include "ControlUnixHandler.hpp"

#include "ControlSocketPath.hpp"

namespace vt {
namespace {
const int LOOP_POLL_MS = 10;
}

ControlUnixHandler::ControlUnixHandler(
    const RelayConfig& _config, shared_ptr<PipeSocketHandler> _socketHandler,
    shared_ptr<SubprocessUtils> _subprocessUtils)
    : config(_config), running(false) {
  ControlSocketPath socketPath;
  if (!config.socketPath.empty()) {
    socketPath.setPathOverride(config.socketPath);
  }
  socketPath.createDirectoriesIfRequired();
  socketEndpoint = socketPath.getEndpoint();

  scheduler.reset(new TaskScheduler());
  correlator.reset(new RequestCorrelator(config.requestTimeout));
  server.reset(new ControlUnixServer(_socketHandler, socketEndpoint,
                                     config.receiveBufferSize,
                                     config.maxWriteBacklog));
  server->setListener(this);
  browserRelay.reset(new BrowserRelay(this));

  systemHandler.reset(new SystemControlHandler(
      scheduler, config.pathSyncReenableDelay, config.repositoryPath));
  screencapHandler.reset(new ScreencapControlHandler(
      this, browserRelay, scheduler, config.initialDataDelay));
  terminalHandler.reset(
      new TerminalControlHandler(_subprocessUtils, config.terminalLauncher));
  registerHandler(systemHandler);
  registerHandler(screencapHandler);
  registerHandler(terminalHandler);
}

ControlUnixHandler::~ControlUnixHandler() { shutdown(); }

void ControlUnixHandler::registerHandler(shared_ptr<ControlHandler> handler) {
  handlers[handler->getCategory()] = handler;
}

void ControlUnixHandler::start() {
  server->start();
  if (config.websocketPort > 0) {
    SocketEndpoint webSocketEndpoint;
    webSocketEndpoint.set_name(config.websocketBindAddress);
    webSocketEndpoint.set_port(config.websocketPort);
    webSocketServer.reset(
        new WebSocketBrowserServer(browserRelay, webSocketEndpoint));
    webSocketServer->start();
  }
  running = true;
}

void ControlUnixHandler::run() {
  while (running) {
    poll(LOOP_POLL_MS);
  }
  shutdown();
}

void ControlUnixHandler::poll(int timeoutMs) {
  server->poll(timeoutMs);
  correlator->expire();
  scheduler->runDue();
}

void ControlUnixHandler::shutdown() {
  running = false;
  if (webSocketServer) {
    webSocketServer->stop();
    webSocketServer.reset();
  }
  correlator->cancelAll();
  scheduler->clear();
  server->stop();
}

bool ControlUnixHandler::isPeerConnected() { return server->isPeerConnected(); }

bool ControlUnixHandler::sendToPeer(const ControlMessage& message) {
  return server->send(message);
}

void ControlUnixHandler::injectPeerMessage(const ControlMessage& message) {
  dispatchPeerMessage(message);
}

void ControlUnixHandler::onPeerMessage(const ControlMessage& message) {
  dispatchPeerMessage(message);
}

void ControlUnixHandler::onPeerDisconnected() {
  LOG(INFO) << "Host peer disconnected, " << correlator->pendingCount()
            << " requests left to time out";
  screencapHandler->onPeerDisconnected();
}

void ControlUnixHandler::dispatchPeerMessage(const ControlMessage& message) {
  VLOG(1) << "Peer message: " << message;

  if (message.isResponse()) {
    if (correlator->resolve(message)) {
      return;
    }
    if (message.category == ControlCategory::SCREENCAP) {
      int delivered = browserRelay->routeResponse(message);
      VLOG(1) << "Relayed " << message << " to " << delivered << " browsers";
      return;
    }
    // Never hand a stray response to a handler, or an error response could
    // bounce between the relay and the peer forever.
    LOG(WARNING) << "Ignoring response with no pending request: " << message;
    return;
  }

  auto it = handlers.find(message.category);
  if (it == handlers.end()) {
    LOG(WARNING) << "No handler for category: " << message.categoryName();
    if (message.isRequest()) {
      replyToPeer(ControlMessage::createErrorResponse(
          message,
          "Unknown category: " + message.categoryName()));
    }
    return;
  }

  optional<ControlMessage> response;
  try {
    response = it->second->handleMessage(message);
  } catch (const std::exception& e) {
    STERROR << "Handler error for " << message << ": " << e.what();
    if (message.isRequest()) {
      replyToPeer(ControlMessage::createErrorResponse(message, e.what()));
    }
    return;
  }

  if (!response) {
    return;
  }
  if (!message.isRequest()) {
    VLOG(1) << "Dropping reply to non-request " << message;
    return;
  }
  replyToPeer(*response);
}

void ControlUnixHandler::replyToPeer(const ControlMessage& response) {
  if (!sendToPeer(response)) {
    LOG(WARNING) << "Could not deliver response " << response;
  }
}

std::future<optional<ControlMessage>> ControlUnixHandler::sendControlMessage(
    const ControlMessage& message) {
  if (!message.isRequest()) {
    LOG(WARNING) << "sendControlMessage called with a non-request " << message;
    std::promise<optional<ControlMessage>> noReply;
    noReply.set_value(nullopt);
    if (!sendToPeer(message)) {
      LOG(WARNING) << "Could not deliver " << message;
    }
    return noReply.get_future();
  }

  auto future = correlator->registerRequest(message.id);
  if (!sendToPeer(message)) {
    correlator->cancel(message.id);
  }
  return future;
}

bool ControlUnixHandler::updateRepositoryPath(const string& path) {
  if (!systemHandler->updateRepositoryPath(path)) {
    return false;
  }
  if (!systemHandler->isPathSyncEnabled()) {
    LOG(INFO) << "Path sync suspended, not telling peer about " << path;
    return true;
  }
  if (!isPeerConnected()) {
    VLOG(1) << "No host peer to sync repository path with";
    return true;
  }
  auto request = ControlMessage::createRequest(
      ControlCategory::SYSTEM,
      toString(SystemAction::REPOSITORY_PATH_UPDATE),
      json{{"path", path}, {"source", "web"}});
  LOG(INFO) << "Syncing repository path to peer: " << path;
  // The peer's acknowledgement is matched and discarded by the correlator.
  sendControlMessage(request);
  return true;
}

string ControlUnixHandler::getRepositoryPath() {
  return systemHandler->getRepositoryPath();
}

void ControlUnixHandler::setConfigUpdateCallback(
    SystemControlHandler::ConfigUpdateCallback cb) {
  systemHandler->setConfigUpdateCallback(cb);
}
}  // namespace vt
