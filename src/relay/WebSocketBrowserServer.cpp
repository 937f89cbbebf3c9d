#include "WebSocketBrowserServer.hpp"

namespace vt {
namespace {
const int BROWSER_ID_LENGTH = 16;
}

RtcBrowserSocket::RtcBrowserSocket(shared_ptr<rtc::WebSocket> _webSocket)
    : id(genRandomAlphaNum(BROWSER_ID_LENGTH)), webSocket(_webSocket) {}

bool RtcBrowserSocket::send(const string& text) {
  try {
    return webSocket->send(text);
  } catch (const std::exception& e) {
    LOG(WARNING) << "WebSocket send to browser " << id
                 << " failed: " << e.what();
    return false;
  }
}

bool RtcBrowserSocket::isOpen() const { return webSocket->isOpen(); }

void RtcBrowserSocket::close() {
  // Callbacks capture the server, which may be gone by the time the close
  // completes.
  webSocket->resetCallbacks();
  webSocket->close();
}

WebSocketBrowserServer::WebSocketBrowserServer(
    shared_ptr<BrowserRelay> _browserRelay, const SocketEndpoint& _endpoint)
    : browserRelay(_browserRelay), endpoint(_endpoint) {}

WebSocketBrowserServer::~WebSocketBrowserServer() { stop(); }

void WebSocketBrowserServer::start() {
  lock_guard<std::mutex> guard(serverMutex);
  if (server) {
    return;
  }
  rtc::WebSocketServer::Configuration config;
  config.port = uint16_t(endpoint.port());
  config.enableTls = false;
  if (endpoint.has_name() && !endpoint.name().empty()) {
    config.bindAddress = endpoint.name();
  }
  try {
    server.reset(new rtc::WebSocketServer(config));
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to start WebSocket server on " +
                             endpoint.name() + ":" +
                             to_string(endpoint.port()) + ": " + e.what());
  }
  server->onClient(
      [this](shared_ptr<rtc::WebSocket> webSocket) { onClient(webSocket); });
  LOG(INFO) << "Browser WebSocket server listening on " << endpoint.name()
            << ":" << server->port();
}

void WebSocketBrowserServer::onClient(shared_ptr<rtc::WebSocket> webSocket) {
  auto socket = make_shared<RtcBrowserSocket>(webSocket);
  string browserId = socket->getId();
  {
    lock_guard<std::mutex> guard(serverMutex);
    sockets[browserId] = socket;
  }
  std::weak_ptr<RtcBrowserSocket> weakSocket = socket;
  auto relay = browserRelay;

  webSocket->onOpen([relay, weakSocket]() {
    if (auto s = weakSocket.lock()) {
      relay->addBrowser(s);
    }
  });

  webSocket->onMessage([relay, browserId](rtc::message_variant data) {
    if (std::holds_alternative<string>(data)) {
      relay->onBrowserMessage(browserId, std::get<string>(data));
    } else {
      LOG(WARNING) << "Ignoring binary message from browser " << browserId;
    }
  });

  webSocket->onError([browserId](string error) {
    LOG(ERROR) << "Browser WebSocket " << browserId << " error: " << error;
  });

  webSocket->onClosed([this, relay, browserId]() {
    relay->removeBrowser(browserId);
    lock_guard<std::mutex> guard(serverMutex);
    sockets.erase(browserId);
  });
}

void WebSocketBrowserServer::stop() {
  unique_ptr<rtc::WebSocketServer> stopping;
  map<string, shared_ptr<RtcBrowserSocket>> closing;
  {
    lock_guard<std::mutex> guard(serverMutex);
    stopping = std::move(server);
    closing.swap(sockets);
  }
  if (!stopping) {
    return;
  }
  stopping->stop();
  for (auto& it : closing) {
    browserRelay->removeBrowser(it.first);
    it.second->close();
  }
  LOG(INFO) << "Browser WebSocket server stopped";
}

bool WebSocketBrowserServer::isRunning() {
  lock_guard<std::mutex> guard(serverMutex);
  return server.get() != NULL;
}

int WebSocketBrowserServer::getPort() {
  lock_guard<std::mutex> guard(serverMutex);
  return server ? int(server->port()) : -1;
}
}  // namespace vt
