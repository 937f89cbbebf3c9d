#include "BrowserRelay.hpp"

namespace vt {
BrowserRelay::BrowserRelay(PeerLink* _peerLink) : peerLink(_peerLink) {}

void BrowserRelay::addBrowser(shared_ptr<BrowserSocket> socket) {
  const string& browserId = socket->getId();
  size_t count;
  {
    lock_guard<std::mutex> guard(browserMutex);
    browsers[browserId] = socket;
    count = browsers.size();
  }
  bool peerConnected = peerLink->isPeerConnected();
  LOG(INFO) << "Browser " << browserId << " connected (" << count
            << " total), host peer "
            << (peerConnected ? "connected" : "not connected");

  auto greeting = ControlMessage::createEvent(
      ControlCategory::SCREENCAP, toString(ScreencapAction::READY),
      json{{"message", "Control channel connected"},
           {"peerConnected", peerConnected}});
  sendTo(browserId, greeting);

  if (peerConnected) {
    // Replay the peer's announcement so this browser gets the same
    // initialization as if the peer had just connected.
    peerLink->injectPeerMessage(ControlMessage::createEvent(
        ControlCategory::SCREENCAP, toString(ScreencapAction::MAC_READY)));
  }
}

void BrowserRelay::removeBrowser(const string& browserId) {
  lock_guard<std::mutex> guard(browserMutex);
  if (browsers.erase(browserId) == 0) {
    return;
  }
  for (auto it = forwardedRequests.begin(); it != forwardedRequests.end();) {
    if (it->second == browserId) {
      it = forwardedRequests.erase(it);
    } else {
      ++it;
    }
  }
  LOG(INFO) << "Browser " << browserId << " disconnected (" << browsers.size()
            << " remaining)";
}

void BrowserRelay::sendParseError(const string& browserId,
                                  const string& error) {
  sendTo(browserId, ControlMessage::createEvent(ControlCategory::SYSTEM, "error",
                                                json{{"error", error}}));
}

void BrowserRelay::replyWithError(const string& browserId,
                                  const ControlMessage& request,
                                  const string& error) {
  if (request.isRequest()) {
    sendTo(browserId, ControlMessage::createErrorResponse(request, error));
  }
}

void BrowserRelay::onBrowserMessage(const string& browserId,
                                    const string& text) {
  VLOG(4) << "Browser " << browserId << " sent (" << text.size()
          << " chars): " << previewString(text, 200);
  ControlMessage message;
  try {
    message = ControlMessage::fromJsonString(text);
  } catch (const std::runtime_error& re) {
    LOG(ERROR) << "Failed to parse message from browser " << browserId << ": "
               << re.what();
    sendParseError(browserId, re.what());
    return;
  }
  VLOG(1) << "Browser " << browserId << " message: " << message;

  if (message.category != ControlCategory::SCREENCAP) {
    LOG(WARNING) << "Ignoring browser message for unsupported category "
                 << message.categoryName();
    return;
  }

  if (!peerLink->isPeerConnected()) {
    LOG(WARNING) << "Cannot forward " << message
                 << " from browser: host peer not connected";
    replyWithError(browserId, message, "Mac app is not connected");
    return;
  }

  if (message.isRequest()) {
    lock_guard<std::mutex> guard(browserMutex);
    forwardedRequests[message.id] = browserId;
  }
  if (!peerLink->sendToPeer(message)) {
    if (message.isRequest()) {
      lock_guard<std::mutex> guard(browserMutex);
      forwardedRequests.erase(message.id);
    }
    replyWithError(browserId, message, "Failed to send to Mac app");
  }
}

int BrowserRelay::broadcast(const ControlMessage& message) {
  vector<shared_ptr<BrowserSocket>> targets;
  {
    lock_guard<std::mutex> guard(browserMutex);
    for (auto& it : browsers) {
      targets.push_back(it.second);
    }
  }
  if (targets.empty()) {
    VLOG(1) << "No browsers to receive " << message;
    return 0;
  }
  string text = message.toJsonString();
  int delivered = 0;
  for (auto& socket : targets) {
    if (socket->isOpen() && socket->send(text)) {
      ++delivered;
    } else {
      LOG(WARNING) << "Could not deliver " << message << " to browser "
                   << socket->getId();
    }
  }
  return delivered;
}

bool BrowserRelay::sendTo(const string& browserId,
                          const ControlMessage& message) {
  shared_ptr<BrowserSocket> socket;
  {
    lock_guard<std::mutex> guard(browserMutex);
    auto it = browsers.find(browserId);
    if (it == browsers.end()) {
      return false;
    }
    socket = it->second;
  }
  if (!socket->isOpen() || !socket->send(message.toJsonString())) {
    LOG(WARNING) << "Could not deliver " << message << " to browser "
                 << browserId;
    return false;
  }
  return true;
}

int BrowserRelay::routeResponse(const ControlMessage& response) {
  string browserId;
  {
    lock_guard<std::mutex> guard(browserMutex);
    auto it = forwardedRequests.find(response.id);
    if (it != forwardedRequests.end()) {
      browserId = it->second;
      forwardedRequests.erase(it);
    }
  }
  if (!browserId.empty()) {
    return sendTo(browserId, response) ? 1 : 0;
  }
  return broadcast(response);
}

void BrowserRelay::clearForwardedRequests() {
  lock_guard<std::mutex> guard(browserMutex);
  forwardedRequests.clear();
}

size_t BrowserRelay::browserCount() {
  lock_guard<std::mutex> guard(browserMutex);
  return browsers.size();
}

vector<string> BrowserRelay::getBrowserIds() {
  lock_guard<std::mutex> guard(browserMutex);
  vector<string> ids;
  for (auto& it : browsers) {
    ids.push_back(it.first);
  }
  return ids;
}
}  // namespace vt
