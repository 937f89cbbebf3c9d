#include "ScreencapControlHandler.hpp"

namespace vt {
ScreencapControlHandler::ScreencapControlHandler(
    PeerLink* _peerLink, shared_ptr<BrowserRelay> _browserRelay,
    shared_ptr<TaskScheduler> _scheduler,
    std::chrono::milliseconds _initialDataDelay)
    : peerLink(_peerLink),
      browserRelay(_browserRelay),
      scheduler(_scheduler),
      initialDataDelay(_initialDataDelay) {}

optional<string> ScreencapControlHandler::getPeerMode() {
  lock_guard<std::mutex> guard(modeMutex);
  return peerMode;
}

optional<ControlMessage> ScreencapControlHandler::handleMessage(
    const ControlMessage& message) {
  auto action = parseScreencapAction(message.action);
  if (!action) {
    LOG(WARNING) << "Unknown screencap action: " << message.action;
    if (message.isRequest()) {
      return ControlMessage::createErrorResponse(
          message, "Unknown screencap action: " + message.action);
    }
    return nullopt;
  }

  switch (*action) {
    case ScreencapAction::MAC_READY:
      handleMacReady(message);
      return nullopt;
    case ScreencapAction::PING: {
      auto pong = ControlMessage::createResponse(
          message, json{{"timestamp", int64_t(time(NULL))}});
      pong.action = toString(ScreencapAction::PONG);
      return pong;
    }
    case ScreencapAction::GET_INITIAL_DATA:
      // Only the relay asks for initial data.
      LOG(WARNING) << "Host peer sent " << message << ", ignoring";
      if (message.isRequest()) {
        return ControlMessage::createErrorResponse(
            message, "Unexpected screencap action from peer: " +
                         message.action);
      }
      return nullopt;
    case ScreencapAction::READY:
    case ScreencapAction::START_CAPTURE:
    case ScreencapAction::OFFER:
    case ScreencapAction::ANSWER:
    case ScreencapAction::ICE_CANDIDATE:
    case ScreencapAction::API_REQUEST:
    case ScreencapAction::API_RESPONSE:
    case ScreencapAction::STATE_CHANGE:
    case ScreencapAction::BITRATE_ADJUSTMENT:
    case ScreencapAction::INITIAL_DATA:
    case ScreencapAction::INITIAL_DATA_ERROR:
    case ScreencapAction::ERROR_EVENT:
    case ScreencapAction::PONG: {
      int delivered = browserRelay->broadcast(message);
      VLOG(1) << "Forwarded " << message << " to " << delivered << " browsers";
      return nullopt;
    }
  }
  return nullopt;
}

void ScreencapControlHandler::handleMacReady(const ControlMessage& message) {
  optional<string> mode;
  {
    lock_guard<std::mutex> guard(modeMutex);
    if (message.payload && message.payload->is_object()) {
      auto it = message.payload->find("mode");
      if (it != message.payload->end() && it->is_string()) {
        peerMode = it->get<string>();
      }
    }
    mode = peerMode;
  }
  LOG(INFO) << "Capture peer ready, mode: " << (mode ? *mode : "unknown");

  json payload = {{"message", "Mac peer connected"}, {"peerConnected", true}};
  if (mode) {
    payload["mode"] = *mode;
  }
  browserRelay->broadcast(ControlMessage::createEvent(
      ControlCategory::SCREENCAP, toString(ScreencapAction::READY), payload));

  // Give the peer's capture stack time to settle before asking for data.
  scheduler->schedule(initialDataDelay, [this]() { requestInitialData(); });
}

void ScreencapControlHandler::requestInitialData() {
  if (!peerLink->isPeerConnected()) {
    VLOG(1) << "Host peer went away before the initial data request";
    return;
  }
  LOG(INFO) << "Requesting initial capture data from host peer";
  if (!peerLink->sendToPeer(ControlMessage::createRequest(
          ControlCategory::SCREENCAP,
          toString(ScreencapAction::GET_INITIAL_DATA)))) {
    LOG(WARNING) << "Initial capture data request was not sent";
  }
}

void ScreencapControlHandler::onPeerDisconnected() {
  {
    lock_guard<std::mutex> guard(modeMutex);
    peerMode.reset();
  }
  browserRelay->clearForwardedRequests();
  browserRelay->broadcast(ControlMessage::createEvent(
      ControlCategory::SCREENCAP, toString(ScreencapAction::ERROR_EVENT),
      json{{"error", "Mac disconnected"}}));
}
}  // namespace vt
