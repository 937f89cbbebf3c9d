#ifndef __VT_SCREENCAP_CONTROL_HANDLER_H__
#define __VT_SCREENCAP_CONTROL_HANDLER_H__

#include "BrowserRelay.hpp"
#include "ControlHandler.hpp"
#include "TaskScheduler.hpp"

namespace vt {
/**
 * @brief Screen capture signaling coming from the host peer.
 *
 * mac-ready announces the capture peer: browsers are told it is up and, after
 * initialDataDelay, the peer is asked for its initial data.  WebRTC signaling
 * and API traffic are passed on to the browsers.
 */
class ScreencapControlHandler : public ControlHandler {
 public:
  ScreencapControlHandler(PeerLink* _peerLink,
                          shared_ptr<BrowserRelay> _browserRelay,
                          shared_ptr<TaskScheduler> _scheduler,
                          std::chrono::milliseconds _initialDataDelay);

  ControlCategory getCategory() const override {
    return ControlCategory::SCREENCAP;
  }
  optional<ControlMessage> handleMessage(const ControlMessage& message) override;

  /** @brief Tells browsers the peer is gone and forgets its capture mode. */
  void onPeerDisconnected();

  /** @brief Mode reported by the last mac-ready (desktop, window, api-only). */
  optional<string> getPeerMode();

 protected:
  void handleMacReady(const ControlMessage& message);
  void requestInitialData();

  PeerLink* peerLink;
  shared_ptr<BrowserRelay> browserRelay;
  shared_ptr<TaskScheduler> scheduler;
  std::chrono::milliseconds initialDataDelay;

  std::mutex modeMutex;
  optional<string> peerMode;
};
}  // namespace vt

#endif  // __VT_SCREENCAP_CONTROL_HANDLER_H__
