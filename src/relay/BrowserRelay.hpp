#ifndef __VT_BROWSER_RELAY_H__
#define __VT_BROWSER_RELAY_H__

#include "BrowserSocket.hpp"
#include "ControlHandler.hpp"
#include "Headers.hpp"

namespace vt {
/**
 * @brief Registry of connected browsers and the screencap forwarding rules
 * between them and the host peer.
 *
 * Peer traffic fans out to every registered browser, except responses to a
 * request that a specific browser forwarded, which go back to that browser
 * only.  Methods may be called from WebSocket threads and the relay loop.
 */
class BrowserRelay {
 public:
  explicit BrowserRelay(PeerLink* _peerLink);

  /**
   * @brief Registers a browser, greets it with screencap:ready and, if the
   * peer is already up, replays mac-ready so the capture handshake starts.
   */
  void addBrowser(shared_ptr<BrowserSocket> socket);
  void removeBrowser(const string& browserId);

  /** @brief Handles one text frame from a browser. */
  void onBrowserMessage(const string& browserId, const string& text);

  /** @return The number of browsers the message was delivered to. */
  int broadcast(const ControlMessage& message);
  bool sendTo(const string& browserId, const ControlMessage& message);

  /**
   * @brief Delivers a peer response: to the browser whose request it
   * answers, otherwise to every browser.
   */
  int routeResponse(const ControlMessage& response);

  /** @brief Forgets requests the peer can no longer answer. */
  void clearForwardedRequests();

  size_t browserCount();
  vector<string> getBrowserIds();

 protected:
  void sendParseError(const string& browserId, const string& error);
  void replyWithError(const string& browserId, const ControlMessage& request,
                      const string& error);

  PeerLink* peerLink;
  std::mutex browserMutex;
  map<string, shared_ptr<BrowserSocket>> browsers;
  // request id -> browser id, for screencap requests sent on to the peer
  unordered_map<string, string> forwardedRequests;
};
}  // namespace vt

#endif  // __VT_BROWSER_RELAY_H__
