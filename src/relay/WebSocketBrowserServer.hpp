#ifndef __VT_WEBSOCKET_BROWSER_SERVER_H__
#define __VT_WEBSOCKET_BROWSER_SERVER_H__

#include <rtc/rtc.hpp>

#include "BrowserRelay.hpp"
#include "BrowserSocket.hpp"
#include "Headers.hpp"

namespace vt {
/**
 * @brief BrowserSocket over a libdatachannel WebSocket.
 */
class RtcBrowserSocket : public BrowserSocket {
 public:
  explicit RtcBrowserSocket(shared_ptr<rtc::WebSocket> _webSocket);

  const string& getId() const override { return id; }
  bool send(const string& text) override;
  bool isOpen() const override;
  void close();

 protected:
  string id;
  shared_ptr<rtc::WebSocket> webSocket;
};

/**
 * @brief Accepts browser WebSocket connections and feeds them to a
 * BrowserRelay.  Callbacks arrive on libdatachannel's threads.
 */
class WebSocketBrowserServer {
 public:
  WebSocketBrowserServer(shared_ptr<BrowserRelay> _browserRelay,
                         const SocketEndpoint& _endpoint);
  ~WebSocketBrowserServer();

  /** @throws std::runtime_error if the port cannot be bound. */
  void start();
  void stop();

  bool isRunning();
  /** @brief The bound port, useful when the endpoint asked for port 0. */
  int getPort();

 protected:
  void onClient(shared_ptr<rtc::WebSocket> webSocket);

  shared_ptr<BrowserRelay> browserRelay;
  SocketEndpoint endpoint;

  std::mutex serverMutex;
  unique_ptr<rtc::WebSocketServer> server;
  map<string, shared_ptr<RtcBrowserSocket>> sockets;
};
}  // namespace vt

#endif  // __VT_WEBSOCKET_BROWSER_SERVER_H__
