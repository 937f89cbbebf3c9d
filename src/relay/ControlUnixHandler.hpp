#ifndef __VT_CONTROL_UNIX_HANDLER_H__
#define __VT_CONTROL_UNIX_HANDLER_H__

#include "BrowserRelay.hpp"
#include "ControlHandler.hpp"
#include "ControlUnixServer.hpp"
#include "Headers.hpp"
#include "RelayConfig.hpp"
#include "RequestCorrelator.hpp"
#include "ScreencapControlHandler.hpp"
#include "SubprocessUtils.hpp"
#include "SystemControlHandler.hpp"
#include "TaskScheduler.hpp"
#include "TerminalControlHandler.hpp"
#include "WebSocketBrowserServer.hpp"

namespace vt {
/**
 * @brief The control relay: owns the control socket, the handlers, the
 * request correlator and the browser side, and routes messages between them.
 *
 * Messages from the host peer are routed in this order:
 * - responses resolve a pending relay request, else screencap responses go to
 *   the browsers, else they are dropped;
 * - requests and events go to the handler for their category, and a
 *   request's response is written back to the peer.
 */
class ControlUnixHandler : public ControlUnixServer::PeerListener,
                           public PeerLink {
 public:
  ControlUnixHandler(const RelayConfig& _config,
                     shared_ptr<PipeSocketHandler> _socketHandler,
                     shared_ptr<SubprocessUtils> _subprocessUtils);
  virtual ~ControlUnixHandler();

  /**
   * @brief Starts the control socket, and the WebSocket listener when a
   * WebSocket port is configured.
   * @throws std::runtime_error if either cannot be bound.
   */
  void start();

  /** @brief Runs poll() until requestStop(), then shuts down. */
  void run();
  /** @brief One loop iteration: socket I/O, request timeouts, timers. */
  void poll(int timeoutMs);
  /** @brief Makes run() return.  Safe to call from a signal handler. */
  void requestStop() { running = false; }
  /**
   * @brief Stops the WebSocket listener, resolves pending requests with
   * nullopt, drops timers and closes the control socket.
   */
  void shutdown();

  /** @brief Routes one message from the host peer. */
  void dispatchPeerMessage(const ControlMessage& message);

  /**
   * @brief Sends a request to the peer and returns a future for its
   * response, which becomes nullopt on timeout or if the send fails.
   */
  std::future<optional<ControlMessage>> sendControlMessage(
      const ControlMessage& message);

  /**
   * @brief Changes the repository base path from the server side and, unless
   * path sync is suspended, tells the peer.
   * @return false if the config update callback threw.
   */
  bool updateRepositoryPath(const string& path);
  string getRepositoryPath();
  void setConfigUpdateCallback(SystemControlHandler::ConfigUpdateCallback cb);

  // PeerLink
  bool isPeerConnected() override;
  bool sendToPeer(const ControlMessage& message) override;
  void injectPeerMessage(const ControlMessage& message) override;

  // ControlUnixServer::PeerListener
  void onPeerMessage(const ControlMessage& message) override;
  void onPeerDisconnected() override;

  shared_ptr<BrowserRelay> getBrowserRelay() { return browserRelay; }
  shared_ptr<RequestCorrelator> getRequestCorrelator() { return correlator; }
  shared_ptr<TaskScheduler> getScheduler() { return scheduler; }
  shared_ptr<SystemControlHandler> getSystemHandler() { return systemHandler; }
  shared_ptr<ScreencapControlHandler> getScreencapHandler() {
    return screencapHandler;
  }
  shared_ptr<ControlUnixServer> getServer() { return server; }
  const SocketEndpoint& getSocketEndpoint() const { return socketEndpoint; }

 protected:
  void registerHandler(shared_ptr<ControlHandler> handler);
  void replyToPeer(const ControlMessage& response);

  RelayConfig config;
  SocketEndpoint socketEndpoint;
  shared_ptr<TaskScheduler> scheduler;
  shared_ptr<RequestCorrelator> correlator;
  shared_ptr<ControlUnixServer> server;
  shared_ptr<BrowserRelay> browserRelay;
  shared_ptr<SystemControlHandler> systemHandler;
  shared_ptr<ScreencapControlHandler> screencapHandler;
  shared_ptr<TerminalControlHandler> terminalHandler;
  map<ControlCategory, shared_ptr<ControlHandler>> handlers;
  unique_ptr<WebSocketBrowserServer> webSocketServer;
  atomic<bool> running;
};
}  // namespace vt

#endif  // __VT_CONTROL_UNIX_HANDLER_H__
