#ifndef __VT_CONTROL_HANDLER_H__
#define __VT_CONTROL_HANDLER_H__

#include "ControlMessage.hpp"
#include "Headers.hpp"

namespace vt {
/**
 * @brief Handles the peer's requests and events for one category.
 *
 * handleMessage returns the response to send back, or nullopt when there is
 * nothing to send.  Unknown actions produce an error response rather than an
 * exception.  Any exception that does escape is converted by the dispatcher.
 */
class ControlHandler {
 public:
  virtual ~ControlHandler() {}

  virtual ControlCategory getCategory() const = 0;
  virtual optional<ControlMessage> handleMessage(
      const ControlMessage& message) = 0;
};

/**
 * @brief The relay's view of the host peer, as seen by the handlers and the
 * browser relay.
 */
class PeerLink {
 public:
  virtual ~PeerLink() {}

  virtual bool isPeerConnected() = 0;
  /** @return false if the message could not be written to a live peer. */
  virtual bool sendToPeer(const ControlMessage& message) = 0;
  /**
   * @brief Runs a locally built message through the same dispatch path as
   * one read from the peer.
   */
  virtual void injectPeerMessage(const ControlMessage& message) = 0;
};
}  // namespace vt

#endif  // __VT_CONTROL_HANDLER_H__
