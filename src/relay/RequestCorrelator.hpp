#ifndef __VT_REQUEST_CORRELATOR_H__
#define __VT_REQUEST_CORRELATOR_H__

#include "ControlMessage.hpp"
#include "Headers.hpp"

namespace vt {
/**
 * @brief Matches responses from the host peer to requests sent by the relay.
 *
 * Each pending request holds a promise and a deadline.  The promise is
 * fulfilled with the response, or with nullopt once the deadline passes.
 */
class RequestCorrelator {
 public:
  typedef std::chrono::steady_clock Clock;

  explicit RequestCorrelator(std::chrono::milliseconds _timeout);
  ~RequestCorrelator();

  /**
   * @brief Starts waiting for a response with this id.  Registering an id
   * that is already pending resolves the older waiter with nullopt.
   */
  std::future<optional<ControlMessage>> registerRequest(const string& id);

  /**
   * @brief Fulfills the waiter for response.id.
   * @return false if nothing was waiting for that id.
   */
  bool resolve(const ControlMessage& response);

  /** @brief Resolves one waiter with nullopt, e.g. when the send failed. */
  bool cancel(const string& id);

  /** @brief Resolves every waiter whose deadline is at or before now. */
  int expire(Clock::time_point now);
  int expire() { return expire(Clock::now()); }

  /** @brief Resolves every waiter with nullopt. */
  void cancelAll();

  size_t pendingCount();
  bool isPending(const string& id);
  std::chrono::milliseconds getTimeout() const { return timeout; }

 protected:
  struct PendingRequest {
    std::promise<optional<ControlMessage>> promise;
    Clock::time_point deadline;
  };

  std::chrono::milliseconds timeout;
  std::mutex pendingMutex;
  unordered_map<string, shared_ptr<PendingRequest>> pending;
};
}  // namespace vt

#endif  // __VT_REQUEST_CORRELATOR_H__
