#include "RequestCorrelator.hpp"

namespace vt {
RequestCorrelator::RequestCorrelator(std::chrono::milliseconds _timeout)
    : timeout(_timeout) {}

RequestCorrelator::~RequestCorrelator() { cancelAll(); }

std::future<optional<ControlMessage>> RequestCorrelator::registerRequest(
    const string& id) {
  auto request = make_shared<PendingRequest>();
  request->deadline = Clock::now() + timeout;
  auto future = request->promise.get_future();

  shared_ptr<PendingRequest> displaced;
  {
    lock_guard<std::mutex> guard(pendingMutex);
    auto it = pending.find(id);
    if (it != pending.end()) {
      displaced = it->second;
      it->second = request;
    } else {
      pending.insert(make_pair(id, request));
    }
  }
  if (displaced) {
    LOG(WARNING) << "Request id " << id
                 << " registered twice, abandoning the older waiter";
    displaced->promise.set_value(nullopt);
  }
  return future;
}

bool RequestCorrelator::resolve(const ControlMessage& response) {
  shared_ptr<PendingRequest> request;
  {
    lock_guard<std::mutex> guard(pendingMutex);
    auto it = pending.find(response.id);
    if (it == pending.end()) {
      return false;
    }
    request = it->second;
    pending.erase(it);
  }
  VLOG(1) << "Resolving pending request " << response.id;
  request->promise.set_value(response);
  return true;
}

bool RequestCorrelator::cancel(const string& id) {
  shared_ptr<PendingRequest> request;
  {
    lock_guard<std::mutex> guard(pendingMutex);
    auto it = pending.find(id);
    if (it == pending.end()) {
      return false;
    }
    request = it->second;
    pending.erase(it);
  }
  request->promise.set_value(nullopt);
  return true;
}

int RequestCorrelator::expire(Clock::time_point now) {
  vector<pair<string, shared_ptr<PendingRequest>>> expired;
  {
    lock_guard<std::mutex> guard(pendingMutex);
    for (auto it = pending.begin(); it != pending.end();) {
      if (it->second->deadline <= now) {
        expired.push_back(*it);
        it = pending.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& it : expired) {
    LOG(WARNING) << "Request " << it.first << " timed out after "
                 << timeout.count() << " ms";
    it.second->promise.set_value(nullopt);
  }
  return int(expired.size());
}

void RequestCorrelator::cancelAll() {
  unordered_map<string, shared_ptr<PendingRequest>> cancelled;
  {
    lock_guard<std::mutex> guard(pendingMutex);
    cancelled.swap(pending);
  }
  if (!cancelled.empty()) {
    LOG(INFO) << "Cancelling " << cancelled.size() << " pending requests";
  }
  for (auto& it : cancelled) {
    it.second->promise.set_value(nullopt);
  }
}

size_t RequestCorrelator::pendingCount() {
  lock_guard<std::mutex> guard(pendingMutex);
  return pending.size();
}

bool RequestCorrelator::isPending(const string& id) {
  lock_guard<std::mutex> guard(pendingMutex);
  return pending.find(id) != pending.end();
}
}  // namespace vt
