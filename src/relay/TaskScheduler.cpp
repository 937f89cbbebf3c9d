#include "TaskScheduler.hpp"

namespace vt {
TaskScheduler::TaskScheduler() : nextSequence(0) {}

void TaskScheduler::schedule(std::chrono::milliseconds delay, Task task) {
  lock_guard<std::mutex> guard(taskMutex);
  tasks.insert(
      make_pair(make_pair(Clock::now() + delay, nextSequence++), std::move(task)));
}

int TaskScheduler::runDue(Clock::time_point now) {
  vector<Task> due;
  {
    lock_guard<std::mutex> guard(taskMutex);
    auto it = tasks.begin();
    while (it != tasks.end() && it->first.first <= now) {
      due.push_back(std::move(it->second));
      it = tasks.erase(it);
    }
  }
  for (auto& task : due) {
    try {
      task();
    } catch (const std::exception& e) {
      STERROR << "Scheduled task failed: " << e.what();
    }
  }
  return int(due.size());
}

void TaskScheduler::clear() {
  lock_guard<std::mutex> guard(taskMutex);
  if (!tasks.empty()) {
    VLOG(1) << "Dropping " << tasks.size() << " scheduled tasks";
  }
  tasks.clear();
}

size_t TaskScheduler::pendingCount() {
  lock_guard<std::mutex> guard(taskMutex);
  return tasks.size();
}
}  // namespace vt
