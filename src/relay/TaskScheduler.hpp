#ifndef __VT_TASK_SCHEDULER_H__
#define __VT_TASK_SCHEDULER_H__

#include "Headers.hpp"

namespace vt {
/**
 * @brief Single-shot delayed callbacks, run by whoever calls runDue().
 *
 * The relay loop calls runDue() every iteration, so tasks execute on the loop
 * thread.  Tasks that come due together run in the order they were scheduled.
 */
class TaskScheduler {
 public:
  typedef std::chrono::steady_clock Clock;
  typedef std::function<void()> Task;

  TaskScheduler();

  void schedule(std::chrono::milliseconds delay, Task task);

  /**
   * @brief Runs every task due at or before now.  Tasks scheduled by a
   * running task wait for the next call.
   * @return The number of tasks run.
   */
  int runDue(Clock::time_point now);
  int runDue() { return runDue(Clock::now()); }

  /** @brief Drops all scheduled tasks without running them. */
  void clear();

  size_t pendingCount();

 protected:
  std::mutex taskMutex;
  // Keyed by (deadline, sequence) to keep scheduling order on ties.
  map<pair<Clock::time_point, uint64_t>, Task> tasks;
  uint64_t nextSequence;
};
}  // namespace vt

#endif  // __VT_TASK_SCHEDULER_H__
