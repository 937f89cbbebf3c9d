#ifndef __VT_SYSTEM_CONTROL_HANDLER_H__
#define __VT_SYSTEM_CONTROL_HANDLER_H__

#include "ControlHandler.hpp"
#include "TaskScheduler.hpp"

namespace vt {
/**
 * @brief system:ping, system:ready and system:repository-path-update.
 *
 * Also owns the repository base path and the path-sync switch.  An inbound
 * path update turns sync off immediately and back on after
 * pathSyncReenableDelay, so that the change is not echoed straight back to
 * the peer.
 */
class SystemControlHandler : public ControlHandler {
 public:
  typedef std::function<void(const string&)> ConfigUpdateCallback;
  typedef std::function<void()> ReadyCallback;
  typedef std::function<void(bool)> PathSyncListener;

  SystemControlHandler(shared_ptr<TaskScheduler> _scheduler,
                       std::chrono::milliseconds _pathSyncReenableDelay,
                       const string& initialRepositoryPath = "");

  ControlCategory getCategory() const override {
    return ControlCategory::SYSTEM;
  }
  optional<ControlMessage> handleMessage(const ControlMessage& message) override;

  void setConfigUpdateCallback(ConfigUpdateCallback callback);
  void setReadyCallback(ReadyCallback callback);
  /** @brief Told false when sync is suspended and true when it resumes. */
  void setPathSyncListener(PathSyncListener listener);

  /**
   * @brief Stores the path and runs the config update callback.
   * @return false if the callback threw.
   */
  bool updateRepositoryPath(const string& path);
  string getRepositoryPath();
  bool isPathSyncEnabled() const { return pathSyncEnabled; }

 protected:
  ControlMessage handleRepositoryPathUpdate(const ControlMessage& message);
  void setPathSyncEnabled(bool enabled);

  shared_ptr<TaskScheduler> scheduler;
  std::chrono::milliseconds pathSyncReenableDelay;

  std::mutex stateMutex;
  string repositoryPath;
  ConfigUpdateCallback configUpdateCallback;
  ReadyCallback readyCallback;
  PathSyncListener pathSyncListener;
  atomic<bool> pathSyncEnabled;
  // Bumped on every suspension so only the latest re-enable takes effect.
  atomic<uint64_t> pathSyncGeneration;
};
}  // namespace vt

#endif  // __VT_SYSTEM_CONTROL_HANDLER_H__
