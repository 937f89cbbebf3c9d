#include "SystemControlHandler.hpp"

namespace vt {
SystemControlHandler::SystemControlHandler(
    shared_ptr<TaskScheduler> _scheduler,
    std::chrono::milliseconds _pathSyncReenableDelay,
    const string& initialRepositoryPath)
    : scheduler(_scheduler),
      pathSyncReenableDelay(_pathSyncReenableDelay),
      repositoryPath(initialRepositoryPath),
      pathSyncEnabled(true),
      pathSyncGeneration(0) {}

void SystemControlHandler::setConfigUpdateCallback(
    ConfigUpdateCallback callback) {
  lock_guard<std::mutex> guard(stateMutex);
  configUpdateCallback = callback;
}

void SystemControlHandler::setReadyCallback(ReadyCallback callback) {
  lock_guard<std::mutex> guard(stateMutex);
  readyCallback = callback;
}

void SystemControlHandler::setPathSyncListener(PathSyncListener listener) {
  lock_guard<std::mutex> guard(stateMutex);
  pathSyncListener = listener;
}

string SystemControlHandler::getRepositoryPath() {
  lock_guard<std::mutex> guard(stateMutex);
  return repositoryPath;
}

bool SystemControlHandler::updateRepositoryPath(const string& path) {
  ConfigUpdateCallback callback;
  {
    lock_guard<std::mutex> guard(stateMutex);
    repositoryPath = path;
    callback = configUpdateCallback;
  }
  if (!callback) {
    return true;
  }
  try {
    callback(path);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Config update callback failed for " << path << ": "
               << e.what();
    return false;
  }
  return true;
}

void SystemControlHandler::setPathSyncEnabled(bool enabled) {
  pathSyncEnabled = enabled;
  PathSyncListener listener;
  {
    lock_guard<std::mutex> guard(stateMutex);
    listener = pathSyncListener;
  }
  VLOG(1) << "Repository path sync " << (enabled ? "enabled" : "disabled");
  if (listener) {
    listener(enabled);
  }
}

optional<ControlMessage> SystemControlHandler::handleMessage(
    const ControlMessage& message) {
  VLOG(1) << "System handler: " << message;
  auto action = parseSystemAction(message.action);
  if (!action) {
    LOG(WARNING) << "Unknown system action: " << message.action;
    return ControlMessage::createErrorResponse(
        message, "Unknown action: " + message.action);
  }

  switch (*action) {
    case SystemAction::PING:
      return ControlMessage::createResponse(message, json{{"status", "ok"}});
    case SystemAction::READY: {
      LOG(INFO) << "Host peer reports ready";
      ReadyCallback callback;
      {
        lock_guard<std::mutex> guard(stateMutex);
        callback = readyCallback;
      }
      if (callback) {
        callback();
      }
      return nullopt;
    }
    case SystemAction::REPOSITORY_PATH_UPDATE:
      return handleRepositoryPathUpdate(message);
  }
  return nullopt;
}

ControlMessage SystemControlHandler::handleRepositoryPathUpdate(
    const ControlMessage& message) {
  if (!message.payload || !message.payload->is_object() ||
      !message.payload->contains("path") ||
      !(*message.payload)["path"].is_string()) {
    LOG(WARNING) << "Repository path update without a path: " << message;
    return ControlMessage::createErrorResponse(message,
                                               "Missing path in payload");
  }
  string path = (*message.payload)["path"].get<string>();
  LOG(INFO) << "Repository path update from peer: " << path;

  // Suspend outbound sync so this change is not echoed back to the peer.
  uint64_t generation = ++pathSyncGeneration;
  setPathSyncEnabled(false);
  scheduler->schedule(pathSyncReenableDelay, [this, generation]() {
    if (pathSyncGeneration == generation) {
      setPathSyncEnabled(true);
    }
  });

  if (!updateRepositoryPath(path)) {
    return ControlMessage::createErrorResponse(
        message, "Failed to update repository path");
  }
  return ControlMessage::createResponse(message,
                                        json{{"success", true}, {"path", path}});
}
}  // namespace vt
