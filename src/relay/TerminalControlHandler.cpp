#include "TerminalControlHandler.hpp"

namespace vt {
namespace {
optional<string> stringField(const json& payload, const char* key) {
  if (!payload.is_object()) {
    return nullopt;
  }
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_string() ||
      it->get<string>().empty()) {
    return nullopt;
  }
  return it->get<string>();
}
}  // namespace

TerminalControlHandler::TerminalControlHandler(
    shared_ptr<SubprocessUtils> _subprocessUtils, const string& _launcher)
    : subprocessUtils(_subprocessUtils), launcher(_launcher) {}

optional<ControlMessage> TerminalControlHandler::handleMessage(
    const ControlMessage& message) {
  LOG(INFO) << "Terminal handler: " << message.action;
  auto action = parseTerminalAction(message.action);
  if (!action) {
    return ControlMessage::createErrorResponse(
        message, "Unknown terminal action: " + message.action);
  }
  switch (*action) {
    case TerminalAction::SPAWN:
      return handleSpawn(message);
  }
  return nullopt;
}

vector<string> TerminalControlHandler::buildSpawnArguments(
    const json& payload, const optional<string>& sessionId) {
  vector<string> args = {"launch"};

  auto workingDirectory = stringField(payload, "workingDirectory");
  if (workingDirectory) {
    args.push_back("--working-directory");
    args.push_back(*workingDirectory);
  }
  auto command = stringField(payload, "command");
  if (command) {
    args.push_back("--command");
    args.push_back(*command);
  }

  auto payloadSession = stringField(payload, "sessionId");
  if (!payloadSession && sessionId && !sessionId->empty()) {
    payloadSession = sessionId;
  }
  if (!payloadSession) {
    throw std::runtime_error("Missing sessionId in spawn request");
  }
  args.push_back("--session-id");
  args.push_back(*payloadSession);

  auto terminal = stringField(payload, "terminalPreference");
  if (terminal) {
    args.push_back("--terminal");
    args.push_back(*terminal);
  }
  return args;
}

ControlMessage TerminalControlHandler::handleSpawn(
    const ControlMessage& message) {
  try {
    auto args = buildSpawnArguments(
        message.payload ? *message.payload : json::object(), message.sessionId);
    LOG(INFO) << "Spawning terminal: " << launcher << " "
              << previewString(json(args).dump(), 256);
    subprocessUtils->spawnDetached(launcher, args);
    return ControlMessage::createResponse(message, json{{"success", true}});
  } catch (const std::exception& e) {
    LOG(ERROR) << "Failed to spawn terminal: " << e.what();
    return ControlMessage::createErrorResponse(message, e.what());
  }
}
}  // namespace vt
