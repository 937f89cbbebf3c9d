#include "ControlMessage.hpp"

namespace vt {
namespace {
template <typename T, size_t N>
optional<T> parseFrom(const std::array<T, N>& values, const string& s) {
  for (auto value : values) {
    if (s == toString(value)) {
      return value;
    }
  }
  return nullopt;
}

const std::array<MessageType, 3> ALL_TYPES = {
    MessageType::REQUEST, MessageType::RESPONSE, MessageType::EVENT};

const std::array<ControlCategory, 4> ALL_CATEGORIES = {
    ControlCategory::TERMINAL, ControlCategory::SCREENCAP, ControlCategory::GIT,
    ControlCategory::SYSTEM};

const std::array<TerminalAction, 1> ALL_TERMINAL_ACTIONS = {
    TerminalAction::SPAWN};

const std::array<SystemAction, 3> ALL_SYSTEM_ACTIONS = {
    SystemAction::PING, SystemAction::READY,
    SystemAction::REPOSITORY_PATH_UPDATE};

const std::array<ScreencapAction, 16> ALL_SCREENCAP_ACTIONS = {
    ScreencapAction::MAC_READY,        ScreencapAction::READY,
    ScreencapAction::START_CAPTURE,    ScreencapAction::OFFER,
    ScreencapAction::ANSWER,           ScreencapAction::ICE_CANDIDATE,
    ScreencapAction::API_REQUEST,      ScreencapAction::API_RESPONSE,
    ScreencapAction::STATE_CHANGE,     ScreencapAction::BITRATE_ADJUSTMENT,
    ScreencapAction::GET_INITIAL_DATA, ScreencapAction::INITIAL_DATA,
    ScreencapAction::INITIAL_DATA_ERROR, ScreencapAction::ERROR_EVENT,
    ScreencapAction::PING,             ScreencapAction::PONG};

string requireString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) {
    throw std::runtime_error(string("Missing field: ") + key);
  }
  if (!it->is_string()) {
    throw std::runtime_error(string("Field is not a string: ") + key);
  }
  return it->get<string>();
}

optional<string> optionalString(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null()) {
    return nullopt;
  }
  if (!it->is_string()) {
    throw std::runtime_error(string("Field is not a string: ") + key);
  }
  return it->get<string>();
}
}  // namespace

const char* toString(MessageType type) {
  switch (type) {
    case MessageType::REQUEST:
      return "request";
    case MessageType::RESPONSE:
      return "response";
    case MessageType::EVENT:
      return "event";
  }
  return "";
}

const char* toString(ControlCategory category) {
  switch (category) {
    case ControlCategory::TERMINAL:
      return "terminal";
    case ControlCategory::SCREENCAP:
      return "screencap";
    case ControlCategory::GIT:
      return "git";
    case ControlCategory::SYSTEM:
      return "system";
    case ControlCategory::UNKNOWN:
      return "unknown";
  }
  return "";
}

const char* toString(TerminalAction action) {
  switch (action) {
    case TerminalAction::SPAWN:
      return "spawn";
  }
  return "";
}

const char* toString(SystemAction action) {
  switch (action) {
    case SystemAction::PING:
      return "ping";
    case SystemAction::READY:
      return "ready";
    case SystemAction::REPOSITORY_PATH_UPDATE:
      return "repository-path-update";
  }
  return "";
}

const char* toString(ScreencapAction action) {
  switch (action) {
    case ScreencapAction::MAC_READY:
      return "mac-ready";
    case ScreencapAction::READY:
      return "ready";
    case ScreencapAction::START_CAPTURE:
      return "start-capture";
    case ScreencapAction::OFFER:
      return "offer";
    case ScreencapAction::ANSWER:
      return "answer";
    case ScreencapAction::ICE_CANDIDATE:
      return "ice-candidate";
    case ScreencapAction::API_REQUEST:
      return "api-request";
    case ScreencapAction::API_RESPONSE:
      return "api-response";
    case ScreencapAction::STATE_CHANGE:
      return "state-change";
    case ScreencapAction::BITRATE_ADJUSTMENT:
      return "bitrate-adjustment";
    case ScreencapAction::GET_INITIAL_DATA:
      return "get-initial-data";
    case ScreencapAction::INITIAL_DATA:
      return "initial-data";
    case ScreencapAction::INITIAL_DATA_ERROR:
      return "initial-data-error";
    case ScreencapAction::ERROR_EVENT:
      return "error";
    case ScreencapAction::PING:
      return "ping";
    case ScreencapAction::PONG:
      return "pong";
  }
  return "";
}

optional<MessageType> parseMessageType(const string& s) {
  return parseFrom(ALL_TYPES, s);
}

optional<ControlCategory> parseCategory(const string& s) {
  return parseFrom(ALL_CATEGORIES, s);
}

optional<TerminalAction> parseTerminalAction(const string& s) {
  return parseFrom(ALL_TERMINAL_ACTIONS, s);
}

optional<SystemAction> parseSystemAction(const string& s) {
  return parseFrom(ALL_SYSTEM_ACTIONS, s);
}

optional<ScreencapAction> parseScreencapAction(const string& s) {
  return parseFrom(ALL_SCREENCAP_ACTIONS, s);
}

ControlMessage::ControlMessage()
    : type(MessageType::EVENT), category(ControlCategory::SYSTEM) {}

ControlMessage ControlMessage::createRequest(ControlCategory category,
                                             const string& action,
                                             optional<json> payload,
                                             optional<string> sessionId) {
  ControlMessage m;
  m.id = sole::uuid4().str();
  m.type = MessageType::REQUEST;
  m.category = category;
  m.action = action;
  m.payload = std::move(payload);
  m.sessionId = std::move(sessionId);
  return m;
}

ControlMessage ControlMessage::createEvent(ControlCategory category,
                                           const string& action,
                                           optional<json> payload,
                                           optional<string> sessionId) {
  ControlMessage m = createRequest(category, action, std::move(payload),
                                   std::move(sessionId));
  m.type = MessageType::EVENT;
  return m;
}

ControlMessage ControlMessage::createResponse(const ControlMessage& request,
                                              optional<json> payload,
                                              optional<string> error) {
  ControlMessage m;
  m.id = request.id;
  m.type = MessageType::RESPONSE;
  m.category = request.category;
  m.unknownCategory = request.unknownCategory;
  m.action = request.action;
  m.sessionId = request.sessionId;
  if (error) {
    m.error = std::move(error);
  } else {
    m.payload = std::move(payload);
  }
  return m;
}

ControlMessage ControlMessage::createErrorResponse(const ControlMessage& request,
                                                   const string& error) {
  return createResponse(request, nullopt, error);
}

json ControlMessage::toJson() const {
  json j = {{"id", id},
            {"type", toString(type)},
            {"category", categoryName()},
            {"action", action}};
  if (payload) {
    j["payload"] = *payload;
  }
  if (sessionId) {
    j["sessionId"] = *sessionId;
  }
  if (error) {
    j["error"] = *error;
  }
  return j;
}

string ControlMessage::toJsonString() const { return toJson().dump(); }

ControlMessage ControlMessage::fromJson(const json& j) {
  if (!j.is_object()) {
    throw std::runtime_error("Control message is not a JSON object");
  }
  ControlMessage m;
  m.id = requireString(j, "id");

  string typeString = requireString(j, "type");
  auto type = parseMessageType(typeString);
  if (!type) {
    throw std::runtime_error("Unknown message type: " + typeString);
  }
  m.type = *type;

  string categoryString = requireString(j, "category");
  auto category = parseCategory(categoryString);
  if (category) {
    m.category = *category;
  } else {
    m.category = ControlCategory::UNKNOWN;
    m.unknownCategory = categoryString;
  }

  m.action = requireString(j, "action");

  auto payloadIt = j.find("payload");
  if (payloadIt != j.end() && !payloadIt->is_null()) {
    m.payload = *payloadIt;
  }
  m.sessionId = optionalString(j, "sessionId");
  m.error = optionalString(j, "error");
  return m;
}

ControlMessage ControlMessage::fromJsonString(const string& s) {
  json j;
  try {
    j = json::parse(s);
  } catch (const json::parse_error& pe) {
    throw std::runtime_error(string("Invalid JSON: ") + pe.what());
  }
  return fromJson(j);
}

string ControlMessage::categoryName() const {
  if (category == ControlCategory::UNKNOWN) {
    return unknownCategory;
  }
  return toString(category);
}

string ControlMessage::summary() const {
  return categoryName() + ":" + action + " " + toString(type) +
         " " + id;
}

bool ControlMessage::operator==(const ControlMessage& other) const {
  return id == other.id && type == other.type && category == other.category &&
         categoryName() == other.categoryName() && action == other.action && payload == other.payload &&
         sessionId == other.sessionId && error == other.error;
}
}  // namespace vt
