#ifndef __VT_CONTROL_MESSAGE_H__
#define __VT_CONTROL_MESSAGE_H__

#include "Headers.hpp"

namespace vt {
enum class MessageType { REQUEST, RESPONSE, EVENT };

// UNKNOWN marks a category that is not part of the protocol.  The message
// keeps the wire string so it can be reported back.
enum class ControlCategory { TERMINAL, SCREENCAP, GIT, SYSTEM, UNKNOWN };

enum class TerminalAction { SPAWN };

enum class SystemAction { PING, READY, REPOSITORY_PATH_UPDATE };

enum class ScreencapAction {
  MAC_READY,
  READY,
  START_CAPTURE,
  OFFER,
  ANSWER,
  ICE_CANDIDATE,
  API_REQUEST,
  API_RESPONSE,
  STATE_CHANGE,
  BITRATE_ADJUSTMENT,
  GET_INITIAL_DATA,
  INITIAL_DATA,
  INITIAL_DATA_ERROR,
  ERROR_EVENT,
  PING,
  PONG
};

const char* toString(MessageType type);
const char* toString(ControlCategory category);
const char* toString(TerminalAction action);
const char* toString(SystemAction action);
const char* toString(ScreencapAction action);

/**
 * @brief Parsers for wire strings.  They return nullopt for values that are
 * not part of the protocol.
 */
optional<MessageType> parseMessageType(const string& s);
optional<ControlCategory> parseCategory(const string& s);
optional<TerminalAction> parseTerminalAction(const string& s);
optional<SystemAction> parseSystemAction(const string& s);
optional<ScreencapAction> parseScreencapAction(const string& s);

/**
 * @brief One message on the control channel.
 *
 * A response carries the id of the request it answers, and carries either an
 * error or a payload, never both.
 */
class ControlMessage {
 public:
  string id;
  MessageType type;
  ControlCategory category;
  /** @brief The wire string when category is UNKNOWN. */
  string unknownCategory;
  string action;
  optional<json> payload;
  optional<string> sessionId;
  optional<string> error;

  ControlMessage();

  /** @brief A new request with a fresh uuid. */
  static ControlMessage createRequest(ControlCategory category,
                                      const string& action,
                                      optional<json> payload = nullopt,
                                      optional<string> sessionId = nullopt);
  /** @brief A new event with a fresh uuid. */
  static ControlMessage createEvent(ControlCategory category,
                                    const string& action,
                                    optional<json> payload = nullopt,
                                    optional<string> sessionId = nullopt);
  /**
   * @brief A response to `request`, copying its id, category, action and
   * sessionId.  When `error` is set the payload is dropped.
   */
  static ControlMessage createResponse(const ControlMessage& request,
                                       optional<json> payload,
                                       optional<string> error = nullopt);
  static ControlMessage createErrorResponse(const ControlMessage& request,
                                            const string& error);

  /** @brief The category as it appears on the wire. */
  string categoryName() const;

  bool isRequest() const { return type == MessageType::REQUEST; }
  bool isResponse() const { return type == MessageType::RESPONSE; }
  bool isEvent() const { return type == MessageType::EVENT; }

  json toJson() const;
  string toJsonString() const;

  /**
   * @throws std::runtime_error if the object is missing a field or names an
   * unknown type.  An unknown category decodes to ControlCategory::UNKNOWN.
   */
  static ControlMessage fromJson(const json& j);
  /**
   * @throws std::runtime_error on invalid JSON or an invalid message shape.
   */
  static ControlMessage fromJsonString(const string& s);

  /** @brief Short form for logs: "category:action type id". */
  string summary() const;

  bool operator==(const ControlMessage& other) const;
  bool operator!=(const ControlMessage& other) const {
    return !(*this == other);
  }
};

inline std::ostream& operator<<(std::ostream& os, const ControlMessage& m) {
  os << m.summary();
  return os;
}
}  // namespace vt

#endif  // __VT_CONTROL_MESSAGE_H__
