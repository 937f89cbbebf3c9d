#ifndef __VT_TERMINAL_CONTROL_HANDLER_H__
#define __VT_TERMINAL_CONTROL_HANDLER_H__

#include "ControlHandler.hpp"
#include "SubprocessUtils.hpp"

namespace vt {
/**
 * @brief terminal:spawn, which opens a new terminal window attached to a
 * session by running `<launcher> launch ...` detached from the relay.
 */
class TerminalControlHandler : public ControlHandler {
 public:
  TerminalControlHandler(shared_ptr<SubprocessUtils> _subprocessUtils,
                         const string& _launcher);

  ControlCategory getCategory() const override {
    return ControlCategory::TERMINAL;
  }
  optional<ControlMessage> handleMessage(const ControlMessage& message) override;

  /**
   * @brief Builds the launcher arguments for a spawn payload.
   * @throws std::runtime_error if no session id is available.
   */
  static vector<string> buildSpawnArguments(const json& payload,
                                            const optional<string>& sessionId);

 protected:
  ControlMessage handleSpawn(const ControlMessage& message);

  shared_ptr<SubprocessUtils> subprocessUtils;
  string launcher;
};
}  // namespace vt

#endif  // __VT_TERMINAL_CONTROL_HANDLER_H__
