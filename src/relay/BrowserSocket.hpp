#ifndef __VT_BROWSER_SOCKET_H__
#define __VT_BROWSER_SOCKET_H__

#include "Headers.hpp"

namespace vt {
/**
 * @brief A browser connection that accepts whole text messages.
 */
class BrowserSocket {
 public:
  virtual ~BrowserSocket() {}

  virtual const string& getId() const = 0;
  /** @return false if the text could not be handed to the transport. */
  virtual bool send(const string& text) = 0;
  virtual bool isOpen() const = 0;
};
}  // namespace vt

#endif  // __VT_BROWSER_SOCKET_H__
