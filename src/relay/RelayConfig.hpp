#ifndef __VT_RELAY_CONFIG_H__
#define __VT_RELAY_CONFIG_H__

#include "Headers.hpp"

namespace vt {
/**
 * @brief Every tunable of the relay, with defaults.
 */
struct RelayConfig {
  /** @brief Empty means the default from ControlSocketPath. */
  string socketPath;
  /** @brief How long the peer has to answer a relay request. */
  std::chrono::milliseconds requestTimeout{10000};
  /** @brief Settle time after mac-ready before asking for initial data. */
  std::chrono::milliseconds initialDataDelay{100};
  /** @brief Path-sync suppression window after an inbound path update. */
  std::chrono::milliseconds pathSyncReenableDelay{500};
  int receiveBufferSize = 1024 * 1024;
  size_t maxWriteBacklog = 16 * 1024 * 1024;

  int websocketPort = 4021;
  string websocketBindAddress = "127.0.0.1";

  string terminalLauncher = "vibetunnel";
  string repositoryPath;

  int verbose = 0;
  bool silent = false;
  string maxLogSize = "20971520";

  /**
   * @brief Overlays the values present in an INI file.
   * @throws std::runtime_error if the file cannot be read or a numeric value
   * is malformed.
   */
  void loadFromIni(const string& filename);
};
}  // namespace vt

#endif  // __VT_RELAY_CONFIG_H__
