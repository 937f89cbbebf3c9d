#include "RelayConfig.hpp"

#include "SimpleIni.h"

namespace vt {
namespace {
int64_t parseInteger(const char* section, const char* key, const char* value) {
  try {
    size_t consumed = 0;
    long long parsed = std::stoll(value, &consumed);
    if (consumed != strlen(value) || parsed < 0) {
      throw std::invalid_argument(value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid value for [") + section + "] " +
                             key + ": " + value);
  }
}

optional<int64_t> readInteger(const CSimpleIniA& ini, const char* section,
                              const char* key) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return nullopt;
  }
  return parseInteger(section, key, value);
}

optional<int64_t> readIntegerInRange(const CSimpleIniA& ini,
                                     const char* section, const char* key,
                                     int64_t minValue, int64_t maxValue) {
  auto value = readInteger(ini, section, key);
  if (value && (*value < minValue || *value > maxValue)) {
    throw std::runtime_error(string("Value for [") + section + "] " + key +
                             " must be between " + to_string(minValue) +
                             " and " + to_string(maxValue) + ": " +
                             to_string(*value));
  }
  return value;
}

optional<string> readString(const CSimpleIniA& ini, const char* section,
                            const char* key) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value == NULL) {
    return nullopt;
  }
  return string(value);
}
}  // namespace

void RelayConfig::loadFromIni(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }

  if (auto v = readString(ini, "ControlSocket", "path")) {
    socketPath = *v;
  }
  if (auto v = readInteger(ini, "ControlSocket", "request_timeout_ms")) {
    requestTimeout = std::chrono::milliseconds(*v);
  }
  if (auto v = readInteger(ini, "ControlSocket", "initial_data_delay_ms")) {
    initialDataDelay = std::chrono::milliseconds(*v);
  }
  if (auto v = readInteger(ini, "ControlSocket", "path_sync_reenable_ms")) {
    pathSyncReenableDelay = std::chrono::milliseconds(*v);
  }
  if (auto v = readIntegerInRange(ini, "ControlSocket", "receive_buffer_size",
                                  1, std::numeric_limits<int>::max())) {
    receiveBufferSize = int(*v);
  }
  if (auto v = readIntegerInRange(ini, "ControlSocket", "max_write_backlog",
                                  1, std::numeric_limits<int64_t>::max())) {
    maxWriteBacklog = size_t(*v);
  }

  if (auto v = readIntegerInRange(ini, "WebSocket", "port", 0, 65535)) {
    websocketPort = int(*v);
  }
  if (auto v = readString(ini, "WebSocket", "bind_ip")) {
    websocketBindAddress = *v;
  }

  if (auto v = readString(ini, "Terminal", "launcher")) {
    terminalLauncher = *v;
  }
  if (auto v = readString(ini, "Repository", "path")) {
    repositoryPath = *v;
  }

  if (auto v = readInteger(ini, "Debug", "verbose")) {
    verbose = int(*v);
  }
  if (auto v = readInteger(ini, "Debug", "silent")) {
    silent = (*v != 0);
  }
  if (auto v = readInteger(ini, "Debug", "logsize")) {
    if (*v != 0) {
      maxLogSize = to_string(*v);
    }
  }
  LOG(INFO) << "Loaded config file " << filename;
}
}  // namespace vt
