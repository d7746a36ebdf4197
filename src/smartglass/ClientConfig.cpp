#include "ClientConfig.hpp"

#include "SimpleIni.h"

namespace sg {
namespace {
int64_t parseMilliseconds(const string& key, const string& value) {
  try {
    size_t consumed = 0;
    int64_t ms = std::stoll(value, &consumed);
    if (consumed != value.length() || ms < 0) {
      throw std::invalid_argument(value);
    }
    return ms;
  } catch (const std::logic_error& le) {
    throw std::runtime_error("Invalid duration for " + key + ": '" + value +
                             "'");
  }
}

void readDuration(const CSimpleIniA& ini, const char* section, const char* key,
                  chrono::milliseconds* out) {
  const char* value = ini.GetValue(section, key, NULL);
  if (value) {
    *out = chrono::milliseconds(parseMilliseconds(key, trim(value)));
  }
}
}  // namespace

vector<chrono::milliseconds> parseRetrySchedule(const string& schedule) {
  vector<chrono::milliseconds> retries;
  for (const auto& entry : split(schedule, ',')) {
    string value = trim(entry);
    if (value.empty()) {
      continue;
    }
    retries.push_back(
        chrono::milliseconds(parseMilliseconds("connect_retries_ms", value)));
  }
  return retries;
}

void ClientConfig::loadFromIni(const string& filename) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }

  const char* portString = ini.GetValue("Networking", "port", NULL);
  if (portString) {
    port = stoi(portString);
  }
  readDuration(ini, "Networking", "discovery_timeout_ms", &discoveryTimeout);

  readDuration(ini, "Session", "connect_timeout_ms", &connectTimeout);
  const char* retries = ini.GetValue("Session", "connect_retries_ms", NULL);
  if (retries) {
    connectRetries = parseRetrySchedule(retries);
  }
  readDuration(ini, "Session", "channel_timeout_ms", &channelTimeout);
  readDuration(ini, "Session", "aux_hello_timeout_ms", &auxHelloTimeout);

  const char* userHashValue = ini.GetValue("Auth", "user_hash", NULL);
  if (userHashValue) {
    userHash = userHashValue;
  }
  const char* authorizationValue = ini.GetValue("Auth", "authorization", NULL);
  if (authorizationValue) {
    authorization = authorizationValue;
  }

  const char* vlevel = ini.GetValue("Debug", "verbose", NULL);
  if (vlevel) {
    verbose = atoi(vlevel);
  }
  logToStdout = ini.GetBoolValue("Debug", "logtostdout", logToStdout);
  const char* logDirValue = ini.GetValue("Debug", "logdir", NULL);
  if (logDirValue) {
    logDir = trim(logDirValue);
  }
  LOG(INFO) << "Loaded config file " << filename;
}

optional<Credentials> ClientConfig::getCredentials() const {
  if (userHash.empty() || authorization.empty()) {
    return std::nullopt;
  }
  Credentials credentials;
  credentials.userHash = userHash;
  credentials.authorization = authorization;
  return credentials;
}
}  // namespace sg
