#ifndef __SG_HEADERS__
#define __SG_HEADERS__

#if __FreeBSD__
#define _WITH_GETLINE
#endif

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <pthread.h>
#include <resolv.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <errno.h>
#include <fcntl.h>
#include <google/protobuf/message_lite.h>
#include <sodium.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <time.h>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <deque>
#include <exception>
#include <filesystem>
#include <fstream>
#include <functional>
#include <future>
#include <iostream>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "SmartGlass.pb.h"
#include "easylogging++.h"
#include "sole.hpp"
#include "ust.hpp"

using namespace std;
namespace fs = std::filesystem;

// Protocol version advertised in presence requests
static const int PROTOCOL_VERSION = 2;

// Default port the console listens on for SmartGlass traffic
static const int DEFAULT_DEVICE_PORT = 5050;

// Device type reported when discovering and joining (Windows desktop)
static const uint32_t CLIENT_DEVICE_TYPE = 3;

#define STFATAL LOG(FATAL) << "Stack Trace: " << endl << ust::generate()

#define STERROR LOG(ERROR) << "Stack Trace: " << endl << ust::generate()

inline int GetErrno() { return errno; }

inline void SetErrno(int e) { errno = e; }

#define FATAL_FAIL(X) \
  if (((X) == -1))    \
    STFATAL << "Error: (" << GetErrno() << "): " << strerror(GetErrno());

#ifndef SG_VERSION
#define SG_VERSION "unknown"
#endif

namespace sg {
template <typename Out>
inline void split(const std::string &s, char delim, Out result) {
  std::stringstream ss;
  ss.str(s);
  std::string item;
  while (std::getline(ss, item, delim)) {
    *(result++) = item;
  }
}

inline std::vector<std::string> split(const std::string &s, char delim) {
  std::vector<std::string> elems;
  split(s, delim, std::back_inserter(elems));
  return elems;
}

inline string trim(const string &s) {
  auto begin = s.find_first_not_of(" \t\r\n");
  if (begin == string::npos) {
    return "";
  }
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(begin, end - begin + 1);
}

template <typename T>
inline T stringToProto(const string &s) {
  T t;
  if (!t.ParseFromString(s)) {
    throw std::runtime_error(string("Error parsing ") + t.GetTypeName() +
                             " from " + to_string(s.length()) + " bytes");
  }
  return t;
}

template <typename T>
inline string protoToString(const T &t) {
  string s;
  if (!t.SerializeToString(&s)) {
    STFATAL << "Error serializing proto to string";
  }
  return s;
}

inline string GetTempDirectory() {
  string tmpDir = fs::temp_directory_path().string();
  if (tmpDir.empty() || tmpDir.back() != '/') {
    tmpDir += '/';
  }
  return tmpDir;
}

inline void HandleTerminate() {
  static bool first = true;
  if (first) {
    first = false;
  } else {
    // If we are recursively terminating, just bail
    return;
  }
  std::set_terminate([]() -> void {
    std::exception_ptr eptr = std::current_exception();
    if (eptr) {
      try {
        std::rethrow_exception(eptr);
      } catch (const std::exception &e) {
        STFATAL << "Uncaught c++ exception: " << e.what();
      }
    } else {
      STFATAL << "Uncaught c++ exception (unknown)";
    }
  });
}

inline void InterruptSignalHandler(int signum) {
  STERROR << "Got interrupt";
  CLOG(INFO, "stdout") << endl
                       << "Got interrupt (perhaps ctrl+c?).  Exiting." << endl;
  ::exit(signum);
}
}  // namespace sg

inline bool operator==(const google::protobuf::MessageLite &msg_a,
                       const google::protobuf::MessageLite &msg_b) {
  return (msg_a.GetTypeName() == msg_b.GetTypeName()) &&
         (msg_a.SerializeAsString() == msg_b.SerializeAsString());
}

inline bool operator!=(const google::protobuf::MessageLite &msg_a,
                       const google::protobuf::MessageLite &msg_b) {
  return !(msg_a == msg_b);
}

#endif
