#include "ClientConfig.hpp"
#include "TestHeaders.hpp"

using namespace sg;

namespace {
string writeTempConfig(const string& contents) {
  string pathPattern = GetTempDirectory() + string("sg_config_XXXXXXXX");
  int fd = mkstemp(&pathPattern[0]);
  FATAL_FAIL(fd);
  ::close(fd);
  ofstream out(pathPattern);
  out << contents;
  out.close();
  return pathPattern;
}
}  // namespace

TEST_CASE("Defaults match what consoles expect", "[ClientConfig]") {
  ClientConfig config;
  REQUIRE(config.port == 5050);
  REQUIRE(config.connectTimeout == chrono::milliseconds(1000));
  REQUIRE(config.connectRetries ==
          vector<chrono::milliseconds>(
              {chrono::milliseconds(500), chrono::milliseconds(500),
               chrono::milliseconds(1500), chrono::milliseconds(5000)}));
  REQUIRE(config.channelTimeout == chrono::milliseconds(1000));
  REQUIRE(config.auxHelloTimeout == chrono::milliseconds(1000));
  REQUIRE_FALSE(config.getCredentials());
}

TEST_CASE("Loads every section from an INI file", "[ClientConfig]") {
  string path = writeTempConfig(
      "; sgclient config\n"
      "[Networking]\n"
      "port = 5051\n"
      "discovery_timeout_ms = 250\n"
      "unknown_key = ignored\n"
      "[Session]\n"
      "connect_timeout_ms = 2000\n"
      "connect_retries_ms = 100, 200,300\n"
      "channel_timeout_ms = 1500\n"
      "aux_hello_timeout_ms = 0\n"
      "[Auth]\n"
      "user_hash = 1234567890\n"
      "authorization = XBL3.0 x=1234567890;eyJ0eXAi\n"
      "[Debug]\n"
      "verbose = 3\n"
      "logtostdout = true\n"
      "logdir = /tmp/sglogs\n");
  ClientConfig config;
  config.loadFromIni(path);
  fs::remove(path);

  REQUIRE(config.port == 5051);
  REQUIRE(config.discoveryTimeout == chrono::milliseconds(250));
  REQUIRE(config.connectTimeout == chrono::milliseconds(2000));
  REQUIRE(config.connectRetries ==
          vector<chrono::milliseconds>({chrono::milliseconds(100),
                                        chrono::milliseconds(200),
                                        chrono::milliseconds(300)}));
  REQUIRE(config.channelTimeout == chrono::milliseconds(1500));
  REQUIRE(config.auxHelloTimeout == chrono::milliseconds(0));
  REQUIRE(config.verbose == 3);
  REQUIRE(config.logToStdout);
  REQUIRE(config.logDir == "/tmp/sglogs");

  auto credentials = config.getCredentials();
  REQUIRE(credentials);
  REQUIRE(credentials->userHash == "1234567890");
  REQUIRE(credentials->authorization == "XBL3.0 x=1234567890;eyJ0eXAi");
}

TEST_CASE("Missing keys keep their defaults", "[ClientConfig]") {
  string path = writeTempConfig("[Auth]\nuser_hash = only-half\n");
  ClientConfig config;
  config.loadFromIni(path);
  fs::remove(path);

  REQUIRE(config.port == 5050);
  REQUIRE(config.connectRetries.size() == 4);
  // One half of the credentials is not enough.
  REQUIRE_FALSE(config.getCredentials());
}

TEST_CASE("Bad config files are rejected", "[ClientConfig]") {
  ClientConfig config;
  REQUIRE_THROWS_AS(config.loadFromIni("/nonexistent/sgclient.ini"),
                    std::runtime_error);

  string path = writeTempConfig("[Session]\nconnect_timeout_ms = soon\n");
  REQUIRE_THROWS_AS(config.loadFromIni(path), std::runtime_error);
  fs::remove(path);
}

TEST_CASE("Retry schedules parse from a comma separated list",
          "[ClientConfig]") {
  REQUIRE(parseRetrySchedule("") == vector<chrono::milliseconds>());
  REQUIRE(parseRetrySchedule(" 10 ,, 20 ") ==
          vector<chrono::milliseconds>(
              {chrono::milliseconds(10), chrono::milliseconds(20)}));
  REQUIRE_THROWS_AS(parseRetrySchedule("10,-5"), std::runtime_error);
  REQUIRE_THROWS_AS(parseRetrySchedule("10ms"), std::runtime_error);
}
