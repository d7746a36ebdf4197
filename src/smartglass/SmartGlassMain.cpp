#include <cxxopts.hpp>

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "LogHandler.hpp"
#include "SmartGlassClient.hpp"

using namespace sg;

namespace {
json consoleStatusToJson(const ConsoleStatus& status) {
  json j;
  const ConsoleConfiguration& configuration = status.configuration();
  j["configuration"]["liveTvProvider"] = configuration.live_tv_provider();
  j["configuration"]["majorVersion"] = configuration.major_version();
  j["configuration"]["minorVersion"] = configuration.minor_version();
  j["configuration"]["buildNumber"] = configuration.build_number();
  j["configuration"]["locale"] = configuration.locale();
  j["activeTitles"] = json::array();
  for (const auto& title : status.active_titles()) {
    json t;
    t["titleId"] = title.title_id();
    t["hasFocus"] = title.has_focus();
    t["disabled"] = title.disabled_flag();
    t["location"] = ActiveTitleLocation_Name(title.location());
    t["productId"] = title.product_id();
    t["sandboxId"] = title.sandbox_id();
    t["aumId"] = title.aum_id();
    j["activeTitles"].push_back(t);
  }
  return j;
}

uint32_t parseTitleId(const string& s) {
  size_t consumed = 0;
  unsigned long titleId = std::stoul(s, &consumed, 0);
  if (consumed != s.length() || titleId > UINT32_MAX) {
    throw std::invalid_argument("Invalid title id: " + s);
  }
  return uint32_t(titleId);
}

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}
}  // namespace

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  sg::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, sg::InterruptSignalHandler);

  cxxopts::Options options("sgclient", "Remote control for SmartGlass consoles");
  try {
    options.positional_help("");
    options.custom_help("[OPTION...] host");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("host", "Console address or host name",
         cxxopts::value<std::string>())  //
        ("p,port", "Console SmartGlass port",
         cxxopts::value<int>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>())  //
        ("userhash", "Xbox Live user hash", cxxopts::value<std::string>())  //
        ("authorization", "Xbox Live authorization token",
         cxxopts::value<std::string>())  //
        ("launch", "Launch a title (hex with 0x prefix, or decimal)",
         cxxopts::value<std::string>())  //
        ("params", "Launch parameters for --launch",
         cxxopts::value<std::string>()->default_value(""))  //
        ("dvr", "Record the last SECONDS of gameplay",
         cxxopts::value<int>())  //
        ("input", "Open the input channel and send a neutral gamepad frame")  //
        ("titlechannel", "Open a channel to a title",
         cxxopts::value<std::string>())  //
        ("watch", "Print console status (and title messages) for SECONDS",
         cxxopts::value<int>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())   //
        ("logtostdout", "Write log to stdout");

    options.parse_positional({"host"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "sgclient version " << SG_VERSION << endl;
      exit(0);
    }

    ClientConfig config;
    if (result.count("cfgfile")) {
      config.loadFromIni(result["cfgfile"].as<string>());
    }
    if (result.count("port")) {
      config.port = result["port"].as<int>();
    }
    if (result.count("userhash")) {
      config.userHash = result["userhash"].as<string>();
    }
    if (result.count("authorization")) {
      config.authorization = result["authorization"].as<string>();
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logdir")) {
      config.logDir = result["logdir"].as<string>();
    }
    if (result.count("logtostdout")) {
      config.logToStdout = true;
    }

    el::Loggers::setVerboseLevel(config.verbose);
    LogHandler::setupLogFile(
        &defaultConf,
        config.logDir.empty() ? GetTempDirectory() : config.logDir,
        "sgclient", config.logToStdout);
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("sgclient-main");

    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    if (!result.count("host")) {
      CLOG(INFO, "stdout") << "Missing console to connect to" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    string host = result["host"].as<string>();

    if ((config.userHash.empty()) != (config.authorization.empty())) {
      CLOG(INFO, "stdout")
          << "--userhash and --authorization must be given together" << endl;
      exit(1);
    }

    shared_ptr<SmartGlassClient> client;
    try {
      client = SmartGlassClient::connect(host, config);
    } catch (const DiscoveryError& de) {
      CLOG(INFO, "stdout") << "Could not find a console at " << host << ": "
                           << de.what() << endl;
      exit(1);
    } catch (const ConnectionFailedError& cfe) {
      CLOG(INFO, "stdout") << "Could not connect to " << host << ": "
                           << cfe.what() << endl;
      exit(1);
    }

    {
      json session;
      session["console"] = client->getDevice().name;
      session["participantId"] = client->getParticipantId();
      session["deviceId"] = client->getDeviceId();
      CLOG(INFO, "stdout") << session.dump() << endl;
    }

    if (result.count("watch")) {
      client->addConsoleStatusHandler([](const ConsoleStatus& status) {
        CLOG(INFO, "stdout") << consoleStatusToJson(status).dump() << endl;
      });
    }

    if (result.count("launch")) {
      client->launchTitle(parseTitleId(result["launch"].as<string>()),
                          result["params"].as<string>());
    }

    if (result.count("dvr")) {
      client->startDvrRecording(result["dvr"].as<int>());
    }

    if (result.count("input")) {
      auto inputChannel = client->getInputChannel();
      Gamepad neutral;
      inputChannel->sendGamepadState(neutral);
      LOG(INFO) << "Sent neutral gamepad frame on channel "
                << inputChannel->getChannelId();
    }

    shared_ptr<TitleChannel> titleChannel;
    if (result.count("titlechannel")) {
      titleChannel = client->startTitleChannel(
          parseTitleId(result["titlechannel"].as<string>()));
      json opened;
      opened["titleChannel"] = titleChannel->getChannelId();
      opened["auxiliaryStream"] =
          bool(titleChannel->getAuxiliaryStream());
      CLOG(INFO, "stdout") << opened.dump() << endl;
      if (result.count("watch")) {
        titleChannel->addTitleMessageHandler([](const json& message) {
          CLOG(INFO, "stdout") << message.dump() << endl;
        });
      }
    }

    if (result.count("watch")) {
      std::this_thread::sleep_for(
          chrono::seconds(result["watch"].as<int>()));
    }

    if (titleChannel) {
      titleChannel->shutdown();
    }
    client->shutdown();
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (const TimeoutError& te) {
    CLOG(INFO, "stdout") << "Console did not answer: " << te.what() << endl;
    exit(1);
  } catch (const ChannelOpenError& coe) {
    CLOG(INFO, "stdout") << "Console refused the channel (result "
                         << coe.getResult() << ")" << endl;
    exit(1);
  } catch (const std::invalid_argument& ia) {
    handleParseException(ia, options);
  } catch (const std::runtime_error& re) {
    STERROR << "Error: " << re.what();
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }

  return 0;
}
