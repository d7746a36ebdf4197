#include "SessionTransport.hpp"

namespace sg {
SessionTransport::SessionTransport(shared_ptr<CorrelatedTransport> _transport,
                                   const SessionInfo& _sessionInfo,
                                   uint32_t firstSequenceNumber)
    : transport(_transport),
      sessionInfo(_sessionInfo),
      nextSequenceNumber(firstSequenceNumber),
      nextHandlerId(1),
      shuttingDown(false) {
  transportHandlerId = transport->addMessageHandler(
      [this](const Envelope& envelope) { handleMessage(envelope); });

  LocalJoin join;
  join.set_device_type(CLIENT_DEVICE_TYPE);
  join.set_native_width(1080);
  join.set_native_height(1920);
  join.set_dpi_x(96);
  join.set_dpi_y(96);
  join.set_device_capabilities(0xFFFFFFFFFFFFFFFFull);
  join.set_client_version(15);
  join.set_os_major_version(6);
  join.set_os_minor_version(2);
  join.set_display_name("SmartGlass-C++");
  try {
    send(LOCAL_JOIN, join);
  } catch (const std::runtime_error& re) {
    LOG(WARNING) << "Local join announcement failed: " << re.what();
  }
}

SessionTransport::~SessionTransport() { shutdown(); }

void SessionTransport::send(MessageType type,
                            const google::protobuf::MessageLite& payload,
                            uint64_t channelId) {
  Envelope envelope;
  envelope.set_type(type);
  envelope.set_participant_id(sessionInfo.participantId);
  envelope.set_channel_id(channelId);
  envelope.set_sequence_number(nextSequenceNumber++);
  envelope.set_payload(protoToString(payload));
  transport->send(envelope);
}

int64_t SessionTransport::addMessageHandler(MessageHandler handler) {
  lock_guard<std::mutex> guard(sessionMutex);
  int64_t handlerId = nextHandlerId++;
  messageHandlers[handlerId] = handler;
  return handlerId;
}

void SessionTransport::removeMessageHandler(int64_t handlerId) {
  lock_guard<std::mutex> guard(sessionMutex);
  messageHandlers.erase(handlerId);
}

int64_t SessionTransport::addConsoleStatusHandler(
    ConsoleStatusHandler handler) {
  lock_guard<std::mutex> guard(sessionMutex);
  int64_t handlerId = nextHandlerId++;
  statusHandlers[handlerId] = handler;
  return handlerId;
}

void SessionTransport::removeConsoleStatusHandler(int64_t handlerId) {
  lock_guard<std::mutex> guard(sessionMutex);
  statusHandlers.erase(handlerId);
}

optional<ConsoleStatus> SessionTransport::getConsoleStatus() {
  lock_guard<std::mutex> guard(sessionMutex);
  return consoleStatus;
}

void SessionTransport::shutdown() {
  {
    lock_guard<std::mutex> guard(sessionMutex);
    if (shuttingDown) {
      return;
    }
    shuttingDown = true;
    messageHandlers.clear();
    statusHandlers.clear();
  }
  VLOG(1) << "Session " << sessionInfo.participantId << " shutting down";
  transport->removeMessageHandler(transportHandlerId);
}

void SessionTransport::handleMessage(const Envelope& envelope) {
  if (isHandshakeMessage(envelope.type())) {
    return;
  }

  vector<MessageHandler> handlers;
  vector<ConsoleStatusHandler> consoleStatusHandlers;
  optional<ConsoleStatus> status;
  if (envelope.type() == CONSOLE_STATUS) {
    try {
      status = parsePayload<ConsoleStatus>(envelope);
    } catch (const std::runtime_error& re) {
      LOG(WARNING) << "Ignoring malformed console status: " << re.what();
    }
  }
  {
    lock_guard<std::mutex> guard(sessionMutex);
    if (shuttingDown) {
      return;
    }
    for (auto& it : messageHandlers) {
      handlers.push_back(it.second);
    }
    if (status) {
      consoleStatus = status;
      for (auto& it : statusHandlers) {
        consoleStatusHandlers.push_back(it.second);
      }
    }
  }

  for (auto& handler : handlers) {
    try {
      handler(envelope);
    } catch (const std::exception& ex) {
      STERROR << "Session handler failed on " << envelope << ": " << ex.what();
    }
  }
  for (auto& handler : consoleStatusHandlers) {
    try {
      handler(*status);
    } catch (const std::exception& ex) {
      STERROR << "Console status handler failed: " << ex.what();
    }
  }
}
}  // namespace sg
