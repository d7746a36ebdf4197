#include "CorrelatedTransport.hpp"

namespace sg {
CorrelatedTransport::CorrelatedTransport(shared_ptr<RawTransport> _rawTransport)
    : rawTransport(_rawTransport),
      nextWaitId(1),
      nextHandlerId(1),
      shuttingDown(false) {
  rawTransport->setReceiveHandler(
      [this](const Envelope& envelope) { handleIncoming(envelope); });
}

CorrelatedTransport::~CorrelatedTransport() {
  try {
    shutdown();
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Error closing transport: " << ex.what();
  }
}

void CorrelatedTransport::send(const Envelope& envelope) {
  {
    lock_guard<std::mutex> guard(transportMutex);
    if (shuttingDown) {
      throw TransportError("Tried to send on a transport that is shut down");
    }
  }
  VLOG(2) << "Sending " << envelope;
  rawTransport->send(envelope);
}

Envelope CorrelatedTransport::sendAndWait(
    MessageType type, chrono::milliseconds timeout,
    const std::function<void()>& sendAction, EnvelopeMatcher matcher) {
  int64_t waitId = expectReply(type, timeout, matcher);
  try {
    if (sendAction) {
      sendAction();
    }
  } catch (...) {
    cancelReply(waitId);
    throw;
  }
  return awaitReply(waitId);
}

int64_t CorrelatedTransport::expectReply(MessageType type,
                                         chrono::milliseconds timeout,
                                         EnvelopeMatcher matcher) {
  auto result = make_shared<std::promise<Envelope>>();
  auto deadline = chrono::steady_clock::now() + timeout;
  lock_guard<std::mutex> guard(transportMutex);
  if (shuttingDown) {
    throw TimeoutError("Transport is shut down, cannot wait for " +
                       MessageType_Name(type));
  }
  sweepExpiredWaits(chrono::steady_clock::now());
  int64_t waitId = nextWaitId++;
  pendingWaits[waitId] = {type, matcher, deadline, result};
  expectedReplies[waitId] = {type, deadline, result->get_future()};
  return waitId;
}

Envelope CorrelatedTransport::awaitReply(
    int64_t waitId, optional<chrono::milliseconds> restartTimeout) {
  MessageType type;
  chrono::steady_clock::time_point deadline;
  std::future<Envelope> future;
  {
    lock_guard<std::mutex> guard(transportMutex);
    auto it = expectedReplies.find(waitId);
    if (it == expectedReplies.end()) {
      STFATAL << "Awaited an unknown wait " << waitId;
    }
    type = it->second.type;
    deadline = it->second.deadline;
    future = std::move(it->second.future);
    expectedReplies.erase(it);
    if (restartTimeout) {
      deadline = chrono::steady_clock::now() + *restartTimeout;
      auto pending = pendingWaits.find(waitId);
      if (pending != pendingWaits.end()) {
        pending->second.deadline = deadline;
      }
    }
  }

  if (future.wait_until(deadline) != std::future_status::ready) {
    lock_guard<std::mutex> guard(transportMutex);
    if (pendingWaits.erase(waitId)) {
      VLOG(1) << "Timed out waiting for " << MessageType_Name(type);
      throw TimeoutError("Timed out waiting for " + MessageType_Name(type));
    }
    // A reply or a shutdown claimed the wait just as it expired.
  }
  return future.get();
}

void CorrelatedTransport::cancelReply(int64_t waitId) {
  lock_guard<std::mutex> guard(transportMutex);
  pendingWaits.erase(waitId);
  expectedReplies.erase(waitId);
}

int64_t CorrelatedTransport::addMessageHandler(MessageHandler handler) {
  lock_guard<std::mutex> guard(transportMutex);
  int64_t handlerId = nextHandlerId++;
  messageHandlers[handlerId] = handler;
  return handlerId;
}

void CorrelatedTransport::removeMessageHandler(int64_t handlerId) {
  lock_guard<std::mutex> guard(transportMutex);
  messageHandlers.erase(handlerId);
}

void CorrelatedTransport::handleIncoming(const Envelope& envelope) {
  VLOG(2) << "Received " << envelope;
  shared_ptr<std::promise<Envelope>> matched;
  vector<MessageHandler> handlers;
  {
    lock_guard<std::mutex> guard(transportMutex);
    if (shuttingDown) {
      return;
    }
    sweepExpiredWaits(chrono::steady_clock::now());
    for (auto it = pendingWaits.begin(); it != pendingWaits.end(); ++it) {
      const PendingWait& wait = it->second;
      if (wait.type != envelope.type()) {
        continue;
      }
      if (wait.matcher && !wait.matcher(envelope)) {
        continue;
      }
      matched = wait.result;
      pendingWaits.erase(it);
      break;
    }
    for (auto& it : messageHandlers) {
      handlers.push_back(it.second);
    }
  }

  if (matched) {
    matched->set_value(envelope);
  }
  for (auto& handler : handlers) {
    try {
      handler(envelope);
    } catch (const std::exception& ex) {
      STERROR << "Message handler failed on " << envelope << ": " << ex.what();
    }
  }
}

void CorrelatedTransport::shutdown() {
  map<int64_t, PendingWait> abandoned;
  {
    lock_guard<std::mutex> guard(transportMutex);
    if (shuttingDown) {
      return;
    }
    LOG(INFO) << "Shutting down transport";
    shuttingDown = true;
    abandoned.swap(pendingWaits);
    messageHandlers.clear();
  }
  for (auto& it : abandoned) {
    it.second.result->set_exception(std::make_exception_ptr(TimeoutError(
        "Transport shut down while waiting for " +
        MessageType_Name(it.second.type))));
  }
  rawTransport->setReceiveHandler(nullptr);
  rawTransport->close();
}

void CorrelatedTransport::sweepExpiredWaits(
    chrono::steady_clock::time_point now) {
  for (auto it = pendingWaits.begin(); it != pendingWaits.end();) {
    if (it->second.deadline <= now) {
      it->second.result->set_exception(std::make_exception_ptr(
          TimeoutError("Timed out waiting for " +
                       MessageType_Name(it->second.type))));
      it = pendingWaits.erase(it);
    } else {
      ++it;
    }
  }
}
}  // namespace sg
