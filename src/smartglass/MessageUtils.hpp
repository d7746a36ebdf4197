#ifndef __SG_MESSAGE_UTILS__
#define __SG_MESSAGE_UTILS__

#include "Headers.hpp"

namespace sg {
/** @brief Wraps a typed payload into an envelope of the given type. */
template <typename T>
inline Envelope makeEnvelope(MessageType type, const T& payload) {
  Envelope envelope;
  envelope.set_type(type);
  envelope.set_payload(protoToString(payload));
  return envelope;
}

/**
 * @brief Parses the typed payload out of an envelope.
 * @throws std::runtime_error when the payload is not a valid T.
 */
template <typename T>
inline T parsePayload(const Envelope& envelope) {
  return stringToProto<T>(envelope.payload());
}

/** @brief Messages that belong to discovery and the handshake. */
inline bool isHandshakeMessage(MessageType type) {
  return type == PRESENCE_REQUEST || type == PRESENCE_RESPONSE ||
         type == CONNECT_REQUEST || type == CONNECT_RESPONSE;
}

inline ostream& operator<<(ostream& os, const Envelope& envelope) {
  os << MessageType_Name(envelope.type());
  if (envelope.participant_id()) {
    os << " participant=" << envelope.participant_id();
  }
  if (envelope.channel_id()) {
    os << " channel=" << envelope.channel_id();
  }
  if (envelope.has_sequence_number()) {
    os << " seq=" << envelope.sequence_number();
  }
  return os;
}
}  // namespace sg

#endif  // __SG_MESSAGE_UTILS__
