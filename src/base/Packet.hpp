#ifndef __SG_PACKET_H__
#define __SG_PACKET_H__

#include "CryptoContext.hpp"
#include "Errors.hpp"
#include "Headers.hpp"

namespace sg {
/**
 * @brief One datagram: an encrypted flag, a message type byte and a payload.
 *
 * The payload is a serialized Envelope.  Only the flag and the type byte are
 * readable before decryption.
 */
class Packet {
 public:
  Packet() : encrypted(false), header(0) {}
  Packet(uint8_t _header, const string& _payload)
      : encrypted(false), header(_header), payload(_payload) {}
  Packet(bool _encrypted, uint8_t _header, const string& _payload)
      : encrypted(_encrypted), header(_header), payload(_payload) {}
  /**
   * @brief Deserializes a packet from a received datagram.
   * @throws TransportError if the datagram is shorter than the header.
   */
  explicit Packet(const string& serializedPacket) {
    if (serializedPacket.length() < HEADER_SIZE) {
      throw TransportError("Truncated datagram of " +
                           to_string(serializedPacket.length()) + " bytes");
    }
    encrypted = serializedPacket[0];
    header = serializedPacket[1];
    payload = serializedPacket.substr(HEADER_SIZE);
  }

  void decrypt(shared_ptr<CryptoContext> cryptoContext) {
    if (encrypted) {
      encrypted = false;
      payload = cryptoContext->decrypt(payload);
    } else {
      STFATAL << "Tried to decrypt a packet that wasn't encrypted";
    }
  }

  void encrypt(shared_ptr<CryptoContext> cryptoContext) {
    if (encrypted) {
      STFATAL << "Tried to encrypt a packet that was already encrypted";
    } else {
      encrypted = true;
      payload = cryptoContext->encrypt(payload);
    }
  }

  bool isEncrypted() const { return encrypted; }
  uint8_t getHeader() const { return header; }
  const string& getPayload() const { return payload; }

  size_t length() const { return HEADER_SIZE + payload.length(); }

  string serialize() const {
    string s = "00" + payload;
    s[0] = uint8_t(encrypted);
    s[1] = header;
    return s;
  }

 protected:
  static const size_t HEADER_SIZE = 2;
  bool encrypted;
  uint8_t header;
  string payload;
};
}  // namespace sg

#endif  // __SG_PACKET_H__
