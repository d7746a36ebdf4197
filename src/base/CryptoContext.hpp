#ifndef __SG_CRYPTO_CONTEXT__
#define __SG_CRYPTO_CONTEXT__

#include <sodium.h>

#include "Headers.hpp"

namespace sg {

/**
 * @brief Per-session encryption state derived from a device certificate.
 *
 * The certificate carries the console's curve25519 public key.  A local key
 * pair is generated on construction and the shared secretbox key is derived
 * with crypto_box_beforenm, so both ends can seal and open payloads once the
 * console has seen our public key in the connect request.
 */
class CryptoContext {
 public:
  /**
   * @brief Generates a local key pair and derives the shared key.
   * @param certificate Exactly crypto_box_PUBLICKEYBYTES of device key.
   * @throws TransportError if the certificate has the wrong length.
   */
  explicit CryptoContext(const string& certificate);
  /**
   * @brief Derives the shared key from an existing secret key, as the
   * console side of a session does with the client's public key.
   */
  CryptoContext(const string& peerPublicKey, const string& secretKey);
  ~CryptoContext();

  /** @brief Local public key that the console needs to derive the same key. */
  string getPublicKey() const;

  /**
   * @brief Seals a payload with a fresh random nonce.
   * @return The nonce followed by the ciphertext and MAC.
   */
  string encrypt(const string& buffer);

  /**
   * @brief Opens a payload produced by encrypt() on the other end.
   * @throws TransportError when the payload is truncated or forged.
   */
  string decrypt(const string& buffer);

  /** @brief Returns 16 random bytes for a connect request. */
  static string generateRandomInitVector();

  /** @brief Creates a key pair, for consoles simulated in tests. */
  static void generateKeyPair(string* publicKey, string* secretKey);

 protected:
  unsigned char publicKey[crypto_box_PUBLICKEYBYTES];
  unsigned char sharedKey[crypto_box_BEFORENMBYTES];

 private:
  mutex cryptoMutex;
};
}  // namespace sg

#endif  // __SG_CRYPTO_CONTEXT__
