#include "CryptoContext.hpp"

#include "Errors.hpp"

namespace sg {
namespace {
void initSodium() {
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
}
}  // namespace

CryptoContext::CryptoContext(const string& certificate) {
  lock_guard<std::mutex> guard(cryptoMutex);
  initSodium();
  if (certificate.length() != crypto_box_PUBLICKEYBYTES) {
    throw TransportError("Invalid device certificate length: " +
                         to_string(certificate.length()));
  }
  unsigned char secretKey[crypto_box_SECRETKEYBYTES];
  crypto_box_keypair(publicKey, secretKey);
  if (crypto_box_beforenm(sharedKey,
                          (const unsigned char*)certificate.data(),
                          secretKey) != 0) {
    sodium_memzero(secretKey, sizeof(secretKey));
    throw TransportError("Device certificate rejected by key agreement");
  }
  sodium_memzero(secretKey, sizeof(secretKey));
}

CryptoContext::CryptoContext(const string& peerPublicKey,
                             const string& secretKey) {
  lock_guard<std::mutex> guard(cryptoMutex);
  initSodium();
  if (peerPublicKey.length() != crypto_box_PUBLICKEYBYTES ||
      secretKey.length() != crypto_box_SECRETKEYBYTES) {
    throw TransportError("Invalid key material length");
  }
  crypto_scalarmult_base(publicKey, (const unsigned char*)secretKey.data());
  if (crypto_box_beforenm(sharedKey,
                          (const unsigned char*)peerPublicKey.data(),
                          (const unsigned char*)secretKey.data()) != 0) {
    throw TransportError("Peer public key rejected by key agreement");
  }
}

CryptoContext::~CryptoContext() {
  sodium_memzero(sharedKey, sizeof(sharedKey));
}

string CryptoContext::getPublicKey() const {
  return string((const char*)publicKey, crypto_box_PUBLICKEYBYTES);
}

string CryptoContext::encrypt(const string& buffer) {
  lock_guard<std::mutex> guard(cryptoMutex);
  string retval(crypto_box_NONCEBYTES + buffer.length() + crypto_box_MACBYTES,
                '\0');
  unsigned char* nonce = (unsigned char*)&retval[0];
  randombytes_buf(nonce, crypto_box_NONCEBYTES);
  if (crypto_box_easy_afternm(nonce + crypto_box_NONCEBYTES,
                              (const unsigned char*)buffer.data(),
                              buffer.length(), nonce, sharedKey) != 0) {
    STFATAL << "Crypto Error while sealing " << buffer.length() << " bytes";
  }
  return retval;
}

string CryptoContext::decrypt(const string& buffer) {
  lock_guard<std::mutex> guard(cryptoMutex);
  if (buffer.length() < crypto_box_NONCEBYTES + crypto_box_MACBYTES) {
    throw TransportError("Encrypted payload too short: " +
                         to_string(buffer.length()));
  }
  const unsigned char* nonce = (const unsigned char*)buffer.data();
  size_t cipherLength = buffer.length() - crypto_box_NONCEBYTES;
  string retval(cipherLength - crypto_box_MACBYTES, '\0');
  if (crypto_box_open_easy_afternm((unsigned char*)&retval[0],
                                   nonce + crypto_box_NONCEBYTES,
                                   cipherLength, nonce, sharedKey) != 0) {
    throw TransportError("Decrypt failed.  Possible key mismatch?");
  }
  return retval;
}

string CryptoContext::generateRandomInitVector() {
  initSodium();
  string iv(16, '\0');
  randombytes_buf(&iv[0], iv.length());
  return iv;
}

void CryptoContext::generateKeyPair(string* publicKeyOut,
                                    string* secretKeyOut) {
  initSodium();
  publicKeyOut->assign(crypto_box_PUBLICKEYBYTES, '\0');
  secretKeyOut->assign(crypto_box_SECRETKEYBYTES, '\0');
  crypto_box_keypair((unsigned char*)&(*publicKeyOut)[0],
                     (unsigned char*)&(*secretKeyOut)[0]);
}
}  // namespace sg
