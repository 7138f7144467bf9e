#include "CredentialVault.hpp"

#define SODIUM_FAIL(X)                                         \
  {                                                            \
    int rc = (X);                                              \
    if ((rc) == -1) STFATAL << "Crypto Error: (" << rc << ")"; \
  }
namespace ot {

CredentialVault::CredentialVault(const string& secret) : wiped(false) {
  lock_guard<std::mutex> guard(vaultMutex);
  if (-1 == sodium_init()) {
    STFATAL << "libsodium init failed";
  }
  crypto_secretbox_keygen(key);
  randombytes_buf(nonce, sizeof(nonce));
  sealed.resize(secret.length() + crypto_secretbox_MACBYTES);
  SODIUM_FAIL(crypto_secretbox_easy((unsigned char*)&sealed[0],
                                    (const unsigned char*)secret.c_str(),
                                    secret.length(), nonce, key));
}

CredentialVault::~CredentialVault() { wipe(); }

string CredentialVault::reveal() {
  lock_guard<std::mutex> guard(vaultMutex);
  if (wiped) {
    throw std::runtime_error("Credential has been wiped");
  }
  string retval(sealed.length() - crypto_secretbox_MACBYTES, '\0');
  if (crypto_secretbox_open_easy((unsigned char*)&retval[0],
                                 (const unsigned char*)sealed.c_str(),
                                 sealed.length(), nonce, key) == -1) {
    throw std::runtime_error("Sealed credential failed verification");
  }
  return retval;
}

void CredentialVault::wipe() {
  lock_guard<std::mutex> guard(vaultMutex);
  if (wiped) {
    return;
  }
  sodium_memzero(key, sizeof(key));
  sodium_memzero(nonce, sizeof(nonce));
  wipeString(&sealed);
  sealed.clear();
  wiped = true;
}

bool CredentialVault::isWiped() {
  lock_guard<std::mutex> guard(vaultMutex);
  return wiped;
}

void CredentialVault::wipeString(string* s) {
  if (!s->empty()) {
    sodium_memzero(&(*s)[0], s->length());
  }
}
}  // namespace ot
