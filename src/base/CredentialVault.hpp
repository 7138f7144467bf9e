#ifndef __OT_CREDENTIAL_VAULT__
#define __OT_CREDENTIAL_VAULT__

#include <sodium.h>

#include "Headers.hpp"

namespace ot {

/**
 * @brief Keeps one secret sealed in memory with libsodium secretbox.
 *
 * The key is random and lives only in this object, so the plaintext exists
 * only for the duration of reveal() and inside the caller's copy.
 */
class CredentialVault {
 public:
  /**
   * @brief Seals `secret` under a fresh random key.
   */
  explicit CredentialVault(const string& secret);
  ~CredentialVault();

  /**
   * @brief Returns the plaintext. Callers must wipe their copy with
   * `wipeString` once done.
   * @throws std::runtime_error after wipe() or on MAC failure.
   */
  string reveal();

  /** @brief Zeroes key and ciphertext. Safe to call more than once. */
  void wipe();

  bool isWiped();

  /** @brief Zeroes the bytes of a plaintext copy in place. */
  static void wipeString(string* s);

 protected:
  unsigned char nonce[crypto_secretbox_NONCEBYTES];
  unsigned char key[crypto_secretbox_KEYBYTES];
  string sealed;
  bool wiped;

 private:
  mutex vaultMutex;
};
}  // namespace ot

#endif  // __OT_CREDENTIAL_VAULT__
