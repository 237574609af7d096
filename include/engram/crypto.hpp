#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <engram/status.hpp>

namespace engram {

/**
 * Per-installation key material persisted in the key file.
 *
 * Layout on disk: 32-byte secret followed by an 8-byte little-endian
 * obfuscation seed (40 bytes, mode 0600).
 */
struct KeyMaterial {
  static constexpr size_t kSecretBytes = 32;
  static constexpr size_t kFileBytes = kSecretBytes + 8;

  std::string secret;
  uint64_t seed = 0;

  /**
   * Read the key file at `path`, creating it with fresh random material when
   * it does not exist. A new key is synced under a temporary name and then
   * linked into place, so a crash never leaves a partial key at `path`.
   * A file of the wrong size is Corruption.
   */
  static Status LoadOrCreate(const std::string& path, KeyMaterial* out);
};

/**
 * Layered frame encryption.
 *
 *   1. Deterministic obfuscation: XOR with a SplitMix64 keystream seeded by
 *      the installation seed. Reversible without key material.
 *   2. AES-256-GCM with a key derived by HKDF-SHA256 from the secret and a
 *      random per-record salt. The caller's associated data (plaintext
 *      header fields) is authenticated but not encrypted.
 *
 * Thread-safe: holds only immutable key material.
 */
class FrameCipher {
 public:
  static constexpr size_t kSaltBytes = 16;
  static constexpr size_t kNonceBytes = 12;
  static constexpr size_t kTagBytes = 16;

  struct Sealed {
    std::string salt;
    std::string nonce;
    std::string tag;
    std::string ciphertext;
  };

  explicit FrameCipher(KeyMaterial key);

  Status Seal(std::string_view plaintext, std::string_view aad,
              Sealed* out) const;

  // Corruption when authentication fails (tampered bytes, wrong key, or
  // mismatched associated data).
  Status Open(const Sealed& sealed, std::string_view aad,
              std::string* plaintext) const;

  // Layer 1 only. Applying it twice restores the input.
  static void Obfuscate(uint64_t seed, std::string* data);

 private:
  Status DeriveKey(std::string_view salt, std::string* key) const;

  KeyMaterial key_;
};

}  // namespace engram
