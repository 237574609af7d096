#include <engram/crypto.hpp>

#include <engram/internal.hpp>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <memory>
#include <utility>

#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

namespace engram {

namespace {

constexpr char kHkdfInfo[] = "engram-frame-v1";

struct CipherCtxDeleter {
  void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};
using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

struct PkeyCtxDeleter {
  void operator()(EVP_PKEY_CTX* ctx) const { EVP_PKEY_CTX_free(ctx); }
};
using PkeyCtx = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

const unsigned char* U8(std::string_view s) {
  return reinterpret_cast<const unsigned char*>(s.data());
}

Status RandomBytes(size_t n, std::string* out) {
  out->assign(n, '\0');
  if (RAND_bytes(reinterpret_cast<unsigned char*>(out->data()),
                 static_cast<int>(n)) != 1) {
    return Status::IOError("RAND_bytes failed");
  }
  return Status::OK();
}

Status ReadWholeFile(const std::string& path, std::string* out) {
  int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (fd < 0) {
    return Status::IOError("open " + path + ": " + std::strerror(errno));
  }
  out->clear();
  char buf[256];
  while (true) {
    ssize_t n = ::read(fd, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR) continue;
      int err = errno;
      ::close(fd);
      return Status::IOError("read " + path + ": " + std::strerror(err));
    }
    if (n == 0) break;
    out->append(buf, static_cast<size_t>(n));
  }
  ::close(fd);
  return Status::OK();
}

Status WriteAll(int fd, const std::string& path, const std::string& data) {
  size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) continue;
      return Status::IOError("write " + path + ": " + std::strerror(errno));
    }
    written += static_cast<size_t>(n);
  }
  return Status::OK();
}

// The key is written and synced under a temporary name, then linked into
// place, so `path` never exists with partial contents. A concurrent creator
// that links first wins and this one's material is discarded.
Status CreateKeyFile(const std::string& path, size_t secret_bytes) {
  std::string secret;
  std::string seed_bytes;
  Status s = RandomBytes(secret_bytes, &secret);
  if (s.ok()) s = RandomBytes(8, &seed_bytes);
  if (!s.ok()) return s;

  std::string tmp = path + ".tmp.XXXXXX";
  int fd = ::mkstemp(tmp.data());
  if (fd < 0) {
    return Status::IOError("create " + tmp + ": " + std::strerror(errno));
  }
  s = WriteAll(fd, tmp, secret + seed_bytes);
  if (s.ok() && ::fsync(fd) != 0) {
    s = Status::IOError("fsync " + tmp + ": " + std::strerror(errno));
  }
  if (::close(fd) != 0 && s.ok()) {
    s = Status::IOError("close " + tmp + ": " + std::strerror(errno));
  }
  if (s.ok() && ::link(tmp.c_str(), path.c_str()) != 0 && errno != EEXIST) {
    s = Status::IOError("link " + path + ": " + std::strerror(errno));
  }
  ::unlink(tmp.c_str());
  if (!s.ok()) return s;

  auto parent = std::filesystem::path(path).parent_path();
  int dfd = ::open(parent.empty() ? "." : parent.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
  if (dfd < 0) {
    return Status::IOError("open " + parent.string() + ": " + std::strerror(errno));
  }
  int rc = ::fsync(dfd);
  int err = errno;
  ::close(dfd);
  if (rc != 0) {
    return Status::IOError("fsync " + parent.string() + ": " + std::strerror(err));
  }
  return Status::OK();
}

}  // namespace

// ---------------------------------------------------------------------------
// KeyMaterial
// ---------------------------------------------------------------------------

Status KeyMaterial::LoadOrCreate(const std::string& path, KeyMaterial* out) {
  std::error_code ec;
  auto parent = std::filesystem::path(path).parent_path();
  if (!parent.empty()) {
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      return Status::IOError("create " + parent.string() + ": " + ec.message());
    }
  }

  if (::access(path.c_str(), F_OK) != 0) {
    if (errno != ENOENT) {
      return Status::IOError("stat " + path + ": " + std::strerror(errno));
    }
    Status s = CreateKeyFile(path, kSecretBytes);
    if (!s.ok()) return s;
  }

  std::string blob;
  Status s = ReadWholeFile(path, &blob);
  if (!s.ok()) return s;
  if (blob.size() != kFileBytes) {
    return Status::Corruption("key file " + path + " has " +
                              std::to_string(blob.size()) + " bytes, expected " +
                              std::to_string(kFileBytes));
  }

  if (!internal::DecodeU64LE(std::string_view(blob).substr(kSecretBytes, 8),
                             &out->seed)) {
    return Status::Corruption("key file " + path + " has an unreadable seed");
  }
  out->secret = blob.substr(0, kSecretBytes);
  return Status::OK();
}

// ---------------------------------------------------------------------------
// FrameCipher
// ---------------------------------------------------------------------------

FrameCipher::FrameCipher(KeyMaterial key) : key_(std::move(key)) {}

void FrameCipher::Obfuscate(uint64_t seed, std::string* data) {
  // SplitMix64 keystream
  uint64_t state = seed;
  uint64_t word = 0;
  for (size_t i = 0; i < data->size(); ++i) {
    if (i % 8 == 0) {
      state += 0x9E3779B97F4A7C15ULL;
      uint64_t z = state;
      z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
      z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
      word = z ^ (z >> 31);
    }
    (*data)[i] = static_cast<char>(static_cast<uint8_t>((*data)[i]) ^
                                   static_cast<uint8_t>(word >> ((i % 8) * 8)));
  }
}

Status FrameCipher::DeriveKey(std::string_view salt, std::string* key) const {
  PkeyCtx pctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
  if (!pctx) return Status::IOError("EVP_PKEY_CTX_new_id(HKDF) failed");

  key->assign(32, '\0');
  size_t key_len = key->size();
  if (EVP_PKEY_derive_init(pctx.get()) <= 0 ||
      EVP_PKEY_CTX_set_hkdf_md(pctx.get(), EVP_sha256()) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_salt(pctx.get(), U8(salt),
                                  static_cast<int>(salt.size())) <= 0 ||
      EVP_PKEY_CTX_set1_hkdf_key(pctx.get(), U8(key_.secret),
                                 static_cast<int>(key_.secret.size())) <= 0 ||
      EVP_PKEY_CTX_add1_hkdf_info(
          pctx.get(), reinterpret_cast<const unsigned char*>(kHkdfInfo),
          static_cast<int>(sizeof(kHkdfInfo) - 1)) <= 0 ||
      EVP_PKEY_derive(pctx.get(), reinterpret_cast<unsigned char*>(key->data()),
                      &key_len) <= 0 ||
      key_len != 32) {
    return Status::IOError("HKDF key derivation failed");
  }
  return Status::OK();
}

Status FrameCipher::Seal(std::string_view plaintext, std::string_view aad,
                         Sealed* out) const {
  std::string obfuscated(plaintext);
  Obfuscate(key_.seed, &obfuscated);

  Status s = RandomBytes(kSaltBytes, &out->salt);
  if (s.ok()) s = RandomBytes(kNonceBytes, &out->nonce);
  if (!s.ok()) return s;

  std::string key;
  s = DeriveKey(out->salt, &key);
  if (!s.ok()) return s;

  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) return Status::IOError("EVP_CIPHER_CTX_new failed");

  out->ciphertext.assign(obfuscated.size() + 16, '\0');
  int len = 0;
  int total = 0;
  auto* ct = reinterpret_cast<unsigned char*>(out->ciphertext.data());

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kNonceBytes), nullptr) != 1 ||
      EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, U8(key),
                         U8(out->nonce)) != 1) {
    return Status::IOError("AES-GCM init failed");
  }
  if (!aad.empty() &&
      EVP_EncryptUpdate(ctx.get(), nullptr, &len, U8(aad),
                        static_cast<int>(aad.size())) != 1) {
    return Status::IOError("AES-GCM aad failed");
  }
  if (EVP_EncryptUpdate(ctx.get(), ct, &len, U8(obfuscated),
                        static_cast<int>(obfuscated.size())) != 1) {
    return Status::IOError("AES-GCM encrypt failed");
  }
  total = len;
  if (EVP_EncryptFinal_ex(ctx.get(), ct + total, &len) != 1) {
    return Status::IOError("AES-GCM final failed");
  }
  total += len;
  out->ciphertext.resize(static_cast<size_t>(total));

  out->tag.assign(kTagBytes, '\0');
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          static_cast<int>(kTagBytes), out->tag.data()) != 1) {
    return Status::IOError("AES-GCM get tag failed");
  }
  return Status::OK();
}

Status FrameCipher::Open(const Sealed& sealed, std::string_view aad,
                         std::string* plaintext) const {
  if (sealed.salt.size() != kSaltBytes || sealed.nonce.size() != kNonceBytes ||
      sealed.tag.size() != kTagBytes) {
    return Status::Corruption("malformed sealed frame");
  }

  std::string key;
  Status s = DeriveKey(sealed.salt, &key);
  if (!s.ok()) return s;

  CipherCtx ctx(EVP_CIPHER_CTX_new());
  if (!ctx) return Status::IOError("EVP_CIPHER_CTX_new failed");

  std::string out(sealed.ciphertext.size() + 16, '\0');
  auto* pt = reinterpret_cast<unsigned char*>(out.data());
  int len = 0;
  int total = 0;

  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr,
                         nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(kNonceBytes), nullptr) != 1 ||
      EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, U8(key),
                         U8(sealed.nonce)) != 1) {
    return Status::IOError("AES-GCM init failed");
  }
  if (!aad.empty() &&
      EVP_DecryptUpdate(ctx.get(), nullptr, &len, U8(aad),
                        static_cast<int>(aad.size())) != 1) {
    return Status::Corruption("AES-GCM aad rejected");
  }
  if (EVP_DecryptUpdate(ctx.get(), pt, &len, U8(sealed.ciphertext),
                        static_cast<int>(sealed.ciphertext.size())) != 1) {
    return Status::Corruption("AES-GCM decrypt failed");
  }
  total = len;

  std::string tag = sealed.tag;
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          static_cast<int>(kTagBytes), tag.data()) != 1) {
    return Status::IOError("AES-GCM set tag failed");
  }
  if (EVP_DecryptFinal_ex(ctx.get(), pt + total, &len) != 1) {
    return Status::Corruption("frame authentication failed");
  }
  total += len;
  out.resize(static_cast<size_t>(total));

  Obfuscate(key_.seed, &out);
  *plaintext = std::move(out);
  return Status::OK();
}

}  // namespace engram
