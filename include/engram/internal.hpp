#pragma once
#include <array>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <string>
#include <string_view>
#include <vector>

#include <openssl/evp.h>

namespace engram::internal {

template <typename ClockT>
inline uint64_t MicrosSinceEpoch() {
  auto since = ClockT::now().time_since_epoch();
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::microseconds>(since).count());
}

// Steady clock, microseconds. Latency only.
inline uint64_t NowMicros() { return MicrosSinceEpoch<std::chrono::steady_clock>(); }

// Microseconds since the Unix epoch. Used for created_at, TTL and retention.
inline uint64_t WallClockMicros() { return MicrosSinceEpoch<std::chrono::system_clock>(); }

// One-shot SHA-256 through EVP_Digest. A failed digest leaves the output
// zeroed, which no stored frame id can equal.
class Sha256 {
 public:
  static constexpr size_t kDigestBytes = 32;
  using Digest_t = std::array<uint8_t, kDigestBytes>;

  static Digest_t Digest(std::string_view data) {
    Digest_t out{};
    unsigned int written = 0;
    if (EVP_Digest(data.data(), data.size(), out.data(), &written, EVP_sha256(),
                   nullptr) != 1 ||
        written != kDigestBytes) {
      out.fill(0);
    }
    return out;
  }
};

inline std::string ToBytes(const uint8_t* p, size_t n) {
  return std::string(p, p + n);
}

inline std::string HexEncode(std::string_view bytes) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(bytes.size() * 2);
  for (char c : bytes) {
    auto b = static_cast<uint8_t>(c);
    out.push_back(kHex[b >> 4]);
    out.push_back(kHex[b & 0x0f]);
  }
  return out;
}

inline bool HexDecode(std::string_view hex, std::string* out) {
  if (hex.size() % 2 != 0) return false;
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  };
  out->clear();
  out->reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = nibble(hex[i]);
    int lo = nibble(hex[i + 1]);
    if (hi < 0 || lo < 0) return false;
    out->push_back(static_cast<char>((hi << 4) | lo));
  }
  return true;
}

// Hex-encoded SHA-256 of data. This is the content-address format used for
// frame ids and cache keys.
inline std::string Sha256Hex(std::string_view data) {
  auto d = Sha256::Digest(data);
  return HexEncode(std::string_view(reinterpret_cast<const char*>(d.data()), d.size()));
}

// Fixed-width little-endian integers. All on-disk and RocksDB integers
// use these.
template <typename UInt>
inline std::string EncodeLE(UInt v) {
  std::string bytes;
  bytes.reserve(sizeof(UInt));
  for (size_t shift = 0; shift < sizeof(UInt) * 8; shift += 8) {
    bytes.push_back(static_cast<char>((v >> shift) & 0xff));
  }
  return bytes;
}

template <typename UInt>
inline bool DecodeLE(std::string_view bytes, UInt* out) {
  if (bytes.size() != sizeof(UInt)) return false;
  UInt v = 0;
  for (size_t i = 0; i < sizeof(UInt); ++i) {
    v |= static_cast<UInt>(static_cast<uint8_t>(bytes[i])) << (8 * i);
  }
  *out = v;
  return true;
}

inline std::string EncodeU64LE(uint64_t v) { return EncodeLE<uint64_t>(v); }
inline bool DecodeU64LE(std::string_view s, uint64_t* out) { return DecodeLE(s, out); }
inline std::string EncodeU32LE(uint32_t v) { return EncodeLE<uint32_t>(v); }
inline bool DecodeU32LE(std::string_view s, uint32_t* out) { return DecodeLE(s, out); }

// --- embeddings ------------------------------------------------------------

constexpr size_t kDefaultEmbeddingDimensions = 384;

// Vectors persist as packed IEEE floats, each stored as its LE bit pattern.
inline std::string SerializeEmbedding(const std::vector<float>& vec) {
  std::string bytes;
  bytes.reserve(vec.size() * sizeof(float));
  for (float f : vec) {
    uint32_t bits = 0;
    std::memcpy(&bits, &f, sizeof(bits));
    bytes += EncodeU32LE(bits);
  }
  return bytes;
}

inline bool DeserializeEmbedding(std::string_view bytes, std::vector<float>* out) {
  if (bytes.size() % sizeof(float) != 0) return false;
  out->clear();
  out->reserve(bytes.size() / sizeof(float));
  for (size_t off = 0; off < bytes.size(); off += sizeof(float)) {
    uint32_t bits = 0;
    if (!DecodeU32LE(bytes.substr(off, sizeof(float)), &bits)) return false;
    float f = 0.0f;
    std::memcpy(&f, &bits, sizeof(f));
    out->push_back(f);
  }
  return true;
}

// Scale to unit L2 norm in place. Returns false for an all-zero vector.
inline bool L2Normalize(std::vector<float>* v) {
  float norm = 0.0f;
  for (float x : *v) norm += x * x;
  norm = std::sqrt(norm);
  if (norm < 1e-12f) return false;
  for (float& x : *v) x /= norm;
  return true;
}

// Cosine in [-1, 1]. Mismatched, empty or zero vectors score 0.
inline float CosineSimilarity(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.empty() || a.size() != b.size()) return 0.0f;
  double ab = 0.0, aa = 0.0, bb = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    ab += static_cast<double>(a[i]) * b[i];
    aa += static_cast<double>(a[i]) * a[i];
    bb += static_cast<double>(b[i]) * b[i];
  }
  if (aa <= 0.0 || bb <= 0.0) return 0.0f;
  return static_cast<float>(ab / (std::sqrt(aa) * std::sqrt(bb)));
}

// hnswlib's L2Space reports squared L2 distance. For unit vectors
// |a-b|^2 = 2 - 2*cos(a,b).
inline float SquaredL2ToCosine(float l2_sq) {
  return 1.0f - l2_sq / 2.0f;
}

}  // namespace engram::internal
