#pragma once
#include "flyodb/consts.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <iosfwd>
#include <span>
#include <string>
#include <string_view>

struct evp_md_ctx_st; // OpenSSL EVP_MD_CTX

namespace flyodb {

enum class HashAlgorithm : std::uint8_t { Sha1 = 1, Sha256 = 2 };

constexpr std::size_t raw_size(HashAlgorithm algo) {
  return algo == HashAlgorithm::Sha256 ? consts::kSha256RawLen : consts::kSha1RawLen;
}
constexpr std::size_t hex_size(HashAlgorithm algo) { return raw_size(algo) * 2; }

std::string_view algorithm_name(HashAlgorithm algo);

/**
 * Object id: the raw digest bytes plus the algorithm that produced them.
 * Bytes past raw_size() are always zero, so the defaulted comparisons
 * order ids by algorithm first and then lexicographically by digest.
 *
 * An abbreviated id is an Oid whose nibbles past the prefix are zero,
 * paired with a hex length (see from_hex_prefix / matches_prefix).
 */
class Oid {
public:
  Oid() = default;
  // Throws OdbError{InvalidArgument} when bytes.size() != raw_size(algo).
  Oid(HashAlgorithm algo, std::span<const std::uint8_t> bytes);

  static Oid zero(HashAlgorithm algo = HashAlgorithm::Sha1);

  [[nodiscard]] HashAlgorithm algorithm() const { return algo_; }
  [[nodiscard]] std::size_t raw_size() const { return flyodb::raw_size(algo_); }
  [[nodiscard]] std::size_t hex_size() const { return flyodb::hex_size(algo_); }
  [[nodiscard]] std::span<const std::uint8_t> bytes() const {
    return {bytes_.data(), raw_size()};
  }

  [[nodiscard]] bool is_zero() const;

  // Value of the i-th hex digit (0..15).
  [[nodiscard]] unsigned nibble(std::size_t i) const;

  // True when the first hex_len hex digits equal those of short_id.
  [[nodiscard]] bool matches_prefix(const Oid &short_id, std::size_t hex_len) const;

  // Copy with every nibble at or past hex_len cleared.
  [[nodiscard]] Oid truncated(std::size_t hex_len) const;

  [[nodiscard]] std::string hex() const;

  friend bool operator==(const Oid &, const Oid &) = default;
  friend auto operator<=>(const Oid &, const Oid &) = default;

private:
  HashAlgorithm algo_ = HashAlgorithm::Sha1;
  std::array<std::uint8_t, consts::kMaxRawLen> bytes_{};
};

std::ostream &operator<<(std::ostream &os, const Oid &id);

/** Convert oid to lowercase hex (40 or 64 chars). */
std::string to_hex(const Oid &id);

/**
 * Parse full-width hex into an oid of the given algorithm.
 * Returns false if length/characters are invalid. Accepts either case.
 */
bool from_hex(std::string_view hex, Oid &out, HashAlgorithm algo = HashAlgorithm::Sha1);

/**
 * Parse 1..full-width hex digits into an abbreviated oid; digits past the
 * prefix are zero. Returns false on bad characters or length.
 */
bool from_hex_prefix(std::string_view hex, Oid &out, HashAlgorithm algo = HashAlgorithm::Sha1);

// Throwing variant of from_hex; OdbError{InvalidArgument} names the input.
Oid parse_oid(std::string_view hex, HashAlgorithm algo = HashAlgorithm::Sha1);

/**
 * Incremental digest over the EVP API.
 * Usage:
 *   Hasher h{HashAlgorithm::Sha1};
 *   h.update(object_header("blob", n));
 *   h.update(payload);
 *   Oid id = h.finish();
 */
class Hasher {
public:
  explicit Hasher(HashAlgorithm algo);
  ~Hasher();
  Hasher(const Hasher &) = delete;
  Hasher &operator=(const Hasher &) = delete;
  Hasher(Hasher &&other) noexcept;
  Hasher &operator=(Hasher &&other) noexcept;

  void update(std::span<const std::uint8_t> data);
  void update(std::string_view s) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(s.data()),
                                         s.size()));
  }

  // Produce the digest. The hasher cannot be updated afterwards.
  Oid finish();

private:
  HashAlgorithm algo_;
  evp_md_ctx_st *ctx_ = nullptr;
};

// One-shot digest of arbitrary bytes.
Oid digest(HashAlgorithm algo, std::span<const std::uint8_t> data);

/**
 * Build the object header used for hashing and storage:
 *   "<type> <size>\\0"
 * Example:
 *   auto hdr = object_header("blob", bytes.size());
 */
inline std::string object_header(std::string_view type, std::size_t size) {
  std::string s;
  s.reserve(type.size() + 1 + 20 + 1); // rough reserve
  s.append(type);
  s.push_back(consts::kSpace);
  s.append(std::to_string(size));
  s.push_back(consts::kNul);
  return s;
}

} // namespace flyodb
