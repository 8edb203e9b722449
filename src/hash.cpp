#include "flyodb/hash.hpp"

#include "flyodb/consts.hpp"
#include "flyodb/error.hpp"

#include <algorithm>
#include <cstdint>
#include <openssl/evp.h> // EVP_* digest API
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace flyodb {

namespace {

int nibble_of(char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return 10 + (c - 'a');
  }
  if (c >= 'A' && c <= 'F') {
    return 10 + (c - 'A');
  }
  return -1;
}

const EVP_MD *evp_for(HashAlgorithm algo) {
  return algo == HashAlgorithm::Sha256 ? EVP_sha256() : EVP_sha1();
}

} // namespace

std::string_view algorithm_name(HashAlgorithm algo) {
  return algo == HashAlgorithm::Sha256 ? "sha256" : "sha1";
}

// Oid

Oid::Oid(HashAlgorithm algo, std::span<const std::uint8_t> bytes) : algo_(algo) {
  if (bytes.size() != flyodb::raw_size(algo)) {
    fail(ErrorCode::InvalidArgument, "oid",
         "expected " + std::to_string(flyodb::raw_size(algo)) + " bytes for " +
             std::string(algorithm_name(algo)) + ", got " + std::to_string(bytes.size()));
  }
  std::ranges::copy(bytes, bytes_.begin());
}

Oid Oid::zero(HashAlgorithm algo) {
  Oid id;
  id.algo_ = algo;
  return id;
}

bool Oid::is_zero() const {
  return std::ranges::all_of(bytes(), [](std::uint8_t b) { return b == 0; });
}

unsigned Oid::nibble(std::size_t i) const {
  const unsigned b = bytes_[i / 2];
  return (i % 2 == 0) ? (b >> 4U) & 0xFU : b & 0xFU;
}

bool Oid::matches_prefix(const Oid &short_id, std::size_t hex_len) const {
  if (algo_ != short_id.algo_ || hex_len > hex_size()) {
    return false;
  }
  const std::size_t full = hex_len / 2;
  if (!std::equal(bytes_.begin(), bytes_.begin() + static_cast<std::ptrdiff_t>(full),
                  short_id.bytes_.begin())) {
    return false;
  }
  if (hex_len % 2 != 0) {
    return (bytes_[full] & 0xF0U) == (short_id.bytes_[full] & 0xF0U);
  }
  return true;
}

Oid Oid::truncated(std::size_t hex_len) const {
  Oid out = *this;
  for (std::size_t i = hex_len; i < consts::kMaxRawLen * 2; ++i) {
    if (i % 2 == 0) {
      out.bytes_[i / 2] = 0;
    } else {
      out.bytes_[i / 2] &= 0xF0U;
    }
  }
  return out;
}

std::string Oid::hex() const { return to_hex(*this); }

std::ostream &operator<<(std::ostream &os, const Oid &id) { return os << to_hex(id); }

// Hex

std::string to_hex(const Oid &id) {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  const auto raw = id.bytes();
  std::string s;
  s.resize(raw.size() * 2);
  for (std::size_t i = 0; i < raw.size(); ++i) {
    unsigned b = raw[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

bool from_hex_prefix(std::string_view hex, Oid &out, HashAlgorithm algo) {
  if (hex.empty() || hex.size() > hex_size(algo)) {
    return false;
  }
  std::array<std::uint8_t, consts::kMaxRawLen> raw{};
  for (std::size_t i = 0; i < hex.size(); ++i) {
    const int v = nibble_of(hex[i]);
    if (v < 0) {
      return false;
    }
    if (i % 2 == 0) {
      raw[i / 2] = static_cast<std::uint8_t>(v << 4);
    } else {
      raw[i / 2] = static_cast<std::uint8_t>(raw[i / 2] | v);
    }
  }
  out = Oid(algo, std::span<const std::uint8_t>(raw.data(), raw_size(algo)));
  return true;
}

bool from_hex(std::string_view hex, Oid &out, HashAlgorithm algo) {
  if (hex.size() != hex_size(algo)) {
    return false;
  }
  return from_hex_prefix(hex, out, algo);
}

Oid parse_oid(std::string_view hex, HashAlgorithm algo) {
  Oid id;
  if (!from_hex(hex, id, algo)) {
    fail(ErrorCode::InvalidArgument, "oid",
         "bad " + std::string(algorithm_name(algo)) + " hex: '" + std::string(hex) + "'");
  }
  return id;
}

// Hasher

Hasher::Hasher(HashAlgorithm algo) : algo_(algo), ctx_(EVP_MD_CTX_new()) {
  if (!ctx_) {
    fail(ErrorCode::Io, "hash", "EVP_MD_CTX_new failed");
  }
  if (EVP_DigestInit_ex(ctx_, evp_for(algo_), nullptr) != 1) {
    EVP_MD_CTX_free(ctx_);
    ctx_ = nullptr;
    fail(ErrorCode::Io, "hash", "EVP_DigestInit_ex failed");
  }
}

Hasher::~Hasher() {
  if (ctx_) {
    EVP_MD_CTX_free(ctx_);
  }
}

Hasher::Hasher(Hasher &&other) noexcept
    : algo_(other.algo_), ctx_(std::exchange(other.ctx_, nullptr)) {}

Hasher &Hasher::operator=(Hasher &&other) noexcept {
  if (this != &other) {
    if (ctx_) {
      EVP_MD_CTX_free(ctx_);
    }
    algo_ = other.algo_;
    ctx_ = std::exchange(other.ctx_, nullptr);
  }
  return *this;
}

void Hasher::update(std::span<const std::uint8_t> data) {
  if (!ctx_) {
    fail(ErrorCode::InvalidState, "hash", "update after finish");
  }
  if (!data.empty() && EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
    fail(ErrorCode::Io, "hash", "EVP_DigestUpdate failed");
  }
}

Oid Hasher::finish() {
  if (!ctx_) {
    fail(ErrorCode::InvalidState, "hash", "finish called twice");
  }
  std::array<std::uint8_t, EVP_MAX_MD_SIZE> out{};
  unsigned int len = 0;
  const int rc = EVP_DigestFinal_ex(ctx_, out.data(), &len);
  EVP_MD_CTX_free(ctx_);
  ctx_ = nullptr;
  if (rc != 1) {
    fail(ErrorCode::Io, "hash", "EVP_DigestFinal_ex failed");
  }
  if (len != raw_size(algo_)) {
    fail(ErrorCode::Io, "hash", "digest produced unexpected length");
  }
  return Oid(algo_, std::span<const std::uint8_t>(out.data(), len));
}

Oid digest(HashAlgorithm algo, std::span<const std::uint8_t> data) {
  Hasher h{algo};
  h.update(data);
  return h.finish();
}

} // namespace flyodb
