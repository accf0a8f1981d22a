#include "evichain/digest.hpp"

#include <cppcodec/hex_lower.hpp>
#include <stdexcept>

namespace evichain {

const std::string GENESIS_SENTINEL(DIGEST_HEX_LENGTH, '0');

Sha256::Sha256() {
  // sodium_init() returns 1 when the library was already initialized
  if (sodium_init() < 0) {
    throw std::runtime_error("Failed to initialize libsodium");
  }
  crypto_hash_sha256_init(&state_);
}

void Sha256::ingest(std::span<const std::byte> data) {
  if (finalized_) {
    throw std::logic_error("Cannot ingest data after finalize() has been called.");
  }
  if (!data.empty()) {
    crypto_hash_sha256_update(
        &state_, reinterpret_cast<const unsigned char *>(data.data()),
        data.size());
  }
}

void Sha256::ingest(std::string_view data) {
  ingest(std::as_bytes(std::span<const char>(data.data(), data.size())));
}

DigestArray Sha256::finalize() {
  if (finalized_) {
    throw std::logic_error("finalize() already called.");
  }
  DigestArray digest{};
  crypto_hash_sha256_final(&state_, digest.data());
  finalized_ = true;
  return digest;
}

std::string Sha256::finalizeHex() { return toHex(finalize()); }

std::string toHex(const DigestArray &digest) {
  return cppcodec::hex_lower::encode(digest.data(), digest.size());
}

std::string sha256Hex(std::string_view data) {
  Sha256 hasher;
  hasher.ingest(data);
  return hasher.finalizeHex();
}

std::string sha256Hex(std::span<const std::byte> data) {
  Sha256 hasher;
  hasher.ingest(data);
  return hasher.finalizeHex();
}

bool isHexDigest(std::string_view value) {
  if (value.size() != DIGEST_HEX_LENGTH)
    return false;
  for (char c : value) {
    bool digit = c >= '0' && c <= '9';
    bool lower = c >= 'a' && c <= 'f';
    if (!digit && !lower)
      return false;
  }
  return true;
}

} // namespace evichain
