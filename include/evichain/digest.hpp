#ifndef EVICHAIN_DIGEST_HPP
#define EVICHAIN_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <sodium.h>
#include <span>
#include <string>
#include <string_view>

namespace evichain {

/// Digest size of SHA-256 (32 bytes).
inline constexpr size_t DIGEST_SIZE = crypto_hash_sha256_BYTES;

/// Length of a digest rendered as lowercase hex.
inline constexpr size_t DIGEST_HEX_LENGTH = DIGEST_SIZE * 2;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/// All-zero digest used as previousHash of the first record in every chain.
extern const std::string GENESIS_SENTINEL;

/**
 * @brief Incremental SHA-256 hasher backed by libsodium.
 *
 * Data may be ingested in any number of pieces; finalize() may only be
 * called once.
 */
class Sha256 {
public:
  Sha256();

  void ingest(std::span<const std::byte> data);
  void ingest(std::string_view data);

  /**
   * @brief Finish hashing and return the raw digest.
   * @throw std::logic_error If called more than once.
   */
  DigestArray finalize();

  /** Finish hashing and return the digest as lowercase hex. */
  std::string finalizeHex();

private:
  crypto_hash_sha256_state state_;
  bool finalized_ = false;
};

/// Lowercase hex rendering of a digest.
std::string toHex(const DigestArray &digest);

std::string sha256Hex(std::string_view data);
std::string sha256Hex(std::span<const std::byte> data);

/// True if @p value is exactly 64 lowercase hex characters.
bool isHexDigest(std::string_view value);

} // namespace evichain

#endif // EVICHAIN_DIGEST_HPP
