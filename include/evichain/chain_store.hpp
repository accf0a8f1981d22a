#ifndef EVICHAIN_CHAIN_STORE_HPP
#define EVICHAIN_CHAIN_STORE_HPP

#include "evichain/evidence_types.hpp"
#include "evichain/record_hasher.hpp"
#include "evichain/storage.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace evichain {

/// Caller-supplied content of a new record.
struct AppendRequest {
  std::string sourceUrl;
  nlohmann::json extractedValue;
  std::vector<DomAnchor> anchors;
  std::optional<ScreenshotMeta> screenshot;
};

/**
 * @brief Owns the persisted evidence chains.
 *
 * Each chain lives in "chain-<id>.json" in the storage root and is only
 * ever changed by append(). The store does no locking of its own: callers
 * must not append to the same chain concurrently, and atomic replacement of
 * chain files is the storage layer's job. A failed append leaves the stored
 * chain exactly as it was.
 */
class ChainStore {
public:
  explicit ChainStore(Storage &storage);

  ChainStore(const ChainStore &) = delete;
  ChainStore &operator=(const ChainStore &) = delete;

  /**
   * @brief Create and persist an empty chain.
   * @throw ChainAlreadyExists If @p chainId is already persisted.
   * @throw std::invalid_argument If @p chainId is not a valid id.
   */
  EvidenceChain create(const std::string &chainId);

  /**
   * @brief Append a record linked to the current head.
   * @throw ChainNotFound If the chain does not exist.
   * @throw StorageFailure If the chain cannot be read or persisted.
   */
  EvidenceRecord append(const std::string &chainId,
                        const AppendRequest &request);

  /// Load a chain, or std::nullopt if it does not exist.
  std::optional<EvidenceChain> get(const std::string &chainId);

  /**
   * @brief Verify every link and record hash of a stored chain.
   *
   * Read-only. A missing chain yields valid=false with reason
   * ChainNotFound.
   */
  VerificationResult verify(const std::string &chainId);

  /**
   * @brief Write the chain to "exports/chain-<id>-<timestamp>.json".
   * @return Location of the export file.
   * @throw ChainNotFound If the chain does not exist.
   */
  std::string exportChain(const std::string &chainId);

  /// Ids of all persisted chains; empty if nothing has been stored yet.
  std::vector<std::string> list();

private:
  void save(const EvidenceChain &chain);

  Storage &storage_;
  RecordHasher hasher_;
};

} // namespace evichain

#endif // EVICHAIN_CHAIN_STORE_HPP
