#ifndef EVICHAIN_CHAIN_VERIFIER_HPP
#define EVICHAIN_CHAIN_VERIFIER_HPP

#include "evichain/evidence_types.hpp"
#include "evichain/record_hasher.hpp"

#include <nlohmann/json.hpp>
#include <string>

namespace evichain {

/**
 * @brief Walk the links of a chain document as it was stored.
 *
 * Starting from GENESIS_SENTINEL, every record must point at its
 * predecessor (checked first) and its stored hash must match its content.
 * A record that does not decode, or that does not re-encode to exactly the
 * stored JSON, cannot be covered by its hash and fails as a hash mismatch
 * (or a link mismatch if its stored previousHash is already wrong). The
 * first failing record is reported in brokenAt; nothing is thrown for a
 * broken chain.
 *
 * @throw std::invalid_argument If @p document is not an object with a
 * "records" array.
 */
VerificationResult verifyChainDocument(const nlohmann::json &document,
                                       const RecordHasher &hasher = RecordHasher());

/// verifyChainDocument() for an in-memory chain.
VerificationResult verifyChain(const EvidenceChain &chain,
                               const RecordHasher &hasher = RecordHasher());

/**
 * @brief Read a chain file written by ChainStore (a chain file or an
 * export) as raw JSON, for verification by an independent process.
 * @throw StorageFailure If the file is missing, unreadable, not JSON, or
 * not a JSON object.
 */
nlohmann::json loadChainDocument(const std::string &path);

/**
 * @brief loadChainDocument() decoded into the typed model.
 * @throw StorageFailure If the document does not decode.
 */
EvidenceChain loadChainFile(const std::string &path);

/// One-line summary such as "Chain broken at record 3: record hash mismatch".
std::string describe(const VerificationResult &result);

} // namespace evichain

#endif // EVICHAIN_CHAIN_VERIFIER_HPP
