#ifndef EVICHAIN_RECORD_HASHER_HPP
#define EVICHAIN_RECORD_HASHER_HPP

#include "evichain/evidence_types.hpp"

#include <string>

namespace evichain {

/**
 * @brief Canonical digest of an evidence record.
 *
 * The digest input is the JSON object
 * {anchors, chainId, extractedAt, extractedValue, id, previousHash,
 * screenshot, sourceUrl} serialized with keys sorted at every level and no
 * whitespace. The output is SHA-256 over the UTF-8 bytes, in lowercase hex.
 *
 * Strings that are not valid UTF-8 cannot be canonicalized and cause
 * nlohmann::json::type_error to be thrown.
 */
class RecordHasher {
public:
  /**
   * @brief Canonical form of @p fields linked to @p previousHash.
   *
   * fields.recordHash and fields.previousHash are ignored.
   */
  std::string canonicalForm(const EvidenceRecord &fields,
                            const std::string &previousHash) const;

  /// SHA-256 of canonicalForm(fields, previousHash).
  std::string digest(const EvidenceRecord &fields,
                     const std::string &previousHash) const;

  /// True if the stored recordHash matches the record's own content and
  /// stored previousHash.
  bool verify(const EvidenceRecord &record) const;
};

} // namespace evichain

#endif // EVICHAIN_RECORD_HASHER_HPP
