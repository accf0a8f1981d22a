#include "evichain/record_hasher.hpp"
#include "evichain/digest.hpp"

#include <nlohmann/json.hpp>

namespace evichain {

std::string RecordHasher::canonicalForm(const EvidenceRecord &fields,
                                        const std::string &previousHash) const {
  // nlohmann::json stores objects in a std::map, so dump() emits keys in
  // lexicographic order at every nesting level.
  nlohmann::json j;
  j["id"] = fields.id;
  j["chainId"] = fields.chainId;
  j["sourceUrl"] = fields.sourceUrl;
  j["extractedAt"] = fields.extractedAt;
  j["extractedValue"] = fields.extractedValue;
  j["anchors"] = fields.anchors;
  j["screenshot"] = nullptr;
  if (fields.screenshot)
    j["screenshot"] = *fields.screenshot;
  j["previousHash"] = previousHash;
  return j.dump();
}

std::string RecordHasher::digest(const EvidenceRecord &fields,
                                 const std::string &previousHash) const {
  return sha256Hex(canonicalForm(fields, previousHash));
}

bool RecordHasher::verify(const EvidenceRecord &record) const {
  return digest(record, record.previousHash) == record.recordHash;
}

} // namespace evichain
