#include "evichain/chain_verifier.hpp"
#include "evichain/digest.hpp"
#include "evichain/errors.hpp"
#include "evichain/logger.h"
#include "evichain/timestamp.hpp"

#include <fstream>
#include <iterator>
#include <optional>
#include <stdexcept>

namespace evichain {

namespace {

VerificationResult broken(const std::string &chainId, size_t recordCount,
                          size_t index, BreakReason reason) {
  VerificationResult result;
  result.chainId = chainId;
  result.valid = false;
  result.recordCount = recordCount;
  result.brokenAt = index;
  result.reason = reason;
  result.message = "Chain broken at record " + std::to_string(index) + ": " +
                   (reason == BreakReason::LinkMismatch
                        ? "previousHash mismatch"
                        : "record hash mismatch");
  result.verifiedAt = isoTimestamp();
  return result;
}

// The typed record, if @p stored decodes and re-encodes to the same JSON.
// Anything lost in between would sit outside the recomputed hash.
std::optional<EvidenceRecord> decodeRecord(const nlohmann::json &stored,
                                           size_t index) {
  std::string problem;
  try {
    EvidenceRecord record = stored.get<EvidenceRecord>();
    if (nlohmann::json(record) == stored)
      return record;
    problem = "stored fields do not round-trip";
  } catch (const nlohmann::json::exception &e) {
    problem = e.what();
  } catch (const std::invalid_argument &e) {
    problem = e.what();
  }
  Logger::getInstance().log(LogLevel::WARN, "Record " + std::to_string(index) +
                                                " does not decode: " + problem);
  return std::nullopt;
}

} // namespace

VerificationResult verifyChainDocument(const nlohmann::json &document,
                                       const RecordHasher &hasher) {
  if (!document.is_object())
    throw std::invalid_argument("chain document is not a JSON object");
  auto records = document.find("records");
  if (records == document.end() || !records->is_array())
    throw std::invalid_argument("chain document has no records array");

  std::string chainId;
  auto id = document.find("chainId");
  if (id != document.end() && id->is_string())
    chainId = id->get<std::string>();
  const size_t count = records->size();

  std::string expectedPrevious = GENESIS_SENTINEL;
  for (size_t i = 0; i < count; ++i) {
    const nlohmann::json &stored = (*records)[i];
    std::optional<EvidenceRecord> record = decodeRecord(stored, i);
    if (!record) {
      auto previous = stored.is_object() ? stored.find("previousHash")
                                         : stored.end();
      if (previous != stored.end() &&
          (!previous->is_string() ||
           previous->get<std::string>() != expectedPrevious))
        return broken(chainId, count, i, BreakReason::LinkMismatch);
      return broken(chainId, count, i, BreakReason::HashMismatch);
    }
    if (record->previousHash != expectedPrevious)
      return broken(chainId, count, i, BreakReason::LinkMismatch);
    if (!hasher.verify(*record))
      return broken(chainId, count, i, BreakReason::HashMismatch);
    expectedPrevious = record->recordHash;
  }

  VerificationResult result;
  result.chainId = chainId;
  result.valid = true;
  result.recordCount = count;
  result.message = "Chain integrity verified";
  result.verifiedAt = isoTimestamp();
  return result;
}

VerificationResult verifyChain(const EvidenceChain &chain,
                               const RecordHasher &hasher) {
  return verifyChainDocument(nlohmann::json(chain), hasher);
}

nlohmann::json loadChainDocument(const std::string &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    throwStorageFailure(path, "cannot open chain file");
  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error &e) {
    throwStorageFailure(path, std::string("malformed chain file: ") + e.what());
  }
  if (!document.is_object())
    throwStorageFailure(path, "malformed chain file: not a JSON object");
  return document;
}

EvidenceChain loadChainFile(const std::string &path) {
  nlohmann::json document = loadChainDocument(path);
  try {
    return document.get<EvidenceChain>();
  } catch (const nlohmann::json::exception &e) {
    throwStorageFailure(path, std::string("malformed chain file: ") + e.what());
  } catch (const std::invalid_argument &e) {
    throwStorageFailure(path, std::string("malformed chain file: ") + e.what());
  }
}

std::string describe(const VerificationResult &result) {
  if (result.valid)
    return "Chain " + result.chainId + " verified: " +
           std::to_string(result.recordCount) + " records";
  return result.message;
}

} // namespace evichain
