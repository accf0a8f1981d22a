#include "evichain/chain_store.hpp"
#include "evichain/chain_verifier.hpp"
#include "evichain/digest.hpp"
#include "evichain/errors.hpp"
#include "evichain/evidence_paths.hpp"
#include "evichain/logger.h"
#include "evichain/timestamp.hpp"

#include <algorithm>
#include <cppcodec/hex_lower.hpp>
#include <sodium.h>
#include <stdexcept>

namespace evichain {

namespace {

// Random (version 4) UUID.
std::string newRecordId() {
  unsigned char b[16];
  randombytes_buf(b, sizeof(b));
  b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
  b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);
  std::string hex = cppcodec::hex_lower::encode(b, sizeof(b));
  return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) +
         "-" + hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

} // namespace

ChainStore::ChainStore(Storage &storage) : storage_(storage) {
  if (sodium_init() < 0)
    throw std::runtime_error("Failed to initialize libsodium");
}

void ChainStore::save(const EvidenceChain &chain) {
  storage_.write(chainKey(chain.chainId), serializeChain(chain));
}

EvidenceChain ChainStore::create(const std::string &chainId) {
  if (!isValidChainId(chainId))
    throw std::invalid_argument("Invalid chain id: " + chainId);
  if (storage_.exists(chainKey(chainId)))
    throwChainAlreadyExists(chainId);

  Logger::getInstance().log(LogLevel::INFO, "Creating evidence chain " + chainId);

  EvidenceChain chain;
  chain.chainId = chainId;
  chain.createdAt = isoTimestamp();
  chain.genesisHash = GENESIS_SENTINEL;
  chain.headHash = GENESIS_SENTINEL;
  chain.length = 0;
  save(chain);
  return chain;
}

std::optional<EvidenceChain> ChainStore::get(const std::string &chainId) {
  if (!isValidChainId(chainId))
    return std::nullopt;

  const std::string key = chainKey(chainId);
  std::optional<std::string> raw = storage_.read(key);
  if (!raw)
    return std::nullopt;

  try {
    return parseChain(*raw);
  } catch (const nlohmann::json::exception &e) {
    throwStorageFailure(key, std::string("malformed chain file: ") + e.what());
  } catch (const std::invalid_argument &e) {
    throwStorageFailure(key, std::string("malformed chain file: ") + e.what());
  }
}

EvidenceRecord ChainStore::append(const std::string &chainId,
                                  const AppendRequest &request) {
  std::optional<EvidenceChain> chain = get(chainId);
  if (!chain)
    throwChainNotFound(chainId);

  EvidenceRecord record;
  record.id = newRecordId();
  record.chainId = chainId;
  record.sourceUrl = request.sourceUrl;
  record.extractedAt = isoTimestamp();
  record.extractedValue = request.extractedValue;
  record.anchors = request.anchors;
  record.screenshot = request.screenshot;
  record.previousHash = chain->headHash;
  record.recordHash = hasher_.digest(record, record.previousHash);

  chain->records.push_back(record);
  chain->headHash = record.recordHash;
  chain->length = chain->records.size();
  // genesisHash identifies the first record from here on; records[0] still
  // links to GENESIS_SENTINEL.
  if (chain->records.size() == 1)
    chain->genesisHash = record.recordHash;

  try {
    save(*chain);
  } catch (const StorageFailure &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Failed to append evidence record to chain " +
                                  chainId + ": " + e.what());
    throw;
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "Evidence record appended: chain=" + chainId +
                                " record=" + record.id +
                                " length=" + std::to_string(chain->length));
  return record;
}

VerificationResult ChainStore::verify(const std::string &chainId) {
  std::optional<std::string> raw;
  const std::string key = isValidChainId(chainId) ? chainKey(chainId) : "";
  if (!key.empty())
    raw = storage_.read(key);
  if (!raw) {
    VerificationResult result;
    result.chainId = chainId;
    result.valid = false;
    result.reason = BreakReason::ChainNotFound;
    result.message = "Chain not found";
    result.verifiedAt = isoTimestamp();
    return result;
  }

  // Records are checked as stored; only a file that is not a chain document
  // at all is a storage failure.
  VerificationResult result;
  try {
    result = verifyChainDocument(nlohmann::json::parse(*raw), hasher_);
  } catch (const nlohmann::json::parse_error &e) {
    throwStorageFailure(key, std::string("malformed chain file: ") + e.what());
  } catch (const std::invalid_argument &e) {
    throwStorageFailure(key, std::string("malformed chain file: ") + e.what());
  }
  if (result.chainId.empty())
    result.chainId = chainId;
  if (result.valid) {
    Logger::getInstance().log(LogLevel::INFO,
                              "Evidence chain verified: chain=" + chainId +
                                  " records=" +
                                  std::to_string(result.recordCount));
  } else {
    Logger::getInstance().log(LogLevel::WARN, "Evidence chain " + chainId +
                                                  ": " + result.message);
  }
  return result;
}

std::string ChainStore::exportChain(const std::string &chainId) {
  std::optional<EvidenceChain> chain = get(chainId);
  if (!chain)
    throwChainNotFound(chainId);

  const std::string stamp = fileSafeTimestamp(isoTimestamp());
  const std::string document = serializeChain(*chain);
  std::string key = exportKey(chainId, stamp);
  for (int n = 1; !storage_.create(key, document); ++n)
    key = exportKey(chainId, stamp + "-" + std::to_string(n));

  std::string path = storage_.resolve(key);
  Logger::getInstance().log(LogLevel::INFO, "Evidence chain exported: chain=" +
                                                chainId + " path=" + path);
  return path;
}

std::vector<std::string> ChainStore::list() {
  std::vector<std::string> ids;
  for (const auto &name : storage_.list("")) {
    std::string id = chainIdFromFileName(name);
    if (!id.empty())
      ids.push_back(id);
  }
  std::sort(ids.begin(), ids.end());
  return ids;
}

} // namespace evichain
