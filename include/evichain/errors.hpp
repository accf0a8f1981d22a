#ifndef EVICHAIN_ERRORS_HPP
#define EVICHAIN_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace evichain {

/// Base class of every error raised by the evidence chain.
class EvidenceError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// The requested chain has no persisted representation.
class ChainNotFound : public EvidenceError {
public:
  explicit ChainNotFound(const std::string &chainId)
      : EvidenceError("Evidence chain not found: " + chainId),
        chainId_(chainId) {}

  const std::string &chainId() const { return chainId_; }

private:
  std::string chainId_;
};

/// create() was called for an id that is already persisted.
class ChainAlreadyExists : public EvidenceError {
public:
  explicit ChainAlreadyExists(const std::string &chainId)
      : EvidenceError("Evidence chain already exists: " + chainId),
        chainId_(chainId) {}

  const std::string &chainId() const { return chainId_; }

private:
  std::string chainId_;
};

/**
 * @brief The storage layer could not complete a read, write or listing,
 * or returned content that does not decode.
 */
class StorageFailure : public EvidenceError {
public:
  StorageFailure(const std::string &key, const std::string &detail)
      : EvidenceError("Storage failure for \"" + key + "\": " + detail),
        key_(key) {}

  const std::string &key() const { return key_; }

private:
  std::string key_;
};

// Helpers that log the failure at ERROR before throwing.
[[noreturn]] void throwChainNotFound(const std::string &chainId);
[[noreturn]] void throwChainAlreadyExists(const std::string &chainId);
[[noreturn]] void throwStorageFailure(const std::string &key,
                                      const std::string &detail);

} // namespace evichain

#endif // EVICHAIN_ERRORS_HPP
