#include "evichain/errors.hpp"
#include "evichain/logger.h"

namespace evichain {

void throwChainNotFound(const std::string &chainId) {
  ChainNotFound err(chainId);
  Logger::getInstance().log(LogLevel::ERROR, err.what());
  throw err;
}

void throwChainAlreadyExists(const std::string &chainId) {
  ChainAlreadyExists err(chainId);
  Logger::getInstance().log(LogLevel::ERROR, err.what());
  throw err;
}

void throwStorageFailure(const std::string &key, const std::string &detail) {
  StorageFailure err(key, detail);
  Logger::getInstance().log(LogLevel::ERROR, err.what());
  throw err;
}

} // namespace evichain
