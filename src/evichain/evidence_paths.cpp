#include "evichain/evidence_paths.hpp"

#include <cstdlib>

namespace evichain {

namespace {

const std::string kChainPrefix = "chain-";
const std::string kChainSuffix = ".json";

std::string defaultEvidenceRoot() {
  const char *env = std::getenv("EVICHAIN_EVIDENCE_DIR");
  if (env && env[0] != '\0')
    return std::string(env);
  const char *xdg = std::getenv("XDG_DATA_HOME");
  if (xdg && xdg[0] != '\0')
    return std::string(xdg) + "/evichain/evidence";
  const char *home = std::getenv("HOME");
  if (home && home[0] != '\0')
    return std::string(home) + "/.local/share/evichain/evidence";
  return "evichain/evidence";
}

} // namespace

static std::string evidenceRoot = defaultEvidenceRoot();

void setEvidenceRoot(const std::string &dir) { evidenceRoot = dir; }

const std::string &getEvidenceRoot() { return evidenceRoot; }

std::string chainKey(const std::string &chainId) {
  return kChainPrefix + chainId + kChainSuffix;
}

std::string exportsPrefix() { return "exports"; }

std::string exportKey(const std::string &chainId,
                      const std::string &timestamp) {
  return exportsPrefix() + "/" + kChainPrefix + chainId + "-" + timestamp +
         kChainSuffix;
}

std::string screenshotsPrefix(const std::string &chainId) {
  return "screenshots/" + chainId;
}

std::string chainIdFromFileName(const std::string &fileName) {
  if (fileName.size() <= kChainPrefix.size() + kChainSuffix.size())
    return "";
  if (fileName.compare(0, kChainPrefix.size(), kChainPrefix) != 0)
    return "";
  if (fileName.compare(fileName.size() - kChainSuffix.size(),
                       kChainSuffix.size(), kChainSuffix) != 0)
    return "";
  return fileName.substr(kChainPrefix.size(), fileName.size() -
                                                  kChainPrefix.size() -
                                                  kChainSuffix.size());
}

bool isValidChainId(const std::string &chainId) {
  if (chainId.empty() || chainId.size() > 200)
    return false;
  if (chainId == "." || chainId == "..")
    return false;
  for (char c : chainId) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
              (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    if (!ok)
      return false;
  }
  return true;
}

} // namespace evichain
