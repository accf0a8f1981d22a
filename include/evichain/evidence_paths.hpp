#pragma once

#include <string>

namespace evichain {

/**
 * Evidence root resolution, in order: setEvidenceRoot(),
 * $EVICHAIN_EVIDENCE_DIR, $XDG_DATA_HOME/evichain/evidence,
 * $HOME/.local/share/evichain/evidence, ./evichain/evidence.
 */
void setEvidenceRoot(const std::string &dir);
const std::string &getEvidenceRoot();

// Storage keys, relative to the evidence root.
std::string chainKey(const std::string &chainId);
std::string exportsPrefix();
std::string exportKey(const std::string &chainId, const std::string &timestamp);
std::string screenshotsPrefix(const std::string &chainId);

/// Chain id embedded in a chain file name, or "" if @p fileName is not one.
std::string chainIdFromFileName(const std::string &fileName);

/// Non-empty, at most 200 chars of [A-Za-z0-9._-], and not "." or "..".
bool isValidChainId(const std::string &chainId);

} // namespace evichain
