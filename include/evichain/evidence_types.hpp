#ifndef EVICHAIN_EVIDENCE_TYPES_HPP
#define EVICHAIN_EVIDENCE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace evichain {

/// Locator strategy used first when re-finding an element.
enum class AnchorTier { Css, XPath, TextContent };

std::string tierToString(AnchorTier tier);
/// @throw std::invalid_argument For anything but "css", "xpath", "text-content".
AnchorTier tierFromString(const std::string &value);

enum class ImageFormat { Png, Jpeg };

std::string formatToString(ImageFormat format);
/// @throw std::invalid_argument For anything but "png" or "jpeg".
ImageFormat formatFromString(const std::string &value);

/// Element position in viewport coordinates at capture time.
struct BoundingBox {
  double x = 0;
  double y = 0;
  double width = 0;
  double height = 0;

  bool operator==(const BoundingBox &) const = default;
};

/**
 * @brief Redundant locator for an extracted element.
 *
 * Built by AnchorBuilder; primaryTier is derived from which locators
 * are present.
 */
struct DomAnchor {
  std::string cssSelector;
  std::string xpath;
  std::string textContent;
  AnchorTier primaryTier = AnchorTier::TextContent;
  std::optional<BoundingBox> boundingBox;

  bool operator==(const DomAnchor &) const = default;
};

/// Integrity record of a persisted screenshot.
struct ScreenshotMeta {
  std::string hash;       ///< SHA-256 of the raw image bytes
  std::string path;       ///< Path relative to the evidence root
  uint32_t width = 0;     ///< 0 when the header could not be parsed
  uint32_t height = 0;    ///< 0 when the header could not be parsed
  std::string capturedAt; ///< ISO-8601 timestamp
  ImageFormat format = ImageFormat::Png;

  bool operator==(const ScreenshotMeta &) const = default;
};

/// One hash-linked entry of an evidence chain.
struct EvidenceRecord {
  std::string id;
  std::string chainId;
  std::string sourceUrl;
  std::string extractedAt;
  nlohmann::json extractedValue;
  std::vector<DomAnchor> anchors;
  std::optional<ScreenshotMeta> screenshot;
  std::string recordHash;
  std::string previousHash;
};

/**
 * @brief Append-only ledger of evidence records.
 *
 * genesisHash starts as GENESIS_SENTINEL and is replaced with the first
 * record's hash when that record is appended. records[0].previousHash
 * always stays GENESIS_SENTINEL.
 */
struct EvidenceChain {
  std::string chainId;
  std::string createdAt;
  std::vector<EvidenceRecord> records;
  std::string genesisHash;
  std::string headHash;
  size_t length = 0;
};

/// Why a chain failed verification.
enum class BreakReason { None, LinkMismatch, HashMismatch, ChainNotFound };

std::string reasonToString(BreakReason reason);

struct VerificationResult {
  std::string chainId;
  bool valid = false;
  size_t recordCount = 0;
  std::optional<size_t> brokenAt;
  BreakReason reason = BreakReason::None;
  std::string message;
  std::string verifiedAt;
};

// nlohmann::json ADL hooks. Key names match the persisted chain format.
void to_json(nlohmann::json &j, const BoundingBox &box);
void from_json(const nlohmann::json &j, BoundingBox &box);
void to_json(nlohmann::json &j, const DomAnchor &anchor);
void from_json(const nlohmann::json &j, DomAnchor &anchor);
void to_json(nlohmann::json &j, const ScreenshotMeta &meta);
void from_json(const nlohmann::json &j, ScreenshotMeta &meta);
void to_json(nlohmann::json &j, const EvidenceRecord &record);
void from_json(const nlohmann::json &j, EvidenceRecord &record);
void to_json(nlohmann::json &j, const EvidenceChain &chain);
void from_json(const nlohmann::json &j, EvidenceChain &chain);
void to_json(nlohmann::json &j, const VerificationResult &result);

/// Pretty-printed JSON document for a chain file.
std::string serializeChain(const EvidenceChain &chain);

/**
 * @brief Decode a chain file.
 * @throw nlohmann::json::exception or std::invalid_argument on malformed
 * content.
 */
EvidenceChain parseChain(const std::string &text);

} // namespace evichain

#endif // EVICHAIN_EVIDENCE_TYPES_HPP
