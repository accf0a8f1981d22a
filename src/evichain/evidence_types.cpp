#include "evichain/evidence_types.hpp"

#include <limits>
#include <stdexcept>

namespace evichain {

namespace {

// Pixel dimensions must be stored as integers that fit uint32_t; anything
// else would be silently narrowed by get_to().
uint32_t dimensionFrom(const nlohmann::json &j, const char *key) {
  const nlohmann::json &value = j.at(key);
  if (!value.is_number_unsigned() ||
      value.get<uint64_t>() > std::numeric_limits<uint32_t>::max())
    throw std::invalid_argument(std::string("Screenshot ") + key +
                                " out of range: " + value.dump());
  return static_cast<uint32_t>(value.get<uint64_t>());
}

} // namespace

std::string tierToString(AnchorTier tier) {
  switch (tier) {
  case AnchorTier::Css:
    return "css";
  case AnchorTier::XPath:
    return "xpath";
  case AnchorTier::TextContent:
    return "text-content";
  }
  throw std::invalid_argument("Unknown anchor tier");
}

AnchorTier tierFromString(const std::string &value) {
  if (value == "css")
    return AnchorTier::Css;
  if (value == "xpath")
    return AnchorTier::XPath;
  if (value == "text-content")
    return AnchorTier::TextContent;
  throw std::invalid_argument("Unknown anchor tier: " + value);
}

std::string formatToString(ImageFormat format) {
  switch (format) {
  case ImageFormat::Png:
    return "png";
  case ImageFormat::Jpeg:
    return "jpeg";
  }
  throw std::invalid_argument("Unknown image format");
}

ImageFormat formatFromString(const std::string &value) {
  if (value == "png")
    return ImageFormat::Png;
  if (value == "jpeg")
    return ImageFormat::Jpeg;
  throw std::invalid_argument("Unknown image format: " + value);
}

std::string reasonToString(BreakReason reason) {
  switch (reason) {
  case BreakReason::None:
    return "none";
  case BreakReason::LinkMismatch:
    return "link mismatch";
  case BreakReason::HashMismatch:
    return "hash mismatch";
  case BreakReason::ChainNotFound:
    return "chain not found";
  }
  return "unknown";
}

void to_json(nlohmann::json &j, const BoundingBox &box) {
  j = nlohmann::json{{"x", box.x},
                     {"y", box.y},
                     {"width", box.width},
                     {"height", box.height}};
}

void from_json(const nlohmann::json &j, BoundingBox &box) {
  j.at("x").get_to(box.x);
  j.at("y").get_to(box.y);
  j.at("width").get_to(box.width);
  j.at("height").get_to(box.height);
}

void to_json(nlohmann::json &j, const DomAnchor &anchor) {
  j = nlohmann::json{{"cssSelector", anchor.cssSelector},
                     {"xpath", anchor.xpath},
                     {"textContent", anchor.textContent},
                     {"primaryTier", tierToString(anchor.primaryTier)}};
  // An absent box is omitted rather than written as null.
  if (anchor.boundingBox)
    j["boundingBox"] = *anchor.boundingBox;
}

void from_json(const nlohmann::json &j, DomAnchor &anchor) {
  j.at("cssSelector").get_to(anchor.cssSelector);
  j.at("xpath").get_to(anchor.xpath);
  j.at("textContent").get_to(anchor.textContent);
  anchor.primaryTier = tierFromString(j.at("primaryTier").get<std::string>());
  auto it = j.find("boundingBox");
  if (it != j.end() && !it->is_null())
    anchor.boundingBox = it->get<BoundingBox>();
  else
    anchor.boundingBox.reset();
}

void to_json(nlohmann::json &j, const ScreenshotMeta &meta) {
  j = nlohmann::json{{"hash", meta.hash},
                     {"path", meta.path},
                     {"width", meta.width},
                     {"height", meta.height},
                     {"capturedAt", meta.capturedAt},
                     {"format", formatToString(meta.format)}};
}

void from_json(const nlohmann::json &j, ScreenshotMeta &meta) {
  j.at("hash").get_to(meta.hash);
  j.at("path").get_to(meta.path);
  meta.width = dimensionFrom(j, "width");
  meta.height = dimensionFrom(j, "height");
  j.at("capturedAt").get_to(meta.capturedAt);
  meta.format = formatFromString(j.at("format").get<std::string>());
}

void to_json(nlohmann::json &j, const EvidenceRecord &record) {
  j = nlohmann::json{{"id", record.id},
                     {"chainId", record.chainId},
                     {"sourceUrl", record.sourceUrl},
                     {"extractedAt", record.extractedAt},
                     {"extractedValue", record.extractedValue},
                     {"anchors", record.anchors},
                     {"screenshot", nullptr},
                     {"recordHash", record.recordHash},
                     {"previousHash", record.previousHash}};
  if (record.screenshot)
    j["screenshot"] = *record.screenshot;
}

void from_json(const nlohmann::json &j, EvidenceRecord &record) {
  j.at("id").get_to(record.id);
  j.at("chainId").get_to(record.chainId);
  j.at("sourceUrl").get_to(record.sourceUrl);
  j.at("extractedAt").get_to(record.extractedAt);
  auto value = j.find("extractedValue");
  record.extractedValue = value != j.end() ? *value : nlohmann::json();
  j.at("anchors").get_to(record.anchors);
  const auto &shot = j.at("screenshot");
  if (shot.is_null())
    record.screenshot.reset();
  else
    record.screenshot = shot.get<ScreenshotMeta>();
  j.at("recordHash").get_to(record.recordHash);
  j.at("previousHash").get_to(record.previousHash);
}

void to_json(nlohmann::json &j, const EvidenceChain &chain) {
  j = nlohmann::json{{"chainId", chain.chainId},
                     {"createdAt", chain.createdAt},
                     {"records", chain.records},
                     {"genesisHash", chain.genesisHash},
                     {"headHash", chain.headHash},
                     {"length", chain.length}};
}

void from_json(const nlohmann::json &j, EvidenceChain &chain) {
  j.at("chainId").get_to(chain.chainId);
  j.at("createdAt").get_to(chain.createdAt);
  j.at("records").get_to(chain.records);
  j.at("genesisHash").get_to(chain.genesisHash);
  j.at("headHash").get_to(chain.headHash);
  j.at("length").get_to(chain.length);
}

void to_json(nlohmann::json &j, const VerificationResult &result) {
  j = nlohmann::json{{"chainId", result.chainId},
                     {"valid", result.valid},
                     {"recordCount", result.recordCount},
                     {"reason", reasonToString(result.reason)},
                     {"message", result.message},
                     {"verifiedAt", result.verifiedAt}};
  if (result.brokenAt)
    j["brokenAt"] = *result.brokenAt;
}

std::string serializeChain(const EvidenceChain &chain) {
  return nlohmann::json(chain).dump(2);
}

EvidenceChain parseChain(const std::string &text) {
  return nlohmann::json::parse(text).get<EvidenceChain>();
}

} // namespace evichain
