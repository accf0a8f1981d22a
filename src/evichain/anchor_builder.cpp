#include "evichain/anchor_builder.hpp"
#include "evichain/logger.h"

#include <stdexcept>

namespace evichain {

AnchorTier selectPrimaryTier(const std::string &cssSelector,
                             const std::string &xpath) {
  if (!cssSelector.empty())
    return AnchorTier::Css;
  if (!xpath.empty())
    return AnchorTier::XPath;
  return AnchorTier::TextContent;
}

std::string truncateUtf8(const std::string &text, size_t maxChars) {
  size_t pos = 0;
  size_t chars = 0;
  while (pos < text.size() && chars < maxChars) {
    auto lead = static_cast<unsigned char>(text[pos]);
    size_t len = 1;
    if ((lead & 0xE0) == 0xC0)
      len = 2;
    else if ((lead & 0xF0) == 0xE0)
      len = 3;
    else if ((lead & 0xF8) == 0xF0)
      len = 4;

    // Only consume continuation bytes that are actually there.
    size_t end = pos + 1;
    while (end < text.size() && end < pos + len &&
           (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80)
      ++end;
    pos = end;
    ++chars;
  }
  return text.substr(0, pos);
}

DomAnchor AnchorBuilder::build(const std::string &cssSelector,
                               const std::string &xpath,
                               const std::string &textContent,
                               const std::optional<BoundingBox> &boundingBox) const {
  DomAnchor anchor;
  anchor.cssSelector = cssSelector;
  anchor.xpath = xpath;
  anchor.textContent = truncateUtf8(textContent, MAX_ANCHOR_TEXT_LENGTH);
  anchor.primaryTier = selectPrimaryTier(cssSelector, xpath);
  anchor.boundingBox = boundingBox;

  Logger::getInstance().log(
      LogLevel::DEBUG,
      "DOM anchor built: primaryTier=" + tierToString(anchor.primaryTier) +
          " hasSelector=" + (cssSelector.empty() ? "false" : "true") +
          " hasXpath=" + (xpath.empty() ? "false" : "true") +
          " textLength=" + std::to_string(textContent.size()));
  return anchor;
}

DomAnchor AnchorBuilder::buildFromInspection(const nlohmann::json &result) const {
  if (!result.is_object())
    throw std::invalid_argument("Inspection result must be a JSON object");

  std::optional<BoundingBox> box;
  auto it = result.find("boundingBox");
  if (it != result.end() && !it->is_null())
    box = it->get<BoundingBox>();

  return build(result.value("cssSelector", std::string()),
               result.value("xpath", std::string()),
               result.value("textContent", std::string()), box);
}

} // namespace evichain
