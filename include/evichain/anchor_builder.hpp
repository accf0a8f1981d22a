#ifndef EVICHAIN_ANCHOR_BUILDER_HPP
#define EVICHAIN_ANCHOR_BUILDER_HPP

#include "evichain/evidence_types.hpp"

#include <cstddef>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace evichain {

/// Maximum number of characters kept from an element's text content.
inline constexpr size_t MAX_ANCHOR_TEXT_LENGTH = 500;

/**
 * @brief Pick the primary locator tier.
 *
 * CSS when a selector is present, otherwise XPath when present, otherwise
 * text content.
 */
AnchorTier selectPrimaryTier(const std::string &cssSelector,
                             const std::string &xpath);

/**
 * @brief First @p maxChars code points of a UTF-8 string.
 *
 * Multi-byte sequences are never split. Bytes that are not valid UTF-8
 * lead bytes count as one character each.
 */
std::string truncateUtf8(const std::string &text, size_t maxChars);

/**
 * @brief Turns locator strings computed by a document inspector into a
 * DomAnchor.
 *
 * Pure transform: no storage or network access.
 */
class AnchorBuilder {
public:
  DomAnchor build(const std::string &cssSelector, const std::string &xpath,
                  const std::string &textContent,
                  const std::optional<BoundingBox> &boundingBox =
                      std::nullopt) const;

  /**
   * @brief Build from an inspection result object with the keys
   * "cssSelector", "xpath", "textContent" and "boundingBox".
   *
   * Missing strings default to "", a missing or null boundingBox to none.
   * @throw std::invalid_argument If @p result is not a JSON object.
   */
  DomAnchor buildFromInspection(const nlohmann::json &result) const;
};

} // namespace evichain

#endif // EVICHAIN_ANCHOR_BUILDER_HPP
