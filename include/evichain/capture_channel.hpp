#ifndef EVICHAIN_CAPTURE_CHANNEL_HPP
#define EVICHAIN_CAPTURE_CHANNEL_HPP

#include "evichain/evidence_types.hpp"

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace evichain {

/// Parameters of a screenshot request.
struct CaptureOptions {
  ImageFormat format = ImageFormat::Png;
  std::optional<int> quality; ///< JPEG quality 1-100, ignored for PNG
  bool fullPage = false;      ///< Capture beyond the viewport
};

/**
 * @brief Request/response link to a remote browser.
 *
 * Implementations either return the expected shape or throw.
 */
class CaptureChannel {
public:
  virtual ~CaptureChannel() = default;

  /// Base64-encoded image data in the requested format.
  virtual std::string captureScreenshot(const CaptureOptions &options) = 0;

  /**
   * @brief Run the document inspector against the element matched by
   * @p locator.
   * @return Object with "cssSelector", "xpath", "textContent" and
   * "boundingBox" (an object or null).
   */
  virtual nlohmann::json inspectElement(const std::string &locator) = 0;
};

} // namespace evichain

#endif // EVICHAIN_CAPTURE_CHANNEL_HPP
