#ifndef EVICHAIN_SCREENSHOT_CAPTURER_HPP
#define EVICHAIN_SCREENSHOT_CAPTURER_HPP

#include "evichain/capture_channel.hpp"
#include "evichain/evidence_types.hpp"
#include "evichain/storage.hpp"

#include <cstddef>
#include <span>
#include <string>

namespace evichain {

/**
 * @brief Hashes, measures and persists screenshots for evidence records.
 *
 * Images are stored under "screenshots/<chainId>/" with a file name derived
 * from the capture time. An existing file is never overwritten.
 */
class ScreenshotCapturer {
public:
  explicit ScreenshotCapturer(Storage &storage);

  /**
   * @brief Persist already-decoded image bytes and describe them.
   *
   * The hash covers the bytes exactly as given. Width and height come from
   * the image header and are 0 if it cannot be parsed.
   *
   * @throw StorageFailure If the bytes cannot be persisted.
   * @throw std::invalid_argument If @p chainId is not a valid chain id.
   */
  ScreenshotMeta finalize(const std::string &chainId,
                          std::span<const std::byte> raw, ImageFormat format);

  /**
   * @brief finalize() for base64 data as delivered by a capture channel.
   * @throw std::invalid_argument If @p base64Data is not valid base64.
   */
  ScreenshotMeta finalizeBase64(const std::string &chainId,
                                const std::string &base64Data,
                                ImageFormat format);

  /// Request a screenshot over @p channel and finalize it.
  ScreenshotMeta capture(CaptureChannel &channel, const std::string &chainId,
                         const CaptureOptions &options);

private:
  // Persist under the first free name for this capture time; returns the key.
  std::string store(const std::string &chainId, const std::string &capturedAt,
                    ImageFormat format, const std::string &bytes);

  Storage &storage_;
};

} // namespace evichain

#endif // EVICHAIN_SCREENSHOT_CAPTURER_HPP
