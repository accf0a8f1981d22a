#include "evichain/screenshot_capturer.hpp"
#include "evichain/digest.hpp"
#include "evichain/errors.hpp"
#include "evichain/evidence_paths.hpp"
#include "evichain/image_header.hpp"
#include "evichain/logger.h"
#include "evichain/timestamp.hpp"

#include <cppcodec/base64_rfc4648.hpp>
#include <stdexcept>
#include <vector>

namespace evichain {

ScreenshotCapturer::ScreenshotCapturer(Storage &storage) : storage_(storage) {}

std::string ScreenshotCapturer::store(const std::string &chainId,
                                      const std::string &capturedAt,
                                      ImageFormat format,
                                      const std::string &bytes) {
  const std::string base = screenshotsPrefix(chainId) + "/screenshot-" +
                           fileSafeTimestamp(capturedAt);
  const std::string ext = "." + formatToString(format);

  std::string key = base + ext;
  for (int n = 1; !storage_.create(key, bytes); ++n)
    key = base + "-" + std::to_string(n) + ext;
  return key;
}

ScreenshotMeta ScreenshotCapturer::finalize(const std::string &chainId,
                                            std::span<const std::byte> raw,
                                            ImageFormat format) {
  if (!isValidChainId(chainId))
    throw std::invalid_argument("Invalid chain id: " + chainId);

  ScreenshotMeta meta;
  meta.format = format;
  meta.hash = sha256Hex(raw);

  ImageDimensions dims = parseDimensions(raw, format);
  meta.width = dims.width;
  meta.height = dims.height;
  if (dims.width == 0 && dims.height == 0) {
    Logger::getInstance().log(LogLevel::WARN,
                              "Could not read dimensions from " +
                                  formatToString(format) + " header (" +
                                  std::to_string(raw.size()) + " bytes)");
  }

  meta.capturedAt = isoTimestamp();
  try {
    meta.path =
        store(chainId, meta.capturedAt, format,
              std::string(reinterpret_cast<const char *>(raw.data()),
                          raw.size()));
  } catch (const StorageFailure &e) {
    Logger::getInstance().log(LogLevel::ERROR,
                              "Screenshot capture failed for chain " + chainId +
                                  ": " + e.what());
    throw;
  }

  Logger::getInstance().log(LogLevel::INFO,
                            "Screenshot captured: chain=" + chainId +
                                " hash=" + meta.hash.substr(0, 16) +
                                " size=" + std::to_string(raw.size()));
  return meta;
}

ScreenshotMeta ScreenshotCapturer::finalizeBase64(const std::string &chainId,
                                                  const std::string &base64Data,
                                                  ImageFormat format) {
  std::vector<uint8_t> decoded;
  try {
    decoded = cppcodec::base64_rfc4648::decode(base64Data);
  } catch (const cppcodec::parse_error &e) {
    throw std::invalid_argument(std::string("Invalid base64 image data: ") +
                                e.what());
  }
  return finalize(chainId, std::as_bytes(std::span<const uint8_t>(decoded)),
                  format);
}

ScreenshotMeta ScreenshotCapturer::capture(CaptureChannel &channel,
                                           const std::string &chainId,
                                           const CaptureOptions &options) {
  Logger::getInstance().log(LogLevel::INFO,
                            "Capturing screenshot for chain " + chainId);
  std::string data = channel.captureScreenshot(options);
  return finalizeBase64(chainId, data, options.format);
}

} // namespace evichain
