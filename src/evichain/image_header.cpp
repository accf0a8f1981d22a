#include "evichain/image_header.hpp"

namespace evichain {

namespace {

constexpr size_t kPngHeaderSize = 24;
constexpr size_t kPngWidthOffset = 16;
constexpr size_t kPngHeightOffset = 20;

constexpr size_t kJpegFirstMarker = 2;
constexpr uint8_t kJpegMarkerPrefix = 0xFF;
constexpr uint8_t kJpegSof0 = 0xC0;
constexpr uint8_t kJpegSof15 = 0xCF;
constexpr uint8_t kJpegDht = 0xC4;
constexpr uint8_t kJpegJpg = 0xC8;

inline uint8_t byteAt(std::span<const std::byte> data, size_t offset) {
  return std::to_integer<uint8_t>(data[offset]);
}

inline uint32_t readBe32(std::span<const std::byte> data, size_t offset) {
  return (uint32_t(byteAt(data, offset)) << 24) |
         (uint32_t(byteAt(data, offset + 1)) << 16) |
         (uint32_t(byteAt(data, offset + 2)) << 8) |
         uint32_t(byteAt(data, offset + 3));
}

inline uint16_t readBe16(std::span<const std::byte> data, size_t offset) {
  return static_cast<uint16_t>((byteAt(data, offset) << 8) |
                               byteAt(data, offset + 1));
}

inline bool isStartOfFrame(uint8_t marker) {
  return marker >= kJpegSof0 && marker <= kJpegSof15 && marker != kJpegDht &&
         marker != kJpegJpg;
}

} // namespace

ImageDimensions parsePngDimensions(std::span<const std::byte> data) noexcept {
  if (data.size() < kPngHeaderSize)
    return {};
  return {readBe32(data, kPngWidthOffset), readBe32(data, kPngHeightOffset)};
}

ImageDimensions parseJpegDimensions(std::span<const std::byte> data) noexcept {
  size_t offset = kJpegFirstMarker;
  // A SOF segment needs the bytes up to marker+8 for the width field.
  while (offset + 8 < data.size()) {
    if (byteAt(data, offset) != kJpegMarkerPrefix)
      break;
    uint8_t marker = byteAt(data, offset + 1);
    if (isStartOfFrame(marker)) {
      uint16_t height = readBe16(data, offset + 5);
      uint16_t width = readBe16(data, offset + 7);
      return {width, height};
    }
    offset += 2 + readBe16(data, offset + 2);
  }
  return {};
}

ImageDimensions parseDimensions(std::span<const std::byte> data,
                                ImageFormat format) noexcept {
  switch (format) {
  case ImageFormat::Png:
    return parsePngDimensions(data);
  case ImageFormat::Jpeg:
    return parseJpegDimensions(data);
  }
  return {};
}

} // namespace evichain
