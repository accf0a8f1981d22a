#ifndef EVICHAIN_IMAGE_HEADER_HPP
#define EVICHAIN_IMAGE_HEADER_HPP

#include "evichain/evidence_types.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace evichain {

/// Pixel size read from an image header; 0x0 when unknown.
struct ImageDimensions {
  uint32_t width = 0;
  uint32_t height = 0;

  bool operator==(const ImageDimensions &) const = default;
};

/**
 * @brief Width and height from the IHDR chunk of a PNG.
 *
 * Reads big-endian u32 values at offsets 16 and 20. Needs at least 24
 * bytes; neither the signature nor the chunk CRC is checked.
 */
ImageDimensions parsePngDimensions(std::span<const std::byte> data) noexcept;

/**
 * @brief Width and height from the first Start-Of-Frame segment of a JPEG.
 *
 * Walks markers from offset 2. SOF markers are 0xC0..0xCF except 0xC4
 * (DHT) and 0xC8 (JPG); height is at marker+5 and width at marker+7.
 * Other segments are skipped by their length field. A byte that is not
 * 0xFF where a marker is expected ends the walk.
 */
ImageDimensions parseJpegDimensions(std::span<const std::byte> data) noexcept;

/// Dispatch on @p format; never throws, yields 0x0 on any failure.
ImageDimensions parseDimensions(std::span<const std::byte> data,
                                ImageFormat format) noexcept;

} // namespace evichain

#endif // EVICHAIN_IMAGE_HEADER_HPP
