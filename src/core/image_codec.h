// Copyright 2026 The skitch Authors
//
// Image file encode/decode using stb_image_write (PNG, JPEG, BMP) and
// stb_image (PNG, JPEG, BMP, GIF).

#ifndef SKITCH_CORE_IMAGE_CODEC_H_
#define SKITCH_CORE_IMAGE_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "skitch/skitch.h"

namespace skitch {
namespace internal {

class Image;

/// Write `image` to `path`.  `quality` is used for JPEG (1-100, else 90).
bool WriteImageFile(const Image& image, const std::string& path,
                    SkitchImageFormat format, int quality);

/// Encode `image` as PNG into `out` (replacing its contents).
bool EncodePng(const Image& image, std::vector<uint8_t>* out);

/// Decode an image file into BGRA8.  Returns nullptr on failure.
std::unique_ptr<Image> DecodeImageFile(const std::string& path);

/// Decode an in-memory encoded image into BGRA8.  Returns nullptr on failure.
std::unique_ptr<Image> DecodeImageMemory(const uint8_t* data, size_t size);

/// Guess the export format from the file extension (.png/.jpg/.jpeg/.bmp).
/// Unknown extensions map to PNG.
SkitchImageFormat FormatFromPath(const std::string& path);

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_CORE_IMAGE_CODEC_H_
