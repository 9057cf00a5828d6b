// Copyright 2026 The skitch Authors

#ifndef SKITCH_CORE_IMAGE_H_
#define SKITCH_CORE_IMAGE_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "skitch/skitch.h"

namespace skitch {
namespace internal {

/// Upper bound on a single image's pixel buffer.
constexpr size_t kMaxImageBytes = 256ULL * 1024 * 1024;  // 256 MB

/// Internal raster image.  Documents, backgrounds and rendered composites
/// are always kSkitchFormatBgra8 (premultiplied, Cairo ARGB32 layout).
class Image {
 public:
  Image(int width, int height, int stride, SkitchPixelFormat format,
        std::vector<uint8_t> data);
  ~Image() = default;

  // Non-copyable, movable.  Use Clone() for deep copies.
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;
  Image(Image&&) = default;
  Image& operator=(Image&&) = default;

  int width() const { return width_; }
  int height() const { return height_; }
  int stride() const { return stride_; }
  SkitchPixelFormat format() const { return format_; }
  const uint8_t* data() const { return data_.data(); }
  size_t data_size() const { return data_.size(); }

  /// Create a zero-filled image.
  static std::unique_ptr<Image> Create(int width, int height,
                                       SkitchPixelFormat format);

  /// Create an image from existing data (takes ownership via move).
  static std::unique_ptr<Image> CreateFromData(int width, int height,
                                               int stride,
                                               SkitchPixelFormat format,
                                               std::vector<uint8_t> data);

  uint8_t* mutable_data() { return data_.data(); }

  /// Deep copy.
  std::unique_ptr<Image> Clone() const;

  /// Copy of the sub-rectangle clamped to the image bounds.
  /// Returns nullptr if the clamped rectangle is empty.
  std::unique_ptr<Image> Crop(int x, int y, int width, int height) const;

  /// Copy converted to BGRA8 (no-op copy if already BGRA8).
  std::unique_ptr<Image> ToBgra() const;

  /// Copy converted to tightly packed RGBA8 rows (stb / clipboard layout).
  std::vector<uint8_t> ToRgbaPacked() const;

  /// Fill every pixel with an ARGB color.
  void Fill(uint32_t argb);

  /// Same dimensions, format and pixel bytes.
  bool SameContent(const Image& other) const;

 private:
  int width_;
  int height_;
  int stride_;
  SkitchPixelFormat format_;
  std::vector<uint8_t> data_;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_CORE_IMAGE_H_
