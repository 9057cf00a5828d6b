// Copyright 2026 The skitch Authors

#include "core/image.h"

#include <algorithm>
#include <cstdint>
#include <cstring>
#include <utility>

namespace skitch {
namespace internal {

namespace {

constexpr int kBytesPerPixel = 4;

}  // namespace

Image::Image(int width, int height, int stride, SkitchPixelFormat format,
             std::vector<uint8_t> data)
    : width_(width),
      height_(height),
      stride_(stride),
      format_(format),
      data_(std::move(data)) {}


// static
std::unique_ptr<Image> Image::Create(int width, int height,
                                     SkitchPixelFormat format) {
  if (width <= 0 || height <= 0) return nullptr;
  int stride = width * kBytesPerPixel;
  size_t total = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (total > kMaxImageBytes) return nullptr;
  std::vector<uint8_t> data(total, 0);
  return std::make_unique<Image>(width, height, stride, format,
                                 std::move(data));
}

// static
std::unique_ptr<Image> Image::CreateFromData(int width, int height, int stride,
                                             SkitchPixelFormat format,
                                             std::vector<uint8_t> data) {
  if (width <= 0 || height <= 0 || stride < width * kBytesPerPixel) {
    return nullptr;
  }
  size_t required = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (required > kMaxImageBytes || data.size() < required) return nullptr;
  data.resize(required);
  return std::make_unique<Image>(width, height, stride, format,
                                 std::move(data));
}

std::unique_ptr<Image> Image::Clone() const {
  std::vector<uint8_t> data_copy(data_);
  return std::make_unique<Image>(width_, height_, stride_, format_,
                                 std::move(data_copy));
}

std::unique_ptr<Image> Image::Crop(int x, int y, int width, int height) const {
  int x0 = (std::max)(0, x);
  int y0 = (std::max)(0, y);
  int x1 = static_cast<int>((std::min)(static_cast<int64_t>(width_),
                                       static_cast<int64_t>(x) + width));
  int y1 = static_cast<int>((std::min)(static_cast<int64_t>(height_),
                                       static_cast<int64_t>(y) + height));
  if (x0 >= x1 || y0 >= y1) return nullptr;

  auto out = Create(x1 - x0, y1 - y0, format_);
  if (!out) return nullptr;
  size_t row_bytes = static_cast<size_t>(out->width()) * kBytesPerPixel;
  for (int row = 0; row < out->height(); ++row) {
    const uint8_t* src =
        data_.data() + static_cast<size_t>(y0 + row) * stride_ +
        static_cast<size_t>(x0) * kBytesPerPixel;
    std::memcpy(out->mutable_data() + static_cast<size_t>(row) * out->stride(),
                src, row_bytes);
  }
  return out;
}

std::unique_ptr<Image> Image::ToBgra() const {
  auto out = Clone();
  if (format_ == kSkitchFormatBgra8) return out;
  // RGBA -> BGRA is the same channel swap in both directions.
  for (int y = 0; y < height_; ++y) {
    uint8_t* row = out->mutable_data() + static_cast<size_t>(y) * stride_;
    for (int x = 0; x < width_; ++x) {
      std::swap(row[x * 4 + 0], row[x * 4 + 2]);
    }
  }
  out->format_ = kSkitchFormatBgra8;
  return out;
}

std::vector<uint8_t> Image::ToRgbaPacked() const {
  std::vector<uint8_t> rgba(static_cast<size_t>(width_) * height_ * 4);
  bool swap = format_ == kSkitchFormatBgra8;
  for (int y = 0; y < height_; ++y) {
    const uint8_t* row = data_.data() + static_cast<size_t>(y) * stride_;
    uint8_t* dst = rgba.data() + static_cast<size_t>(y) * width_ * 4;
    for (int x = 0; x < width_; ++x) {
      dst[x * 4 + 0] = row[x * 4 + (swap ? 2 : 0)];
      dst[x * 4 + 1] = row[x * 4 + 1];
      dst[x * 4 + 2] = row[x * 4 + (swap ? 0 : 2)];
      dst[x * 4 + 3] = row[x * 4 + 3];
    }
  }
  return rgba;
}

void Image::Fill(uint32_t argb) {
  uint8_t a = static_cast<uint8_t>((argb >> 24) & 0xFF);
  uint8_t r = static_cast<uint8_t>((argb >> 16) & 0xFF);
  uint8_t g = static_cast<uint8_t>((argb >> 8) & 0xFF);
  uint8_t b = static_cast<uint8_t>(argb & 0xFF);
  bool bgra = format_ == kSkitchFormatBgra8;
  for (int y = 0; y < height_; ++y) {
    uint8_t* row = data_.data() + static_cast<size_t>(y) * stride_;
    for (int x = 0; x < width_; ++x) {
      row[x * 4 + 0] = bgra ? b : r;
      row[x * 4 + 1] = g;
      row[x * 4 + 2] = bgra ? r : b;
      row[x * 4 + 3] = a;
    }
  }
}

bool Image::SameContent(const Image& other) const {
  return width_ == other.width_ && height_ == other.height_ &&
         stride_ == other.stride_ && format_ == other.format_ &&
         data_ == other.data_;
}

}  // namespace internal
}  // namespace skitch
