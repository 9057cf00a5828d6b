// Copyright 2026 The skitch Authors

#include "core/image_codec.h"

#include <algorithm>
#include <cctype>
#include <cstring>
#include <utility>

#ifdef _MSC_VER
#pragma warning(push)
#pragma warning(disable : 4996)  // sprintf deprecation in stb
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wmissing-field-initializers"
#pragma GCC diagnostic ignored "-Wunused-function"
#endif

#define STB_IMAGE_WRITE_IMPLEMENTATION
#include "stb_image_write.h"

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#define STBI_ONLY_BMP
#define STBI_ONLY_GIF
#include "stb_image.h"

#ifdef _MSC_VER
#pragma warning(pop)
#elif defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif

#include "core/image.h"
#include "core/logger.h"

namespace skitch {
namespace internal {

namespace {

void AppendToVector(void* context, void* data, int size) {
  auto* out = static_cast<std::vector<uint8_t>*>(context);
  const auto* bytes = static_cast<const uint8_t*>(data);
  out->insert(out->end(), bytes, bytes + size);
}

// stb returns tightly packed RGBA; convert to the internal BGRA layout.
std::unique_ptr<Image> FromStbRgba(stbi_uc* pixels, int w, int h) {
  if (!pixels) return nullptr;
  std::vector<uint8_t> bgra(static_cast<size_t>(w) * h * 4);
  for (size_t i = 0; i < bgra.size(); i += 4) {
    bgra[i + 0] = pixels[i + 2];  // B <- R
    bgra[i + 1] = pixels[i + 1];
    bgra[i + 2] = pixels[i + 0];  // R <- B
    bgra[i + 3] = pixels[i + 3];
  }
  stbi_image_free(pixels);
  return Image::CreateFromData(w, h, w * 4, kSkitchFormatBgra8,
                               std::move(bgra));
}

}  // namespace

bool WriteImageFile(const Image& image, const std::string& path,
                    SkitchImageFormat format, int quality) {
  int w = image.width();
  int h = image.height();
  std::vector<uint8_t> rgba = image.ToRgbaPacked();

  int result = 0;
  switch (format) {
    case kSkitchImageFormatPng:
      result = stbi_write_png(path.c_str(), w, h, 4, rgba.data(), w * 4);
      break;
    case kSkitchImageFormatJpeg:
      if (quality <= 0 || quality > 100) quality = 90;
      result = stbi_write_jpg(path.c_str(), w, h, 4, rgba.data(), quality);
      break;
    case kSkitchImageFormatBmp:
      result = stbi_write_bmp(path.c_str(), w, h, 4, rgba.data());
      break;
    default:
      return false;
  }
  if (!result) {
    SKITCH_LOG_ERROR("Failed to write image '{}'", path);
    return false;
  }
  return true;
}

bool EncodePng(const Image& image, std::vector<uint8_t>* out) {
  if (!out) return false;
  out->clear();
  std::vector<uint8_t> rgba = image.ToRgbaPacked();
  int w = image.width();
  int ok = stbi_write_png_to_func(AppendToVector, out, w, image.height(), 4,
                                  rgba.data(), w * 4);
  return ok != 0 && !out->empty();
}

std::unique_ptr<Image> DecodeImageFile(const std::string& path) {
  int w = 0, h = 0, channels = 0;
  stbi_uc* pixels = stbi_load(path.c_str(), &w, &h, &channels, 4);
  if (!pixels) {
    SKITCH_LOG_ERROR("Failed to decode image '{}': {}", path,
                     stbi_failure_reason());
    return nullptr;
  }
  return FromStbRgba(pixels, w, h);
}

std::unique_ptr<Image> DecodeImageMemory(const uint8_t* data, size_t size) {
  if (!data || size == 0 || size > 0x7FFFFFFF) return nullptr;
  int w = 0, h = 0, channels = 0;
  stbi_uc* pixels = stbi_load_from_memory(data, static_cast<int>(size), &w,
                                          &h, &channels, 4);
  if (!pixels) {
    SKITCH_LOG_ERROR("Failed to decode image data: {}",
                     stbi_failure_reason());
    return nullptr;
  }
  return FromStbRgba(pixels, w, h);
}

SkitchImageFormat FormatFromPath(const std::string& path) {
  auto dot = path.rfind('.');
  if (dot == std::string::npos) return kSkitchImageFormatPng;
  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == "jpg" || ext == "jpeg") return kSkitchImageFormatJpeg;
  if (ext == "bmp") return kSkitchImageFormatBmp;
  return kSkitchImageFormatPng;
}

}  // namespace internal
}  // namespace skitch
