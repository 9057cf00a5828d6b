// Copyright 2026 The skitch Authors

#include "annotation/snapshot_codec.h"

#include <cmath>
#include <cstring>
#include <unordered_set>
#include <utility>

#include "core/byte_io.h"
#include "core/image.h"
#include "core/logger.h"
#include "core/rle_codec.h"

namespace skitch {
namespace internal {

namespace {

constexpr uint8_t kMagic[4] = {'S', 'K', 'S', 'N'};
constexpr int kMaxDimension = 32768;
constexpr uint32_t kMaxObjects = 100000;
constexpr uint32_t kMaxStrokePoints = 1u << 20;
constexpr size_t kMaxTextBytes = 1u << 20;
constexpr size_t kMaxFontNameBytes = 256;
constexpr int kMaxFontSize = 1000;

bool ValidDimension(uint32_t v) {
  return v >= 1 && v <= static_cast<uint32_t>(kMaxDimension);
}

bool ValidWidth(float w) { return std::isfinite(w) && w >= 0.0f; }

bool ReadStyle(ByteReader* r, ShapeStyle* style) {
  return r->U32(&style->stroke_color) && r->F32(&style->stroke_width) &&
         ValidWidth(style->stroke_width);
}

std::unique_ptr<Shape> DecodeShape(ByteReader* r, ShapeType type) {
  switch (type) {
    case ShapeType::kRect: {
      ShapeStyle style = {};
      int32_t x = 0, y = 0, w = 0, h = 0;
      if (!ReadStyle(r, &style) || !r->I32(&x) || !r->I32(&y) ||
          !r->I32(&w) || !r->I32(&h) || w < 0 || h < 0) {
        return nullptr;
      }
      return std::make_unique<RectShape>(x, y, w, h, style);
    }
    case ShapeType::kArrow: {
      ShapeStyle style = {};
      int32_t x1 = 0, y1 = 0, x2 = 0, y2 = 0;
      float head = 0.0f;
      if (!ReadStyle(r, &style) || !r->I32(&x1) || !r->I32(&y1) ||
          !r->I32(&x2) || !r->I32(&y2) || !r->F32(&head) ||
          !ValidWidth(head)) {
        return nullptr;
      }
      return std::make_unique<ArrowShape>(x1, y1, x2, y2, head, style);
    }
    case ShapeType::kStroke: {
      ShapeStyle style = {};
      uint32_t count = 0;
      if (!ReadStyle(r, &style) || !r->U32(&count)) return nullptr;
      if (count > kMaxStrokePoints || count > r->remaining() / 8) {
        return nullptr;
      }
      std::vector<Point> points(count);
      for (auto& p : points) {
        int32_t x = 0, y = 0;
        if (!r->I32(&x) || !r->I32(&y)) return nullptr;
        p = {x, y};
      }
      return std::make_unique<StrokeShape>(std::move(points), style);
    }
    case ShapeType::kText: {
      int32_t x = 0, y = 0, size = 0;
      uint32_t color = 0;
      std::string text, font;
      if (!r->I32(&x) || !r->I32(&y) || !r->String(&text, kMaxTextBytes) ||
          !r->String(&font, kMaxFontNameBytes) || !r->I32(&size) ||
          !r->U32(&color) || size < 1 || size > kMaxFontSize) {
        return nullptr;
      }
      return std::make_unique<TextShape>(x, y, text, font, size, color);
    }
    case ShapeType::kImagePatch: {
      int32_t x = 0, y = 0;
      if (!r->I32(&x) || !r->I32(&y)) return nullptr;
      std::unique_ptr<Image> image = DecodeImage(r);
      if (!image) return nullptr;
      return std::make_unique<ImagePatch>(
          x, y, std::shared_ptr<const Image>(std::move(image)));
    }
  }
  return nullptr;
}

}  // namespace

void EncodeImage(const Image& image, ByteWriter* w) {
  int width = image.width();
  int height = image.height();
  size_t row_bytes = static_cast<size_t>(width) * 4;

  // Canonical layout: packed BGRA rows regardless of stride or format.
  std::vector<uint8_t> packed(row_bytes * height);
  bool swap = image.format() == kSkitchFormatRgba8;
  for (int y = 0; y < height; ++y) {
    const uint8_t* src = image.data() + static_cast<size_t>(y) * image.stride();
    uint8_t* dst = packed.data() + y * row_bytes;
    std::memcpy(dst, src, row_bytes);
    if (swap) {
      for (size_t i = 0; i < row_bytes; i += 4) std::swap(dst[i], dst[i + 2]);
    }
  }

  std::vector<uint8_t> rle;
  RleEncode(packed.data(), packed.size(), &rle);

  w->U32(static_cast<uint32_t>(width));
  w->U32(static_cast<uint32_t>(height));
  w->U32(static_cast<uint32_t>(rle.size()));
  w->Bytes(rle.data(), rle.size());
}

std::unique_ptr<Image> DecodeImage(ByteReader* r) {
  uint32_t width = 0, height = 0, rle_len = 0;
  if (!r->U32(&width) || !r->U32(&height) || !r->U32(&rle_len)) {
    return nullptr;
  }
  if (!ValidDimension(width) || !ValidDimension(height)) return nullptr;
  size_t raw = static_cast<size_t>(width) * height * 4;
  if (raw > kMaxImageBytes) return nullptr;

  const uint8_t* rle = nullptr;
  if (!r->Bytes(rle_len, &rle)) return nullptr;

  std::vector<uint8_t> pixels(raw);
  if (!RleDecode(rle, rle_len, pixels.data(), raw)) return nullptr;
  return Image::CreateFromData(static_cast<int>(width),
                               static_cast<int>(height),
                               static_cast<int>(width) * 4,
                               kSkitchFormatBgra8, std::move(pixels));
}

void EncodeDocument(const DocumentState& state, std::vector<uint8_t>* out) {
  out->clear();
  ByteWriter w(out);
  w.Bytes(kMagic, sizeof(kMagic));
  w.U32(kSnapshotFormatVersion);
  w.U32(static_cast<uint32_t>(state.width));
  w.U32(static_cast<uint32_t>(state.height));

  if (state.background) {
    w.U8(1);
    w.I32(state.placement.left);
    w.I32(state.placement.top);
    w.F32(state.placement.scale_x);
    w.F32(state.placement.scale_y);
    EncodeImage(*state.background, &w);
  } else {
    w.U8(0);
  }

  w.U32(static_cast<uint32_t>(state.objects.size()));
  for (const auto& shape : state.objects) {
    w.U8(static_cast<uint8_t>(shape->type()));
    w.I32(shape->id());
    shape->Encode(&w);
  }
}

bool DecodeDocument(const uint8_t* data, size_t size, DocumentState* out) {
  if (!data || !out) return false;
  ByteReader r(data, size);

  const uint8_t* magic = nullptr;
  uint32_t version = 0, width = 0, height = 0;
  if (!r.Bytes(sizeof(kMagic), &magic) ||
      std::memcmp(magic, kMagic, sizeof(kMagic)) != 0) {
    SKITCH_LOG_ERROR("Snapshot decode: bad magic");
    return false;
  }
  if (!r.U32(&version) || version != kSnapshotFormatVersion) {
    SKITCH_LOG_ERROR("Snapshot decode: unsupported version {}", version);
    return false;
  }
  if (!r.U32(&width) || !r.U32(&height) || !ValidDimension(width) ||
      !ValidDimension(height)) {
    SKITCH_LOG_ERROR("Snapshot decode: invalid canvas size");
    return false;
  }

  DocumentState state;
  state.width = static_cast<int>(width);
  state.height = static_cast<int>(height);

  uint8_t has_background = 0;
  if (!r.U8(&has_background) || has_background > 1) return false;
  if (has_background) {
    BackgroundPlacement& p = state.placement;
    if (!r.I32(&p.left) || !r.I32(&p.top) || !r.F32(&p.scale_x) ||
        !r.F32(&p.scale_y) || !std::isfinite(p.scale_x) ||
        !std::isfinite(p.scale_y) || p.scale_x <= 0.0f ||
        p.scale_y <= 0.0f) {
      SKITCH_LOG_ERROR("Snapshot decode: invalid background placement");
      return false;
    }
    std::unique_ptr<Image> background = DecodeImage(&r);
    if (!background) {
      SKITCH_LOG_ERROR("Snapshot decode: invalid background image");
      return false;
    }
    state.background = std::move(background);
  }

  uint32_t count = 0;
  if (!r.U32(&count) || count > kMaxObjects) return false;
  std::unordered_set<int32_t> ids;
  state.objects.reserve(count);
  for (uint32_t i = 0; i < count; ++i) {
    uint8_t type = 0;
    int32_t id = 0;
    if (!r.U8(&type) || !r.I32(&id) || id < 0 || !ids.insert(id).second) {
      SKITCH_LOG_ERROR("Snapshot decode: bad header for object {}", i);
      return false;
    }
    if (type < static_cast<uint8_t>(ShapeType::kRect) ||
        type > static_cast<uint8_t>(ShapeType::kImagePatch)) {
      SKITCH_LOG_ERROR("Snapshot decode: unknown object type {}", type);
      return false;
    }
    std::unique_ptr<Shape> shape =
        DecodeShape(&r, static_cast<ShapeType>(type));
    if (!shape) {
      SKITCH_LOG_ERROR("Snapshot decode: malformed object {}", i);
      return false;
    }
    shape->set_id(id);
    state.objects.push_back(std::move(shape));
  }

  if (!r.AtEnd()) {
    SKITCH_LOG_ERROR("Snapshot decode: {} trailing bytes", r.remaining());
    return false;
  }
  *out = std::move(state);
  return true;
}

}  // namespace internal
}  // namespace skitch
