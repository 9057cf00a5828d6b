// Copyright 2026 The skitch Authors

#include "annotation/shape.h"

#include <algorithm>
#include <cmath>

#include "annotation/annotation_renderer.h"
#include "annotation/snapshot_codec.h"
#include "core/byte_io.h"
#include "core/image.h"

namespace skitch {
namespace internal {

namespace {

void WriteStyle(const ShapeStyle& style, ByteWriter* w) {
  w->U32(style.stroke_color);
  w->F32(style.stroke_width);
}

// Bounds spanning two points, grown by half the stroke width.
Bounds SpanBounds(int x0, int y0, int x1, int y1, float stroke_width) {
  int pad = static_cast<int>(std::ceil(stroke_width / 2.0f));
  int left = (std::min)(x0, x1) - pad;
  int top = (std::min)(y0, y1) - pad;
  int right = (std::max)(x0, x1) + pad;
  int bottom = (std::max)(y0, y1) + pad;
  return {left, top, right - left + 1, bottom - top + 1};
}

}  // namespace

bool Shape::Recolor(uint32_t argb) {
  style_.stroke_color = argb;
  return true;
}

// ---------------------------------------------------------------------------
// Render (delegate to renderer)
// ---------------------------------------------------------------------------

void RectShape::Render(AnnotationRenderer* r) const {
  r->DrawRect(x_, y_, w_, h_, style_);
}

void ArrowShape::Render(AnnotationRenderer* r) const {
  r->DrawArrow(x1_, y1_, x2_, y2_, head_size_, style_);
}

void StrokeShape::Render(AnnotationRenderer* r) const {
  if (!points_.empty()) {
    r->DrawPolyline(points_.data(), static_cast<int>(points_.size()), style_);
  }
}

void TextShape::Render(AnnotationRenderer* r) const {
  r->DrawText(x_, y_, text_.c_str(), font_name_.c_str(), font_size_, color_);
}

void ImagePatch::Render(AnnotationRenderer* /*r*/) const {
  // Composited by Document::Render() on raw pixels.
}

// ---------------------------------------------------------------------------
// Geometry
// ---------------------------------------------------------------------------

Bounds RectShape::GetBounds() const {
  return SpanBounds(x_, y_, x_ + w_, y_ + h_, style_.stroke_width);
}

Bounds ArrowShape::GetBounds() const {
  Bounds b = SpanBounds(x1_, y1_, x2_, y2_, style_.stroke_width);
  // Head may stick out sideways at the tip.
  int head = static_cast<int>(std::ceil(head_size_ / 2.0f));
  return {b.x - head, b.y - head, b.w + 2 * head, b.h + 2 * head};
}

void StrokeShape::Translate(int dx, int dy) {
  for (auto& p : points_) {
    p.x += dx;
    p.y += dy;
  }
}

Bounds StrokeShape::GetBounds() const {
  if (points_.empty()) return {0, 0, 0, 0};
  int x0 = points_[0].x, y0 = points_[0].y, x1 = x0, y1 = y0;
  for (const auto& p : points_) {
    x0 = (std::min)(x0, p.x);
    y0 = (std::min)(y0, p.y);
    x1 = (std::max)(x1, p.x);
    y1 = (std::max)(y1, p.y);
  }
  return SpanBounds(x0, y0, x1, y1, style_.stroke_width);
}

Bounds TextShape::GetBounds() const {
  // Layout-free estimate: average glyph advance of 0.6 em, one line per
  // newline at 1.2 em.
  size_t longest = 0, current = 0;
  int lines = 1;
  for (char c : text_) {
    if (c == '\n') {
      ++lines;
      current = 0;
    } else {
      longest = (std::max)(longest, ++current);
    }
  }
  int w = static_cast<int>(std::ceil(longest * font_size_ * 0.6));
  int h = static_cast<int>(std::ceil(lines * font_size_ * 1.2));
  return {x_, y_, (std::max)(w, 1), h};
}

Bounds ImagePatch::GetBounds() const {
  return {x_, y_, image_->width(), image_->height()};
}

// ---------------------------------------------------------------------------
// Encoding (see snapshot_codec.h)
// ---------------------------------------------------------------------------

void RectShape::Encode(ByteWriter* w) const {
  WriteStyle(style_, w);
  w->I32(x_);
  w->I32(y_);
  w->I32(w_);
  w->I32(h_);
}

void ArrowShape::Encode(ByteWriter* w) const {
  WriteStyle(style_, w);
  w->I32(x1_);
  w->I32(y1_);
  w->I32(x2_);
  w->I32(y2_);
  w->F32(head_size_);
}

void StrokeShape::Encode(ByteWriter* w) const {
  WriteStyle(style_, w);
  w->U32(static_cast<uint32_t>(points_.size()));
  for (const auto& p : points_) {
    w->I32(p.x);
    w->I32(p.y);
  }
}

void TextShape::Encode(ByteWriter* w) const {
  w->I32(x_);
  w->I32(y_);
  w->String(text_);
  w->String(font_name_);
  w->I32(font_size_);
  w->U32(color_);
}

void ImagePatch::Encode(ByteWriter* w) const {
  w->I32(x_);
  w->I32(y_);
  EncodeImage(*image_, w);
}

}  // namespace internal
}  // namespace skitch
