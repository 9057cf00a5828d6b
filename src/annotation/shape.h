// Copyright 2026 The skitch Authors

#ifndef SKITCH_ANNOTATION_SHAPE_H_
#define SKITCH_ANNOTATION_SHAPE_H_

#include <cstdint>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace skitch {
namespace internal {

// Forward declarations.
class AnnotationRenderer;
class ByteWriter;
class Image;

/// Shape types.  Values are part of the snapshot format.
enum class ShapeType : uint8_t {
  kRect = 1,
  kArrow = 2,
  kStroke = 3,
  kText = 4,
  kImagePatch = 5,
};

/// Point in 2D space.
struct Point {
  int x;
  int y;
};

/// Axis-aligned bounds (w/h >= 0).
struct Bounds {
  int x;
  int y;
  int w;
  int h;

  bool Contains(int px, int py) const {
    return px >= x && py >= y && px < x + w && py < y + h;
  }
};

/// Shape drawing style (mirrors public SkitchShapeStyle).
struct ShapeStyle {
  uint32_t stroke_color;  // ARGB
  float stroke_width;
};

/// Abstract base class for all annotation objects.
class Shape {
 public:
  virtual ~Shape() = default;

  virtual ShapeType type() const = 0;

  /// Render this shape using the given renderer.  Raster objects
  /// (image patches) are composited by the document instead.
  virtual void Render(AnnotationRenderer* renderer) const = 0;

  /// Create a deep copy of this shape (id included).
  virtual std::unique_ptr<Shape> Clone() const = 0;

  virtual void Translate(int dx, int dy) = 0;

  /// Change the shape's color.  Returns false if it has none.
  virtual bool Recolor(uint32_t argb);

  /// Hit-test / selection bounds.
  virtual Bounds GetBounds() const = 0;

  /// Append type-specific fields (everything after the type tag and id).
  virtual void Encode(ByteWriter* w) const = 0;

  /// Get shape ID (assigned by the Document).
  int id() const { return id_; }
  void set_id(int id) { id_ = id; }

  const ShapeStyle& style() const { return style_; }

 protected:
  Shape() = default;
  explicit Shape(const ShapeStyle& style) : style_(style) {}
  ShapeStyle style_ = {};

 private:
  int id_ = -1;
};

// ---------------------------------------------------------------------------
// Concrete shape types
// ---------------------------------------------------------------------------

class RectShape : public Shape {
 public:
  RectShape(int x, int y, int w, int h, const ShapeStyle& style)
      : Shape(style), x_(x), y_(y), w_(w), h_(h) {}

  ShapeType type() const override { return ShapeType::kRect; }
  void Render(AnnotationRenderer* renderer) const override;
  std::unique_ptr<Shape> Clone() const override {
    auto c = std::make_unique<RectShape>(x_, y_, w_, h_, style_);
    c->set_id(id());
    return c;
  }
  void Translate(int dx, int dy) override {
    x_ += dx;
    y_ += dy;
  }
  Bounds GetBounds() const override;
  void Encode(ByteWriter* w) const override;

  int x_, y_, w_, h_;
};

class ArrowShape : public Shape {
 public:
  static constexpr float kDefaultHeadSize = 15.0f;

  ArrowShape(int x1, int y1, int x2, int y2, float head_size,
             const ShapeStyle& style)
      : Shape(style),
        x1_(x1), y1_(y1), x2_(x2), y2_(y2), head_size_(head_size) {}

  ShapeType type() const override { return ShapeType::kArrow; }
  void Render(AnnotationRenderer* renderer) const override;
  std::unique_ptr<Shape> Clone() const override {
    auto c = std::make_unique<ArrowShape>(x1_, y1_, x2_, y2_, head_size_,
                                          style_);
    c->set_id(id());
    return c;
  }
  void Translate(int dx, int dy) override {
    x1_ += dx;
    y1_ += dy;
    x2_ += dx;
    y2_ += dy;
  }
  Bounds GetBounds() const override;
  void Encode(ByteWriter* w) const override;

  int x1_, y1_, x2_, y2_;
  float head_size_;
};

/// Freehand marker / highlighter stroke.
class StrokeShape : public Shape {
 public:
  StrokeShape(std::vector<Point> points, const ShapeStyle& style)
      : Shape(style), points_(std::move(points)) {}

  ShapeType type() const override { return ShapeType::kStroke; }
  void Render(AnnotationRenderer* renderer) const override;
  std::unique_ptr<Shape> Clone() const override {
    auto c = std::make_unique<StrokeShape>(points_, style_);
    c->set_id(id());
    return c;
  }
  void Translate(int dx, int dy) override;
  Bounds GetBounds() const override;
  void Encode(ByteWriter* w) const override;

  std::vector<Point> points_;
};

class TextShape : public Shape {
 public:
  static constexpr const char* kDefaultText = "Type here";
  static constexpr const char* kDefaultFont = "Arial";
  static constexpr int kDefaultFontSize = 20;

  TextShape(int x, int y, const std::string& text,
            const std::string& font_name, int font_size, uint32_t color)
      : x_(x), y_(y), text_(text), font_name_(font_name),
        font_size_(font_size), color_(color) {}

  ShapeType type() const override { return ShapeType::kText; }
  void Render(AnnotationRenderer* renderer) const override;
  std::unique_ptr<Shape> Clone() const override {
    auto c = std::make_unique<TextShape>(x_, y_, text_, font_name_, font_size_,
                                         color_);
    c->set_id(id());
    return c;
  }
  void Translate(int dx, int dy) override {
    x_ += dx;
    y_ += dy;
  }
  bool Recolor(uint32_t argb) override {
    color_ = argb;
    return true;
  }
  Bounds GetBounds() const override;
  void Encode(ByteWriter* w) const override;

  int x_, y_;
  std::string text_;
  std::string font_name_;
  int font_size_;
  uint32_t color_;
};

/// Raster patch placed on the canvas (the result of a mosaic).
class ImagePatch : public Shape {
 public:
  ImagePatch(int x, int y, std::shared_ptr<const Image> image)
      : x_(x), y_(y), image_(std::move(image)) {}

  ShapeType type() const override { return ShapeType::kImagePatch; }
  void Render(AnnotationRenderer* renderer) const override;
  std::unique_ptr<Shape> Clone() const override {
    // Pixels are immutable; clones share them.
    auto c = std::make_unique<ImagePatch>(x_, y_, image_);
    c->set_id(id());
    return c;
  }
  void Translate(int dx, int dy) override {
    x_ += dx;
    y_ += dy;
  }
  bool Recolor(uint32_t /*argb*/) override { return false; }
  Bounds GetBounds() const override;
  void Encode(ByteWriter* w) const override;

  const Image& image() const { return *image_; }

  int x_, y_;

 private:
  std::shared_ptr<const Image> image_;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_ANNOTATION_SHAPE_H_
