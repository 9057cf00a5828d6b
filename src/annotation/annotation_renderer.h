// Copyright 2026 The skitch Authors

#ifndef SKITCH_ANNOTATION_ANNOTATION_RENDERER_H_
#define SKITCH_ANNOTATION_ANNOTATION_RENDERER_H_

#include <cstdint>
#include <memory>

#include "annotation/shape.h"

namespace skitch {
namespace internal {

class Image;

/// Abstract interface for vector annotation rendering.
///
/// The Linux implementation uses Cairo + Pango.  Raster work (background
/// placement, image patches, pixelation) is done platform-independently
/// by the Document since it operates on raw pixel data.
class AnnotationRenderer {
 public:
  virtual ~AnnotationRenderer() = default;

  // Non-copyable.
  AnnotationRenderer(const AnnotationRenderer&) = delete;
  AnnotationRenderer& operator=(const AnnotationRenderer&) = delete;

  /// Begin rendering to the target image (BGRA8).
  /// @return true on success.
  virtual bool BeginRender(Image* target) = 0;

  /// Finish rendering and flush all drawing operations to the image.
  virtual void EndRender() = 0;

  // --- Primitive drawing operations ---

  virtual void DrawRect(int x, int y, int w, int h,
                        const ShapeStyle& style) = 0;

  virtual void DrawArrow(int x1, int y1, int x2, int y2, float head_size,
                         const ShapeStyle& style) = 0;

  virtual void DrawPolyline(const Point* points, int count,
                            const ShapeStyle& style) = 0;

  virtual void DrawText(int x, int y, const char* text,
                        const char* font_name, int font_size,
                        uint32_t color) = 0;

 protected:
  AnnotationRenderer() = default;
};

/// Factory function: returns the platform-native renderer.
/// Defined in platform/linux/cairo_annotation_renderer.cpp.
std::unique_ptr<AnnotationRenderer> CreatePlatformAnnotationRenderer();

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_ANNOTATION_ANNOTATION_RENDERER_H_
