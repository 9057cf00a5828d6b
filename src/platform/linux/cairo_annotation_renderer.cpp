// Copyright 2026 The skitch Authors
// Linux annotation renderer: Cairo for vector shapes, Pango for text.

#include "platform/linux/cairo_annotation_renderer.h"

#include <cmath>
#include <string>

#include <cairo/cairo.h>
#include <pango/pangocairo.h>

#include "core/image.h"
#include "core/logger.h"

namespace skitch {
namespace internal {

CairoAnnotationRenderer::~CairoAnnotationRenderer() { EndRender(); }

// -----------------------------------------------------------------------
// Begin / End
// -----------------------------------------------------------------------

bool CairoAnnotationRenderer::BeginRender(Image* target) {
  if (!target || target->format() != kSkitchFormatBgra8) return false;
  EndRender();

  // BGRA8 matches CAIRO_FORMAT_ARGB32 on little-endian.
  surface_ = cairo_image_surface_create_for_data(
      target->mutable_data(), CAIRO_FORMAT_ARGB32,
      target->width(), target->height(), target->stride());
  if (cairo_surface_status(surface_) != CAIRO_STATUS_SUCCESS) {
    SKITCH_LOG_ERROR("Cairo surface creation failed: {}",
                     cairo_status_to_string(cairo_surface_status(surface_)));
    cairo_surface_destroy(surface_);
    surface_ = nullptr;
    return false;
  }
  cr_ = cairo_create(surface_);
  return true;
}

void CairoAnnotationRenderer::EndRender() {
  if (cr_) {
    cairo_destroy(cr_);
    cr_ = nullptr;
  }
  if (surface_) {
    cairo_surface_flush(surface_);
    cairo_surface_destroy(surface_);
    surface_ = nullptr;
  }
}

// -----------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------

namespace {

void SetSourceArgb(cairo_t* cr, uint32_t c) {
  double a = static_cast<double>((c >> 24) & 0xFF) / 255.0;
  double r = static_cast<double>((c >> 16) & 0xFF) / 255.0;
  double g = static_cast<double>((c >> 8) & 0xFF) / 255.0;
  double b = static_cast<double>(c & 0xFF) / 255.0;
  cairo_set_source_rgba(cr, r, g, b, a);
}

void ApplyStroke(cairo_t* cr, const ShapeStyle& style) {
  SetSourceArgb(cr, style.stroke_color);
  cairo_set_line_width(cr, style.stroke_width);
}

}  // namespace

// -----------------------------------------------------------------------
// Primitives
// -----------------------------------------------------------------------

void CairoAnnotationRenderer::DrawRect(int x, int y, int w, int h,
                                       const ShapeStyle& style) {
  if (!cr_) return;
  cairo_rectangle(cr_, x, y, w, h);
  ApplyStroke(cr_, style);
  cairo_stroke(cr_);
}

void CairoAnnotationRenderer::DrawArrow(int x1, int y1, int x2, int y2,
                                        float head_size,
                                        const ShapeStyle& style) {
  if (!cr_) return;

  // Shaft
  ApplyStroke(cr_, style);
  cairo_move_to(cr_, x1, y1);
  cairo_line_to(cr_, x2, y2);
  cairo_stroke(cr_);

  // Arrowhead: isosceles triangle, base and height = head_size, tip at
  // (x2, y2).
  double dx = static_cast<double>(x2 - x1);
  double dy = static_cast<double>(y2 - y1);
  double len = std::sqrt(dx * dx + dy * dy);
  if (len < 1.0) return;

  double ux = dx / len;
  double uy = dy / len;
  double px = -uy;
  double py = ux;
  double hs = static_cast<double>(head_size);

  double bx = x2 - ux * hs;
  double by = y2 - uy * hs;
  double lx = bx + px * hs * 0.5;
  double ly = by + py * hs * 0.5;
  double rx = bx - px * hs * 0.5;
  double ry = by - py * hs * 0.5;

  SetSourceArgb(cr_, style.stroke_color);
  cairo_move_to(cr_, x2, y2);
  cairo_line_to(cr_, lx, ly);
  cairo_line_to(cr_, rx, ry);
  cairo_close_path(cr_);
  cairo_fill(cr_);
}

void CairoAnnotationRenderer::DrawPolyline(const Point* points, int count,
                                           const ShapeStyle& style) {
  if (!cr_ || !points || count < 1) return;

  ApplyStroke(cr_, style);
  cairo_set_line_join(cr_, CAIRO_LINE_JOIN_ROUND);
  cairo_set_line_cap(cr_, CAIRO_LINE_CAP_ROUND);

  cairo_move_to(cr_, points[0].x, points[0].y);
  if (count == 1) {
    // A click without movement still leaves a dot.
    cairo_line_to(cr_, points[0].x, points[0].y);
  }
  for (int i = 1; i < count; ++i)
    cairo_line_to(cr_, points[i].x, points[i].y);
  cairo_stroke(cr_);
}

void CairoAnnotationRenderer::DrawText(int x, int y, const char* text,
                                       const char* font_name, int font_size,
                                       uint32_t color) {
  if (!cr_ || !text) return;

  SetSourceArgb(cr_, color);

  PangoLayout* layout = pango_cairo_create_layout(cr_);
  pango_layout_set_text(layout, text, -1);

  // Sizes are canvas pixels.
  PangoFontDescription* desc = pango_font_description_from_string(
      (font_name && font_name[0]) ? font_name : "Sans");
  pango_font_description_set_absolute_size(
      desc, (font_size > 0 ? font_size : 20) * PANGO_SCALE);
  pango_layout_set_font_description(layout, desc);
  pango_font_description_free(desc);

  cairo_move_to(cr_, x, y);
  pango_cairo_show_layout(cr_, layout);
  g_object_unref(layout);
}

// Factory.
std::unique_ptr<AnnotationRenderer> CreatePlatformAnnotationRenderer() {
  return std::make_unique<CairoAnnotationRenderer>();
}

}  // namespace internal
}  // namespace skitch
