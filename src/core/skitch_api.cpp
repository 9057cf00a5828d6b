// Copyright 2026 The skitch Authors
//
// This file implements all public C API functions declared in skitch.h.
// It bridges the extern "C" interface to the internal C++ implementation.

#include "skitch/skitch.h"

#include <cmath>
#include <cstring>
#include <memory>
#include <new>
#include <string>
#include <utility>
#include <vector>

#include "annotation/document.h"
#include "annotation/shape.h"
#include "core/callback_sink.h"
#include "core/image.h"
#include "core/image_codec.h"
#include "core/logger.h"
#include "core/skitch_context.h"
#include "editor/editor.h"
#include "editor/host_shell.h"
#include "history/history_engine.h"

using skitch::internal::ArrowShape;
using skitch::internal::Editor;
using skitch::internal::HistoryEngine;
using skitch::internal::HostShell;
using skitch::internal::Image;
using skitch::internal::Point;
using skitch::internal::RectShape;
using skitch::internal::ShapeStyle;
using skitch::internal::SkitchContextImpl;
using skitch::internal::StrokeShape;
using skitch::internal::TextShape;
using skitch::internal::ToSkitchError;

// ---------------------------------------------------------------------------
// Opaque struct definitions (must be in global namespace to match the
// forward declarations in skitch.h).
// ---------------------------------------------------------------------------

struct SkitchContext {
  SkitchContextImpl impl;
};

struct SkitchImage {
  std::unique_ptr<Image> impl;

  explicit SkitchImage(Image* raw) : impl(raw) {}
};

// Wrap a raw Image* into a heap-allocated SkitchImage*.
static SkitchImage* WrapImage(Image* raw) {
  if (!raw) return nullptr;
  SkitchImage* wrapped = new (std::nothrow) SkitchImage(raw);
  if (!wrapped) delete raw;
  return wrapped;
}

namespace {

constexpr size_t kMaxPathLength = 4096;
constexpr size_t kMaxTextBytes = 1024 * 1024;
constexpr size_t kMaxFontNameBytes = 256;
constexpr int kMaxFontSize = 1000;
constexpr int kMaxStrokePoints = 1 << 20;

// HostShell forwarding to the callbacks registered through
// skitch_set_host_callbacks().
class CallbackHostShell : public HostShell {
 public:
  explicit CallbackHostShell(const SkitchHostCallbacks& callbacks)
      : callbacks_(callbacks) {}

  bool ConfirmDiscardChanges(const std::string& message) override {
    if (!callbacks_.confirm_discard) return true;
    return callbacks_.confirm_discard(message.c_str(), callbacks_.userdata) !=
           0;
  }

  bool PickOpenPath(std::string* out_path) override {
    return Pick(callbacks_.pick_open_path, out_path);
  }

  bool PickSavePath(std::string* out_path) override {
    return Pick(callbacks_.pick_save_path, out_path);
  }

  std::unique_ptr<Image> ReadClipboardImage() override {
    if (!callbacks_.read_clipboard_image) return nullptr;
    SkitchImage* image = callbacks_.read_clipboard_image(callbacks_.userdata);
    if (!image) return nullptr;
    std::unique_ptr<Image> out = std::move(image->impl);
    delete image;
    return out;
  }

  bool WriteClipboardPng(const std::vector<uint8_t>& png) override {
    if (!callbacks_.write_clipboard_png) return false;
    return callbacks_.write_clipboard_png(png.data(), png.size(),
                                          callbacks_.userdata) != 0;
  }

 private:
  using PickFn = int (*)(char*, size_t, void*);

  bool Pick(PickFn fn, std::string* out_path) {
    if (!fn) return false;
    std::vector<char> buf(kMaxPathLength, '\0');
    if (!fn(buf.data(), buf.size(), callbacks_.userdata)) return false;
    buf.back() = '\0';
    *out_path = buf.data();
    return !out_path->empty();
  }

  SkitchHostCallbacks callbacks_;
};

ShapeStyle StyleOrDefault(const SkitchShapeStyle* style, const Editor* editor) {
  if (style) return {style->stroke_color, style->stroke_width};
  return {editor->color(), editor->stroke_width()};
}

bool ValidStyle(const ShapeStyle& style) {
  return std::isfinite(style.stroke_width) && style.stroke_width > 0.0f;
}

// Add a shape through the document, recording the outcome on the context.
int AddShape(SkitchContext* ctx, std::unique_ptr<skitch::internal::Shape> s) {
  int id = ctx->impl.document()->AddObject(std::move(s));
  if (id < 0) {
    ctx->impl.SetError(kSkitchErrorUnknown, "Failed to add object");
    return -1;
  }
  ctx->impl.ClearError();
  return id;
}

}  // namespace

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

SkitchContext* skitch_context_create(void) {
  return skitch_context_create_with_options(nullptr);
}

SkitchContext* skitch_context_create_with_options(
    const SkitchOptions* options) {
  auto* ctx = new (std::nothrow) SkitchContext();
  if (!ctx) return nullptr;

  if (!ctx->impl.Initialize(options)) {
    delete ctx;
    return nullptr;
  }
  return ctx;
}

void skitch_context_destroy(SkitchContext* ctx) {
  delete ctx;
}

int skitch_process_events(SkitchContext* ctx, int timeout_ms) {
  if (!ctx) return -1;
  return ctx->impl.ProcessEvents(timeout_ms);
}

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

SkitchError skitch_get_last_error(const SkitchContext* ctx) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.last_error();
}

const char* skitch_get_last_error_message(const SkitchContext* ctx) {
  if (!ctx) return "Invalid context (NULL)";
  return ctx->impl.last_error_message();
}

// ---------------------------------------------------------------------------
// Images
// ---------------------------------------------------------------------------

SkitchImage* skitch_image_create(int width, int height, int stride,
                                 SkitchPixelFormat format,
                                 const uint8_t* data) {
  if (!data || width <= 0 || height <= 0) return nullptr;
  if (format != kSkitchFormatBgra8 && format != kSkitchFormatRgba8) {
    return nullptr;
  }
  if (stride == 0) stride = width * 4;
  if (stride < width * 4) return nullptr;
  size_t size = static_cast<size_t>(stride) * static_cast<size_t>(height);
  if (size > skitch::internal::kMaxImageBytes) return nullptr;

  std::vector<uint8_t> pixels(data, data + size);
  return WrapImage(Image::CreateFromData(width, height, stride, format,
                                         std::move(pixels))
                       .release());
}

SkitchImage* skitch_image_load(const char* path) {
  if (!path) return nullptr;
  return WrapImage(skitch::internal::DecodeImageFile(path).release());
}

void skitch_image_destroy(SkitchImage* image) {
  delete image;
}

int skitch_image_get_width(const SkitchImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->width();
}

int skitch_image_get_height(const SkitchImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->height();
}

int skitch_image_get_stride(const SkitchImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->stride();
}

SkitchPixelFormat skitch_image_get_format(const SkitchImage* image) {
  if (!image || !image->impl) return kSkitchFormatBgra8;
  return image->impl->format();
}

const uint8_t* skitch_image_get_data(const SkitchImage* image) {
  if (!image || !image->impl) return nullptr;
  return image->impl->data();
}

size_t skitch_image_get_data_size(const SkitchImage* image) {
  if (!image || !image->impl) return 0;
  return image->impl->data_size();
}

SkitchError skitch_image_export(const SkitchImage* image, const char* path,
                                SkitchImageFormat format, int quality) {
  if (!image || !image->impl || !path) return kSkitchErrorInvalidParam;
  if (!skitch::internal::WriteImageFile(*image->impl, path, format,
                                        quality)) {
    SKITCH_LOG_ERROR("Failed to write image to {}", path);
    return kSkitchErrorIoFailed;
  }
  return kSkitchOk;
}

// ---------------------------------------------------------------------------
// Document objects
// ---------------------------------------------------------------------------

int skitch_document_width(const SkitchContext* ctx) {
  if (!ctx) return 0;
  return ctx->impl.document()->width();
}

int skitch_document_height(const SkitchContext* ctx) {
  if (!ctx) return 0;
  return ctx->impl.document()->height();
}

int skitch_document_object_count(const SkitchContext* ctx) {
  if (!ctx) return 0;
  return ctx->impl.document()->object_count();
}

int skitch_add_rect(SkitchContext* ctx, int x, int y, int width, int height,
                    const SkitchShapeStyle* style) {
  if (!ctx) return -1;
  ShapeStyle s = StyleOrDefault(style, ctx->impl.editor());
  if (width <= 0 || height <= 0 || !ValidStyle(s)) {
    ctx->impl.SetError(kSkitchErrorInvalidParam,
                       "Rectangle size and stroke width must be positive");
    return -1;
  }
  return AddShape(ctx, std::make_unique<RectShape>(x, y, width, height, s));
}

int skitch_add_arrow(SkitchContext* ctx, int x1, int y1, int x2, int y2,
                     const SkitchShapeStyle* style) {
  if (!ctx) return -1;
  ShapeStyle s = StyleOrDefault(style, ctx->impl.editor());
  if (!ValidStyle(s)) {
    ctx->impl.SetError(kSkitchErrorInvalidParam,
                       "Stroke width must be positive");
    return -1;
  }
  return AddShape(ctx, std::make_unique<ArrowShape>(
                           x1, y1, x2, y2, ArrowShape::kDefaultHeadSize, s));
}

int skitch_add_stroke(SkitchContext* ctx, const int* points, int point_count,
                      const SkitchShapeStyle* style) {
  if (!ctx) return -1;
  ShapeStyle s = StyleOrDefault(style, ctx->impl.editor());
  if (!points || point_count < 2 || point_count > kMaxStrokePoints ||
      !ValidStyle(s)) {
    ctx->impl.SetError(kSkitchErrorInvalidParam,
                       "Stroke needs at least 2 points and a positive width");
    return -1;
  }
  std::vector<Point> pts(point_count);
  for (int i = 0; i < point_count; ++i) {
    pts[i].x = points[i * 2];
    pts[i].y = points[i * 2 + 1];
  }
  return AddShape(ctx, std::make_unique<StrokeShape>(std::move(pts), s));
}

int skitch_add_text(SkitchContext* ctx, int x, int y, const char* text,
                    const char* font_name, int font_size, uint32_t color) {
  if (!ctx) return -1;
  if (!text) {
    ctx->impl.SetError(kSkitchErrorInvalidParam, "Text must not be NULL");
    return -1;
  }
  if (font_size <= 0) font_size = TextShape::kDefaultFontSize;
  if (!font_name || !font_name[0]) font_name = TextShape::kDefaultFont;
  if (std::strlen(text) > kMaxTextBytes ||
      std::strlen(font_name) > kMaxFontNameBytes || font_size > kMaxFontSize) {
    ctx->impl.SetError(kSkitchErrorInvalidParam,
                       "Text, font name or font size too large");
    return -1;
  }
  return AddShape(ctx, std::make_unique<TextShape>(x, y, text, font_name,
                                                   font_size, color));
}

SkitchError skitch_remove_object(SkitchContext* ctx, int object_id) {
  if (!ctx) return kSkitchErrorInvalidParam;
  if (!ctx->impl.document()->RemoveObject(object_id)) {
    return ctx->impl.Report(kSkitchErrorNoObject, "No object with that id");
  }
  ctx->impl.ClearError();
  return kSkitchOk;
}

SkitchError skitch_move_object(SkitchContext* ctx, int object_id, int dx,
                               int dy) {
  if (!ctx) return kSkitchErrorInvalidParam;
  if (!ctx->impl.document()->MoveObject(object_id, dx, dy)) {
    return ctx->impl.Report(kSkitchErrorNoObject, "No object with that id");
  }
  ctx->impl.ClearError();
  return kSkitchOk;
}

SkitchError skitch_begin_text_edit(SkitchContext* ctx, int object_id) {
  if (!ctx) return kSkitchErrorInvalidParam;
  if (!ctx->impl.document()->BeginTextEdit(object_id)) {
    return ctx->impl.Report(kSkitchErrorNoObject,
                            "No text object with that id");
  }
  ctx->impl.ClearError();
  return kSkitchOk;
}

SkitchError skitch_update_text(SkitchContext* ctx, const char* text) {
  if (!ctx) return kSkitchErrorInvalidParam;
  if (!text || std::strlen(text) > kMaxTextBytes) {
    return ctx->impl.Report(kSkitchErrorInvalidParam,
                            "Text must be non-NULL and at most 1 MiB");
  }
  if (!ctx->impl.document()->UpdateEditedText(text)) {
    return ctx->impl.Report(kSkitchErrorInvalidParam,
                            "No text edit in progress");
  }
  ctx->impl.ClearError();
  return kSkitchOk;
}

SkitchError skitch_end_text_edit(SkitchContext* ctx) {
  if (!ctx) return kSkitchErrorInvalidParam;
  if (!ctx->impl.document()->EndTextEdit()) {
    return ctx->impl.Report(kSkitchErrorInvalidParam,
                            "No text edit in progress");
  }
  ctx->impl.ClearError();
  return kSkitchOk;
}

SkitchImage* skitch_render(SkitchContext* ctx) {
  if (!ctx) return nullptr;
  SkitchImage* image = WrapImage(ctx->impl.document()->Render().release());
  if (!image) {
    ctx->impl.SetError(kSkitchErrorOutOfMemory, "Failed to render document");
    return nullptr;
  }
  ctx->impl.ClearError();
  return image;
}

// ---------------------------------------------------------------------------
// Editing flows
// ---------------------------------------------------------------------------

SkitchError skitch_set_tool(SkitchContext* ctx, SkitchTool tool) {
  if (!ctx) return kSkitchErrorInvalidParam;
  if (tool < kSkitchToolSelect || tool > kSkitchToolMosaic) {
    return ctx->impl.Report(kSkitchErrorInvalidParam, "Unknown tool");
  }
  ctx->impl.editor()->SetTool(tool);
  ctx->impl.ClearError();
  return kSkitchOk;
}

SkitchError skitch_set_color(SkitchContext* ctx, uint32_t argb) {
  if (!ctx) return kSkitchErrorInvalidParam;
  ctx->impl.editor()->SetColor(argb);
  ctx->impl.ClearError();
  return kSkitchOk;
}

SkitchError skitch_set_stroke_width(SkitchContext* ctx, float width) {
  if (!ctx) return kSkitchErrorInvalidParam;
  if (!ctx->impl.editor()->SetStrokeWidth(width)) {
    return ctx->impl.Report(kSkitchErrorInvalidParam,
                            "Stroke width must be positive");
  }
  ctx->impl.ClearError();
  return kSkitchOk;
}

SkitchError skitch_pointer_down(SkitchContext* ctx, int x, int y) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.Report(ctx->impl.editor()->PointerDown(x, y),
                          "Pointer down");
}

SkitchError skitch_pointer_move(SkitchContext* ctx, int x, int y) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.Report(ctx->impl.editor()->PointerMove(x, y),
                          "Pointer move");
}

SkitchError skitch_pointer_up(SkitchContext* ctx, int x, int y) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.Report(ctx->impl.editor()->PointerUp(x, y), "Pointer up");
}

int skitch_handle_key(SkitchContext* ctx, int key, int modifiers) {
  if (!ctx) return 0;
  SkitchError result = kSkitchOk;
  if (!ctx->impl.editor()->HandleKey(key, modifiers, &result)) return 0;
  ctx->impl.Report(result, "Keyboard shortcut");
  return 1;
}

SkitchError skitch_new_document(SkitchContext* ctx, int width, int height) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.Report(ctx->impl.editor()->NewDocument(width, height),
                          "New document");
}

SkitchError skitch_load_image(SkitchContext* ctx, const SkitchImage* image) {
  if (!ctx) return kSkitchErrorInvalidParam;
  if (!image || !image->impl) {
    return ctx->impl.Report(kSkitchErrorInvalidParam, "Image is NULL");
  }
  std::unique_ptr<Image> bgra = image->impl->ToBgra();
  if (!bgra) {
    return ctx->impl.Report(kSkitchErrorOutOfMemory, "Failed to copy image");
  }
  return ctx->impl.Report(ctx->impl.editor()->LoadImage(std::move(bgra)),
                          "Load image");
}

SkitchError skitch_open_file(SkitchContext* ctx, const char* path) {
  if (!ctx) return kSkitchErrorInvalidParam;
  if (!path) return ctx->impl.Report(kSkitchErrorInvalidParam, "Path is NULL");
  return ctx->impl.Report(ctx->impl.editor()->OpenFile(path), "Open file");
}

SkitchError skitch_save_file(SkitchContext* ctx, const char* path,
                             SkitchImageFormat format, int quality) {
  if (!ctx) return kSkitchErrorInvalidParam;
  if (!path) return ctx->impl.Report(kSkitchErrorInvalidParam, "Path is NULL");
  return ctx->impl.Report(ctx->impl.editor()->Save(path, format, quality),
                          "Save file");
}

SkitchError skitch_crop(SkitchContext* ctx, int x, int y, int width,
                        int height) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.Report(ctx->impl.editor()->Crop(x, y, width, height),
                          "Crop");
}

int skitch_mosaic(SkitchContext* ctx, int x, int y, int width, int height) {
  if (!ctx) return -1;
  int id = -1;
  SkitchError result = ctx->impl.editor()->Mosaic(x, y, width, height, &id);
  if (ctx->impl.Report(result, "Mosaic") != kSkitchOk) return -1;
  return id;
}

void skitch_set_host_callbacks(SkitchContext* ctx,
                               const SkitchHostCallbacks* host) {
  if (!ctx) return;
  if (!host) {
    ctx->impl.set_host_shell(nullptr);
    return;
  }
  ctx->impl.set_host_shell(std::make_unique<CallbackHostShell>(*host));
}

SkitchError skitch_paste(SkitchContext* ctx) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.Report(ctx->impl.editor()->Paste(), "Paste");
}

SkitchError skitch_copy(SkitchContext* ctx) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.Report(ctx->impl.editor()->Copy(), "Copy");
}

int skitch_is_modified(const SkitchContext* ctx) {
  if (!ctx) return 0;
  return ctx->impl.editor()->is_modified() ? 1 : 0;
}

float skitch_set_zoom(SkitchContext* ctx, float zoom) {
  if (!ctx) return 0.0f;
  return ctx->impl.editor()->SetZoom(zoom);
}

// ---------------------------------------------------------------------------
// Undo / redo history
// ---------------------------------------------------------------------------

SkitchError skitch_undo(SkitchContext* ctx) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.Report(ctx->impl.editor()->Undo(), "Undo");
}

SkitchError skitch_redo(SkitchContext* ctx) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.Report(ctx->impl.editor()->Redo(), "Redo");
}

int skitch_can_undo(const SkitchContext* ctx) {
  if (!ctx) return 0;
  return ctx->impl.history()->CanUndo() ? 1 : 0;
}

int skitch_can_redo(const SkitchContext* ctx) {
  if (!ctx) return 0;
  return ctx->impl.history()->CanRedo() ? 1 : 0;
}

SkitchError skitch_history_flush(SkitchContext* ctx) {
  if (!ctx) return kSkitchErrorInvalidParam;
  return ctx->impl.Report(ToSkitchError(ctx->impl.history()->Flush()),
                          "History flush");
}

void skitch_history_sync(SkitchContext* ctx) {
  if (!ctx) return;
  ctx->impl.writer()->Flush();
}

SkitchError skitch_history_get_info(const SkitchContext* ctx,
                                    SkitchHistoryInfo* out_info) {
  if (!ctx || !out_info) return kSkitchErrorInvalidParam;
  const HistoryEngine* history = ctx->impl.history();
  out_info->undo_depth = history->undo_depth();
  out_info->redo_depth = history->redo_depth();
  out_info->top_id = history->top_id();
  out_info->locked = history->IsLocked() ? 1 : 0;
  out_info->degraded = history->degraded() ? 1 : 0;
  return kSkitchOk;
}

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

const char* skitch_version_string(void) {
  return SKITCH_VERSION_STRING;
}

int skitch_version_major(void) { return SKITCH_VERSION_MAJOR; }
int skitch_version_minor(void) { return SKITCH_VERSION_MINOR; }
int skitch_version_patch(void) { return SKITCH_VERSION_PATCH; }

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

void skitch_set_log_level(SkitchLogLevel level) {
  skitch::internal::SetLogLevel(level);
}

void skitch_set_log_callback(skitch_log_callback_t callback,
                             void* userdata) {
  auto sink = skitch::internal::GetCallbackSink();
  if (sink) {
    sink->SetCallback(callback, userdata);
  }
}

void skitch_log(SkitchLogLevel level, const char* message) {
  if (!message) return;
  auto logger = skitch::internal::GetLogger();
  if (logger) {
    logger->log(skitch::internal::ToSpdlogLevel(level), "{}", message);
  }
}
