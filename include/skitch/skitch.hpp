// Copyright 2026 The skitch Authors
//
// C++ RAII wrapper for the skitch C API.
// Header-only; just include this file.  Requires C++17 or later.
//
// Usage:
//   #include "skitch/skitch.hpp"
//   skitch::Context ctx;
//   ctx.AddRect(10, 10, 100, 50);
//   ctx.FlushHistory();
//   ctx.Undo();

#ifndef SKITCH_SKITCH_HPP_
#define SKITCH_SKITCH_HPP_

#include "skitch/skitch.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace skitch {

// ---------------------------------------------------------------------------
// Exception
// ---------------------------------------------------------------------------

class Error : public std::runtime_error {
 public:
  Error(SkitchError code, const char* msg)
      : std::runtime_error(msg ? msg : "skitch error"), code_(code) {}
  SkitchError code() const noexcept { return code_; }

 private:
  SkitchError code_;
};

// ---------------------------------------------------------------------------
// Image  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Image {
 public:
  Image() noexcept = default;
  explicit Image(SkitchImage* raw) noexcept : raw_(raw) {}
  ~Image() { skitch_image_destroy(raw_); }

  Image(Image&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Image& operator=(Image&& o) noexcept {
    if (this != &o) {
      skitch_image_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Image(const Image&) = delete;
  Image& operator=(const Image&) = delete;

  /// Decode an image file.  Throws on failure.
  static Image Load(const char* path) {
    SkitchImage* raw = skitch_image_load(path);
    if (!raw) throw Error(kSkitchErrorDecodeFailed, "Failed to load image");
    return Image(raw);
  }

  explicit operator bool() const noexcept { return raw_ != nullptr; }
  SkitchImage* get() const noexcept { return raw_; }
  SkitchImage* release() noexcept {
    auto* p = raw_;
    raw_ = nullptr;
    return p;
  }

  int width() const noexcept { return skitch_image_get_width(raw_); }
  int height() const noexcept { return skitch_image_get_height(raw_); }
  int stride() const noexcept { return skitch_image_get_stride(raw_); }
  SkitchPixelFormat format() const noexcept {
    return skitch_image_get_format(raw_);
  }
  const uint8_t* data() const noexcept { return skitch_image_get_data(raw_); }
  size_t data_size() const noexcept {
    return skitch_image_get_data_size(raw_);
  }

  void Export(const char* path, SkitchImageFormat format, int quality = 0) {
    SkitchError err = skitch_image_export(raw_, path, format, quality);
    if (err != kSkitchOk) throw Error(err, "Image export failed");
  }

 private:
  SkitchImage* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Context  (move-only RAII wrapper)
// ---------------------------------------------------------------------------

class Context {
 public:
  Context() : raw_(skitch_context_create()) {
    if (!raw_) throw Error(kSkitchErrorNotInitialized, "Context creation failed");
  }
  explicit Context(const SkitchOptions& options)
      : raw_(skitch_context_create_with_options(&options)) {
    if (!raw_) throw Error(kSkitchErrorNotInitialized, "Context creation failed");
  }
  ~Context() { skitch_context_destroy(raw_); }

  Context(Context&& o) noexcept : raw_(o.raw_) { o.raw_ = nullptr; }
  Context& operator=(Context&& o) noexcept {
    if (this != &o) {
      skitch_context_destroy(raw_);
      raw_ = o.raw_;
      o.raw_ = nullptr;
    }
    return *this;
  }
  Context(const Context&) = delete;
  Context& operator=(const Context&) = delete;

  SkitchContext* get() const noexcept { return raw_; }

  SkitchError last_error() const { return skitch_get_last_error(raw_); }
  const char* last_error_message() const {
    return skitch_get_last_error_message(raw_);
  }

  int ProcessEvents(int timeout_ms = 0) {
    return skitch_process_events(raw_, timeout_ms);
  }

  void SetHostCallbacks(const SkitchHostCallbacks& host) {
    skitch_set_host_callbacks(raw_, &host);
  }

  // -- Document --

  int width() const { return skitch_document_width(raw_); }
  int height() const { return skitch_document_height(raw_); }
  int object_count() const { return skitch_document_object_count(raw_); }

  int AddRect(int x, int y, int w, int h,
              const SkitchShapeStyle* style = nullptr) {
    return checked_id(skitch_add_rect(raw_, x, y, w, h, style), "AddRect");
  }
  int AddArrow(int x1, int y1, int x2, int y2,
               const SkitchShapeStyle* style = nullptr) {
    return checked_id(skitch_add_arrow(raw_, x1, y1, x2, y2, style),
                      "AddArrow");
  }
  /// `points` holds x, y pairs.
  int AddStroke(const std::vector<int>& points,
                const SkitchShapeStyle* style = nullptr) {
    return checked_id(
        skitch_add_stroke(raw_, points.data(),
                          static_cast<int>(points.size() / 2), style),
        "AddStroke");
  }
  int AddText(int x, int y, const std::string& text,
              const char* font_name = nullptr, int font_size = 0,
              uint32_t color = 0xFFFF0000) {
    return checked_id(skitch_add_text(raw_, x, y, text.c_str(), font_name,
                                      font_size, color),
                      "AddText");
  }
  void RemoveObject(int id) { check(skitch_remove_object(raw_, id)); }
  void MoveObject(int id, int dx, int dy) {
    check(skitch_move_object(raw_, id, dx, dy));
  }

  void BeginTextEdit(int id) { check(skitch_begin_text_edit(raw_, id)); }
  void UpdateText(const std::string& text) {
    check(skitch_update_text(raw_, text.c_str()));
  }
  void EndTextEdit() { check(skitch_end_text_edit(raw_)); }

  Image Render() {
    auto* img = skitch_render(raw_);
    if (!img) throw_last("Render failed");
    return Image(img);
  }

  // -- Editing --

  void SetTool(SkitchTool tool) { check(skitch_set_tool(raw_, tool)); }
  void SetColor(uint32_t argb) { check(skitch_set_color(raw_, argb)); }
  void SetStrokeWidth(float w) { check(skitch_set_stroke_width(raw_, w)); }

  void PointerDown(int x, int y) { check(skitch_pointer_down(raw_, x, y)); }
  void PointerMove(int x, int y) { check(skitch_pointer_move(raw_, x, y)); }
  void PointerUp(int x, int y) { check(skitch_pointer_up(raw_, x, y)); }
  bool HandleKey(int key, int modifiers = kSkitchModNone) {
    return skitch_handle_key(raw_, key, modifiers) != 0;
  }

  void NewDocument(int w = 0, int h = 0) {
    check(skitch_new_document(raw_, w, h));
  }
  void LoadImage(const Image& img) { check(skitch_load_image(raw_, img.get())); }
  void OpenFile(const char* path) { check(skitch_open_file(raw_, path)); }
  void SaveFile(const char* path, SkitchImageFormat format,
                int quality = 0) {
    check(skitch_save_file(raw_, path, format, quality));
  }
  void Crop(int x, int y, int w, int h) {
    check(skitch_crop(raw_, x, y, w, h));
  }
  int Mosaic(int x, int y, int w, int h) {
    return checked_id(skitch_mosaic(raw_, x, y, w, h), "Mosaic");
  }
  void Copy() { check(skitch_copy(raw_)); }
  void Paste() { check(skitch_paste(raw_)); }
  bool modified() const { return skitch_is_modified(raw_) != 0; }
  float SetZoom(float zoom) { return skitch_set_zoom(raw_, zoom); }

  // -- History --

  /// Returns false if there was nothing to undo or history is locked.
  bool Undo() { return step(skitch_undo(raw_)); }
  bool Redo() { return step(skitch_redo(raw_)); }
  bool can_undo() const { return skitch_can_undo(raw_) != 0; }
  bool can_redo() const { return skitch_can_redo(raw_) != 0; }
  void FlushHistory() { check(skitch_history_flush(raw_)); }
  void SyncHistory() { skitch_history_sync(raw_); }
  SkitchHistoryInfo history_info() const {
    SkitchHistoryInfo info = {};
    skitch_history_get_info(raw_, &info);
    return info;
  }

 private:
  void check(SkitchError err) {
    if (err != kSkitchOk) throw Error(err, skitch_get_last_error_message(raw_));
  }
  bool step(SkitchError err) {
    if (err == kSkitchErrorHistoryEmpty || err == kSkitchErrorHistoryBusy) {
      return false;
    }
    check(err);
    return true;
  }
  int checked_id(int id, const char* fallback) {
    if (id < 0) throw_last(fallback);
    return id;
  }
  [[noreturn]] void throw_last(const char* fallback) {
    auto err = skitch_get_last_error(raw_);
    const char* msg = skitch_get_last_error_message(raw_);
    throw Error(err != kSkitchOk ? err : kSkitchErrorUnknown,
                (msg && msg[0]) ? msg : fallback);
  }

  SkitchContext* raw_ = nullptr;
};

// ---------------------------------------------------------------------------
// Free functions
// ---------------------------------------------------------------------------

inline const char* version_string() { return skitch_version_string(); }

}  // namespace skitch

#endif  // SKITCH_SKITCH_HPP_
