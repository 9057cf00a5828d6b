// Copyright 2026 The skitch Authors

#ifndef SKITCH_EDITOR_EDITOR_H_
#define SKITCH_EDITOR_EDITOR_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "annotation/document.h"
#include "annotation/shape.h"
#include "editor/host_shell.h"
#include "history/history_engine.h"
#include "skitch/skitch.h"

namespace skitch {
namespace internal {

/// Map a history result to the public error code.
SkitchError ToSkitchError(HistoryResult result);

/// Interactive editing on top of a Document and its HistoryEngine: tools
/// and pointer gestures, keyboard shortcuts, crop and mosaic, and the
/// new / open / paste / save / copy flows.
class Editor {
 public:
  static constexpr uint32_t kDefaultColor = 0xFFFF0000;  // #ff0000
  static constexpr float kDefaultStrokeWidth = 3.0f;
  static constexpr int kMinRegionSize = 10;
  static constexpr float kMinZoom = 0.1f;
  static constexpr float kMaxZoom = 5.0f;

  /// `host` may be null (headless): confirmations then pass and flows
  /// needing a picker or the clipboard report kSkitchErrorCanceled.
  Editor(Document* document, HistoryEngine* history, HostShell* host,
         int default_width, int default_height);
  ~Editor();

  Editor(const Editor&) = delete;
  Editor& operator=(const Editor&) = delete;

  void set_host(HostShell* host) { host_ = host; }

  // -- Tool state --

  void SetTool(SkitchTool tool);
  SkitchTool tool() const { return tool_; }
  /// Also recolors the selected object.
  void SetColor(uint32_t argb);
  uint32_t color() const { return color_; }
  bool SetStrokeWidth(float width);
  float stroke_width() const { return stroke_width_; }

  // -- Pointer gestures (document coordinates) --

  SkitchError PointerDown(int x, int y);
  SkitchError PointerMove(int x, int y);
  SkitchError PointerUp(int x, int y);
  bool gesture_active() const { return gesture_active_; }

  /// Returns true if the key was handled; `out_result` receives the
  /// result of the triggered operation.
  bool HandleKey(int key, int modifiers, SkitchError* out_result);

  // -- Document flows --

  SkitchError NewDocument(int width, int height);
  SkitchError OpenFile(const std::string& path);
  /// Picker, then OpenFile().
  SkitchError Open();
  SkitchError LoadImage(std::unique_ptr<Image> image);
  SkitchError Paste();
  SkitchError Save(const std::string& path, SkitchImageFormat format,
                   int quality);
  /// Picker, then Save() with the format guessed from the extension.
  SkitchError SaveAs();
  SkitchError Copy();

  SkitchError Crop(int x, int y, int width, int height);
  /// Adds the pixelated region as an image patch.  `out_id` receives its
  /// object id.
  SkitchError Mosaic(int x, int y, int width, int height, int* out_id);

  SkitchError DeleteSelection();
  /// Cancel the gesture, deselect and return to the select tool.
  void Escape();

  SkitchError Undo();
  SkitchError Redo();

  bool is_modified() const { return modified_; }
  float SetZoom(float zoom);
  float zoom() const { return zoom_; }

 private:
  struct Region {
    int x, y, w, h;
  };

  /// Normalize and clamp to the canvas.  False if under the minimum size.
  bool ClampRegion(int x, int y, int w, int h, Region* out) const;

  bool ConfirmDiscard(const char* message);
  SkitchError DecodeFile(const std::string& path,
                         std::unique_ptr<Image>* out);
  /// Replace the document with `image` without asking.
  SkitchError ReplaceWithImage(std::unique_ptr<Image> image);
  SkitchError Replace(const HistoryEngine::Mutator& mutator);
  ShapeStyle CurrentStyle() const;
  SkitchError CommitGesture();
  void CancelGesture();

  Document* document_;
  HistoryEngine* history_;
  HostShell* host_;
  int default_width_;
  int default_height_;

  SkitchTool tool_ = kSkitchToolSelect;
  uint32_t color_ = kDefaultColor;
  float stroke_width_ = kDefaultStrokeWidth;
  float zoom_ = 1.0f;
  bool modified_ = false;

  // Gesture in progress.
  bool gesture_active_ = false;
  Point start_ = {0, 0};
  Point current_ = {0, 0};
  std::vector<Point> points_;
  int drag_id_ = -1;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_EDITOR_EDITOR_H_
