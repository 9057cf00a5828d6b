// Copyright 2026 The skitch Authors

#include "editor/editor.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cmath>
#include <fstream>
#include <utility>

#include "annotation/pixel_ops.h"
#include "core/image_codec.h"
#include "core/logger.h"

namespace skitch {
namespace internal {

namespace {

constexpr float kHighlighterAlpha = 0.3f;
constexpr float kHighlighterWidthFactor = 3.0f;

const char* ToolName(SkitchTool tool) {
  switch (tool) {
    case kSkitchToolSelect:
      return "select";
    case kSkitchToolMarker:
      return "marker";
    case kSkitchToolHighlighter:
      return "highlighter";
    case kSkitchToolArrow:
      return "arrow";
    case kSkitchToolRectangle:
      return "rectangle";
    case kSkitchToolText:
      return "text";
    case kSkitchToolCrop:
      return "crop";
    case kSkitchToolMosaic:
      return "mosaic";
  }
  return "unknown";
}

}  // namespace

SkitchError ToSkitchError(HistoryResult result) {
  switch (result) {
    case HistoryResult::kOk:
    case HistoryResult::kUnchanged:
      return kSkitchOk;
    case HistoryResult::kBusy:
      return kSkitchErrorHistoryBusy;
    case HistoryResult::kNothingToUndo:
    case HistoryResult::kNothingToRedo:
      return kSkitchErrorHistoryEmpty;
    case HistoryResult::kSnapshotMissing:
      return kSkitchErrorSnapshotMissing;
    case HistoryResult::kRestoreFailed:
      return kSkitchErrorRestoreFailed;
    case HistoryResult::kFailed:
      return kSkitchErrorUnknown;
  }
  return kSkitchErrorUnknown;
}

Editor::Editor(Document* document, HistoryEngine* history, HostShell* host,
               int default_width, int default_height)
    : document_(document),
      history_(history),
      host_(host),
      default_width_(default_width),
      default_height_(default_height) {
  history_->set_capture_callback([this](SnapshotId) {
    if (history_->undo_depth() > 1) modified_ = true;
  });
}

Editor::~Editor() { history_->set_capture_callback(nullptr); }

// ---------------------------------------------------------------------------
// Tool state
// ---------------------------------------------------------------------------

void Editor::SetTool(SkitchTool tool) {
  if (gesture_active_) CancelGesture();
  if (tool != kSkitchToolSelect) document_->ClearSelection();
  tool_ = tool;
  SKITCH_LOG_DEBUG("Tool selected: {}", ToolName(tool));
}

void Editor::SetColor(uint32_t argb) {
  color_ = argb;
  int selected = document_->selected_id();
  if (selected >= 0) document_->RecolorObject(selected, argb);
}

bool Editor::SetStrokeWidth(float width) {
  if (!std::isfinite(width) || width <= 0.0f) return false;
  stroke_width_ = width;
  return true;
}

ShapeStyle Editor::CurrentStyle() const {
  ShapeStyle style = {};
  style.stroke_color = color_;
  style.stroke_width = stroke_width_;
  if (tool_ == kSkitchToolHighlighter) {
    uint32_t alpha = static_cast<uint32_t>(
        std::lround(((color_ >> 24) & 0xFF) * kHighlighterAlpha));
    style.stroke_color = (color_ & 0x00FFFFFF) | (alpha << 24);
    style.stroke_width = stroke_width_ * kHighlighterWidthFactor;
  }
  return style;
}

// ---------------------------------------------------------------------------
// Pointer gestures
// ---------------------------------------------------------------------------

SkitchError Editor::PointerDown(int x, int y) {
  if (gesture_active_) CancelGesture();
  // Clicking anywhere ends a text edit.
  document_->EndTextEdit();

  start_ = current_ = {x, y};
  points_.clear();
  drag_id_ = -1;

  switch (tool_) {
    case kSkitchToolSelect: {
      int hit = document_->HitTest(x, y);
      if (hit >= 0) {
        document_->Select(hit);
        drag_id_ = hit;
        gesture_active_ = true;
      } else {
        document_->ClearSelection();
      }
      return kSkitchOk;
    }
    case kSkitchToolMarker:
    case kSkitchToolHighlighter:
      points_.push_back({x, y});
      gesture_active_ = true;
      return kSkitchOk;
    case kSkitchToolText: {
      int id = document_->AddObject(std::make_unique<TextShape>(
          x, y, TextShape::kDefaultText, TextShape::kDefaultFont,
          TextShape::kDefaultFontSize, color_));
      SetTool(kSkitchToolSelect);
      document_->BeginTextEdit(id);
      return kSkitchOk;
    }
    case kSkitchToolArrow:
    case kSkitchToolRectangle:
    case kSkitchToolCrop:
    case kSkitchToolMosaic:
      gesture_active_ = true;
      return kSkitchOk;
  }
  return kSkitchErrorInvalidParam;
}

SkitchError Editor::PointerMove(int x, int y) {
  if (!gesture_active_) return kSkitchOk;
  current_ = {x, y};
  if (tool_ == kSkitchToolMarker || tool_ == kSkitchToolHighlighter) {
    const Point& last = points_.back();
    if (last.x != x || last.y != y) points_.push_back({x, y});
  }
  return kSkitchOk;
}

SkitchError Editor::PointerUp(int x, int y) {
  if (!gesture_active_) return kSkitchOk;
  PointerMove(x, y);
  SkitchError result = CommitGesture();
  gesture_active_ = false;
  points_.clear();
  drag_id_ = -1;
  return result;
}

SkitchError Editor::CommitGesture() {
  int left = (std::min)(start_.x, current_.x);
  int top = (std::min)(start_.y, current_.y);
  int w = std::abs(current_.x - start_.x);
  int h = std::abs(current_.y - start_.y);

  switch (tool_) {
    case kSkitchToolSelect:
      if (drag_id_ >= 0) {
        document_->MoveObject(drag_id_, current_.x - start_.x,
                              current_.y - start_.y);
      }
      return kSkitchOk;
    case kSkitchToolMarker:
    case kSkitchToolHighlighter:
      // Free drawing keeps its tool.
      document_->AddObject(
          std::make_unique<StrokeShape>(points_, CurrentStyle()),
          ChangeKind::kDrawCompleted);
      return kSkitchOk;
    case kSkitchToolArrow:
      document_->AddObject(std::make_unique<ArrowShape>(
          start_.x, start_.y, current_.x, current_.y,
          ArrowShape::kDefaultHeadSize, CurrentStyle()));
      break;
    case kSkitchToolRectangle:
      document_->AddObject(
          std::make_unique<RectShape>(left, top, w, h, CurrentStyle()));
      break;
    case kSkitchToolCrop: {
      SkitchError err = Crop(left, top, w, h);
      SetTool(kSkitchToolSelect);
      return err;
    }
    case kSkitchToolMosaic: {
      int id = -1;
      SkitchError err = Mosaic(left, top, w, h, &id);
      SetTool(kSkitchToolSelect);
      return err;
    }
    case kSkitchToolText:
      break;
  }
  SKITCH_LOG_DEBUG("Shape completed");
  SetTool(kSkitchToolSelect);
  return kSkitchOk;
}

void Editor::CancelGesture() {
  gesture_active_ = false;
  points_.clear();
  drag_id_ = -1;
}

// ---------------------------------------------------------------------------
// Keyboard shortcuts
// ---------------------------------------------------------------------------

bool Editor::HandleKey(int key, int modifiers, SkitchError* out_result) {
  SkitchError result = kSkitchOk;
  bool handled = true;

  if (document_->is_editing_text()) {
    // Keys belong to the text being edited; only Escape leaves it.
    if (key != kSkitchKeyEscape) return false;
    document_->EndTextEdit();
    document_->ClearSelection();
    if (out_result) *out_result = kSkitchOk;
    return true;
  }

  bool ctrl = (modifiers & kSkitchModCtrl) != 0;
  bool shift = (modifiers & kSkitchModShift) != 0;
  int letter = (key >= 'A' && key <= 'Z') ? key - 'A' + 'a' : key;

  if (key == kSkitchKeyDelete || key == kSkitchKeyBackspace) {
    if (document_->selected_id() < 0) return false;
    result = DeleteSelection();
  } else if (key == kSkitchKeyEscape) {
    Escape();
  } else if (ctrl && letter == 'z' && !shift) {
    result = Undo();
  } else if (ctrl && (letter == 'z' || letter == 'y')) {
    result = Redo();
  } else if (ctrl && letter == 'c') {
    result = Copy();
  } else if (ctrl && letter == 'v') {
    result = Paste();
  } else if (ctrl && letter == 's') {
    result = SaveAs();
  } else if (ctrl && letter == 'o') {
    result = Open();
  } else if (ctrl && letter == 'n') {
    result = NewDocument(default_width_, default_height_);
  } else {
    handled = false;
  }

  if (out_result) *out_result = result;
  return handled;
}

void Editor::Escape() {
  CancelGesture();
  document_->ExitInteractiveEdit();
  SetTool(kSkitchToolSelect);
}

SkitchError Editor::DeleteSelection() {
  int id = document_->selected_id();
  if (id < 0) return kSkitchErrorNoObject;
  document_->ClearSelection();
  return document_->RemoveObject(id) ? kSkitchOk : kSkitchErrorNoObject;
}

// ---------------------------------------------------------------------------
// History
// ---------------------------------------------------------------------------

SkitchError Editor::Undo() {
  CancelGesture();
  return ToSkitchError(history_->Undo());
}

SkitchError Editor::Redo() {
  CancelGesture();
  return ToSkitchError(history_->Redo());
}

// ---------------------------------------------------------------------------
// Document flows
// ---------------------------------------------------------------------------

bool Editor::ConfirmDiscard(const char* message) {
  if (!modified_ || !host_) return true;
  return host_->ConfirmDiscardChanges(message);
}

SkitchError Editor::Replace(const HistoryEngine::Mutator& mutator) {
  CancelGesture();
  HistoryResult result = history_->ReplaceDocument(mutator);
  if (result == HistoryResult::kFailed) return kSkitchErrorInvalidParam;
  return ToSkitchError(result);
}

SkitchError Editor::NewDocument(int width, int height) {
  if (width <= 0) width = default_width_;
  if (height <= 0) height = default_height_;
  if (!ConfirmDiscard("You have unsaved changes. Are you sure you want to "
                      "create a new canvas?")) {
    return kSkitchErrorCanceled;
  }
  SkitchError err =
      Replace([&] { return document_->Reset(width, height); });
  if (err != kSkitchOk) return err;
  modified_ = false;
  zoom_ = 1.0f;
  SKITCH_LOG_INFO("New canvas {}x{}", width, height);
  return kSkitchOk;
}

SkitchError Editor::Open() {
  if (!host_) return kSkitchErrorCanceled;
  if (!ConfirmDiscard("You have unsaved changes. Are you sure you want to "
                      "open a new image?")) {
    return kSkitchErrorCanceled;
  }
  std::string path;
  if (!host_->PickOpenPath(&path)) return kSkitchErrorCanceled;
  std::unique_ptr<Image> image;
  SkitchError err = DecodeFile(path, &image);
  if (err != kSkitchOk) return err;
  return ReplaceWithImage(std::move(image));
}

SkitchError Editor::OpenFile(const std::string& path) {
  if (path.empty()) return kSkitchErrorInvalidParam;
  if (!ConfirmDiscard("You have unsaved changes. Are you sure you want to "
                      "open a new image?")) {
    return kSkitchErrorCanceled;
  }
  std::unique_ptr<Image> image;
  SkitchError err = DecodeFile(path, &image);
  if (err != kSkitchOk) return err;
  return ReplaceWithImage(std::move(image));
}

SkitchError Editor::DecodeFile(const std::string& path,
                               std::unique_ptr<Image>* out) {
  if (!std::ifstream(path).good()) {
    SKITCH_LOG_ERROR("Cannot open '{}'", path);
    return kSkitchErrorIoFailed;
  }
  *out = DecodeImageFile(path);
  return *out ? kSkitchOk : kSkitchErrorDecodeFailed;
}

SkitchError Editor::LoadImage(std::unique_ptr<Image> image) {
  if (!image) return kSkitchErrorInvalidParam;
  if (!ConfirmDiscard("You have unsaved changes. Are you sure you want to "
                      "replace your current work?")) {
    return kSkitchErrorCanceled;
  }
  return ReplaceWithImage(std::move(image));
}

SkitchError Editor::ReplaceWithImage(std::unique_ptr<Image> image) {
  int w = image->width();
  int h = image->height();
  // Shared so the mutator stays copyable.
  std::shared_ptr<const Image> pending(std::move(image));
  SkitchError err = Replace([this, pending] {
    return document_->SetBackgroundImage(pending->Clone());
  });
  if (err != kSkitchOk) return err;
  modified_ = false;
  zoom_ = 1.0f;
  SKITCH_LOG_INFO("Image loaded ({}x{})", w, h);
  return kSkitchOk;
}

SkitchError Editor::Paste() {
  if (!host_) return kSkitchErrorCanceled;
  std::unique_ptr<Image> image = host_->ReadClipboardImage();
  if (!image) {
    SKITCH_LOG_INFO("No image in clipboard");
    return kSkitchErrorClipboardEmpty;
  }
  if (!ConfirmDiscard("You have unsaved changes. Are you sure you want to "
                      "paste from clipboard?")) {
    return kSkitchErrorCanceled;
  }
  return ReplaceWithImage(std::move(image));
}

SkitchError Editor::Save(const std::string& path, SkitchImageFormat format,
                         int quality) {
  if (path.empty()) return kSkitchErrorInvalidParam;
  document_->ExitInteractiveEdit();
  std::unique_ptr<Image> composite = document_->Render();
  if (!composite) return kSkitchErrorOutOfMemory;
  if (!WriteImageFile(*composite, path, format, quality)) {
    return kSkitchErrorIoFailed;
  }
  SKITCH_LOG_INFO("Saved to {}", path);
  return kSkitchOk;
}

SkitchError Editor::SaveAs() {
  if (!host_) return kSkitchErrorCanceled;
  std::string path;
  if (!host_->PickSavePath(&path)) return kSkitchErrorCanceled;
  return Save(path, FormatFromPath(path), 0);
}

SkitchError Editor::Copy() {
  if (!host_) return kSkitchErrorCanceled;
  document_->ExitInteractiveEdit();
  std::unique_ptr<Image> composite = document_->Render();
  if (!composite) return kSkitchErrorOutOfMemory;
  std::vector<uint8_t> png;
  if (!EncodePng(*composite, &png)) return kSkitchErrorUnknown;
  if (!host_->WriteClipboardPng(png)) return kSkitchErrorIoFailed;
  SKITCH_LOG_INFO("Copied to clipboard ({} bytes)", png.size());
  return kSkitchOk;
}

// ---------------------------------------------------------------------------
// Crop and mosaic
// ---------------------------------------------------------------------------

bool Editor::ClampRegion(int x, int y, int w, int h, Region* out) const {
  // 64-bit so that extreme sizes (INT_MAX, INT_MIN) clamp instead of wrap.
  int64_t x0 = x;
  int64_t y0 = y;
  int64_t x1 = x0 + w;
  int64_t y1 = y0 + h;
  if (x1 < x0) std::swap(x0, x1);
  if (y1 < y0) std::swap(y0, y1);
  int64_t left = (std::max)(int64_t{0}, x0);
  int64_t top = (std::max)(int64_t{0}, y0);
  int64_t right = (std::min)(x1, static_cast<int64_t>(document_->width()));
  int64_t bottom = (std::min)(y1, static_cast<int64_t>(document_->height()));
  if (right - left < kMinRegionSize || bottom - top < kMinRegionSize) {
    return false;
  }
  *out = {static_cast<int>(left), static_cast<int>(top),
          static_cast<int>(right - left), static_cast<int>(bottom - top)};
  return true;
}

SkitchError Editor::Crop(int x, int y, int width, int height) {
  Region r = {};
  if (!ClampRegion(x, y, width, height, &r)) {
    SKITCH_LOG_INFO("Crop area too small");
    return kSkitchErrorRegionTooSmall;
  }
  SKITCH_LOG_INFO("Executing crop: {}x{} at {},{}", r.w, r.h, r.x, r.y);

  document_->ExitInteractiveEdit();
  std::unique_ptr<Image> composite = document_->Render();
  if (!composite) return kSkitchErrorOutOfMemory;
  std::shared_ptr<const Image> cropped(
      composite->Crop(r.x, r.y, r.w, r.h));
  if (!cropped) return kSkitchErrorOutOfMemory;

  SkitchError err = Replace([this, cropped]() {
    return document_->SetBackgroundImage(cropped->Clone());
  });
  if (err != kSkitchOk) return err;
  modified_ = true;
  return kSkitchOk;
}

SkitchError Editor::Mosaic(int x, int y, int width, int height, int* out_id) {
  Region r = {};
  if (!ClampRegion(x, y, width, height, &r)) {
    SKITCH_LOG_INFO("Mosaic area too small");
    return kSkitchErrorRegionTooSmall;
  }
  SKITCH_LOG_INFO("Executing mosaic: {}x{} at {},{}", r.w, r.h, r.x, r.y);

  std::unique_ptr<Image> composite = document_->Render();
  if (!composite) return kSkitchErrorOutOfMemory;
  std::unique_ptr<Image> patch = composite->Crop(r.x, r.y, r.w, r.h);
  if (!patch) return kSkitchErrorOutOfMemory;
  ApplyMosaic(patch.get(), 0, 0, r.w, r.h, kMosaicBlockSize);

  int id = document_->AddObject(std::make_unique<ImagePatch>(
      r.x, r.y, std::shared_ptr<const Image>(std::move(patch))));
  if (out_id) *out_id = id;
  return id >= 0 ? kSkitchOk : kSkitchErrorUnknown;
}

float Editor::SetZoom(float zoom) {
  if (!std::isfinite(zoom)) return zoom_;
  zoom_ = (std::min)((std::max)(zoom, kMinZoom), kMaxZoom);
  return zoom_;
}

}  // namespace internal
}  // namespace skitch
