// Copyright 2026 The skitch Authors

#include "annotation/document.h"

#include <algorithm>
#include <utility>

#include "annotation/pixel_ops.h"
#include "core/logger.h"

namespace skitch {
namespace internal {

namespace {

constexpr int kMaxCanvasDimension = 32768;

bool ValidCanvasSize(int width, int height) {
  return width >= 1 && height >= 1 && width <= kMaxCanvasDimension &&
         height <= kMaxCanvasDimension;
}

}  // namespace

Document::Document(int width, int height,
                   std::unique_ptr<AnnotationRenderer> renderer)
    : renderer_(std::move(renderer)) {
  state_.width = ValidCanvasSize(width, height) ? width : 1200;
  state_.height = ValidCanvasSize(width, height) ? height : 750;
}

Document::~Document() = default;

const Shape* Document::FindObject(int id) const {
  for (const auto& s : state_.objects) {
    if (s->id() == id) return s.get();
  }
  return nullptr;
}

Shape* Document::FindMutable(int id) {
  for (auto& s : state_.objects) {
    if (s->id() == id) return s.get();
  }
  return nullptr;
}

// ---------------------------------------------------------------------------
// Object mutations
// ---------------------------------------------------------------------------

int Document::AddObject(std::unique_ptr<Shape> shape, ChangeKind kind) {
  if (!shape) return -1;
  int id = next_object_id_++;
  shape->set_id(id);
  state_.objects.push_back(std::move(shape));
  SKITCH_LOG_TRACE("Document: added object {}", id);
  Notify(kind);
  return id;
}

bool Document::RemoveObject(int id) {
  auto it = std::find_if(state_.objects.begin(), state_.objects.end(),
                         [id](const auto& s) { return s->id() == id; });
  if (it == state_.objects.end()) return false;
  if (selected_id_ == id) selected_id_ = -1;
  if (editing_id_ == id) editing_id_ = -1;
  state_.objects.erase(it);
  Notify(ChangeKind::kObjectRemoved);
  return true;
}

bool Document::MoveObject(int id, int dx, int dy) {
  Shape* shape = FindMutable(id);
  if (!shape) return false;
  if (dx == 0 && dy == 0) return true;
  shape->Translate(dx, dy);
  Notify(ChangeKind::kObjectModified);
  return true;
}

bool Document::RecolorObject(int id, uint32_t argb) {
  Shape* shape = FindMutable(id);
  if (!shape || !shape->Recolor(argb)) return false;
  Notify(ChangeKind::kObjectModified);
  return true;
}

int Document::HitTest(int x, int y) const {
  for (auto it = state_.objects.rbegin(); it != state_.objects.rend(); ++it) {
    if ((*it)->GetBounds().Contains(x, y)) return (*it)->id();
  }
  return -1;
}

bool Document::Select(int id) {
  if (!FindObject(id)) return false;
  selected_id_ = id;
  return true;
}

// ---------------------------------------------------------------------------
// Text editing
// ---------------------------------------------------------------------------

bool Document::BeginTextEdit(int id) {
  const Shape* shape = FindObject(id);
  if (!shape || shape->type() != ShapeType::kText) return false;
  if (editing_id_ >= 0 && editing_id_ != id) EndTextEdit();
  editing_id_ = id;
  selected_id_ = id;
  return true;
}

bool Document::UpdateEditedText(const std::string& text) {
  if (editing_id_ < 0) return false;
  auto* shape = static_cast<TextShape*>(FindMutable(editing_id_));
  if (!shape) return false;
  if (shape->text_ == text) return true;
  shape->text_ = text;
  Notify(ChangeKind::kTextChanged);
  return true;
}

bool Document::EndTextEdit() {
  if (editing_id_ < 0) return false;
  editing_id_ = -1;
  Notify(ChangeKind::kTextEditExited);
  return true;
}

void Document::ExitInteractiveEdit() {
  EndTextEdit();
  selected_id_ = -1;
}

// ---------------------------------------------------------------------------
// Wholesale replacement
// ---------------------------------------------------------------------------

bool Document::Reset(int width, int height) {
  if (!ValidCanvasSize(width, height)) {
    SKITCH_LOG_ERROR("Document: invalid canvas size {}x{}", width, height);
    return false;
  }
  DocumentState fresh;
  fresh.width = width;
  fresh.height = height;
  state_ = std::move(fresh);
  next_object_id_ = 0;
  ResetInteraction();
  Notify(ChangeKind::kReplaced);
  return true;
}

bool Document::SetBackgroundImage(std::unique_ptr<Image> image) {
  if (!image || !ValidCanvasSize(image->width(), image->height())) {
    return false;
  }
  if (image->format() != kSkitchFormatBgra8) {
    image = image->ToBgra();
    if (!image) return false;
  }
  DocumentState fresh;
  fresh.width = image->width();
  fresh.height = image->height();
  fresh.background = std::move(image);
  state_ = std::move(fresh);
  next_object_id_ = 0;
  ResetInteraction();
  Notify(ChangeKind::kReplaced);
  return true;
}

// ---------------------------------------------------------------------------
// Render: background + all objects
// ---------------------------------------------------------------------------

std::unique_ptr<Image> Document::Render() const {
  auto output = Image::Create(state_.width, state_.height, kSkitchFormatBgra8);
  if (!output) return nullptr;
  output->Fill(0xFFFFFFFF);

  if (state_.background) {
    const BackgroundPlacement& p = state_.placement;
    BlitImage(*state_.background, output.get(), p.left, p.top, p.scale_x,
              p.scale_y);
  }

  bool gfx_active = false;
  for (const auto& shape : state_.objects) {
    if (shape->type() == ShapeType::kImagePatch) {
      if (gfx_active) {
        renderer_->EndRender();
        gfx_active = false;
      }
      auto* patch = static_cast<const ImagePatch*>(shape.get());
      BlitImage(patch->image(), output.get(), patch->x_, patch->y_, 1.0f,
                1.0f);
    } else {
      if (!gfx_active && renderer_) {
        if (renderer_->BeginRender(output.get())) {
          gfx_active = true;
        }
      }
      if (gfx_active) {
        shape->Render(renderer_.get());
      }
    }
  }

  if (gfx_active) {
    renderer_->EndRender();
  }
  return output;
}

// ---------------------------------------------------------------------------
// DocumentSurface
// ---------------------------------------------------------------------------

bool Document::Serialize(Snapshot* out) const {
  if (!out) return false;
  std::vector<uint8_t> bytes;
  EncodeDocument(state_, &bytes);
  *out = Snapshot(std::move(bytes));
  return true;
}

bool Document::Restore(const Snapshot& snapshot) {
  DocumentState decoded;
  if (!DecodeDocument(snapshot.data(), snapshot.size(), &decoded)) {
    return false;
  }
  state_ = std::move(decoded);
  next_object_id_ = 0;
  for (const auto& s : state_.objects) {
    next_object_id_ = (std::max)(next_object_id_, s->id() + 1);
  }
  ResetInteraction();
  SKITCH_LOG_DEBUG("Document restored: {}x{}, {} objects, background={}",
                   state_.width, state_.height, state_.objects.size(),
                   state_.background != nullptr);
  Notify(ChangeKind::kRestored);
  return true;
}

void Document::AddChangeListener(ChangeListener* listener) {
  if (!listener) return;
  if (std::find(listeners_.begin(), listeners_.end(), listener) ==
      listeners_.end()) {
    listeners_.push_back(listener);
  }
}

void Document::RemoveChangeListener(ChangeListener* listener) {
  listeners_.erase(std::remove(listeners_.begin(), listeners_.end(), listener),
                   listeners_.end());
}

void Document::Notify(ChangeKind kind) {
  // Listeners may unregister while being notified.
  std::vector<ChangeListener*> snapshot = listeners_;
  for (ChangeListener* l : snapshot) l->OnDocumentChanged(kind);
}

void Document::ResetInteraction() {
  selected_id_ = -1;
  editing_id_ = -1;
}

}  // namespace internal
}  // namespace skitch
