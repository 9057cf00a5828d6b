// Copyright 2026 The skitch Authors

#ifndef SKITCH_ANNOTATION_DOCUMENT_H_
#define SKITCH_ANNOTATION_DOCUMENT_H_

#include <memory>
#include <string>
#include <vector>

#include "annotation/annotation_renderer.h"
#include "annotation/shape.h"
#include "annotation/snapshot_codec.h"
#include "core/image.h"
#include "history/document_surface.h"

namespace skitch {
namespace internal {

/// The annotated image: canvas size, optional background image and an
/// ordered list of annotation objects, plus the transient selection and
/// text-edit state (which snapshots do not capture).
///
/// Every mutation notifies the registered change listeners.
class Document : public DocumentSurface {
 public:
  /// `renderer` may be null; vector objects are then skipped by Render().
  Document(int width, int height,
           std::unique_ptr<AnnotationRenderer> renderer);
  ~Document() override;

  // Non-copyable.
  Document(const Document&) = delete;
  Document& operator=(const Document&) = delete;

  int width() const { return state_.width; }
  int height() const { return state_.height; }
  int object_count() const { return static_cast<int>(state_.objects.size()); }
  const std::vector<std::unique_ptr<Shape>>& objects() const {
    return state_.objects;
  }
  const Image* background() const { return state_.background.get(); }
  const BackgroundPlacement& background_placement() const {
    return state_.placement;
  }

  const Shape* FindObject(int id) const;

  // --- Object mutations (ids >= 0, -1 / false on error) ---

  int AddObject(std::unique_ptr<Shape> shape,
                ChangeKind kind = ChangeKind::kObjectAdded);
  bool RemoveObject(int id);
  bool MoveObject(int id, int dx, int dy);
  bool RecolorObject(int id, uint32_t argb);

  /// Topmost object whose bounds contain (x, y), or -1.
  int HitTest(int x, int y) const;

  // --- Selection ---

  int selected_id() const { return selected_id_; }
  bool Select(int id);
  void ClearSelection() { selected_id_ = -1; }

  // --- Text editing ---

  bool BeginTextEdit(int id);
  bool UpdateEditedText(const std::string& text);
  /// Emits kTextEditExited.  Returns false if no edit was active.
  bool EndTextEdit();
  bool is_editing_text() const { return editing_id_ >= 0; }
  int editing_id() const { return editing_id_; }

  // --- Wholesale replacement (emit kReplaced) ---

  /// Blank white canvas of the given size.
  bool Reset(int width, int height);

  /// The image becomes the background at (0, 0), scale 1; the canvas takes
  /// its size and all objects are dropped.
  bool SetBackgroundImage(std::unique_ptr<Image> image);

  /// Composite: white canvas, background, then objects in order.
  std::unique_ptr<Image> Render() const;

  // --- DocumentSurface ---

  bool Serialize(Snapshot* out) const override;
  bool Restore(const Snapshot& snapshot) override;
  void AddChangeListener(ChangeListener* listener) override;
  void RemoveChangeListener(ChangeListener* listener) override;
  void ExitInteractiveEdit() override;

 private:
  Shape* FindMutable(int id);
  void Notify(ChangeKind kind);
  void ResetInteraction();

  DocumentState state_;
  std::unique_ptr<AnnotationRenderer> renderer_;
  std::vector<ChangeListener*> listeners_;
  int next_object_id_ = 0;
  int selected_id_ = -1;
  int editing_id_ = -1;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_ANNOTATION_DOCUMENT_H_
