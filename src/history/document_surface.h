// Copyright 2026 The skitch Authors

#ifndef SKITCH_HISTORY_DOCUMENT_SURFACE_H_
#define SKITCH_HISTORY_DOCUMENT_SURFACE_H_

#include "history/snapshot.h"

namespace skitch {
namespace internal {

/// Kinds of document change notifications.
enum class ChangeKind {
  kObjectAdded,
  kObjectModified,
  kObjectRemoved,
  kDrawCompleted,
  kTextChanged,
  kTextEditExited,  // Terminal: the engine captures immediately.
  kRestored,
  kReplaced,
};

/// Receives document change notifications.
class ChangeListener {
 public:
  virtual ~ChangeListener() = default;
  virtual void OnDocumentChanged(ChangeKind kind) = 0;
};

/// The live document as seen by the history engine.
///
/// Serialize() must be a pure function of the document state: two equal
/// documents yield byte-identical snapshots.  Implementations may throw
/// std::exception from Serialize() and Restore(); the engine treats that
/// like a false return.
class DocumentSurface {
 public:
  virtual ~DocumentSurface() = default;

  virtual bool Serialize(Snapshot* out) const = 0;

  /// Replace the document with `snapshot`.  On failure the document is left
  /// unchanged.  Emits kRestored on success.
  virtual bool Restore(const Snapshot& snapshot) = 0;

  virtual void AddChangeListener(ChangeListener* listener) = 0;
  virtual void RemoveChangeListener(ChangeListener* listener) = 0;

  /// Leave any interactive edit (text editing) and drop the selection.
  /// Emits kTextEditExited if an edit was active.
  virtual void ExitInteractiveEdit() = 0;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_HISTORY_DOCUMENT_SURFACE_H_
