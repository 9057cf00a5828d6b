// Copyright 2026 The skitch Authors

#ifndef SKITCH_EDITOR_HOST_SHELL_H_
#define SKITCH_EDITOR_HOST_SHELL_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace skitch {
namespace internal {

class Image;

/// Services the embedding application provides to editing flows: dialogs,
/// file pickers and the system clipboard.  Called synchronously on the
/// editing thread.
class HostShell {
 public:
  virtual ~HostShell() = default;

  /// Ask whether unsaved changes may be discarded.
  virtual bool ConfirmDiscardChanges(const std::string& message) = 0;

  /// Returns false if the user canceled.
  virtual bool PickOpenPath(std::string* out_path) = 0;
  virtual bool PickSavePath(std::string* out_path) = 0;

  /// Returns nullptr if the clipboard holds no image.
  virtual std::unique_ptr<Image> ReadClipboardImage() = 0;

  virtual bool WriteClipboardPng(const std::vector<uint8_t>& png) = 0;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_EDITOR_HOST_SHELL_H_
