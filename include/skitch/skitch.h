// Copyright 2026 The skitch Authors
//
// Licensed under the MIT License. See LICENSE file in the project root for
// full license information.

#ifndef SKITCH_SKITCH_H_
#define SKITCH_SKITCH_H_

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

// ---------------------------------------------------------------------------
// Export macro
// ---------------------------------------------------------------------------
#if defined(_WIN32)
#if defined(SKITCH_BUILDING)
#define SKITCH_API __declspec(dllexport)
#else
#define SKITCH_API __declspec(dllimport)
#endif
#elif defined(__GNUC__) || defined(__clang__)
#define SKITCH_API __attribute__((visibility("default")))
#else
#define SKITCH_API
#endif

// ---------------------------------------------------------------------------
// Version (auto-generated from CMakeLists.txt via configure_file)
// ---------------------------------------------------------------------------
#include "skitch/version.h"

// ---------------------------------------------------------------------------
// Threading model
// ---------------------------------------------------------------------------
//
//   - A SkitchContext is one editing session: one document, one undo/redo
//     history.  All calls on a context must come from the same thread (the
//     "UI thread").  Timers (capture debounce, undo settle delay) only fire
//     from skitch_process_events(), so the host must pump it from its event
//     loop.
//   - Snapshot persistence runs on an internal worker thread; it never calls
//     back into user code.
//   - skitch_set_log_level() and skitch_set_log_callback() are
//     process-global and internally synchronized.  The log callback may be
//     invoked from the persistence worker thread.
//

// ---------------------------------------------------------------------------
// Opaque handles
// ---------------------------------------------------------------------------
typedef struct SkitchContext SkitchContext;
typedef struct SkitchImage SkitchImage;

// ---------------------------------------------------------------------------
// Types
// ---------------------------------------------------------------------------

/// Error codes returned by skitch functions.
typedef enum SkitchError {
  kSkitchOk = 0,
  kSkitchErrorNotInitialized = -1,
  kSkitchErrorInvalidParam = -2,
  kSkitchErrorOutOfMemory = -3,
  kSkitchErrorIoFailed = -4,            ///< File could not be read/written
  kSkitchErrorDecodeFailed = -5,        ///< Image data could not be decoded
  kSkitchErrorNoObject = -6,            ///< Object id not in the document
  kSkitchErrorRegionTooSmall = -7,      ///< Crop/mosaic region under 10x10
  kSkitchErrorCanceled = -8,            ///< User declined / picker canceled
  kSkitchErrorClipboardEmpty = -9,      ///< No image on the clipboard
  kSkitchErrorHistoryBusy = -10,        ///< Undo/redo/capture in progress
  kSkitchErrorHistoryEmpty = -11,       ///< Nothing to undo / redo
  kSkitchErrorSnapshotMissing = -12,    ///< Snapshot lost from cache+store
  kSkitchErrorRestoreFailed = -13,      ///< Document rejected the snapshot
  kSkitchErrorUnknown = -99,
} SkitchError;

/// Log severity levels for the internal logging system.
typedef enum SkitchLogLevel {
  kSkitchLogTrace = 0,   ///< Very detailed diagnostic info
  kSkitchLogDebug = 1,   ///< Debug-level messages
  kSkitchLogInfo = 2,    ///< Informational messages (default)
  kSkitchLogWarn = 3,    ///< Warnings
  kSkitchLogError = 4,   ///< Errors
  kSkitchLogFatal = 5,   ///< Fatal / critical errors
} SkitchLogLevel;

/// User-defined log callback function type.
///
/// @param level  The severity level of the message.
/// @param message  Null-terminated UTF-8 log message.
/// @param userdata  The opaque pointer passed to skitch_set_log_callback.
typedef void (*skitch_log_callback_t)(SkitchLogLevel level,
                                      const char* message, void* userdata);

/// Pixel format of image data.
typedef enum SkitchPixelFormat {
  kSkitchFormatBgra8 = 0,   ///< B8G8R8A8 (default, internal format)
  kSkitchFormatRgba8 = 1,   ///< R8G8B8A8
} SkitchPixelFormat;

/// Image file format for export.
typedef enum SkitchImageFormat {
  kSkitchImageFormatPng = 0,
  kSkitchImageFormatJpeg = 1,
  kSkitchImageFormatBmp = 2,
} SkitchImageFormat;

/// Shape drawing style.
typedef struct SkitchShapeStyle {
  uint32_t stroke_color;  ///< Stroke color in ARGB format (0xAARRGGBB)
  float stroke_width;     ///< Stroke width in pixels
} SkitchShapeStyle;

/// Editing tools (mirror the toolbar of the annotation app).
typedef enum SkitchTool {
  kSkitchToolSelect = 0,
  kSkitchToolMarker = 1,
  kSkitchToolHighlighter = 2,
  kSkitchToolArrow = 3,
  kSkitchToolRectangle = 4,
  kSkitchToolText = 5,
  kSkitchToolCrop = 6,
  kSkitchToolMosaic = 7,
} SkitchTool;

/// Keyboard modifier flags for skitch_handle_key().
typedef enum SkitchKeyModifier {
  kSkitchModNone = 0,
  kSkitchModCtrl = 1 << 0,   ///< Ctrl (or Cmd on macOS)
  kSkitchModShift = 1 << 1,
} SkitchKeyModifier;

/// Named keys for skitch_handle_key(); printable keys use their ASCII code.
typedef enum SkitchKey {
  kSkitchKeyEscape = 0x1B,
  kSkitchKeyBackspace = 0x08,
  kSkitchKeyDelete = 0x7F,
} SkitchKey;

/// Overflow behavior of the snapshot write-behind queue.
typedef enum SkitchWritePolicy {
  kSkitchWritePolicyBlock = 0,       ///< Caller waits for queue space
  kSkitchWritePolicyDropOldest = 1,  ///< Oldest pending write is dropped
} SkitchWritePolicy;

/// Session options.  Zero-valued fields keep the configured defaults
/// (settings.ini, then built-in values).
typedef struct SkitchOptions {
  const char* store_dir;      ///< Snapshot directory (NULL = default)
  int max_undo_steps;         ///< Undo depth cap (default 100)
  int cache_capacity;         ///< In-memory snapshot cache size (default 20)
  int debounce_ms;            ///< Capture quiescence window (default 150)
  int settle_ms;              ///< Post-restore lock time (default 500, <0 = 0)
  int write_queue_capacity;   ///< Pending store writes (default 64)
  SkitchWritePolicy write_policy;
  int canvas_width;           ///< Initial blank canvas (default 1200)
  int canvas_height;          ///< Initial blank canvas (default 750)
} SkitchOptions;

/// Summary of the undo/redo history.
typedef struct SkitchHistoryInfo {
  int undo_depth;     ///< Entries on the undo stack (>= 1 once started)
  int redo_depth;     ///< Entries on the redo stack
  int64_t top_id;     ///< Snapshot id on top of the undo stack (0 = none)
  int locked;         ///< Non-zero while a restore/replace is settling
  int degraded;       ///< Non-zero if the store is unavailable (cache only)
} SkitchHistoryInfo;

/// Services the embedding application provides to the editing flows.
/// Any member may be NULL: confirmations then pass, and pickers and the
/// clipboard behave as canceled / empty.  Called on the editing thread.
typedef struct SkitchHostCallbacks {
  /// Return non-zero if unsaved changes may be discarded.
  int (*confirm_discard)(const char* message, void* userdata);
  /// Write a NUL-terminated path into `buf`; return 0 if canceled.
  int (*pick_open_path)(char* buf, size_t buf_size, void* userdata);
  int (*pick_save_path)(char* buf, size_t buf_size, void* userdata);
  /// Return the clipboard image (ownership passes to skitch) or NULL.
  SkitchImage* (*read_clipboard_image)(void* userdata);
  /// Receive PNG bytes for the clipboard; return 0 on failure.
  int (*write_clipboard_png)(const uint8_t* data, size_t size,
                             void* userdata);
  void* userdata;
} SkitchHostCallbacks;

// ---------------------------------------------------------------------------
// Context management
// ---------------------------------------------------------------------------

/// Create an editing session using ~/.config/skitch/settings.ini.
/// Clears any snapshots left by a previous session and records the initial
/// (blank canvas) snapshot.  Returns NULL on failure.
SKITCH_API SkitchContext* skitch_context_create(void);

/// Create an editing session with explicit options (NULL = defaults).
SKITCH_API SkitchContext* skitch_context_create_with_options(
    const SkitchOptions* options);

/// Destroy a session.  Pending snapshot writes are flushed first.
SKITCH_API void skitch_context_destroy(SkitchContext* ctx);

/// Run due timers (debounced capture, settle delay).
/// @param timeout_ms  Maximum time to wait for the next timer (0 = poll).
/// @return Number of timer tasks executed, or -1 on invalid ctx.
SKITCH_API int skitch_process_events(SkitchContext* ctx, int timeout_ms);

// ---------------------------------------------------------------------------
// Error handling
// ---------------------------------------------------------------------------

SKITCH_API SkitchError skitch_get_last_error(const SkitchContext* ctx);
SKITCH_API const char* skitch_get_last_error_message(const SkitchContext* ctx);

// ---------------------------------------------------------------------------
// Images
// ---------------------------------------------------------------------------

/// Create an image by copying pixel data.  `stride` may be 0 (tightly
/// packed).  Returns NULL on invalid parameters.
SKITCH_API SkitchImage* skitch_image_create(int width, int height,
                                            int stride,
                                            SkitchPixelFormat format,
                                            const uint8_t* data);

/// Decode a PNG / JPEG / BMP / GIF file.  Returns NULL on failure.
SKITCH_API SkitchImage* skitch_image_load(const char* path);

SKITCH_API void skitch_image_destroy(SkitchImage* image);
SKITCH_API int skitch_image_get_width(const SkitchImage* image);
SKITCH_API int skitch_image_get_height(const SkitchImage* image);
SKITCH_API int skitch_image_get_stride(const SkitchImage* image);
SKITCH_API SkitchPixelFormat skitch_image_get_format(const SkitchImage* image);
SKITCH_API const uint8_t* skitch_image_get_data(const SkitchImage* image);
SKITCH_API size_t skitch_image_get_data_size(const SkitchImage* image);

/// Write an image to disk.  `quality` applies to JPEG (1-100, 0 = 90).
SKITCH_API SkitchError skitch_image_export(const SkitchImage* image,
                                           const char* path,
                                           SkitchImageFormat format,
                                           int quality);

// ---------------------------------------------------------------------------
// Document objects
// ---------------------------------------------------------------------------
//
// Each mutation notifies the history engine; the capture happens after the
// debounce window (pump skitch_process_events) or on skitch_history_flush().
// Object-creating functions return the object id (>= 0) or -1 on error.

SKITCH_API int skitch_document_width(const SkitchContext* ctx);
SKITCH_API int skitch_document_height(const SkitchContext* ctx);
SKITCH_API int skitch_document_object_count(const SkitchContext* ctx);

SKITCH_API int skitch_add_rect(SkitchContext* ctx, int x, int y, int width,
                               int height, const SkitchShapeStyle* style);
SKITCH_API int skitch_add_arrow(SkitchContext* ctx, int x1, int y1, int x2,
                                int y2, const SkitchShapeStyle* style);
/// `points` holds point_count (x, y) pairs; point_count >= 2.
SKITCH_API int skitch_add_stroke(SkitchContext* ctx, const int* points,
                                 int point_count,
                                 const SkitchShapeStyle* style);
SKITCH_API int skitch_add_text(SkitchContext* ctx, int x, int y,
                               const char* text, const char* font_name,
                               int font_size, uint32_t color);

SKITCH_API SkitchError skitch_remove_object(SkitchContext* ctx,
                                            int object_id);
SKITCH_API SkitchError skitch_move_object(SkitchContext* ctx, int object_id,
                                          int dx, int dy);

/// Enter text editing on a text object.
SKITCH_API SkitchError skitch_begin_text_edit(SkitchContext* ctx,
                                              int object_id);
/// Replace the text of the object being edited.
SKITCH_API SkitchError skitch_update_text(SkitchContext* ctx,
                                          const char* text);
/// Leave text editing; forces an immediate history capture.
SKITCH_API SkitchError skitch_end_text_edit(SkitchContext* ctx);

/// Render the composited document (background + objects).
/// The caller owns the returned image.
SKITCH_API SkitchImage* skitch_render(SkitchContext* ctx);

// ---------------------------------------------------------------------------
// Editing flows
// ---------------------------------------------------------------------------

SKITCH_API SkitchError skitch_set_tool(SkitchContext* ctx, SkitchTool tool);
SKITCH_API SkitchError skitch_set_color(SkitchContext* ctx, uint32_t argb);
SKITCH_API SkitchError skitch_set_stroke_width(SkitchContext* ctx,
                                               float width);

/// Pointer gestures in document coordinates, interpreted by the active tool.
SKITCH_API SkitchError skitch_pointer_down(SkitchContext* ctx, int x, int y);
SKITCH_API SkitchError skitch_pointer_move(SkitchContext* ctx, int x, int y);
SKITCH_API SkitchError skitch_pointer_up(SkitchContext* ctx, int x, int y);

/// Dispatch a keyboard shortcut.  `key` is an ASCII letter or SkitchKey.
/// @return Non-zero if the key was handled.
SKITCH_API int skitch_handle_key(SkitchContext* ctx, int key, int modifiers);

/// Start a blank document (history cleared).
SKITCH_API SkitchError skitch_new_document(SkitchContext* ctx, int width,
                                           int height);

/// Replace the document with an image (open / paste).  History cleared.
SKITCH_API SkitchError skitch_load_image(SkitchContext* ctx,
                                         const SkitchImage* image);

/// Open an image file as the new document.  History cleared.
SKITCH_API SkitchError skitch_open_file(SkitchContext* ctx, const char* path);

/// Render and save the document.
SKITCH_API SkitchError skitch_save_file(SkitchContext* ctx, const char* path,
                                        SkitchImageFormat format,
                                        int quality);

/// Crop the document to a region.  History cleared.
SKITCH_API SkitchError skitch_crop(SkitchContext* ctx, int x, int y,
                                   int width, int height);

/// Pixelate a region (10px blocks) as a new image object.
/// @return Object id (>= 0) or -1 on error.
SKITCH_API int skitch_mosaic(SkitchContext* ctx, int x, int y, int width,
                             int height);

/// Install host services (NULL = headless).  The struct is copied.
SKITCH_API void skitch_set_host_callbacks(SkitchContext* ctx,
                                          const SkitchHostCallbacks* host);

/// Replace the document with the clipboard image.  History cleared.
SKITCH_API SkitchError skitch_paste(SkitchContext* ctx);

/// Put the rendered document on the clipboard as PNG.
SKITCH_API SkitchError skitch_copy(SkitchContext* ctx);

/// Non-zero if the document changed since the last new/open/paste.
SKITCH_API int skitch_is_modified(const SkitchContext* ctx);

/// View zoom (clamped to [0.1, 5]).  Not part of the history.
SKITCH_API float skitch_set_zoom(SkitchContext* ctx, float zoom);

// ---------------------------------------------------------------------------
// Undo / redo history
// ---------------------------------------------------------------------------

SKITCH_API SkitchError skitch_undo(SkitchContext* ctx);
SKITCH_API SkitchError skitch_redo(SkitchContext* ctx);
SKITCH_API int skitch_can_undo(const SkitchContext* ctx);
SKITCH_API int skitch_can_redo(const SkitchContext* ctx);

/// Capture a pending (debounced) change immediately.
SKITCH_API SkitchError skitch_history_flush(SkitchContext* ctx);

/// Wait until all pending snapshot writes reached the store.
SKITCH_API void skitch_history_sync(SkitchContext* ctx);

SKITCH_API SkitchError skitch_history_get_info(const SkitchContext* ctx,
                                               SkitchHistoryInfo* out_info);

// ---------------------------------------------------------------------------
// Version information
// ---------------------------------------------------------------------------

/// Get the library version as a string (e.g. "1.0.0").
SKITCH_API const char* skitch_version_string(void);
SKITCH_API int skitch_version_major(void);
SKITCH_API int skitch_version_minor(void);
SKITCH_API int skitch_version_patch(void);

// ---------------------------------------------------------------------------
// Logging
// ---------------------------------------------------------------------------

/// Set the global log level.  Messages below it are discarded.
SKITCH_API void skitch_set_log_level(SkitchLogLevel level);

/// Register a callback receiving every log message (NULL to unregister).
SKITCH_API void skitch_set_log_callback(skitch_log_callback_t callback,
                                        void* userdata);

/// Emit a message through the skitch logger.
SKITCH_API void skitch_log(SkitchLogLevel level, const char* message);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // SKITCH_SKITCH_H_
