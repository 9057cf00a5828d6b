// Copyright 2026 The skitch Authors
//
// Canonical binary encoding of a document.  All integers little-endian:
//
//   "SKSN" u32 version u32 width u32 height
//   u8 has_background [i32 left i32 top f32 scale_x f32 scale_y <image>]
//   u32 object_count { u8 type i32 id <type fields> } * object_count
//
//   <image> = u32 width u32 height u32 rle_len <RLE of packed BGRA rows>
//
// Equal documents encode to identical bytes.

#ifndef SKITCH_ANNOTATION_SNAPSHOT_CODEC_H_
#define SKITCH_ANNOTATION_SNAPSHOT_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "annotation/shape.h"

namespace skitch {
namespace internal {

class ByteReader;
class ByteWriter;
class Image;

constexpr uint32_t kSnapshotFormatVersion = 1;

/// Where the background image sits on the canvas.
struct BackgroundPlacement {
  int left = 0;
  int top = 0;
  float scale_x = 1.0f;
  float scale_y = 1.0f;
};

/// Everything a snapshot captures.
struct DocumentState {
  int width = 0;
  int height = 0;
  std::shared_ptr<const Image> background;  // May be null.
  BackgroundPlacement placement;
  std::vector<std::unique_ptr<Shape>> objects;
};

void EncodeImage(const Image& image, ByteWriter* w);
std::unique_ptr<Image> DecodeImage(ByteReader* r);

void EncodeDocument(const DocumentState& state, std::vector<uint8_t>* out);

/// Fully validates the blob.  `out` is only written on success.
bool DecodeDocument(const uint8_t* data, size_t size, DocumentState* out);

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_ANNOTATION_SNAPSHOT_CODEC_H_
