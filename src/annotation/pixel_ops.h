// Copyright 2026 The skitch Authors
// Raster operations used when compositing the document.

#ifndef SKITCH_ANNOTATION_PIXEL_OPS_H_
#define SKITCH_ANNOTATION_PIXEL_OPS_H_

namespace skitch {
namespace internal {

class Image;

/// Mosaic block size used by the mosaic tool.
constexpr int kMosaicBlockSize = 10;

/// Draw `src` onto `dst` with its top-left corner at (left, top), scaled by
/// (scale_x, scale_y) using nearest-neighbour sampling and source-over
/// blending.  Both images must be BGRA8.
void BlitImage(const Image& src, Image* dst, int left, int top,
               float scale_x, float scale_y);

/// Replace each block_size x block_size cell of the region with its
/// average color.  Blocks are aligned to the region origin.
void ApplyMosaic(Image* image, int x, int y, int w, int h, int block_size);

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_ANNOTATION_PIXEL_OPS_H_
