// Copyright 2026 The skitch Authors

#include "annotation/pixel_ops.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

#include "core/image.h"

namespace skitch {
namespace internal {

void BlitImage(const Image& src, Image* dst, int left, int top,
               float scale_x, float scale_y) {
  if (!dst || scale_x <= 0.0f || scale_y <= 0.0f) return;
  if (src.width() <= 0 || src.height() <= 0) return;

  int out_w = static_cast<int>(std::lround(src.width() * scale_x));
  int out_h = static_cast<int>(std::lround(src.height() * scale_y));

  // Clamp destination rectangle to the target.
  int x0 = (std::max)(0, left);
  int y0 = (std::max)(0, top);
  int x1 = (std::min)(dst->width(), left + out_w);
  int y1 = (std::min)(dst->height(), top + out_h);
  if (x0 >= x1 || y0 >= y1) return;

  const uint8_t* s = src.data();
  uint8_t* d = dst->mutable_data();
  int src_stride = src.stride();
  int dst_stride = dst->stride();

  for (int py = y0; py < y1; ++py) {
    int sy = static_cast<int>((py - top) / scale_y);
    sy = (std::min)(sy, src.height() - 1);
    for (int px = x0; px < x1; ++px) {
      int sx = static_cast<int>((px - left) / scale_x);
      sx = (std::min)(sx, src.width() - 1);
      const uint8_t* sp = s + sy * src_stride + sx * 4;
      uint8_t* dp = d + py * dst_stride + px * 4;
      uint32_t a = sp[3];
      if (a == 255) {
        dp[0] = sp[0];
        dp[1] = sp[1];
        dp[2] = sp[2];
        dp[3] = 255;
      } else if (a != 0) {
        uint32_t inv = 255 - a;
        for (int c = 0; c < 3; ++c) {
          dp[c] = static_cast<uint8_t>((sp[c] * a + dp[c] * inv + 127) / 255);
        }
        dp[3] = static_cast<uint8_t>(a + (dp[3] * inv + 127) / 255);
      }
    }
  }
}

void ApplyMosaic(Image* image, int x, int y, int w, int h, int block_size) {
  if (!image || block_size <= 1) return;

  int img_w = image->width();
  int img_h = image->height();
  int stride = image->stride();
  uint8_t* data = image->mutable_data();

  // Clamp region to image bounds.
  int x0 = (std::max)(0, x);
  int y0 = (std::max)(0, y);
  int x1 = (std::min)(img_w, x + w);
  int y1 = (std::min)(img_h, y + h);

  for (int by = y0; by < y1; by += block_size) {
    for (int bx = x0; bx < x1; bx += block_size) {
      int bx1 = (std::min)(bx + block_size, x1);
      int by1 = (std::min)(by + block_size, y1);
      uint32_t count = 0;
      uint32_t sum[4] = {0, 0, 0, 0};

      for (int py = by; py < by1; ++py) {
        for (int px = bx; px < bx1; ++px) {
          const uint8_t* p = data + py * stride + px * 4;
          for (int c = 0; c < 4; ++c) sum[c] += p[c];
          ++count;
        }
      }
      if (count == 0) continue;

      // Rounded average.
      uint8_t avg[4];
      for (int c = 0; c < 4; ++c) {
        avg[c] = static_cast<uint8_t>((sum[c] + count / 2) / count);
      }

      for (int py = by; py < by1; ++py) {
        for (int px = bx; px < bx1; ++px) {
          uint8_t* p = data + py * stride + px * 4;
          for (int c = 0; c < 4; ++c) p[c] = avg[c];
        }
      }
    }
  }
}

}  // namespace internal
}  // namespace skitch
