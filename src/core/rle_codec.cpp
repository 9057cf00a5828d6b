// Copyright 2026 The skitch Authors

#include "core/rle_codec.h"

#include <algorithm>
#include <cstring>

namespace skitch {
namespace internal {

namespace {

constexpr size_t kMaxRun = 130;
constexpr size_t kMaxLiteral = 128;

// Length of the run of identical bytes starting at src[i] (capped).
size_t RunLength(const uint8_t* src, size_t len, size_t i) {
  size_t run = 1;
  while (i + run < len && src[i + run] == src[i] && run < kMaxRun) ++run;
  return run;
}

}  // namespace

void RleEncode(const uint8_t* src, size_t len, std::vector<uint8_t>* out) {
  if (!out) return;
  out->reserve(out->size() + len + len / kMaxLiteral + 2);

  size_t i = 0;
  while (i < len) {
    size_t run = RunLength(src, len, i);
    if (run >= 3) {
      out->push_back(static_cast<uint8_t>(0x80 + run - 3));
      out->push_back(src[i]);
      i += run;
      continue;
    }

    // Literal run: collect bytes until the next repeat of 3+ starts.
    size_t lit_start = i;
    size_t lit_len = 0;
    while (lit_len < kMaxLiteral && i < len) {
      if (RunLength(src, len, i) >= 3) break;
      ++lit_len;
      ++i;
    }
    out->push_back(static_cast<uint8_t>(lit_len - 1));
    out->insert(out->end(), src + lit_start, src + lit_start + lit_len);
  }
}

bool RleDecode(const uint8_t* src, size_t src_len, uint8_t* dst,
               size_t dst_len) {
  size_t si = 0;
  size_t di = 0;
  while (si < src_len) {
    uint8_t tag = src[si++];
    if (tag <= 0x7F) {
      size_t count = static_cast<size_t>(tag) + 1;
      if (count > src_len - si || count > dst_len - di) return false;
      std::memcpy(dst + di, src + si, count);
      si += count;
      di += count;
    } else {
      size_t count = static_cast<size_t>(tag - 0x80) + 3;
      if (si >= src_len || count > dst_len - di) return false;
      std::memset(dst + di, src[si++], count);
      di += count;
    }
  }
  return di == dst_len;
}

}  // namespace internal
}  // namespace skitch
