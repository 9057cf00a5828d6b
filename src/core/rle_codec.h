// Copyright 2026 The skitch Authors
// Byte-level run-length codec used for image payloads inside snapshots.

#ifndef SKITCH_CORE_RLE_CODEC_H_
#define SKITCH_CORE_RLE_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace skitch {
namespace internal {

/// Append the RLE encoding of `src[0..len)` to `out`.
///
/// Format:  [tag, payload...]
///   tag 0x00..0x7F  => literal run of (tag+1) bytes follows
///   tag 0x80..0xFF  => repeat next byte (tag - 0x80 + 3) times  (3..130)
///
/// Worst case expansion: ~1.008x for incompressible data.
void RleEncode(const uint8_t* src, size_t len, std::vector<uint8_t>* out);

/// Decode exactly `dst_len` bytes.  Returns false if the stream is
/// truncated, overruns the destination or leaves trailing bytes.
bool RleDecode(const uint8_t* src, size_t src_len, uint8_t* dst,
               size_t dst_len);

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_CORE_RLE_CODEC_H_
