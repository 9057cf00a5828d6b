// Copyright 2026 The skitch Authors
// Little-endian byte writer/reader for the snapshot format.

#ifndef SKITCH_CORE_BYTE_IO_H_
#define SKITCH_CORE_BYTE_IO_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace skitch {
namespace internal {

/// Appends little-endian values to a byte vector.
class ByteWriter {
 public:
  explicit ByteWriter(std::vector<uint8_t>* out) : out_(out) {}

  void U8(uint8_t v) { out_->push_back(v); }
  void U32(uint32_t v);
  void I32(int32_t v) { U32(static_cast<uint32_t>(v)); }
  /// IEEE-754 bit pattern.
  void F32(float v);
  /// u32 length + bytes.
  void String(const std::string& s);
  void Bytes(const uint8_t* data, size_t len);

  size_t size() const { return out_->size(); }

 private:
  std::vector<uint8_t>* out_;
};

/// Bounds-checked reader.  Once a read fails every later read fails too,
/// so callers may check ok() once at the end of a record.
class ByteReader {
 public:
  ByteReader(const uint8_t* data, size_t size)
      : data_(data), size_(size) {}

  bool U8(uint8_t* v);
  bool U32(uint32_t* v);
  bool I32(int32_t* v);
  bool F32(float* v);
  /// Fails if the declared length exceeds `max_len`.
  bool String(std::string* s, size_t max_len);
  /// Points `*ptr` at the next `len` bytes without copying.
  bool Bytes(size_t len, const uint8_t** ptr);

  bool ok() const { return ok_; }
  size_t remaining() const { return ok_ ? size_ - pos_ : 0; }
  bool AtEnd() const { return ok_ && pos_ == size_; }

 private:
  bool Take(size_t len, const uint8_t** ptr);

  const uint8_t* data_;
  size_t size_;
  size_t pos_ = 0;
  bool ok_ = true;
};

}  // namespace internal
}  // namespace skitch

#endif  // SKITCH_CORE_BYTE_IO_H_
