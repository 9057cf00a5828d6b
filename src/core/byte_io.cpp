// Copyright 2026 The skitch Authors

#include "core/byte_io.h"

#include <cstring>

namespace skitch {
namespace internal {

void ByteWriter::U32(uint32_t v) {
  for (int i = 0; i < 4; ++i) {
    out_->push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
  }
}

void ByteWriter::F32(float v) {
  uint32_t bits = 0;
  std::memcpy(&bits, &v, sizeof(bits));
  U32(bits);
}

void ByteWriter::String(const std::string& s) {
  U32(static_cast<uint32_t>(s.size()));
  Bytes(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

void ByteWriter::Bytes(const uint8_t* data, size_t len) {
  if (len == 0) return;
  out_->insert(out_->end(), data, data + len);
}

bool ByteReader::Take(size_t len, const uint8_t** ptr) {
  if (!ok_ || len > size_ - pos_) {
    ok_ = false;
    return false;
  }
  *ptr = data_ + pos_;
  pos_ += len;
  return true;
}

bool ByteReader::U8(uint8_t* v) {
  const uint8_t* p = nullptr;
  if (!Take(1, &p)) return false;
  *v = p[0];
  return true;
}

bool ByteReader::U32(uint32_t* v) {
  const uint8_t* p = nullptr;
  if (!Take(4, &p)) return false;
  *v = static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
       (static_cast<uint32_t>(p[2]) << 16) |
       (static_cast<uint32_t>(p[3]) << 24);
  return true;
}

bool ByteReader::I32(int32_t* v) {
  uint32_t u = 0;
  if (!U32(&u)) return false;
  *v = static_cast<int32_t>(u);
  return true;
}

bool ByteReader::F32(float* v) {
  uint32_t bits = 0;
  if (!U32(&bits)) return false;
  std::memcpy(v, &bits, sizeof(bits));
  return true;
}

bool ByteReader::String(std::string* s, size_t max_len) {
  uint32_t len = 0;
  if (!U32(&len)) return false;
  if (len > max_len) {
    ok_ = false;
    return false;
  }
  const uint8_t* p = nullptr;
  if (!Take(len, &p)) return false;
  s->assign(reinterpret_cast<const char*>(p), len);
  return true;
}

bool ByteReader::Bytes(size_t len, const uint8_t** ptr) {
  return Take(len, ptr);
}

}  // namespace internal
}  // namespace skitch
