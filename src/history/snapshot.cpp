// Copyright 2026 The skitch Authors

#include "history/snapshot.h"

#include <cstring>
#include <utility>

namespace skitch {
namespace internal {

namespace {

const std::vector<uint8_t>& EmptyBytes() {
  static const std::vector<uint8_t> empty;
  return empty;
}

}  // namespace

Snapshot::Snapshot(std::vector<uint8_t> bytes)
    : bytes_(std::make_shared<const std::vector<uint8_t>>(std::move(bytes))) {}

const uint8_t* Snapshot::data() const {
  return bytes_ ? bytes_->data() : nullptr;
}

const std::vector<uint8_t>& Snapshot::bytes() const {
  return bytes_ ? *bytes_ : EmptyBytes();
}

bool Snapshot::operator==(const Snapshot& other) const {
  if (bytes_ == other.bytes_) return true;
  if (size() != other.size()) return false;
  if (size() == 0) return true;
  return std::memcmp(data(), other.data(), size()) == 0;
}

}  // namespace internal
}  // namespace skitch
