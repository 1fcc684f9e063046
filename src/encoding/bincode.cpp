#include "encoding/bincode.hpp"
#include <utility>

namespace Bincode {
  bool Reader::ReadLE(size_t width, uint64_t& out) {
    if (Remaining() < width) return false;
    uint64_t v = 0;
    for (size_t i = 0; i < width; ++i) v |= static_cast<uint64_t>(data_[pos_ + i]) << (8 * i);
    pos_ += width;
    out = v;
    return true;
  }

  bool Reader::ReadU8(uint8_t& out) {
    uint64_t v = 0;
    if (!ReadLE(1, v)) return false;
    out = static_cast<uint8_t>(v);
    return true;
  }

  bool Reader::ReadU32(uint32_t& out) {
    uint64_t v = 0;
    if (!ReadLE(4, v)) return false;
    out = static_cast<uint32_t>(v);
    return true;
  }

  bool Reader::ReadU64(uint64_t& out) { return ReadLE(8, out); }

  bool Reader::ReadBytes(size_t count, const uint8_t*& out) {
    if (Remaining() < count) return false;
    out = data_ + pos_;
    pos_ += count;
    return true;
  }

  void Writer::WriteLE(uint64_t v, size_t width) {
    for (size_t i = 0; i < width; ++i) buf_.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
  }

  void Writer::WriteU8(uint8_t v) { buf_.push_back(v); }
  void Writer::WriteU16(uint16_t v) { WriteLE(v, 2); }
  void Writer::WriteU32(uint32_t v) { WriteLE(v, 4); }
  void Writer::WriteU64(uint64_t v) { WriteLE(v, 8); }

  void Writer::WriteBytes(const uint8_t* data, size_t len) {
    buf_.insert(buf_.end(), data, data + len);
  }

  void Writer::PadTo(size_t size) {
    if (buf_.size() < size) buf_.resize(size, 0);
  }
}
