#pragma once
#include <cstdint>
#include <cstddef>
#include <utility>
#include <vector>

// Little-endian fixed-width primitives as laid out by the bincode format.
namespace Bincode {
  class Reader {
  public:
    Reader(const uint8_t* data, size_t size) : data_(data), size_(size) {}
    explicit Reader(const std::vector<uint8_t>& data) : data_(data.data()), size_(data.size()) {}
    bool ReadU8(uint8_t& out);
    bool ReadU32(uint32_t& out);
    bool ReadU64(uint64_t& out);
    bool ReadBytes(size_t count, const uint8_t*& out);
    size_t Remaining() const { return size_ - pos_; }
  private:
    bool ReadLE(size_t width, uint64_t& out);
    const uint8_t* data_;
    size_t size_;
    size_t pos_ = 0;
  };

  class Writer {
  public:
    void WriteU8(uint8_t v);
    void WriteU16(uint16_t v);
    void WriteU32(uint32_t v);
    void WriteU64(uint64_t v);
    void WriteBytes(const uint8_t* data, size_t len);
    void PadTo(size_t size);
    std::vector<uint8_t> Take() { return std::move(buf_); }
  private:
    void WriteLE(uint64_t v, size_t width);
    std::vector<uint8_t> buf_;
  };
}
