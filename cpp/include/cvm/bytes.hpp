// include/cvm/bytes.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace cvm {

// Append-only little-endian encoder.
class ByteWriter {
public:
  void write_u16(std::uint16_t v);
  void write_u32(std::uint32_t v);
  void write_u64(std::uint64_t v);

  const std::vector<std::uint8_t> &bytes() const noexcept { return buf_; }
  std::vector<std::uint8_t> take() noexcept { return std::move(buf_); }

private:
  std::vector<std::uint8_t> buf_;
};

// Little-endian decoder over a borrowed buffer. Every read throws
// cvm::DecodeError when the buffer runs short.
class ByteReader {
public:
  ByteReader(const std::uint8_t *data, std::size_t size) noexcept
      : data_(data), size_(size) {}
  explicit ByteReader(const std::vector<std::uint8_t> &v) noexcept
      : ByteReader(v.data(), v.size()) {}

  std::uint16_t read_u16();
  std::uint32_t read_u32();
  std::uint64_t read_u64();

  std::size_t remaining() const noexcept { return size_ - pos_; }
  bool at_end() const noexcept { return pos_ == size_; }

private:
  const std::uint8_t *need(std::size_t n);

  const std::uint8_t *data_;
  std::size_t size_;
  std::size_t pos_ = 0;
};

} // namespace cvm
