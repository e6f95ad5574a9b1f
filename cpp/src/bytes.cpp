// src/bytes.cpp
#include "cvm/bytes.hpp"
#include "cvm/errors.hpp"

#include <string>

namespace cvm {

void ByteWriter::write_u16(std::uint16_t v) {
  buf_.push_back(static_cast<std::uint8_t>(v));
  buf_.push_back(static_cast<std::uint8_t>(v >> 8));
}

void ByteWriter::write_u32(std::uint32_t v) {
  for (int i = 0; i < 4; ++i)
    buf_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
}

void ByteWriter::write_u64(std::uint64_t v) {
  for (int i = 0; i < 8; ++i)
    buf_.push_back(static_cast<std::uint8_t>(v >> (8 * i)));
}

const std::uint8_t *ByteReader::need(std::size_t n) {
  if (remaining() < n)
    throw DecodeError("unexpected end of input: need " + std::to_string(n) +
                      " byte(s) at offset " + std::to_string(pos_) + ", have " +
                      std::to_string(remaining()));
  const std::uint8_t *p = data_ + pos_;
  pos_ += n;
  return p;
}

std::uint16_t ByteReader::read_u16() {
  const std::uint8_t *p = need(2);
  return static_cast<std::uint16_t>(p[0] | (p[1] << 8));
}

std::uint32_t ByteReader::read_u32() {
  const std::uint8_t *p = need(4);
  return (std::uint32_t)p[0] | (std::uint32_t)p[1] << 8 |
         (std::uint32_t)p[2] << 16 | (std::uint32_t)p[3] << 24;
}

std::uint64_t ByteReader::read_u64() {
  const std::uint8_t *p = need(8);
  std::uint64_t v = 0;
  for (int i = 7; i >= 0; --i)
    v = (v << 8) | p[i];
  return v;
}

} // namespace cvm
