#include "ByteCursor.hpp"
#include "DecodeError.hpp"

#include <sstream>

namespace livewire
{

  ByteCursor::ByteCursor(const uint8_t *data, size_t size)
      : data(data), len(size), pos(0)
  {
  }

  const uint8_t *ByteCursor::peek(size_t n) const
  {
    if (n > remaining())
    {
      std::stringstream ss;
      ss << "need " << n << " bytes at offset " << pos << ", only "
         << remaining() << " left";
      throw DecodeError(DecodeStatus::Truncated, ss.str());
    }
    return data + pos;
  }

  const uint8_t *ByteCursor::readExact(size_t n)
  {
    const uint8_t *p = peek(n);
    pos += n;
    return p;
  }

  uint8_t ByteCursor::readU8() { return *readExact(1); }

  uint16_t ByteCursor::readU16() { return rd16(readExact(2)); }

  uint32_t ByteCursor::readU32() { return rd32(readExact(4)); }

  std::vector<uint8_t> ByteCursor::readBytes(size_t n)
  {
    const uint8_t *p = readExact(n);
    return std::vector<uint8_t>(p, p + n);
  }

} // namespace livewire
