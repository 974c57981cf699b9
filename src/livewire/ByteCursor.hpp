#pragma once
#include <cstddef>
#include <cstdint>
#include <vector>

namespace livewire
{

  /**
   * @brief Forward-only, bounds-checked reader over a borrowed byte buffer.
   *
   * The cursor never owns the bytes and never moves backwards. Any read that
   * would run past the end throws DecodeError(Truncated) and leaves the
   * position unchanged.
   */
  class ByteCursor
  {
  public:
    ByteCursor(const uint8_t *data, size_t size);

    /**
     * Returns a pointer to the next n bytes and advances past them.
     * @throws DecodeError with status Truncated if fewer than n bytes remain.
     */
    const uint8_t *readExact(size_t n);

    /**
     * Returns a pointer to the next n bytes without advancing.
     * @throws DecodeError with status Truncated if fewer than n bytes remain.
     */
    const uint8_t *peek(size_t n) const;

    uint8_t readU8();
    uint16_t readU16(); ///< big-endian
    uint32_t readU32(); ///< big-endian
    std::vector<uint8_t> readBytes(size_t n);

    size_t position() const { return pos; }
    size_t size() const { return len; }
    size_t remaining() const { return len - pos; }
    bool atEnd() const { return pos == len; }

  private:
    const uint8_t *data;
    size_t len;
    size_t pos;
  };

  inline uint16_t rd16(const uint8_t *p) { return (uint16_t(p[0]) << 8) | p[1]; }
  inline uint32_t rd32(const uint8_t *p) { return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | p[3]; }

} // namespace livewire
