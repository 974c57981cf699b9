#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "ByteCursor.hpp"
#include "Diagnostic.hpp"

namespace livewire
{

  /**
   * Data-type tags. The tag fixes the operand's size on the wire; it does not
   * always fix how the operand is read (see QuadInterpretation).
   */
  enum DataType : uint8_t
  {
    DT_U8 = 0x00,
    DT_QUAD = 0x01,
    DT_TEXT = 0x03,
    DT_U16 = 0x06,
    DT_U8_ALT = 0x07,
    DT_U16_ALT = 0x08,
    DT_BLOCK = 0x09
  };

  /**
   * @brief An operand as it came off the wire.
   *
   * `bytes` holds the operand exactly as received, except for text operands,
   * which keep only the bytes before the first NUL.
   */
  struct Operand
  {
    uint8_t dataType = DT_U8;
    std::vector<uint8_t> bytes;

    bool isInteger() const;

    /// Integer value of a u8/u16 operand, or a 0x01 operand read as big-endian u32.
    uint32_t asUnsigned() const;
    /// A 0x01 operand as dotted-quad IPv4 text.
    std::string asIpv4() const;
    /// A text operand, or a 0x01 operand read as four characters.
    std::string asText() const;
    std::string hex() const;
  };

  struct Phrase
  {
    std::string opcode;
    Operand operand;
  };

  /**
   * Reads one phrase at the cursor: 4-byte opcode, 1-byte data type, operand.
   * Advances the cursor by exactly 5 + operand length (plus the 2-byte length
   * prefix for text).
   *
   * @throws DecodeError Truncated if the buffer ends inside the phrase.
   * @throws DecodeError UnknownDataType for a tag with no known operand shape.
   */
  Phrase readPhrase(ByteCursor &cursor, const DiagnosticCallback &diag = nullptr);

  /**
   * Renders a phrase for the diagnostic trace, reading 0x01 operands the way
   * quadInterpretation() says the opcode should be read.
   */
  std::string describe(const Phrase &phrase);

} // namespace livewire
