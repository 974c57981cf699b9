#include "Phrase.hpp"
#include "DecodeError.hpp"
#include "Opcodes.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace livewire
{

  namespace
  {
    std::string typeTag(uint8_t dataType)
    {
      std::stringstream ss;
      ss << "0x" << std::hex << std::setw(2) << std::setfill('0') << int(dataType);
      return ss.str();
    }
  } // namespace

  bool Operand::isInteger() const
  {
    return dataType == DT_U8 || dataType == DT_U8_ALT || dataType == DT_U16 ||
           dataType == DT_U16_ALT || dataType == DT_QUAD;
  }

  uint32_t Operand::asUnsigned() const
  {
    switch (dataType)
    {
    case DT_U8:
    case DT_U8_ALT:
      return bytes[0];
    case DT_U16:
    case DT_U16_ALT:
      return rd16(bytes.data());
    case DT_QUAD:
      return rd32(bytes.data());
    default:
      throw DecodeError(DecodeStatus::ProtocolViolation,
                        "operand of type " + typeTag(dataType) + " is not numeric");
    }
  }

  std::string Operand::asIpv4() const
  {
    if (dataType != DT_QUAD)
      throw DecodeError(DecodeStatus::ProtocolViolation,
                        "operand of type " + typeTag(dataType) + " is not an address");
    std::stringstream ss;
    ss << int(bytes[0]) << "." << int(bytes[1]) << "." << int(bytes[2]) << "." << int(bytes[3]);
    return ss.str();
  }

  std::string Operand::asText() const
  {
    if (dataType != DT_TEXT && dataType != DT_QUAD)
      throw DecodeError(DecodeStatus::ProtocolViolation,
                        "operand of type " + typeTag(dataType) + " is not text");
    return std::string(bytes.begin(), bytes.end());
  }

  std::string Operand::hex() const
  {
    std::stringstream ss;
    ss << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); i++)
    {
      if (i)
        ss << ' ';
      ss << std::setw(2) << int(bytes[i]);
    }
    return ss.str();
  }

  Phrase readPhrase(ByteCursor &cursor, const DiagnosticCallback &diag)
  {
    Phrase phrase;
    const uint8_t *op = cursor.readExact(4);
    phrase.opcode.assign(reinterpret_cast<const char *>(op), 4);
    phrase.operand.dataType = cursor.readU8();

    switch (phrase.operand.dataType)
    {
    case DT_U8:
    case DT_U8_ALT:
      phrase.operand.bytes = cursor.readBytes(1);
      break;
    case DT_QUAD:
      phrase.operand.bytes = cursor.readBytes(4);
      break;
    case DT_U16:
    case DT_U16_ALT:
      phrase.operand.bytes = cursor.readBytes(2);
      break;
    case DT_TEXT:
    {
      uint16_t n = cursor.readU16();
      const uint8_t *p = cursor.readExact(n);
      // Senders leave garbage after the terminator; nothing past the first NUL is kept.
      const uint8_t *nul = std::find(p, p + n, 0);
      phrase.operand.bytes.assign(p, nul);
      break;
    }
    case DT_BLOCK:
    {
      phrase.operand.bytes = cursor.readBytes(8);
      bool zero = std::all_of(phrase.operand.bytes.begin(), phrase.operand.bytes.end(),
                              [](uint8_t b)
                              { return b == 0; });
      if (!zero)
        report(diag, Diagnostic::Kind::AssumptionViolation, "phrase",
               phrase.opcode + ": expected all-zero block, got " + phrase.operand.hex());
      break;
    }
    default:
      throw DecodeError(DecodeStatus::UnknownDataType,
                        "unknown data type " + typeTag(phrase.operand.dataType) +
                            " for opcode '" + phrase.opcode + "' at offset " +
                            std::to_string(cursor.position() - 1));
    }
    return phrase;
  }

  std::string describe(const Phrase &phrase)
  {
    const Operand &o = phrase.operand;
    std::stringstream ss;
    ss << phrase.opcode << " [" << typeTag(o.dataType) << "] ";
    switch (o.dataType)
    {
    case DT_TEXT:
      ss << '"' << o.asText() << '"';
      break;
    case DT_QUAD:
      switch (quadInterpretation(phrase.opcode))
      {
      case QuadInterpretation::Unsigned:
        ss << o.asUnsigned();
        break;
      case QuadInterpretation::Tag:
        ss << '\'' << o.asText() << '\'';
        break;
      case QuadInterpretation::Ipv4:
        ss << o.asIpv4();
        break;
      }
      break;
    case DT_BLOCK:
      ss << o.hex();
      break;
    default:
      ss << o.asUnsigned();
      break;
    }
    return ss.str();
  }

} // namespace livewire
