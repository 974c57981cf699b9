#include "Opcodes.hpp"

#include <cctype>

namespace livewire
{

  QuadInterpretation quadInterpretation(const std::string &opcode)
  {
    if (opcode == OP_CHANNEL_ID || opcode == OP_SEQUENCE || opcode == OP_ALT_CHANNEL_ID)
      return QuadInterpretation::Unsigned;
    if (opcode == OP_STREAM_TYPE)
      return QuadInterpretation::Tag;
    return QuadInterpretation::Ipv4;
  }

  bool isOpaqueChannelFlag(const std::string &opcode)
  {
    return opcode == "lvmd" || opcode == "fasm" || opcode == "bsbt" || opcode == "pmod";
  }

  bool isChannelMarker(const std::string &opcode)
  {
    if (opcode.size() != 4)
      return false;
    if (!std::isalpha((unsigned char)opcode[0]))
      return false;
    for (size_t i = 1; i < 4; i++)
    {
      if (!std::isdigit((unsigned char)opcode[i]))
        return false;
    }
    return true;
  }

  int channelMarkerNumber(const std::string &opcode)
  {
    return (opcode[1] - '0') * 100 + (opcode[2] - '0') * 10 + (opcode[3] - '0');
  }

} // namespace livewire
