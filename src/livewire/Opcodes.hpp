#pragma once
#include <string>

namespace livewire
{

  // Nest section
  static constexpr const char *OP_NEST = "NEST";
  static constexpr const char *OP_ADVV = "ADVV"; // advertisement (protocol) version
  static constexpr const char *OP_ADVT = "ADVT"; // advertisement type, 1..4
  static constexpr const char *OP_TERM = "TERM"; // byte length of the next section, advisory
  static constexpr const char *OP_NUMS = "NUMS"; // declared source count
  static constexpr const char *OP_SEQH = "SEQH"; // sequence hint, meaning unknown

  // Section phrase count, opens node and channel sections
  static constexpr const char *OP_INDI = "INDI";

  // Node section
  static constexpr const char *OP_SEQUENCE = "advv";
  static constexpr const char *OP_NODE_NAME = "atrn";
  static constexpr const char *OP_NODE_IP = "inip";
  static constexpr const char *OP_HWID = "hwid";
  static constexpr const char *OP_UDP_PORT = "udpp";
  static constexpr const char *OP_RESERVED = "rsrv";

  // Channel section
  static constexpr const char *OP_CHANNEL_ID = "psid";
  static constexpr const char *OP_CHANNEL_NAME = "psnm";
  static constexpr const char *OP_FROM_SOURCE = "fsid";
  static constexpr const char *OP_BACKFEED = "bsid";
  static constexpr const char *OP_SHAREABLE = "shab";
  static constexpr const char *OP_STREAM_TYPE = "styp";
  static constexpr const char *OP_ALT_CHANNEL_ID = "asid";

  /**
   * How a 4-byte (type 0x01) operand is to be read. The wire shape is the
   * same for all three; only the carrying opcode tells them apart.
   */
  enum class QuadInterpretation
  {
    Unsigned,
    Tag,
    Ipv4
  };

  QuadInterpretation quadInterpretation(const std::string &opcode);

  /// Per-channel flags whose meaning is unknown; captured verbatim.
  bool isOpaqueChannelFlag(const std::string &opcode);

  /**
   * True for a channel section marker: one ASCII letter followed by three
   * ASCII digits, e.g. "S001".
   */
  bool isChannelMarker(const std::string &opcode);

  /// The ordinal encoded in a channel marker's digits ("S012" -> 12).
  int channelMarkerNumber(const std::string &opcode);

} // namespace livewire
