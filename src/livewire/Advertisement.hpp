#pragma once
#include <array>
#include <cstdint>
#include <map>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

#include "Phrase.hpp"

namespace livewire
{

  static constexpr const char *ADVERTISEMENT_GROUP = "239.192.255.3";
  static constexpr uint16_t ADVERTISEMENT_PORT = 4001;
  static constexpr std::array<uint8_t, 4> HEADER_MAGIC{0x03, 0x00, 0x02, 0x07};
  static constexpr size_t HEADER_SIZE = 16;

  /// Opcode -> operand, for fields that are captured but not interpreted.
  using OpaqueFields = std::map<std::string, Operand>;

  struct Header
  {
    std::array<uint8_t, 4> magic{};
    uint32_t messageCounter = 0; ///< increments per message from a sender; purpose unconfirmed
    std::array<uint8_t, 8> padding{};
  };

  /**
   * One audio source offered by a node.
   */
  struct Channel
  {
    int channelNumber = 0;     ///< from the section marker's digits
    uint32_t livewireChannel = 0;
    std::string presentationName;
    std::string fromSourceAddress;
    std::string backfeedAddress;
    bool shareable = false;
    std::string streamType;
    uint32_t alternateChannel = 0;
    OpaqueFields unknownFields;
  };

  /**
   * The decoded contents of one advertisement datagram.
   */
  struct Advertisement
  {
    uint32_t messageCounter = 0;
    uint32_t protocolVersion = 0;
    int advertisementType = 0;
    uint32_t sequenceNumber = 0;
    std::string nodeName;
    std::string nodeAddress;
    uint16_t udpPort = 0;
    uint32_t hardwareIdSuffix = 0;
    uint32_t declaredSourceCount = 0;
    std::vector<Channel> channels;
    OpaqueFields nestFields;
    OpaqueFields nodeFields;
    /// Trailing bytes left undecoded (advertisement types 3 and 4 only).
    size_t unconsumedBytes = 0;
  };

  nlohmann::json toJson(const Operand &operand);
  nlohmann::json toJson(const Channel &channel);
  nlohmann::json toJson(const Advertisement &advertisement);

} // namespace livewire
