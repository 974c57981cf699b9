#include "Advertisement.hpp"

using json = nlohmann::json;

namespace livewire
{

  namespace
  {
    json fieldsToJson(const OpaqueFields &fields)
    {
      json j = json::object();
      for (const auto &kv : fields)
        j[kv.first] = toJson(kv.second);
      return j;
    }
  } // namespace

  json toJson(const Operand &operand)
  {
    return {{"type", operand.dataType}, {"hex", operand.hex()}};
  }

  json toJson(const Channel &channel)
  {
    json j = {{"channelNumber", channel.channelNumber},
              {"livewireChannel", channel.livewireChannel},
              {"presentationName", channel.presentationName},
              {"fromSourceAddress", channel.fromSourceAddress},
              {"backfeedAddress", channel.backfeedAddress},
              {"shareable", channel.shareable},
              {"unknownFields", fieldsToJson(channel.unknownFields)}};
    if (!channel.streamType.empty())
      j["streamType"] = channel.streamType;
    if (channel.alternateChannel != 0)
      j["alternateChannel"] = channel.alternateChannel;
    return j;
  }

  json toJson(const Advertisement &advertisement)
  {
    json channels = json::array();
    for (const auto &c : advertisement.channels)
      channels.push_back(toJson(c));

    return {{"messageCounter", advertisement.messageCounter},
            {"protocolVersion", advertisement.protocolVersion},
            {"advertisementType", advertisement.advertisementType},
            {"sequenceNumber", advertisement.sequenceNumber},
            {"nodeName", advertisement.nodeName},
            {"nodeAddress", advertisement.nodeAddress},
            {"udpPort", advertisement.udpPort},
            {"hardwareIdSuffix", advertisement.hardwareIdSuffix},
            {"declaredSourceCount", advertisement.declaredSourceCount},
            {"channels", channels},
            {"nestFields", fieldsToJson(advertisement.nestFields)},
            {"nodeFields", fieldsToJson(advertisement.nodeFields)},
            {"unconsumedBytes", advertisement.unconsumedBytes}};
  }

} // namespace livewire
