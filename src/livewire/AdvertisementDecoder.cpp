#include "AdvertisementDecoder.hpp"
#include "Opcodes.hpp"

#include <algorithm>
#include <sstream>

namespace livewire
{

  namespace
  {
    enum class MessageState
    {
      AwaitingHeader,
      InNest,
      TopLevel,
      InNodeSection,
      InChannelSection,
      Complete
    };

    const char *toString(MessageState state)
    {
      switch (state)
      {
      case MessageState::AwaitingHeader:
        return "header";
      case MessageState::InNest:
        return "nest section";
      case MessageState::TopLevel:
        return "top level";
      case MessageState::InNodeSection:
        return "node section";
      case MessageState::InChannelSection:
        return "channel section";
      case MessageState::Complete:
        return "complete";
      }
      return "?";
    }

    Phrase nextPhrase(ByteCursor &cursor, const DiagnosticCallback &diag, const char *component)
    {
      size_t offset = cursor.position();
      Phrase phrase = readPhrase(cursor, diag);
      if (diag)
        report(diag, Diagnostic::Kind::Trace, component,
               "@" + std::to_string(offset) + " " + describe(phrase));
      return phrase;
    }

    [[noreturn]] void unknownOpcode(const Phrase &phrase, const char *section)
    {
      throw DecodeError(DecodeStatus::UnknownOpcode,
                        std::string("unknown opcode '") + phrase.opcode + "' in " + section);
    }

    /// A 4-byte operand is only a number for opcodes that quadInterpretation() reads as one.
    uint32_t unsignedField(const Phrase &phrase)
    {
      const Operand &o = phrase.operand;
      if (!o.isInteger() ||
          (o.dataType == DT_QUAD && quadInterpretation(phrase.opcode) != QuadInterpretation::Unsigned))
        throw DecodeError(DecodeStatus::ProtocolViolation,
                          phrase.opcode + ": expected a numeric operand");
      return o.asUnsigned();
    }

    /**
     * hwid, udpp and NUMS are 8/16-bit on the wire. A 4-byte operand is not
     * reinterpreted or narrowed: it is kept verbatim in `fields` and reported.
     * @return false if the numeric field was not set.
     */
    bool smallNumberField(const Phrase &phrase, uint32_t &value, OpaqueFields &fields,
                          const DiagnosticCallback &diag)
    {
      const Operand &o = phrase.operand;
      if (o.dataType == DT_QUAD)
      {
        fields[phrase.opcode] = o;
        report(diag, Diagnostic::Kind::AssumptionViolation, "node",
               phrase.opcode + ": 4-byte operand " + o.hex() + " kept verbatim");
        return false;
      }
      value = unsignedField(phrase);
      return true;
    }

    std::string addressField(const Phrase &phrase)
    {
      if (phrase.operand.dataType != DT_QUAD)
        throw DecodeError(DecodeStatus::ProtocolViolation,
                          phrase.opcode + ": expected a 4-byte address operand");
      return phrase.operand.asIpv4();
    }

    std::string textField(const Phrase &phrase)
    {
      if (phrase.operand.dataType != DT_TEXT)
        throw DecodeError(DecodeStatus::ProtocolViolation,
                          phrase.opcode + ": expected a text operand");
      return phrase.operand.asText();
    }

    std::string tagField(const Phrase &phrase)
    {
      if (phrase.operand.dataType != DT_QUAD)
        throw DecodeError(DecodeStatus::ProtocolViolation,
                          phrase.opcode + ": expected a 4-character tag");
      return phrase.operand.asText();
    }
  } // namespace

  Header readHeader(ByteCursor &cursor, const DiagnosticCallback &diag)
  {
    Header header;
    const uint8_t *p = cursor.readExact(HEADER_SIZE);
    std::copy(p, p + 4, header.magic.begin());
    header.messageCounter = rd32(p + 4);
    std::copy(p + 8, p + HEADER_SIZE, header.padding.begin());

    if (header.magic != HEADER_MAGIC)
    {
      Operand magic{DT_QUAD, std::vector<uint8_t>(p, p + 4)};
      report(diag, Diagnostic::Kind::AssumptionViolation, "header",
             "unexpected magic " + magic.hex());
    }
    if (std::any_of(header.padding.begin(), header.padding.end(),
                    [](uint8_t b)
                    { return b != 0; }))
    {
      Operand padding{DT_BLOCK, std::vector<uint8_t>(p + 8, p + HEADER_SIZE)};
      report(diag, Diagnostic::Kind::AssumptionViolation, "header",
             "non-zero padding " + padding.hex());
    }
    if (diag)
      report(diag, Diagnostic::Kind::Trace, "header",
             "counter=" + std::to_string(header.messageCounter));
    return header;
  }

  NestParser::NestParser(ByteCursor &cursor, const DiagnosticCallback &diag)
      : cursor_(cursor), diag_(diag)
  {
  }

  void NestParser::parse(Advertisement &advertisement)
  {
    Phrase first = nextPhrase(cursor_, diag_, "nest");
    if (first.opcode != OP_NEST)
      throw DecodeError(DecodeStatus::ProtocolViolation,
                        "expected NEST, got '" + first.opcode + "'");
    state_ = State::ReadingFields;

    bool haveType = false;
    while (state_ == State::ReadingFields)
    {
      Phrase phrase = nextPhrase(cursor_, diag_, "nest");
      const std::string &op = phrase.opcode;
      if (op == OP_ADVV)
      {
        advertisement.protocolVersion = unsignedField(phrase);
      }
      else if (op == OP_ADVT)
      {
        uint32_t type = unsignedField(phrase);
        if (type < 1 || type > 4)
          throw DecodeError(DecodeStatus::InvalidAdvertisementType,
                            "advertisement type " + std::to_string(type) + " not in 1..4");
        advertisement.advertisementType = int(type);
        haveType = true;
      }
      else if (op == OP_TERM)
      {
        // Length of the following section; senders are not consistent about it.
        unsignedField(phrase);
        state_ = State::Done;
      }
      else if (op == OP_NUMS || op == OP_SEQH)
      {
        advertisement.nestFields[op] = phrase.operand;
      }
      else
      {
        unknownOpcode(phrase, "nest section");
      }
    }

    if (!haveType)
      throw DecodeError(DecodeStatus::ProtocolViolation, "nest section has no ADVT");
  }

  void parseNodeSection(ByteCursor &cursor, uint32_t phraseCount,
                        Advertisement &advertisement, const DiagnosticCallback &diag)
  {
    for (uint32_t i = 0; i < phraseCount; i++)
    {
      Phrase phrase = nextPhrase(cursor, diag, "node");
      const std::string &op = phrase.opcode;
      if (op == OP_SEQUENCE)
        advertisement.sequenceNumber = unsignedField(phrase);
      else if (op == OP_NODE_NAME)
        advertisement.nodeName = textField(phrase);
      else if (op == OP_NODE_IP)
        advertisement.nodeAddress = addressField(phrase);
      else if (op == OP_HWID)
        smallNumberField(phrase, advertisement.hardwareIdSuffix, advertisement.nodeFields, diag);
      else if (op == OP_UDP_PORT)
      {
        uint32_t port = 0;
        if (smallNumberField(phrase, port, advertisement.nodeFields, diag))
          advertisement.udpPort = uint16_t(port);
      }
      else if (op == OP_NUMS)
        smallNumberField(phrase, advertisement.declaredSourceCount, advertisement.nodeFields, diag);
      else if (op == OP_RESERVED)
        advertisement.nodeFields[op] = phrase.operand;
      else
        unknownOpcode(phrase, "node section");
    }
  }

  Channel parseChannelSection(ByteCursor &cursor, int channelNumber,
                              const DiagnosticCallback &diag)
  {
    Phrase indi = nextPhrase(cursor, diag, "channel");
    if (indi.opcode != OP_INDI)
      throw DecodeError(DecodeStatus::ProtocolViolation,
                        "channel " + std::to_string(channelNumber) +
                            ": expected INDI, got '" + indi.opcode + "'");
    uint32_t phraseCount = unsignedField(indi);

    Channel channel;
    channel.channelNumber = channelNumber;
    for (uint32_t i = 0; i < phraseCount; i++)
    {
      Phrase phrase = nextPhrase(cursor, diag, "channel");
      const std::string &op = phrase.opcode;
      if (op == OP_CHANNEL_ID)
        channel.livewireChannel = unsignedField(phrase);
      else if (op == OP_CHANNEL_NAME)
        channel.presentationName = textField(phrase);
      else if (op == OP_FROM_SOURCE)
        channel.fromSourceAddress = addressField(phrase);
      else if (op == OP_BACKFEED)
        channel.backfeedAddress = addressField(phrase);
      else if (op == OP_SHAREABLE)
        channel.shareable = unsignedField(phrase) != 0;
      else if (op == OP_STREAM_TYPE)
        channel.streamType = tagField(phrase);
      else if (op == OP_ALT_CHANNEL_ID)
        channel.alternateChannel = unsignedField(phrase);
      else if (isOpaqueChannelFlag(op))
        channel.unknownFields[op] = phrase.operand;
      else
        unknownOpcode(phrase, "channel section");
    }
    return channel;
  }

  DecodeResult decodeAdvertisement(const uint8_t *data, size_t size,
                                   const DiagnosticCallback &diag)
  {
    DecodeResult result;
    Advertisement advertisement;
    MessageState state = MessageState::AwaitingHeader;
    try
    {
      ByteCursor cursor(data, size);
      advertisement.messageCounter = readHeader(cursor, diag).messageCounter;

      state = MessageState::InNest;
      NestParser(cursor, diag).parse(advertisement);

      // Types 3 and 4 carry sections nobody has worked out yet.
      const bool opaqueTail = advertisement.advertisementType >= 3;
      while (!cursor.atEnd())
      {
        state = MessageState::TopLevel;
        if (opaqueTail && cursor.remaining() < 4)
        {
          advertisement.unconsumedBytes = cursor.remaining();
          break;
        }
        const uint8_t *p = cursor.peek(4);
        std::string opcode(reinterpret_cast<const char *>(p), 4);

        if (opcode == OP_INDI)
        {
          state = MessageState::InNodeSection;
          Phrase indi = nextPhrase(cursor, diag, "node");
          parseNodeSection(cursor, unsignedField(indi), advertisement, diag);
        }
        else if (isChannelMarker(opcode))
        {
          state = MessageState::InChannelSection;
          nextPhrase(cursor, diag, "channel");
          advertisement.channels.push_back(
              parseChannelSection(cursor, channelMarkerNumber(opcode), diag));
        }
        else if (opaqueTail)
        {
          advertisement.unconsumedBytes = cursor.remaining();
          if (diag)
            report(diag, Diagnostic::Kind::Trace, "message",
                   "type " + std::to_string(advertisement.advertisementType) +
                       ": leaving " + std::to_string(cursor.remaining()) +
                       " bytes from '" + opcode + "' undecoded");
          break;
        }
        else
        {
          throw DecodeError(DecodeStatus::UnknownOpcode,
                            "unknown top-level opcode '" + opcode + "' at offset " +
                                std::to_string(cursor.position()));
        }
      }
      state = MessageState::Complete;
    }
    catch (const DecodeError &e)
    {
      result.status = e.status();
      result.message = std::string(toString(state)) + ": " + e.what();
      report(diag, Diagnostic::Kind::Failure, "message",
             std::string(toString(result.status)) + ": " + result.message);
      return result;
    }

    result.advertisement = std::move(advertisement);
    return result;
  }

  DecodeResult decodeAdvertisement(const std::vector<uint8_t> &datagram,
                                   const DiagnosticCallback &diag)
  {
    return decodeAdvertisement(datagram.data(), datagram.size(), diag);
  }

} // namespace livewire
