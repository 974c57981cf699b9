#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "advertisement_bytes.hpp"
#include "livewire/AdvertisementDecoder.hpp"

using namespace livewire;
using testing::_;
using testing::AnyNumber;
using testing::Field;
using testing::HasSubstr;
using testing::MockFunction;

namespace
{
  std::vector<uint8_t> withoutLastByte(std::vector<uint8_t> data)
  {
    data.pop_back();
    return data;
  }

  /// Type 1 advertisement with `channels` channel sections, node declaring `nums`.
  std::vector<uint8_t> typeOneWithChannels(int channels, uint8_t nums)
  {
    test::Bytes b = test::header();
    test::nest(b, 1);
    b.phrase("INDI", 0x08, {0x00, 0x03})
        .phrase("advv", 0x01, {0x00, 0x00, 0x00, 0x01})
        .text("atrn", "Rack 3", 32)
        .phrase("NUMS", 0x08, {0x00, nums});
    for (int i = 1; i <= channels; i++)
    {
      std::string marker = "S00" + std::to_string(i);
      test::channel(b, marker, uint16_t(100 + i), "Ch " + std::to_string(i));
    }
    return b.data;
  }
} // namespace

// ---------------------------------------------------------------------------
// End-to-end captures
// ---------------------------------------------------------------------------

TEST(DecodeAdvertisement, ScenarioA_TypeOneWithOneChannel)
{
  auto result = decodeAdvertisement(test::scenarioA());
  ASSERT_TRUE(result.ok()) << result.message;

  const Advertisement &adv = result.advertisement;
  EXPECT_EQ(adv.messageCounter, 0xc7c2a060u);
  EXPECT_EQ(adv.protocolVersion, 2u);
  EXPECT_EQ(adv.advertisementType, 1);
  EXPECT_EQ(adv.sequenceNumber, 0x98u);
  EXPECT_EQ(adv.nodeName, "Studio-A Engine");
  EXPECT_EQ(adv.nodeAddress, "192.168.2.10");
  EXPECT_EQ(adv.udpPort, 4001);
  EXPECT_EQ(adv.declaredSourceCount, 1u);
  EXPECT_EQ(adv.unconsumedBytes, 0u);

  ASSERT_EQ(adv.channels.size(), 1u);
  const Channel &ch = adv.channels[0];
  EXPECT_EQ(ch.channelNumber, 1);
  EXPECT_EQ(ch.livewireChannel, 6031u);
  EXPECT_EQ(ch.presentationName, "Host Mic 1");
  EXPECT_EQ(ch.fromSourceAddress, "239.192.23.143");
  EXPECT_EQ(ch.backfeedAddress, "0.0.0.0");
  EXPECT_FALSE(ch.shareable);
  ASSERT_EQ(ch.unknownFields.count("lvmd"), 1u);
  EXPECT_EQ(ch.unknownFields.at("lvmd").hex(), "01");
}

TEST(DecodeAdvertisement, ScenarioB_TypeTwoHasNoChannels)
{
  auto result = decodeAdvertisement(test::scenarioB());
  ASSERT_TRUE(result.ok()) << result.message;

  const Advertisement &adv = result.advertisement;
  EXPECT_EQ(adv.advertisementType, 2);
  EXPECT_EQ(adv.sequenceNumber, 0x22u);
  EXPECT_EQ(adv.declaredSourceCount, 5u);
  EXPECT_EQ(adv.nodeName, "xNode-4431");
  EXPECT_EQ(adv.nodeAddress, "10.216.1.44");
  EXPECT_EQ(adv.hardwareIdSuffix, 0x1234u);
  EXPECT_TRUE(adv.channels.empty());
  EXPECT_EQ(adv.nodeFields.count("rsrv"), 1u);
}

TEST(DecodeAdvertisement, ChannelCountFollowsMarkersNotNums)
{
  auto result = decodeAdvertisement(typeOneWithChannels(3, 8));
  ASSERT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(result.advertisement.declaredSourceCount, 8u);
  ASSERT_EQ(result.advertisement.channels.size(), 3u);
  for (int i = 0; i < 3; i++)
  {
    EXPECT_EQ(result.advertisement.channels[i].channelNumber, i + 1);
    EXPECT_EQ(result.advertisement.channels[i].livewireChannel, uint32_t(101 + i));
    EXPECT_EQ(result.advertisement.channels[i].presentationName, "Ch " + std::to_string(i + 1));
  }
}

TEST(DecodeAdvertisement, IsDeterministic)
{
  auto data = test::scenarioA();
  auto first = decodeAdvertisement(data);
  auto second = decodeAdvertisement(data);
  ASSERT_TRUE(first.ok());
  EXPECT_EQ(toJson(first.advertisement).dump(), toJson(second.advertisement).dump());

  auto bad = withoutLastByte(data);
  auto f1 = decodeAdvertisement(bad);
  auto f2 = decodeAdvertisement(bad);
  EXPECT_EQ(f1.status, f2.status);
  EXPECT_EQ(f1.message, f2.message);
}

// ---------------------------------------------------------------------------
// Truncation
// ---------------------------------------------------------------------------

TEST(DecodeAdvertisement, MissingFinalByteIsTruncated)
{
  for (const auto &data : {test::scenarioA(), test::scenarioB()})
  {
    auto result = decodeAdvertisement(withoutLastByte(data));
    EXPECT_EQ(result.status, DecodeStatus::Truncated) << result.message;
    EXPECT_FALSE(result.ok());
    EXPECT_TRUE(result.advertisement.nodeName.empty());
    EXPECT_TRUE(result.advertisement.channels.empty());
  }
}

TEST(DecodeAdvertisement, CutInsideHeaderOrNestIsTruncated)
{
  auto data = test::scenarioA();
  for (size_t len : {size_t(0), size_t(5), size_t(15), size_t(16), size_t(20), size_t(30)})
  {
    std::vector<uint8_t> cut(data.begin(), data.begin() + len);
    auto result = decodeAdvertisement(cut);
    EXPECT_EQ(result.status, DecodeStatus::Truncated) << "length " << len;
  }
}

TEST(DecodeAdvertisement, NodeSectionShorterThanItsCountIsTruncated)
{
  test::Bytes b = test::header();
  test::nest(b, 2);
  b.phrase("INDI", 0x08, {0x00, 0x04}).phrase("advv", 0x01, {0, 0, 0, 1});
  auto result = decodeAdvertisement(b.data);
  EXPECT_EQ(result.status, DecodeStatus::Truncated);
  EXPECT_THAT(result.message, HasSubstr("node section"));
}

// ---------------------------------------------------------------------------
// Header
// ---------------------------------------------------------------------------

TEST(DecodeAdvertisement, BadMagicAndPaddingAreWarningsOnly)
{
  auto data = test::scenarioB();
  data[0] = 0x04;
  data[10] = 0xff;

  MockFunction<void(const Diagnostic &)> diag;
  EXPECT_CALL(diag, Call(Field(&Diagnostic::kind, Diagnostic::Kind::Trace))).Times(AnyNumber());
  EXPECT_CALL(diag, Call(Field(&Diagnostic::kind, Diagnostic::Kind::AssumptionViolation))).Times(2);
  EXPECT_CALL(diag, Call(Field(&Diagnostic::kind, Diagnostic::Kind::Failure))).Times(0);

  auto result = decodeAdvertisement(data, diag.AsStdFunction());
  ASSERT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(result.advertisement.sequenceNumber, 0x22u);
}

TEST(ReadHeader, RecordsCounter)
{
  auto data = test::scenarioA();
  ByteCursor cursor(data.data(), data.size());
  Header h = readHeader(cursor);
  EXPECT_EQ(h.messageCounter, 0xc7c2a060u);
  EXPECT_EQ(h.magic, HEADER_MAGIC);
  EXPECT_EQ(cursor.position(), HEADER_SIZE);
}

// ---------------------------------------------------------------------------
// Nest section
// ---------------------------------------------------------------------------

TEST(NestParser, AcceptsFieldsInAnyOrder)
{
  test::Bytes b;
  b.phrase("NEST", 0x08, {0x00, 0x04})
      .phrase("ADVT", 0x07, {0x02})
      .phrase("SEQH", 0x06, {0x00, 0x09})
      .phrase("ADVV", 0x07, {0x03})
      .phrase("NUMS", 0x08, {0x00, 0x02})
      .phrase("TERM", 0x08, {0x01, 0x00});
  ByteCursor cursor(b.data.data(), b.data.size());
  Advertisement adv;
  NestParser parser(cursor, nullptr);
  EXPECT_EQ(parser.state(), NestParser::State::ExpectNest);
  parser.parse(adv);

  EXPECT_EQ(parser.state(), NestParser::State::Done);
  EXPECT_EQ(adv.protocolVersion, 3u);
  EXPECT_EQ(adv.advertisementType, 2);
  EXPECT_EQ(adv.nestFields.size(), 2u);
  EXPECT_EQ(adv.nestFields.at("SEQH").asUnsigned(), 9u);
  EXPECT_EQ(adv.nestFields.at("NUMS").asUnsigned(), 2u);
  EXPECT_TRUE(cursor.atEnd());
}

TEST(DecodeAdvertisement, FirstPhraseMustBeNest)
{
  test::Bytes b = test::header();
  b.phrase("ADVV", 0x07, {0x02}).phrase("ADVT", 0x07, {0x01}).phrase("TERM", 0x06, {0, 0});
  auto result = decodeAdvertisement(b.data);
  EXPECT_EQ(result.status, DecodeStatus::ProtocolViolation);
  EXPECT_THAT(result.message, HasSubstr("NEST"));
}

TEST(DecodeAdvertisement, NestWithoutTypeIsProtocolViolation)
{
  test::Bytes b = test::header();
  b.phrase("NEST", 0x08, {0, 1}).phrase("ADVV", 0x07, {0x02}).phrase("TERM", 0x06, {0, 0});
  EXPECT_EQ(decodeAdvertisement(b.data).status, DecodeStatus::ProtocolViolation);
}

TEST(DecodeAdvertisement, AdvertisementTypeOutOfRange)
{
  for (uint8_t type : {0, 5, 0xff})
  {
    test::Bytes b = test::header();
    test::nest(b, type);
    EXPECT_EQ(decodeAdvertisement(b.data).status, DecodeStatus::InvalidAdvertisementType)
        << "type " << int(type);
  }
}

TEST(DecodeAdvertisement, UnknownOpcodeInNest)
{
  test::Bytes b = test::header();
  b.phrase("NEST", 0x08, {0, 3}).phrase("WHAT", 0x07, {0x01});
  auto result = decodeAdvertisement(b.data);
  EXPECT_EQ(result.status, DecodeStatus::UnknownOpcode);
  EXPECT_THAT(result.message, HasSubstr("WHAT"));
}

// ---------------------------------------------------------------------------
// Node and channel sections
// ---------------------------------------------------------------------------

TEST(ParseNodeSection, ReadsExactlyItsCount)
{
  test::Bytes b;
  b.phrase("advv", 0x01, {0, 0, 1, 0})
      .text("atrn", "Node", 8)
      .phrase("S001", 0x08, {0, 0});
  ByteCursor cursor(b.data.data(), b.data.size());
  Advertisement adv;
  parseNodeSection(cursor, 2, adv);
  EXPECT_EQ(adv.sequenceNumber, 256u);
  EXPECT_EQ(adv.nodeName, "Node");
  EXPECT_EQ(cursor.remaining(), 7u);
}

TEST(ParseNodeSection, UnknownOpcode)
{
  test::Bytes b;
  b.phrase("psid", 0x01, {0, 0, 0, 1});
  ByteCursor cursor(b.data.data(), b.data.size());
  Advertisement adv;
  try
  {
    parseNodeSection(cursor, 1, adv);
    FAIL() << "expected DecodeError";
  }
  catch (const DecodeError &e)
  {
    EXPECT_EQ(e.status(), DecodeStatus::UnknownOpcode);
  }
}

TEST(ParseNodeSection, AddressMustBeQuad)
{
  test::Bytes b;
  b.text("inip", "10.0.0.1", 8);
  ByteCursor cursor(b.data.data(), b.data.size());
  Advertisement adv;
  EXPECT_THROW(parseNodeSection(cursor, 1, adv), DecodeError);
}

TEST(ParseChannelSection, KeepsUnexplainedFlagsVerbatim)
{
  test::Bytes b;
  b.phrase("INDI", 0x08, {0x00, 0x07})
      .phrase("psid", 0x01, {0x00, 0x00, 0x00, 0x2a})
      .phrase("styp", 0x01, {'L', 'W', 'S', 'S'})
      .phrase("asid", 0x01, {0x00, 0x00, 0x01, 0x00})
      .phrase("shab", 0x00, {0x01})
      .phrase("fasm", 0x08, {0xbe, 0xef})
      .phrase("bsbt", 0x09, {1, 2, 3, 4, 5, 6, 7, 8})
      .phrase("pmod", 0x07, {0x03});
  ByteCursor cursor(b.data.data(), b.data.size());

  Channel ch = parseChannelSection(cursor, 42);
  EXPECT_EQ(ch.channelNumber, 42);
  EXPECT_EQ(ch.livewireChannel, 42u);
  EXPECT_EQ(ch.streamType, "LWSS");
  EXPECT_EQ(ch.alternateChannel, 256u);
  EXPECT_TRUE(ch.shareable);
  ASSERT_EQ(ch.unknownFields.size(), 3u);
  EXPECT_EQ(ch.unknownFields.at("fasm").hex(), "be ef");
  EXPECT_EQ(ch.unknownFields.at("bsbt").dataType, 0x09);
  EXPECT_EQ(ch.unknownFields.at("pmod").bytes, std::vector<uint8_t>{0x03});
  EXPECT_TRUE(cursor.atEnd());
}

TEST(ParseChannelSection, MustOpenWithIndi)
{
  test::Bytes b;
  b.phrase("psid", 0x01, {0, 0, 0, 1});
  ByteCursor cursor(b.data.data(), b.data.size());
  try
  {
    parseChannelSection(cursor, 1);
    FAIL() << "expected DecodeError";
  }
  catch (const DecodeError &e)
  {
    EXPECT_EQ(e.status(), DecodeStatus::ProtocolViolation);
  }
}

TEST(DecodeAdvertisement, UnknownDataTypeInChannel)
{
  test::Bytes b = test::header();
  test::nest(b, 1);
  b.phrase("S001", 0x08, {0, 0}).phrase("INDI", 0x08, {0, 1}).phrase("psid", 0x05, {0, 0, 0, 1});
  auto result = decodeAdvertisement(b.data);
  EXPECT_EQ(result.status, DecodeStatus::UnknownDataType);
  EXPECT_THAT(result.message, HasSubstr("channel section"));
}

TEST(DecodeAdvertisement, UnknownTopLevelOpcodeForTypeOne)
{
  auto data = test::scenarioA();
  test::Bytes tail;
  tail.phrase("XTRA", 0x07, {0x01});
  data.insert(data.end(), tail.data.begin(), tail.data.end());
  EXPECT_EQ(decodeAdvertisement(data).status, DecodeStatus::UnknownOpcode);
}

TEST(DecodeAdvertisement, TypeThreeLeavesUndocumentedTailUnconsumed)
{
  test::Bytes b = test::header();
  test::nest(b, 3);
  b.phrase("INDI", 0x08, {0x00, 0x01}).text("atrn", "Codec", 16);
  size_t decodedLength = b.data.size();
  b.raw({'Q', 'Q', 'Q', 'Q', 0x42, 0x01, 0x02, 0x03});

  auto result = decodeAdvertisement(b.data);
  ASSERT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(result.advertisement.advertisementType, 3);
  EXPECT_EQ(result.advertisement.nodeName, "Codec");
  EXPECT_EQ(result.advertisement.unconsumedBytes, b.data.size() - decodedLength);
}

// ---------------------------------------------------------------------------
// Failure isolation
// ---------------------------------------------------------------------------

TEST(DecodeAdvertisement, FailureDoesNotAffectNextDatagram)
{
  auto reference = decodeAdvertisement(test::scenarioA());
  ASSERT_TRUE(reference.ok());

  test::Bytes b = test::header();
  test::nest(b, 1);
  b.phrase("S001", 0x08, {0, 0}).phrase("INDI", 0x08, {0, 1}).phrase("zzzz", 0x07, {0x01});

  MockFunction<void(const Diagnostic &)> diag;
  EXPECT_CALL(diag, Call(_)).Times(AnyNumber());
  EXPECT_CALL(diag, Call(Field(&Diagnostic::kind, Diagnostic::Kind::Failure))).Times(1);
  auto failed = decodeAdvertisement(b.data, diag.AsStdFunction());
  EXPECT_EQ(failed.status, DecodeStatus::UnknownOpcode);
  EXPECT_THAT(failed.message, HasSubstr("zzzz"));

  auto after = decodeAdvertisement(test::scenarioA());
  ASSERT_TRUE(after.ok());
  EXPECT_EQ(toJson(after.advertisement).dump(), toJson(reference.advertisement).dump());
}

TEST(DecodeAdvertisement, TraceCoversEveryPhrase)
{
  std::vector<std::string> trace;
  auto result = decodeAdvertisement(test::scenarioB(), [&trace](const Diagnostic &d)
                                    {
                                      if (d.kind == Diagnostic::Kind::Trace)
                                        trace.push_back(d.message); });
  ASSERT_TRUE(result.ok());
  // header + 4 nest phrases + INDI + 7 node phrases
  EXPECT_EQ(trace.size(), 13u);
  EXPECT_THAT(trace[0], HasSubstr("counter="));
  EXPECT_THAT(trace[1], HasSubstr("NEST"));
  EXPECT_THAT(trace.back(), HasSubstr("rsrv"));
}

TEST(AdvertisementJson, CarriesEveryField)
{
  auto result = decodeAdvertisement(test::scenarioA());
  ASSERT_TRUE(result.ok());
  auto j = toJson(result.advertisement);
  EXPECT_EQ(j["nodeName"], "Studio-A Engine");
  EXPECT_EQ(j["advertisementType"], 1);
  ASSERT_EQ(j["channels"].size(), 1u);
  EXPECT_EQ(j["channels"][0]["livewireChannel"], 6031);
  EXPECT_EQ(j["channels"][0]["unknownFields"]["lvmd"]["hex"], "01");
  EXPECT_FALSE(j["channels"][0].contains("streamType"));
}

// ---------------------------------------------------------------------------
// Operand shapes
// ---------------------------------------------------------------------------

TEST(DecodeAdvertisement, FourByteNodeNumbersAreKeptVerbatim)
{
  test::Bytes b = test::header();
  test::nest(b, 2);
  b.phrase("INDI", 0x08, {0x00, 0x04})
      .text("atrn", "xNode-7", 32)
      .phrase("hwid", 0x01, {10, 0, 0, 5})
      .phrase("udpp", 0x01, {0x00, 0x01, 0x0f, 0xa1})
      .phrase("NUMS", 0x01, {0x00, 0x00, 0x00, 0x05});

  std::vector<std::string> warnings;
  std::vector<std::string> trace;
  auto result = decodeAdvertisement(b.data, [&](const Diagnostic &d)
                                    {
                                      if (d.kind == Diagnostic::Kind::AssumptionViolation)
                                        warnings.push_back(d.message);
                                      else if (d.kind == Diagnostic::Kind::Trace)
                                        trace.push_back(d.message); });
  ASSERT_TRUE(result.ok()) << result.message;

  const Advertisement &adv = result.advertisement;
  EXPECT_EQ(adv.hardwareIdSuffix, 0u);
  EXPECT_EQ(adv.udpPort, 0);
  EXPECT_EQ(adv.declaredSourceCount, 0u);
  ASSERT_EQ(adv.nodeFields.size(), 3u);
  EXPECT_EQ(adv.nodeFields.at("hwid").hex(), "0a 00 00 05");
  EXPECT_EQ(adv.nodeFields.at("udpp").hex(), "00 01 0f a1");
  EXPECT_EQ(adv.nodeFields.at("NUMS").hex(), "00 00 00 05");

  ASSERT_EQ(warnings.size(), 3u);
  EXPECT_THAT(warnings[1], HasSubstr("udpp"));
  EXPECT_THAT(trace, testing::Contains(HasSubstr("udpp [0x01] 0.1.15.161")));
}

TEST(DecodeAdvertisement, SixteenBitNodeNumbersAreRead)
{
  test::Bytes b = test::header();
  test::nest(b, 2);
  b.phrase("INDI", 0x08, {0x00, 0x03})
      .phrase("hwid", 0x06, {0xab, 0xcd})
      .phrase("udpp", 0x08, {0x0f, 0xa2})
      .phrase("NUMS", 0x07, {0x02});
  auto result = decodeAdvertisement(b.data);
  ASSERT_TRUE(result.ok()) << result.message;
  EXPECT_EQ(result.advertisement.hardwareIdSuffix, 0xabcdu);
  EXPECT_EQ(result.advertisement.udpPort, 4002);
  EXPECT_EQ(result.advertisement.declaredSourceCount, 2u);
  EXPECT_TRUE(result.advertisement.nodeFields.empty());
}

TEST(DecodeAdvertisement, FourByteOperandIsNumericOnlyWhereTheOpcodeSaysSo)
{
  test::Bytes b = test::header();
  test::nest(b, 1);
  b.phrase("S001", 0x08, {0, 0})
      .phrase("INDI", 0x08, {0, 1})
      .phrase("shab", 0x01, {0, 0, 0, 1});
  auto result = decodeAdvertisement(b.data);
  EXPECT_EQ(result.status, DecodeStatus::ProtocolViolation);
  EXPECT_THAT(result.message, HasSubstr("shab"));
}

TEST(DecodeAdvertisement, NamesMustBeText)
{
  test::Bytes node = test::header();
  test::nest(node, 2);
  node.phrase("INDI", 0x08, {0, 1}).phrase("atrn", 0x01, {'N', 'o', 'd', 'e'});
  auto result = decodeAdvertisement(node.data);
  EXPECT_EQ(result.status, DecodeStatus::ProtocolViolation);
  EXPECT_THAT(result.message, HasSubstr("atrn"));

  test::Bytes channel = test::header();
  test::nest(channel, 1);
  channel.phrase("S001", 0x08, {0, 0})
      .phrase("INDI", 0x08, {0, 1})
      .phrase("psnm", 0x01, {'M', 'i', 'c', '1'});
  EXPECT_EQ(decodeAdvertisement(channel.data).status, DecodeStatus::ProtocolViolation);
}

TEST(ParseChannelSection, StreamTypeMustBeATag)
{
  test::Bytes b;
  b.phrase("INDI", 0x08, {0, 1}).text("styp", "LWSS", 4);
  ByteCursor cursor(b.data.data(), b.data.size());
  EXPECT_THROW(parseChannelSection(cursor, 1), DecodeError);
}

TEST(DecodeAdvertisement, TruncationBetweenSectionsNamesTheTopLevel)
{
  auto data = test::scenarioA();
  data.push_back(0xaa);
  data.push_back(0xbb);
  auto result = decodeAdvertisement(data);
  EXPECT_EQ(result.status, DecodeStatus::Truncated);
  EXPECT_THAT(result.message, testing::StartsWith("top level:"));
}
