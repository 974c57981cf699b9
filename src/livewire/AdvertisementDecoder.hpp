/**
 * @file
 * @brief Decoder for Livewire node advertisements.
 *
 * An advertisement datagram is a 16-byte header followed by phrases
 * ([4-byte opcode][1-byte data type][operand]) grouped into sections:
 *
 *   header | NEST ... TERM | INDI n, <n phrases> | S001, INDI n, <n phrases> | ...
 *
 * The first group after the header is the nest section. Top-level INDI opens
 * the node section; a top-level "letter + three digits" opcode opens a channel
 * section, which carries its own INDI count. Decoding is stateless; every call
 * owns its cursor, so datagrams may be decoded concurrently.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "Advertisement.hpp"
#include "ByteCursor.hpp"
#include "DecodeError.hpp"
#include "Diagnostic.hpp"

namespace livewire
{

  /**
   * @brief The result of decoding one datagram.
   *
   * `advertisement` is only meaningful when status is OK; on failure it is
   * left default-constructed and `message` says what went wrong and where.
   */
  struct DecodeResult
  {
    DecodeStatus status = DecodeStatus::OK;
    std::string message;
    Advertisement advertisement;

    bool ok() const { return status == DecodeStatus::OK; }
  };

  /**
   * Reads and checks the fixed 16-byte preamble. A wrong magic or non-zero
   * padding is reported as an assumption violation; it does not fail.
   */
  Header readHeader(ByteCursor &cursor, const DiagnosticCallback &diag = nullptr);

  /**
   * @brief Consumes the nest section: NEST, then version/type fields in any
   * order, ended by TERM.
   */
  class NestParser
  {
  public:
    enum class State
    {
      ExpectNest,
      ReadingFields,
      Done
    };

    NestParser(ByteCursor &cursor, const DiagnosticCallback &diag);

    /**
     * Reads the section into `advertisement`.
     * @throws DecodeError ProtocolViolation if the first phrase is not NEST or
     * the section carries no advertisement type, InvalidAdvertisementType for a
     * type outside 1..4, UnknownOpcode for anything unrecognised.
     */
    void parse(Advertisement &advertisement);

    State state() const { return state_; }

  private:
    ByteCursor &cursor_;
    DiagnosticCallback diag_;
    State state_ = State::ExpectNest;
  };

  /**
   * Reads exactly `phraseCount` node-identity phrases into `advertisement`.
   * The INDI phrase carrying the count has already been consumed.
   */
  void parseNodeSection(ByteCursor &cursor, uint32_t phraseCount,
                        Advertisement &advertisement,
                        const DiagnosticCallback &diag = nullptr);

  /**
   * Reads one channel section. The section marker has already been consumed;
   * the cursor is at the section's INDI phrase.
   */
  Channel parseChannelSection(ByteCursor &cursor, int channelNumber,
                              const DiagnosticCallback &diag = nullptr);

  /**
   * Decodes one advertisement datagram.
   *
   * Never throws for malformed input; the first failure is returned in the
   * result and also reported to `diag` as a Failure diagnostic.
   */
  DecodeResult decodeAdvertisement(const uint8_t *data, size_t size,
                                   const DiagnosticCallback &diag = nullptr);

  DecodeResult decodeAdvertisement(const std::vector<uint8_t> &datagram,
                                   const DiagnosticCallback &diag = nullptr);

} // namespace livewire
