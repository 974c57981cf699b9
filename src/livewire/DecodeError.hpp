#pragma once
#include <stdexcept>
#include <string>

namespace livewire
{

  /**
   * @brief Outcome of decoding a single advertisement datagram.
   *
   * Every failure is scoped to the datagram being decoded; none of them
   * affects the decoding of later datagrams.
   */
  enum class DecodeStatus
  {
    /// The datagram was fully decoded.
    OK,
    /// The buffer ended before an expected field could be read.
    Truncated,
    /// A structurally required phrase was missing or out of place.
    ProtocolViolation,
    /// The advertisement type was outside 1..4.
    InvalidAdvertisementType,
    /// An opcode outside the known set for its section.
    UnknownOpcode,
    /// A data-type tag the phrase reader has no operand shape for.
    UnknownDataType
  };

  const char *toString(DecodeStatus status);

  /**
   * @brief Thrown by the section parsers, caught by decodeAdvertisement().
   */
  class DecodeError : public std::runtime_error
  {
  public:
    DecodeError(DecodeStatus status, const std::string &message)
        : std::runtime_error(message), status_(status) {}

    DecodeStatus status() const { return status_; }

  private:
    DecodeStatus status_;
  };

} // namespace livewire
