#include "DecodeError.hpp"
#include "Diagnostic.hpp"

namespace livewire
{

  const char *toString(DecodeStatus status)
  {
    switch (status)
    {
    case DecodeStatus::OK:
      return "OK";
    case DecodeStatus::Truncated:
      return "Truncated";
    case DecodeStatus::ProtocolViolation:
      return "ProtocolViolation";
    case DecodeStatus::InvalidAdvertisementType:
      return "InvalidAdvertisementType";
    case DecodeStatus::UnknownOpcode:
      return "UnknownOpcode";
    case DecodeStatus::UnknownDataType:
      return "UnknownDataType";
    }
    return "Unknown";
  }

  const char *toString(Diagnostic::Kind kind)
  {
    switch (kind)
    {
    case Diagnostic::Kind::Trace:
      return "trace";
    case Diagnostic::Kind::AssumptionViolation:
      return "warning";
    case Diagnostic::Kind::Failure:
      return "error";
    }
    return "?";
  }

} // namespace livewire
