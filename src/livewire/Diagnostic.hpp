#pragma once
#include <functional>
#include <string>

namespace livewire
{

  /**
   * @brief One structured message emitted while decoding.
   */
  struct Diagnostic
  {
    enum class Kind
    {
      /// Opcode-by-opcode decode trace.
      Trace,
      /// A protocol assumption did not hold; decoding continued.
      AssumptionViolation,
      /// The datagram was discarded.
      Failure
    };

    Kind kind;
    std::string component; ///< "header", "phrase", "nest", "node", "channel", "message"
    std::string message;
  };

  /**
   * Receives diagnostics. May be empty, in which case nothing is reported.
   * Called synchronously from the decoding thread.
   */
  using DiagnosticCallback = std::function<void(const Diagnostic &)>;

  const char *toString(Diagnostic::Kind kind);

  inline void report(const DiagnosticCallback &diag, Diagnostic::Kind kind,
                     const std::string &component, const std::string &message)
  {
    if (diag)
      diag(Diagnostic{kind, component, message});
  }

} // namespace livewire
