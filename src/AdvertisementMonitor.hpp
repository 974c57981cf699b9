#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>

#include "MulticastReceiver.hpp"
#include "ScanOptions.hpp"
#include "SequenceTracker.hpp"
#include "livewire/AdvertisementDecoder.hpp"

/**
 * Class responsible for turning received datagrams into output.
 *
 * Each datagram is decoded on its own; a datagram that fails to decode is
 * counted, reported on the "decode" event channel and dropped. Decoded
 * advertisements of type 1 (and of every type with ScanOptions::all) are
 * rendered as table rows or JSON lines and passed to the output callback.
 */
class AdvertisementMonitor
{
public:
  using OutputCallback = std::function<void(const std::string &)>;
  using ClockCallback = std::function<std::string()>;

  struct Stats
  {
    uint64_t received = 0;
    uint64_t decoded = 0;
    uint64_t skipped = 0; ///< decoded but filtered out of the output
    std::map<livewire::DecodeStatus, uint64_t> failures;

    uint64_t failed() const;
  };

  AdvertisementMonitor(const ScanOptions &options, OutputCallback output,
                       ClockCallback clock = nullptr);

  void handleDatagram(const Datagram &datagram);

  Stats stats() const;
  std::string statsSummary() const;

private:
  ScanOptions options;
  OutputCallback output;
  ClockCallback clock;
  SequenceTracker tracker;
  mutable std::mutex mutex_;
  Stats stats_;
  bool headerPrinted = false;

  void onDiagnostic(const std::string &sender, const livewire::Diagnostic &diagnostic);
  void track(const std::string &sender, const livewire::Advertisement &advertisement);
};
