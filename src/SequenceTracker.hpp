#pragma once
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

/**
 * Remembers the last header counter and advertised sequence number seen from
 * each sender. This is the only cross-message state in the program; the
 * decoder itself keeps none.
 */
class SequenceTracker
{
public:
  struct Observation
  {
    bool firstSeen = false;
    /// The counter did not move forward (serial-number comparison, so a wrap
    /// from 0xffffffff to 0 is not a regression).
    bool counterRegressed = false;
    bool sequenceChanged = false;
    uint32_t previousCounter = 0;
    uint32_t previousSequence = 0;
  };

  Observation observe(const std::string &sender, uint32_t counter,
                      uint32_t sequenceNumber);

  /// Number of distinct senders seen so far.
  size_t senderCount() const;

private:
  struct Entry
  {
    uint32_t counter;
    uint32_t sequence;
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
};
