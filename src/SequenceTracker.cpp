#include "SequenceTracker.hpp"

SequenceTracker::Observation SequenceTracker::observe(const std::string &sender,
                                                      uint32_t counter,
                                                      uint32_t sequenceNumber)
{
  std::lock_guard<std::mutex> lock(mutex_);
  Observation obs;
  auto it = entries_.find(sender);
  if (it == entries_.end())
  {
    obs.firstSeen = true;
    entries_.emplace(sender, Entry{counter, sequenceNumber});
    return obs;
  }

  obs.previousCounter = it->second.counter;
  obs.previousSequence = it->second.sequence;
  obs.counterRegressed = int32_t(counter - it->second.counter) <= 0;
  obs.sequenceChanged = sequenceNumber != it->second.sequence;
  it->second = Entry{counter, sequenceNumber};
  return obs;
}

size_t SequenceTracker::senderCount() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}
