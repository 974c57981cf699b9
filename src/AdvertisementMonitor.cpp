#include "AdvertisementMonitor.hpp"
#include "AdvertisementTable.hpp"
#include "SystemEventQueue.hpp"
#include "util.hpp"

#include <sstream>

uint64_t AdvertisementMonitor::Stats::failed() const
{
  uint64_t n = 0;
  for (const auto &kv : failures)
    n += kv.second;
  return n;
}

AdvertisementMonitor::AdvertisementMonitor(const ScanOptions &options,
                                           OutputCallback output,
                                           ClockCallback clock)
    : options(options), output(std::move(output)), clock(std::move(clock))
{
  if (!this->clock)
    this->clock = getCurrentTimeAsString;
}

void AdvertisementMonitor::onDiagnostic(const std::string &sender,
                                        const livewire::Diagnostic &diagnostic)
{
  if (diagnostic.kind == livewire::Diagnostic::Kind::Trace && !options.verbose)
    return;
  SystemEventQueue::push("decode", sender + " " + diagnostic.component + " " +
                                       livewire::toString(diagnostic.kind) + ": " +
                                       diagnostic.message);
}

void AdvertisementMonitor::track(const std::string &sender,
                                 const livewire::Advertisement &advertisement)
{
  auto obs = tracker.observe(sender, advertisement.messageCounter,
                             advertisement.sequenceNumber);
  std::stringstream ss;
  if (obs.firstSeen)
  {
    ss << "new node " << advertisement.nodeName << " at " << sender;
    SystemEventQueue::push("monitor", ss.str());
    return;
  }
  if (obs.counterRegressed)
  {
    ss << sender << ": counter went from " << obs.previousCounter << " to "
       << advertisement.messageCounter << " (node restarted or duplicate)";
    SystemEventQueue::push("monitor", ss.str());
  }
  else if (obs.sequenceChanged && options.verbose)
  {
    ss << sender << ": sequence " << obs.previousSequence << " -> "
       << advertisement.sequenceNumber;
    SystemEventQueue::push("monitor", ss.str());
  }
}

void AdvertisementMonitor::handleDatagram(const Datagram &datagram)
{
  const std::string &sender = datagram.sender;
  auto result = livewire::decodeAdvertisement(
      datagram.data, [this, &sender](const livewire::Diagnostic &d)
      { onDiagnostic(sender, d); });

  std::string text;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    stats_.received++;
    if (!result.ok())
    {
      stats_.failures[result.status]++;
      return;
    }
    stats_.decoded++;

    const auto &adv = result.advertisement;
    if (adv.advertisementType != 1 && !options.all)
    {
      stats_.skipped++;
    }
    else if (options.json)
    {
      auto j = livewire::toJson(adv);
      j["sender"] = sender;
      text = j.dump() + "\n";
    }
    else
    {
      if (!headerPrinted)
      {
        text = AdvertisementTable::header();
        headerPrinted = true;
      }
      text += AdvertisementTable::formatRows(adv, clock());
    }
  }

  track(sender, result.advertisement);
  if (!text.empty() && output)
    output(text);
}

AdvertisementMonitor::Stats AdvertisementMonitor::stats() const
{
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

std::string AdvertisementMonitor::statsSummary() const
{
  Stats s = stats();
  std::stringstream ss;
  ss << "received=" << s.received << " decoded=" << s.decoded
     << " skipped=" << s.skipped << " failed=" << s.failed()
     << " nodes=" << tracker.senderCount();
  for (const auto &kv : s.failures)
    ss << " " << livewire::toString(kv.first) << "=" << kv.second;
  return ss.str();
}
