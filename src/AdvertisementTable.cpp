#include "AdvertisementTable.hpp"

#include <iomanip>
#include <sstream>

namespace
{
  std::string fit(const std::string &s, size_t width)
  {
    if (s.size() <= width)
      return s;
    return s.substr(0, width - 1) + "~";
  }

  void writeRow(std::stringstream &ss, const std::string &time,
                const std::string &node, const std::string &address,
                const std::string &channel, const std::string &lw,
                const std::string &name, const std::string &source)
  {
    ss << std::left << std::setw(9) << time << std::setw(25) << fit(node, 24)
       << std::setw(16) << address << std::right << std::setw(4) << channel
       << std::setw(7) << lw << "  " << std::left << std::setw(17)
       << fit(name, 16) << source << "\n";
  }
} // namespace

std::string AdvertisementTable::header()
{
  std::stringstream ss;
  writeRow(ss, "Time", "Node", "Address", "Ch", "LW", "Name", "Source");
  ss << std::string(94, '-') << "\n";
  return ss.str();
}

std::string AdvertisementTable::formatRows(const livewire::Advertisement &advertisement,
                                           const std::string &timestamp)
{
  std::stringstream ss;
  if (advertisement.channels.empty())
  {
    writeRow(ss, timestamp, advertisement.nodeName, advertisement.nodeAddress,
             "-", "-", "-", "-");
    return ss.str();
  }
  for (const auto &c : advertisement.channels)
  {
    writeRow(ss, timestamp, advertisement.nodeName, advertisement.nodeAddress,
             std::to_string(c.channelNumber), std::to_string(c.livewireChannel),
             c.presentationName, c.fromSourceAddress);
  }
  return ss.str();
}
