#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>

#include "AdvertisementMonitor.hpp"
#include "MulticastReceiver.hpp"
#include "ScanOptions.hpp"
#include "SystemEventQueue.hpp"

std::atomic<bool> running{false};

void signalHandler(int signal)
{
  if (signal == SIGINT || signal == SIGTERM)
  {
    running = false;
  }
}

int main(int argc, char *argv[])
{
  ScanOptions options;
  std::string error;
  if (!parseScanOptions(argc, argv, options, error))
  {
    std::cerr << error << std::endl
              << scanUsage();
    return -1;
  }
  if (options.usage)
  {
    std::cout << scanUsage();
    return 0;
  }

  std::signal(SIGINT, signalHandler);
  std::signal(SIGTERM, signalHandler);

  std::mutex outputMutex;
  AdvertisementMonitor monitor(options, [&outputMutex](const std::string &text)
                               {
                                 std::lock_guard<std::mutex> lock(outputMutex);
                                 std::cout << text << std::flush; });

  MulticastReceiver receiver(options.group, options.port, options.interfaceIP);
  receiver.setDatagramCallback([&monitor](const Datagram &datagram)
                               { monitor.handleDatagram(datagram); });
  running = true;
  receiver.start();

  auto started = std::chrono::steady_clock::now();
  auto nextSummary = started + std::chrono::seconds(60);
  while (running)
  {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    auto now = std::chrono::steady_clock::now();
    if (options.timeoutSecs != 0 &&
        now - started >= std::chrono::seconds(options.timeoutSecs))
    {
      break;
    }
    if (options.verbose && now >= nextSummary)
    {
      SystemEventQueue::push("monitor", monitor.statsSummary());
      nextSummary = now + std::chrono::seconds(60);
    }
  }

  receiver.stop();
  SystemEventQueue::push("monitor", monitor.statsSummary());
  return 0;
}
