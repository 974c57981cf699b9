#pragma once
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "EventQueue.hpp"

struct SystemEvent
{
  const int64_t tsMilli;
  const std::string subsystem;
  const std::string message;
  SystemEvent(int64_t tsMilli, std::string subsystem, std::string message)
      : tsMilli(tsMilli), subsystem(subsystem), message(message) {}
};

/**
 * Process-wide log. Every event is echoed to stderr (unless muted) and the
 * last 200 are kept for later inspection.
 */
class SystemEventQueue : public EventQueue<std::shared_ptr<SystemEvent>>
{
public:
  SystemEventQueue() : EventQueue(200) {}
  static SystemEventQueue &instance()
  {
    static SystemEventQueue singleton;
    return singleton;
  }
  static void push(const std::string &subsystem, const std::string &message)
  {
    if (instance().echo_)
      std::cerr << "Event: " << subsystem << ": " << message << std::endl;

    const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
                         std::chrono::system_clock::now().time_since_epoch())
                         .count();
    instance().addEvent(std::make_shared<SystemEvent>(now, subsystem, message));
  }
  static std::vector<std::shared_ptr<SystemEvent>> getEventList()
  {
    return instance().snapshot();
  }
  /// Tests turn the stderr echo off.
  static void setEcho(bool echo) { instance().echo_ = echo; }

private:
  std::atomic<bool> echo_{true};
};
