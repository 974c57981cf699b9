#pragma once
#include <string>

#include "livewire/Advertisement.hpp"

struct ScanOptions
{
  std::string group = livewire::ADVERTISEMENT_GROUP;
  unsigned short port = livewire::ADVERTISEMENT_PORT;
  std::string interfaceIP;   // empty: any interface
  bool verbose = false;      // opcode-by-opcode decode trace
  bool json = false;         // one JSON object per line instead of the table
  bool all = false;          // also show type 2-4 advertisements
  int timeoutSecs = 0;       // 0: run until SIGINT
  bool usage = false;
};

/**
 * Parses `-flag value` / `-flag` arguments into options.
 * @return false with `error` set for an unknown, incomplete or malformed option.
 */
bool parseScanOptions(int argc, const char *const argv[], ScanOptions &options,
                      std::string &error);

std::string scanUsage();
