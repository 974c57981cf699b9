#include "ScanOptions.hpp"

#include <map>
#include <sstream>
#include <stdexcept>

bool parseScanOptions(int argc, const char *const argv[], ScanOptions &options,
                      std::string &error)
{
  std::map<std::string, std::string> args;

  // Default values for optional parameters
  args["-group"] = options.group;
  args["-port"] = std::to_string(options.port);
  args["-iface"] = options.interfaceIP;
  args["-timeout"] = std::to_string(options.timeoutSecs);
  args["-v"] = options.verbose ? "true" : "false";
  args["-json"] = options.json ? "true" : "false";
  args["-all"] = options.all ? "true" : "false";
  args["-u"] = "false";

  for (int i = 1; i < argc; ++i)
  {
    std::string arg = argv[i];
    if ((arg == "-group" || arg == "-port" || arg == "-iface" ||
         arg == "-timeout") &&
        i + 1 < argc)
    {
      args[arg] = argv[++i];
    }
    else if (arg == "-v" || arg == "-json" || arg == "-all" || arg == "-u")
    {
      args[arg] = "true";
    }
    else
    {
      error = "Unknown or incomplete option: " + arg;
      return false;
    }
  }

  int port = 0;
  try
  {
    port = std::stoi(args["-port"]);
    options.timeoutSecs = std::stoi(args["-timeout"]);
  }
  catch (const std::logic_error &)
  {
    error = "-port and -timeout take a number";
    return false;
  }
  if (port <= 0 || port > 65535)
  {
    error = "-port out of range: " + args["-port"];
    return false;
  }
  if (options.timeoutSecs < 0)
  {
    error = "-timeout must not be negative";
    return false;
  }

  options.port = (unsigned short)port;
  options.group = args["-group"];
  options.interfaceIP = args["-iface"];
  options.verbose = args["-v"] == "true";
  options.json = args["-json"] == "true";
  options.all = args["-all"] == "true";
  options.usage = args["-u"] == "true";
  return true;
}

std::string scanUsage()
{
  std::stringstream ss;
  ss << "Usage: lwscan -group <ip> -port <port> -iface <local ip> -timeout <secs> "
        "[-v] [-json] [-all] [-u]"
     << std::endl
     << "  -group    multicast group (default " << livewire::ADVERTISEMENT_GROUP << ")" << std::endl
     << "  -port     UDP port (default " << livewire::ADVERTISEMENT_PORT << ")" << std::endl
     << "  -iface    interface to join the group on (default any)" << std::endl
     << "  -timeout  stop after this many seconds, 0 = until Ctrl-C" << std::endl
     << "  -v        print the opcode-by-opcode decode trace" << std::endl
     << "  -json     print advertisements as JSON lines" << std::endl
     << "  -all      include advertisements without channels (types 2-4)" << std::endl;
  return ss.str();
}
