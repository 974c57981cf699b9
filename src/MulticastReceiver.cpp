#include "MulticastReceiver.hpp"
#include "SystemEventQueue.hpp"
#include <cerrno>
#include <cstring>
#include <sstream>

#if defined(_WIN32) || defined(_WIN64)
#include <winsock2.h>
#include <ws2tcpip.h>
#pragma comment(lib, "ws2_32.lib")

typedef int socklen_t;

// Windows specific initialization and cleanup
static void initialize_sockets()
{
  WSADATA wsaData;
  if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0)
  {
    SystemEventQueue::push("mcast", "WSAStartup failed.");
  }
}

static void cleanup_sockets() { WSACleanup(); }

#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>

// No initialization or cleanup required for sockets on Unix-based systems
static void initialize_sockets() {}
static void cleanup_sockets() {}

#define closesocket close // Define closesocket as close on Unix-based systems

#endif

MulticastReceiver::MulticastReceiver(const std::string &multicastIP,
                                     unsigned short port,
                                     const std::string &interfaceIP)
    : multicastIP(multicastIP), port(port), interfaceIP(interfaceIP),
      sockfd(-1), running(false)
{
  initialize_sockets();
}

MulticastReceiver::~MulticastReceiver()
{
  stop();
  cleanup_sockets();
}

void MulticastReceiver::setDatagramCallback(DatagramCallback callback)
{
  this->onDatagramReceived = callback;
}

void MulticastReceiver::start()
{
  if (running)
    return;
  // A listener that failed to open its socket has already exited.
  if (listenerThread.joinable())
    listenerThread.join();
  running = true;
  listenerThread = std::thread(&MulticastReceiver::listen, this);
}

void MulticastReceiver::stop()
{
  running = false;

  // The listener owns the socket and closes it; shutting it down here only
  // unblocks the pending receive.
  int s = sockfd.load();
  if (s != -1)
  {
#if defined(_WIN32) || defined(_WIN64)
    shutdown(s, SD_BOTH);
#else
    shutdown(s, SHUT_RDWR);
#endif
  }
  if (listenerThread.joinable())
  {
    listenerThread.join();
  }
}

int MulticastReceiver::openSocket()
{
  int s = socket(AF_INET, SOCK_DGRAM, 0);
  if (s < 0)
  {
    SystemEventQueue::push("mcast", std::string("Error: cannot open multicast socket: ") +
                                        strerror(errno));
    return -1;
  }

  int reuse = 1;
  if (setsockopt(s, SOL_SOCKET, SO_REUSEADDR, (char *)&reuse,
                 sizeof(reuse)) < 0)
  {
    SystemEventQueue::push(
        "mcast", std::string("Error: Setting SO_REUSEADDR error: ") + strerror(errno));
    closesocket(s);
    return -1;
  }

  // Wake up once a second so stop() is noticed even if shutdown() does not
  // interrupt the blocking receive.
#if defined(_WIN32) || defined(_WIN64)
  DWORD timeoutMs = 1000;
  setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, (char *)&timeoutMs, sizeof(timeoutMs));
#else
  struct timeval tv;
  tv.tv_sec = 1;
  tv.tv_usec = 0;
  setsockopt(s, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
#endif

  struct sockaddr_in localSock;
  memset(&localSock, 0, sizeof(localSock));
  localSock.sin_family = AF_INET;
  localSock.sin_port = htons(port);
  localSock.sin_addr.s_addr = INADDR_ANY;

  if (bind(s, (struct sockaddr *)&localSock, sizeof(localSock)) < 0)
  {
    SystemEventQueue::push("mcast", std::string("Error: binding socket: ") +
                                        strerror(errno));
    closesocket(s);
    return -1;
  }

  struct ip_mreq group;
  memset(&group, 0, sizeof(group));
  if (inet_pton(AF_INET, multicastIP.c_str(), &group.imr_multiaddr) != 1)
  {
    SystemEventQueue::push("mcast", "Error: invalid multicast group " + multicastIP);
    closesocket(s);
    return -1;
  }
  group.imr_interface.s_addr = INADDR_ANY;
  if (!interfaceIP.empty() &&
      inet_pton(AF_INET, interfaceIP.c_str(), &group.imr_interface) != 1)
  {
    SystemEventQueue::push("mcast", "Error: invalid interface address " + interfaceIP);
    closesocket(s);
    return -1;
  }
  if (setsockopt(s, IPPROTO_IP, IP_ADD_MEMBERSHIP, (char *)&group,
                 sizeof(group)) < 0)
  {
    SystemEventQueue::push("mcast",
                           std::string("Error: Adding multicast group error: ") +
                               strerror(errno));
    closesocket(s);
    return -1;
  }
  return s;
}

void MulticastReceiver::listen()
{
  int s = openSocket();
  if (s < 0)
  {
    running = false;
    return;
  }
  sockfd = s;

  std::stringstream ss;
  ss << "Multicast listening on " << multicastIP << ":" << port;
  if (!interfaceIP.empty())
    ss << " via " << interfaceIP;
  SystemEventQueue::push("mcast", ss.str());

  std::vector<uint8_t> buffer(MAX_DATAGRAM);
  while (running)
  {
    struct sockaddr_in src;
    socklen_t srcLen = sizeof(src);
    int nbytes = recvfrom(s, (char *)buffer.data(), (int)buffer.size(), 0,
                          (struct sockaddr *)&src, &srcLen);
    if (nbytes <= 0)
    {
      if (!running)
      {
        SystemEventQueue::push("mcast", "Listener stopping.");
        break;
      }
      continue;
    }

    if (onDatagramReceived)
    {
      char srcIP[INET_ADDRSTRLEN] = {0};
      inet_ntop(AF_INET, &src.sin_addr, srcIP, sizeof(srcIP));

      Datagram datagram;
      datagram.data.assign(buffer.begin(), buffer.begin() + nbytes);
      datagram.sender = srcIP;
      onDatagramReceived(datagram);
    }
  }

  sockfd = -1;
  closesocket(s);
}
