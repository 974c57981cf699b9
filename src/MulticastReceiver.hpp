/**
 * @file
 * @brief Multicast Receiver class for receiving raw UDP multicast datagrams.
 */
#pragma once
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

/**
 * One received datagram and the address it came from.
 */
struct Datagram
{
  std::vector<uint8_t> data;
  std::string sender; ///< dotted-quad source address
};

/**
 * @class MulticastReceiver
 * @brief Listens for UDP multicast datagrams and hands each one, unparsed, to
 * a callback.
 *
 * The listener runs on its own thread and blocks in recvfrom(); stop()
 * shuts the socket down to unblock it. Datagrams are delivered in arrival
 * order on the listener thread.
 */
class MulticastReceiver {
public:
  /**
   * Type definition for the datagram callback function.
   * @param datagram The bytes received and their sender.
   */
  using DatagramCallback = std::function<void(const Datagram &)>;

  /**
   * Large enough for any UDP payload; advertisements have been seen well
   * above 1 KB and a short read cannot be recovered.
   */
  static constexpr size_t MAX_DATAGRAM = 65536;

  /**
   * Constructor for the MulticastReceiver class.
   * @param multicastIP IP address of the multicast group.
   * @param port Port number to listen on for multicast messages.
   * @param interfaceIP Local interface to join the group on; empty for any.
   */
  MulticastReceiver(const std::string &multicastIP, unsigned short port,
                    const std::string &interfaceIP = "");

  /**
   * Destructor for the MulticastReceiver class.
   * Stops the listening thread if it is running and cleans up resources.
   */
  ~MulticastReceiver();

  MulticastReceiver(const MulticastReceiver &) = delete;
  MulticastReceiver &operator=(const MulticastReceiver &) = delete;

  /**
   * Sets the callback function to be triggered when a datagram is received.
   * Must be called before start().
   */
  void setDatagramCallback(DatagramCallback callback);

  /**
   * Starts the listening thread to receive multicast datagrams.
   * If the listener is already running, this method has no effect.
   */
  void start();

  /**
   * Stops the listening thread and cleans up resources.
   * If the listener is not running, this method has no effect.
   */
  void stop();

private:
  std::string multicastIP;    ///< IP address of the multicast group.
  unsigned short port;        ///< Port number to listen on.
  std::string interfaceIP;    ///< Interface for the group membership.
  std::atomic<int> sockfd;    ///< Socket file descriptor.
  std::thread listenerThread; ///< Thread for listening to multicast messages.
  std::atomic<bool> running;  ///< Flag to control the listener thread.
  DatagramCallback onDatagramReceived; ///< User-defined callback function.

  /**
   * Opens the socket, binds the port and joins the multicast group.
   * @return the socket, or -1 after reporting the failure.
   */
  int openSocket();

  /**
   * The main listening loop for the multicast receiver.
   * Receives datagrams until stop() and triggers the callback for each.
   */
  void listen();
};
