/*
 *	Client interface for local Motion blinds gateway access
 *
 *	This is the base UDP communication class.
 *
 *	Each unicast exchange uses its own socket, multicast sockets are bound
 *	to the gateway's push port and joined to the multicast group. All
 *	receives are blocking with a timeout so that callers can retry or stop.
 *
 *	Common functions:
 *	 - OpenUnicast()
 *		Opens an unbound datagram socket for request/reply traffic
 *		Returns true|false indicating success or failure
 *	 - OpenMulticast(interface)
 *		Opens a datagram socket bound to MOTION_UDP_PORT_RECEIVE and joins
 *		the multicast group on `interface` (an IPv4 address or "any")
 *		Returns true|false indicating success or failure
 *	 - sendto(address, port, buffer[], size)
 *		Sends `size` bytes of `buffer` to `address`:`port`
 *		Returns `size` on success or -1 if an error occurred
 *	 - receive(buffer[], maxsize, timeout, source)
 *		Waits up to `timeout` milliseconds for one datagram and fills
 *		`buffer` with it. If `source` is given it receives the sender's IP.
 *		Returns number of bytes received or -1 if an error occurred. On
 *		timeout getlasterror() returns EAGAIN.
 *	 - disconnect()
 *		Closes the socket
 *	 - getlasterror()
 *		Use this instead of referencing `errno`, which may be polluted
 *
 *	motionDatagram is the abstract face of this class. Transport, discovery
 *	and listener code receive sockets from a motionDatagramFactory so that
 *	tests can replace the network.
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionUDP
#define _motionUDP

#include <string>
#include <cstdint>
#include <memory>
#include <functional>


namespace Motion {
  namespace UDP {
    namespace Socket {
      enum value {
        NO_SUCH_HOST,
        NO_SOCK_AVAIL,
        FAILED,
        CLOSED,
        UNICAST,
        MULTICAST
      }; // enum value
    }; // namespace Socket
  }; // namespace UDP
}; // namespace Motion


class motionDatagram
{
public:
	virtual ~motionDatagram() {}

	virtual bool OpenUnicast() = 0;
	virtual bool OpenMulticast(const std::string &interface) = 0;
	virtual int sendto(const std::string &address, const uint16_t port, const unsigned char *buffer, const int size) = 0;
	virtual int receive(unsigned char *buffer, const int maxsize, const int timeout, std::string *source = nullptr) = 0;
	virtual int getlasterror() = 0;
	virtual void disconnect() = 0;
};

typedef std::function<std::unique_ptr<motionDatagram>()> motionDatagramFactory;


class motionUDP : public motionDatagram
{

public:
	motionUDP();
	~motionUDP();

	static std::unique_ptr<motionDatagram> create();

	Motion::UDP::Socket::value getSocketState();

	bool OpenUnicast() override;
	bool OpenMulticast(const std::string &interface) override;
	int sendto(const std::string &address, const uint16_t port, const unsigned char *buffer, const int size) override;
	int receive(unsigned char *buffer, const int maxsize, const int timeout, std::string *source = nullptr) override;
	int getlasterror() override;
	void disconnect() override;

private:
	bool resolve(const std::string &hostname, struct sockaddr_in *address);
	int getSocketEvents(short events, int timeout);

	int m_sockfd;
	int m_lasterror;
	Motion::UDP::Socket::value m_socketState;
};

#endif
