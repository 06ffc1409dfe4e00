/*
 *	Client interface for local Motion blinds gateway access
 *
 *	This is the base UDP communication class.
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#define MULTICAST_TTL 2

#include "motionUDP.hpp"
#include "motionMessage.hpp"
#include "motionLog.hpp"
#include <unistd.h>
#include <cstring>
#include <netdb.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <errno.h>
#include <poll.h>


motionUDP::motionUDP()
{
	m_sockfd = -1;
	m_lasterror = 0;
	m_socketState = Motion::UDP::Socket::CLOSED;
}


motionUDP::~motionUDP()
{
	disconnect();
}


std::unique_ptr<motionDatagram> motionUDP::create()
{
	return std::unique_ptr<motionDatagram>(new motionUDP());
}


Motion::UDP::Socket::value motionUDP::getSocketState()
{
	return m_socketState;
}


bool motionUDP::OpenUnicast()
{
	disconnect();
	m_sockfd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
	if (m_sockfd < 0)
	{
		m_lasterror = errno;
		m_socketState = Motion::UDP::Socket::NO_SOCK_AVAIL;
		return false;
	}
	m_socketState = Motion::UDP::Socket::UNICAST;
	return true;
}


bool motionUDP::OpenMulticast(const std::string &interface)
{
	disconnect();
	m_sockfd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
	if (m_sockfd < 0)
	{
		m_lasterror = errno;
		m_socketState = Motion::UDP::Socket::NO_SOCK_AVAIL;
		return false;
	}

	struct in_addr if_addr;
	if_addr.s_addr = htonl(INADDR_ANY);
	if ((!interface.empty()) && (interface != "any"))
	{
		if (inet_pton(AF_INET, interface.c_str(), &if_addr) != 1)
		{
			MOTION_ERROR("invalid multicast interface address '" << interface << "'");
			m_socketState = Motion::UDP::Socket::NO_SUCH_HOST;
			disconnect();
			return false;
		}
	}

	int set = 1;
	setsockopt(m_sockfd, SOL_SOCKET, SO_REUSEADDR, (char*)&set, sizeof(set));
#ifdef SO_REUSEPORT
	setsockopt(m_sockfd, SOL_SOCKET, SO_REUSEPORT, (char*)&set, sizeof(set));
#endif

	struct sockaddr_in bind_addr;
	memset(&bind_addr, 0, sizeof(bind_addr));
	bind_addr.sin_family = AF_INET;
	bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
	bind_addr.sin_port = htons(MOTION_UDP_PORT_RECEIVE);
	if (bind(m_sockfd, (const sockaddr*)&bind_addr, sizeof(bind_addr)) != 0)
	{
		m_lasterror = errno;
		MOTION_ERROR("cannot bind multicast socket: " << strerror(m_lasterror));
		disconnect();
		m_socketState = Motion::UDP::Socket::FAILED;
		return false;
	}

	unsigned char ttl = MULTICAST_TTL;
	setsockopt(m_sockfd, IPPROTO_IP, IP_MULTICAST_TTL, (char*)&ttl, sizeof(ttl));
	if (if_addr.s_addr != htonl(INADDR_ANY))
		setsockopt(m_sockfd, IPPROTO_IP, IP_MULTICAST_IF, (char*)&if_addr, sizeof(if_addr));

	struct ip_mreq mreq;
	memset(&mreq, 0, sizeof(mreq));
	inet_pton(AF_INET, MOTION_MULTICAST_IP, &mreq.imr_multiaddr);
	mreq.imr_interface = if_addr;
	if (setsockopt(m_sockfd, IPPROTO_IP, IP_ADD_MEMBERSHIP, (char*)&mreq, sizeof(mreq)) != 0)
	{
		m_lasterror = errno;
		MOTION_ERROR("cannot join multicast group " << MOTION_MULTICAST_IP << ": " << strerror(m_lasterror));
		disconnect();
		m_socketState = Motion::UDP::Socket::FAILED;
		return false;
	}

	m_socketState = Motion::UDP::Socket::MULTICAST;
	return true;
}


int motionUDP::sendto(const std::string &address, const uint16_t port, const unsigned char *buffer, const int size)
{
	struct sockaddr_in dest_addr;
	if (!resolve(address, &dest_addr))
		return -1;
	dest_addr.sin_port = htons(port);

	int numbytes = (int)::sendto(m_sockfd, buffer, size, 0, (const sockaddr*)&dest_addr, sizeof(dest_addr));
	if (numbytes < 0)
		m_lasterror = errno;
	return numbytes;
}


int motionUDP::receive(unsigned char *buffer, const int maxsize, const int timeout, std::string *source)
{
	m_lasterror = EAGAIN;
	if (m_sockfd < 0)
		return -1;

	if (getSocketEvents(POLLIN, timeout) != 0)
		return -1;

	struct sockaddr_in src_addr;
	socklen_t addrlen = sizeof(src_addr);
	int numbytes = (int)recvfrom(m_sockfd, buffer, maxsize, 0, (sockaddr*)&src_addr, &addrlen);
	if (numbytes < 0)
	{
		m_lasterror = errno;
		return numbytes;
	}

	if (source)
	{
		char cAddress[INET_ADDRSTRLEN];
		if (inet_ntop(AF_INET, &src_addr.sin_addr, cAddress, sizeof(cAddress)))
			*source = cAddress;
		else
			source->clear();
	}
	m_lasterror = 0;
	return numbytes;
}


int motionUDP::getlasterror()
{
	return m_lasterror;
}


void motionUDP::disconnect()
{
	if (m_sockfd >= 0)
		close(m_sockfd);
	m_sockfd = -1;
	if ((m_socketState == Motion::UDP::Socket::UNICAST) || (m_socketState == Motion::UDP::Socket::MULTICAST))
		m_socketState = Motion::UDP::Socket::CLOSED;
}


/* private */ bool motionUDP::resolve(const std::string &hostname, struct sockaddr_in *address)
{
	memset(address, 0, sizeof(sockaddr_in));
	address->sin_family = AF_INET;

	if (hostname.empty())
	{
		m_lasterror = EINVAL;
		return false;
	}

	if ((hostname[0] ^ 0x30) < 10)
	{
		if (inet_pton(AF_INET, hostname.c_str(), &address->sin_addr) == 1)
			return true;
	}

	struct addrinfo hints;
	memset(&hints, 0, sizeof(hints));
	hints.ai_family = AF_INET;
	hints.ai_socktype = SOCK_DGRAM;
	struct addrinfo *result;
	if (getaddrinfo(hostname.c_str(), nullptr, &hints, &result) != 0)
	{
		m_lasterror = EHOSTUNREACH;
		m_socketState = Motion::UDP::Socket::NO_SUCH_HOST;
		return false;
	}
	memcpy(address, result->ai_addr, sizeof(sockaddr_in));
	freeaddrinfo(result);
	return true;
}


/* private */ int motionUDP::getSocketEvents(short events, int timeout)
{
	struct pollfd fds;
	fds.fd = m_sockfd;
	fds.events = events;
	fds.revents = 0;
	int result = poll(&fds, 1, timeout);
	if (result > 0)
	{
		if (fds.revents & (POLLERR | POLLHUP))
		{
			// try to get socket error
			m_lasterror = EIO;
			int sockerr;
			socklen_t len = sizeof sockerr;
			if (getsockopt(m_sockfd, SOL_SOCKET, SO_ERROR, (char *)&sockerr, &len) >= 0)
			{
				if (sockerr > 0)
					m_lasterror = sockerr;
			}
			return m_lasterror;
		}
		else if (fds.revents & events)
		{
			m_lasterror = 0;
			return m_lasterror;
		}
	}
	else if (result == 0)
	{
		m_lasterror = EAGAIN;
		return -1;
	}
	else
	{
		m_lasterror = errno;
		m_socketState = Motion::UDP::Socket::FAILED;
	}
	return -1;
}
