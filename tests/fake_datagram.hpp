/*
 *  In-memory stand-in for the gateway's UDP network
 *
 *  Every socket handed out by FakeNetwork::factory() talks to the same
 *  FakeNetwork. A unicast send is answered at once by the network's
 *  responder; a socket with nothing left to read reports EAGAIN without
 *  waiting. Multicast sockets read the `pushes` queue and do wait up to
 *  their timeout for a push to show up.
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _fake_datagram
#define _fake_datagram

#include "motionUDP.hpp"
#include "motionMessage.hpp"
#include <json/json.h>
#include <string>
#include <vector>
#include <deque>
#include <mutex>
#include <condition_variable>
#include <chrono>
#include <functional>
#include <memory>
#include <cstring>
#include <errno.h>


struct SentDatagram
{
	std::string address;
	uint16_t port;
	std::string payload;

	Json::Value json() const { return Motion::Message::decode(payload); }
};

struct Datagram
{
	std::string source;
	std::string payload;
};


class FakeNetwork : public std::enable_shared_from_this<FakeNetwork>
{
public:
	// replies to one unicast request, none simulates a lost request
	typedef std::function<std::vector<std::string>(const Json::Value &request)> Responder;

	FakeNetwork() : unicast_opens(0), multicast_opens(0), fail_multicast(false) {}

	motionDatagramFactory factory();

	void push(const std::string &source, const std::string &payload)
	{
		{
			std::lock_guard<std::mutex> lock(mutex);
			pushes.push_back(Datagram{source, payload});
		}
		cv.notify_all();
	}

	void push(const std::string &source, const Json::Value &message)
	{
		push(source, Motion::Message::encode(message));
	}

	std::vector<SentDatagram> getSent()
	{
		std::lock_guard<std::mutex> lock(mutex);
		return sent;
	}

	std::mutex mutex;
	std::condition_variable cv;
	Responder responder;
	std::vector<SentDatagram> sent;
	std::deque<Datagram> pushes;
	int unicast_opens;
	int multicast_opens;
	bool fail_multicast;
};


class FakeDatagram : public motionDatagram
{
public:
	explicit FakeDatagram(std::shared_ptr<FakeNetwork> network) :
		m_network(network),
		m_multicast(false),
		m_open(false),
		m_lasterror(0)
	{
	}

	bool OpenUnicast() override
	{
		std::lock_guard<std::mutex> lock(m_network->mutex);
		m_network->unicast_opens++;
		m_multicast = false;
		m_open = true;
		return true;
	}

	bool OpenMulticast(const std::string &) override
	{
		std::lock_guard<std::mutex> lock(m_network->mutex);
		m_network->multicast_opens++;
		if (m_network->fail_multicast)
		{
			m_lasterror = EADDRINUSE;
			return false;
		}
		m_multicast = true;
		m_open = true;
		return true;
	}

	int sendto(const std::string &address, const uint16_t port, const unsigned char *buffer, const int size) override
	{
		std::string payload((const char*)buffer, size);
		FakeNetwork::Responder responder;
		{
			std::lock_guard<std::mutex> lock(m_network->mutex);
			m_network->sent.push_back(SentDatagram{address, port, payload});
			responder = m_network->responder;
		}
		if (responder)
		{
			std::vector<std::string> replies = responder(Motion::Message::decode(payload));
			for (const std::string &reply : replies)
				m_inbox.push_back(Datagram{address, reply});
		}
		return size;
	}

	int receive(unsigned char *buffer, const int maxsize, const int timeout, std::string *source = nullptr) override
	{
		if (!m_open)
		{
			m_lasterror = EBADF;
			return -1;
		}

		Datagram datagram;
		if (!m_inbox.empty())
		{
			datagram = m_inbox.front();
			m_inbox.pop_front();
		}
		else if (m_multicast)
		{
			std::unique_lock<std::mutex> lock(m_network->mutex);
			if (!m_network->cv.wait_for(lock, std::chrono::milliseconds(timeout), [this] { return !m_network->pushes.empty(); }))
			{
				m_lasterror = EAGAIN;
				return -1;
			}
			datagram = m_network->pushes.front();
			m_network->pushes.pop_front();
		}
		else
		{
			m_lasterror = EAGAIN;
			return -1;
		}

		int numbytes = ((int)datagram.payload.size() < maxsize) ? (int)datagram.payload.size() : maxsize;
		memcpy(buffer, datagram.payload.data(), numbytes);
		if (source)
			*source = datagram.source;
		m_lasterror = 0;
		return numbytes;
	}

	int getlasterror() override { return m_lasterror; }

	void disconnect() override
	{
		m_open = false;
		m_inbox.clear();
	}

private:
	std::shared_ptr<FakeNetwork> m_network;
	std::deque<Datagram> m_inbox;
	bool m_multicast;
	bool m_open;
	int m_lasterror;
};


inline motionDatagramFactory FakeNetwork::factory()
{
	std::shared_ptr<FakeNetwork> network = shared_from_this();
	return [network]() { return std::unique_ptr<motionDatagram>(new FakeDatagram(network)); };
}


// A reply padded with spaces to exactly `size` bytes, still valid JSON
inline std::string padded(const Json::Value &message, const size_t size)
{
	std::string payload = Motion::Message::encode(message);
	if (payload.size() < size)
		payload.append(size - payload.size(), ' ');
	return payload;
}

#endif
