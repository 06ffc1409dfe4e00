/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Gateway discovery
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionDiscovery.hpp"
#include "motionMessage.hpp"
#include "motionErrors.hpp"
#include "motionLog.hpp"
#include <chrono>
#include <cstring>
#include <errno.h>


motionDiscovery::motionDiscovery(const std::string &interface, motionDatagramFactory factory) :
	m_interface(interface),
	m_factory(factory)
{
}


std::map<std::string, Json::Value> motionDiscovery::discover(const int window_ms)
{
	std::map<std::string, Json::Value> discovered;

	std::unique_ptr<motionDatagram> udpclient = m_factory();
	if (!udpclient->OpenMulticast(m_interface))
		throw Motion::Error(std::string("cannot open multicast socket for discovery: ") + strerror(udpclient->getlasterror()));

	std::string szPayload = Motion::Message::encode(Motion::Message::GetDeviceList());
	if (udpclient->sendto(MOTION_MULTICAST_IP, MOTION_UDP_PORT_SEND, (const unsigned char*)szPayload.c_str(), (int)szPayload.length()) < 0)
	{
		int lasterror = udpclient->getlasterror();
		udpclient->disconnect();
		throw Motion::Error(std::string("cannot send discovery request: ") + strerror(lasterror));
	}

	std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(window_ms);
	unsigned char message_buffer[MOTION_SOCKET_BUFSIZE];
	std::string source;
	while (true)
	{
		int remaining = (int)std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
		if (remaining <= 0)
			break;

		int numbytes = udpclient->receive(message_buffer, MOTION_SOCKET_BUFSIZE, remaining, &source);
		if (numbytes < 0)
		{
			if (udpclient->getlasterror() != EAGAIN)
				MOTION_ERROR("error receiving discovery replies: " << strerror(udpclient->getlasterror()));
			break;
		}

		Json::Value jReply;
		try
		{
			jReply = Motion::Message::decode((const char*)message_buffer, numbytes);
		}
		catch (const Motion::DecodeError &e)
		{
			MOTION_WARNING("discovery reply from " << source << " cannot be decoded: " << e.what());
			continue;
		}

		const std::string msgType = jReply.get("msgType", "").asString();
		if (msgType == MOTION_MSG_HEARTBEAT)
			continue;
		if (msgType != MOTION_MSG_GET_DEVICE_LIST_ACK)
		{
			MOTION_ERROR("discovery reply from " << source << " is a '" << msgType << "', not a " << MOTION_MSG_GET_DEVICE_LIST_ACK);
			continue;
		}
		const std::string deviceType = jReply.get("deviceType", "").asString();
		if (!Motion::Message::isControllerType(deviceType))
		{
			MOTION_WARNING("discovered device " << source << " has type " << deviceType << ", which does not correspond to a gateway");
			continue;
		}

		MOTION_DEBUG("discovered gateway " << source << ": " << Motion::Message::describe(jReply));
		discovered[source] = jReply;
	}

	udpclient->disconnect();

	if (discovered.empty())
		MOTION_WARNING("no Motion gateways discovered within " << window_ms << " ms");
	return discovered;
}
