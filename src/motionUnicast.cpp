/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Unicast request/reply transport
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionUnicast.hpp"
#include "motionMessage.hpp"
#include "motionErrors.hpp"
#include "motionLog.hpp"
#include <cstring>
#include <errno.h>


motionUnicast::motionUnicast(motionDatagramFactory factory) :
	m_factory(factory),
	m_timeout(MOTION_UNICAST_TIMEOUT_MS)
{
}


void motionUnicast::setTimeout(const int timeout_ms)
{
	m_timeout = (timeout_ms > 0) ? timeout_ms : MOTION_UNICAST_TIMEOUT_MS;
}


Json::Value motionUnicast::send(const std::string &address, const Json::Value &message, motionCredentials *credentials)
{
	std::vector<Json::Value> replies = exchange(address, message, false, credentials);
	return replies.front();
}


std::vector<Json::Value> motionUnicast::sendMultiple(const std::string &address, const Json::Value &message, motionCredentials *credentials)
{
	return exchange(address, message, true, credentials);
}


std::vector<Json::Value> motionUnicast::exchange(const std::string &address, const Json::Value &message, const bool expectMultiple, motionCredentials *credentials)
{
	std::string szPayload = Motion::Message::encode(message);
	std::vector<std::string> fragments;

	for (int i = 1; i <= MOTION_UNICAST_ATTEMPTS; i++)
	{
		MOTION_DEBUG("sending to " << address << " (attempt " << i << "): " << Motion::Message::describe(message));
		if (attempt(address, szPayload, expectMultiple, fragments))
			break;
		MOTION_WARNING("timeout of " << m_timeout << " ms on attempt " << i << "/" << MOTION_UNICAST_ATTEMPTS << " waiting for a reply from " << address);
	}

	if (fragments.empty())
	{
		MOTION_ERROR("no reply from " << address << " after " << MOTION_UNICAST_ATTEMPTS << " attempts");
		throw Motion::TimeoutError("no reply from " + address + " after " + std::to_string(MOTION_UNICAST_ATTEMPTS) + " attempts");
	}

	if ((!expectMultiple) && (fragments.size() > 1))
		fragments.resize(1);

	std::vector<Json::Value> replies;
	for (const std::string &fragment : fragments)
	{
		Json::Value jReply;
		try
		{
			jReply = Motion::Message::decode(fragment);
		}
		catch (const Motion::DecodeError &e)
		{
			MOTION_ERROR("cannot decode reply from " << address << ": " << e.what() << ", raw: '" << Motion::Message::redact(fragment) << "'");
			throw;
		}
		MOTION_DEBUG("received from " << address << ": " << Motion::Message::describe(jReply));
		CheckActionResult(jReply, message, credentials);
		replies.push_back(jReply);
	}
	return replies;
}


void motionUnicast::CheckActionResult(const Json::Value &reply, const Json::Value &request, motionCredentials *credentials)
{
	if (!reply.isMember("actionResult"))
		return;

	const Json::Value &result = reply["actionResult"];
	MOTION_ERROR("gateway reported actionResult '" << (result.isString() ? result.asString() : Motion::Message::encode(result)) << "' for request " << Motion::Message::describe(request));

	if ((credentials != nullptr) && reply["token"].isString())
	{
		if (credentials->setToken(reply["token"].asString()))
			MOTION_WARNING("gateway session token changed, AccessToken will be recalculated");
	}
}


// Returns true once at least one datagram was collected
/* private */ bool motionUnicast::attempt(const std::string &address, const std::string &payload, const bool expectMultiple, std::vector<std::string> &fragments)
{
	fragments.clear();

	std::unique_ptr<motionDatagram> udpclient = m_factory();
	if (!udpclient->OpenUnicast())
	{
		MOTION_ERROR("cannot open socket: " << strerror(udpclient->getlasterror()));
		return false;
	}

	if (udpclient->sendto(address, MOTION_UDP_PORT_SEND, (const unsigned char*)payload.c_str(), (int)payload.length()) < 0)
	{
		MOTION_ERROR("error sending to " << address << ": " << strerror(udpclient->getlasterror()));
		udpclient->disconnect();
		return false;
	}

	unsigned char message_buffer[MOTION_SOCKET_BUFSIZE];
	int timeout = m_timeout;
	while (true)
	{
		int numbytes = udpclient->receive(message_buffer, MOTION_SOCKET_BUFSIZE, timeout);
		if (numbytes < 0)
		{
			if (udpclient->getlasterror() != EAGAIN)
				MOTION_ERROR("error reading from " << address << ": " << strerror(udpclient->getlasterror()));
			// a timeout after fragments arrived ends the reply
			break;
		}

		fragments.push_back(std::string((const char*)message_buffer, numbytes));
		if (numbytes < MOTION_FRAGMENT_THRESHOLD)
			break;

		if (!expectMultiple)
			MOTION_ERROR("reply of " << numbytes << " bytes from " << address << " is a fragment, but a single response was expected");
		timeout = (MOTION_FRAGMENT_TIMEOUT_MS < m_timeout) ? MOTION_FRAGMENT_TIMEOUT_MS : m_timeout;
	}

	udpclient->disconnect();
	return !fragments.empty();
}
