/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Unicast request/reply transport
 *
 *	A request is sent from a fresh socket to the gateway's command port and
 *	the replies are read back on the same socket. A reply that fills at
 *	least MOTION_FRAGMENT_THRESHOLD bytes announces that more datagrams
 *	follow; these are collected with a shorter timeout until a smaller one
 *	arrives or the gateway goes quiet.
 *
 *	If nothing at all comes back the whole request is repeated, up to
 *	MOTION_UNICAST_ATTEMPTS times, after which Motion::TimeoutError is
 *	thrown. Timeouts apply per attempt.
 *
 *	Replies carrying `actionResult` are logged as gateway errors. When such
 *	a reply also carries a new session token, the token in the supplied
 *	credentials is replaced so the AccessToken gets derived again on its
 *	next use.
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionUnicast
#define _motionUnicast

#define MOTION_UNICAST_ATTEMPTS 3
#define MOTION_UNICAST_TIMEOUT_MS 3000
#define MOTION_FRAGMENT_TIMEOUT_MS 1000

#include "motionUDP.hpp"
#include "motionCredentials.hpp"
#include <json/json.h>
#include <string>
#include <vector>


class motionUnicast
{
public:
	explicit motionUnicast(motionDatagramFactory factory = motionUDP::create);

	void setTimeout(const int timeout_ms);
	int getTimeout() const { return m_timeout; }

	// single reply; extra fragments are logged and dropped
	Json::Value send(const std::string &address, const Json::Value &message, motionCredentials *credentials = nullptr);

	// all replies in arrival order
	std::vector<Json::Value> sendMultiple(const std::string &address, const Json::Value &message, motionCredentials *credentials = nullptr);

	std::vector<Json::Value> exchange(const std::string &address, const Json::Value &message, const bool expectMultiple, motionCredentials *credentials);

	static void CheckActionResult(const Json::Value &reply, const Json::Value &request, motionCredentials *credentials);

private:
	bool attempt(const std::string &address, const std::string &payload, const bool expectMultiple, std::vector<std::string> &fragments);

	motionDatagramFactory m_factory;
	int m_timeout;
};

#endif
