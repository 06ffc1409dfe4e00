/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Gateway discovery
 *
 *	Sends an unauthenticated GetDeviceList to the multicast group and
 *	collects the GetDeviceListAck replies that arrive within the window,
 *	keyed by the sender's IP address. The window is a hard deadline; what
 *	arrived until then is returned.
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionDiscovery
#define _motionDiscovery

#define MOTION_DISCOVERY_WINDOW_MS 10000

#include "motionUDP.hpp"
#include <json/json.h>
#include <string>
#include <map>


class motionDiscovery
{
public:
	explicit motionDiscovery(const std::string &interface = "any", motionDatagramFactory factory = motionUDP::create);

	// Throws Motion::Error if the multicast socket cannot be opened
	std::map<std::string, Json::Value> discover(const int window_ms = MOTION_DISCOVERY_WINDOW_MS);

private:
	std::string m_interface;
	motionDatagramFactory m_factory;
};

#endif
