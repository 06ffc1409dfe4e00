/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Response parsing
 *
 *	These functions map a decoded gateway reply or push onto the typed
 *	state structures of motionDevice.hpp. They hold no state of their own:
 *	the previous state is passed in and updated in place, so fields the
 *	message does not carry keep their value.
 *
 *	Replies carrying `actionResult` are error signals and leave the state
 *	untouched. Unknown enum values are stored as Unknown. A message whose
 *	fields cannot be read as the protocol describes is logged in full
 *	(with the token redacted) and reported as Motion::ParseError.
 *
 *	Functions:
 *	 - ParseDeviceList(response, state, list)
 *		GetDeviceListAck: gateway mac, type, versions, token and children
 *	 - ParseGatewayStatus(response, state)
 *		ReadDeviceAck, Report or Heartbeat of the gateway itself
 *	 - ParseCover(response, state, dualMotor)
 *		Any reply or push for a blind. `dualMotor` selects the `_T`/`_B`
 *		field set of top-down/bottom-up blinds. The parser does not check
 *		that the top rail is above the bottom rail; only commands do.
 *	Each returns false if the message was an error signal and was skipped.
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionParser
#define _motionParser

#include "motionDevice.hpp"
#include <json/json.h>
#include <string>
#include <vector>


namespace Motion {
  namespace Parser {

	struct DeviceListEntry
	{
		std::string mac;
		std::string device_type;
	};

	struct DeviceList
	{
		std::string token;
		std::vector<DeviceListEntry> devices;
	};

	bool ParseDeviceList(const Json::Value &response, GatewayState &state, DeviceList &list);
	bool ParseGatewayStatus(const Json::Value &response, GatewayState &state);
	bool ParseCover(const Json::Value &response, CoverState &state, const bool dualMotor);

	bool isKnownCoverType(const std::string &deviceType);

  }; // namespace Parser
}; // namespace Motion

#endif
