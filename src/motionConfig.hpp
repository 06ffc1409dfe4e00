/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Settings file
 *
 *  Gateways and their pairing keys are kept in a JSON file:
 *
 *	{
 *	  "interface": "any",
 *	  "timeout": 3.0,
 *	  "discovery_window": 10,
 *	  "gateways": [
 *	    { "name": "livingroom", "address": "192.168.1.100", "key": "12ab345c-d67e-8f" }
 *	  ]
 *	}
 *
 *  Times are in seconds. All top level fields are optional.
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionConfig
#define _motionConfig

#ifndef SECRETSFILE
#define SECRETSFILE "motion-gateways.json"
#endif

#include <string>
#include <vector>


namespace Motion {
  namespace Config {

	struct GatewayEntry
	{
		std::string name;
		std::string address;
		std::string key;
	};

	struct Settings
	{
		std::string interface = "any";
		int timeout_ms = 3000;
		int discovery_window_ms = 10000;
		std::vector<GatewayEntry> gateways;
	};

	// Throws Motion::DecodeError for unreadable files, Motion::ParseError
	// for gateway entries without address or key
	Settings LoadConfig(const std::string &path = SECRETSFILE);
	Settings ParseConfig(const std::string &content);

	// case insensitive name match
	bool FindGateway(const Settings &settings, const std::string &name, GatewayEntry &entry);

  }; // namespace Config
}; // namespace Motion

#endif
