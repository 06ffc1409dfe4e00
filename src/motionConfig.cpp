/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Settings file
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionConfig.hpp"
#include "motionErrors.hpp"
#include <json/json.h>
#include <fstream>
#include <sstream>
#include <memory>


namespace {
	std::string lowercase(const std::string &name)
	{
		std::string lowername = name;
		for (int i = 0; i < (int)lowername.length(); i++)
		{
			if (lowername[i] & 0x40)
				lowername[i] = lowername[i] | 0x20;
		}
		return lowername;
	}

	int seconds_to_ms(const Json::Value &value, const int fallback)
	{
		if (value.isNull())
			return fallback;
		if (!value.isNumeric())
			throw Motion::ParseError("time values must be numbers of seconds");
		int ms = (int)(value.asDouble() * 1000.0);
		return (ms > 0) ? ms : fallback;
	}
}


Motion::Config::Settings Motion::Config::LoadConfig(const std::string &path)
{
	std::ifstream myfile(path);
	if (!myfile.is_open())
		throw Motion::DecodeError("cannot open settings file " + path);

	std::stringstream szFileContent;
	szFileContent << myfile.rdbuf();
	myfile.close();
	return ParseConfig(szFileContent.str());
}


Motion::Config::Settings Motion::Config::ParseConfig(const std::string &content)
{
	Json::Value jSettings;
	std::string szErrors;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	if (!jReader->parse(content.c_str(), content.c_str() + content.size(), &jSettings, &szErrors) || !jSettings.isObject())
		throw Motion::DecodeError("settings are not a JSON object: " + szErrors);

	Settings settings;
	if (jSettings.isMember("interface"))
		settings.interface = jSettings["interface"].asString();
	settings.timeout_ms = seconds_to_ms(jSettings["timeout"], settings.timeout_ms);
	settings.discovery_window_ms = seconds_to_ms(jSettings["discovery_window"], settings.discovery_window_ms);

	const Json::Value &jGateways = jSettings["gateways"];
	if (jGateways.isNull())
		return settings;
	if (!jGateways.isArray())
		throw Motion::ParseError("'gateways' must be a list");

	for (Json::ArrayIndex i = 0; i < jGateways.size(); i++)
	{
		const Json::Value &jGateway = jGateways[i];
		if (!jGateway.isObject())
			throw Motion::ParseError("gateway entry " + std::to_string(i) + " is not an object");

		GatewayEntry entry;
		entry.name = lowercase(jGateway.get("name", "").asString());
		entry.address = jGateway.get("address", "").asString();
		entry.key = jGateway.get("key", "").asString();
		if (entry.address.empty() || entry.key.empty())
			throw Motion::ParseError("gateway entry " + std::to_string(i) + " needs both an address and a key");
		settings.gateways.push_back(entry);
	}
	return settings;
}


bool Motion::Config::FindGateway(const Settings &settings, const std::string &name, GatewayEntry &entry)
{
	std::string lowername = lowercase(name);
	for (const GatewayEntry &gateway : settings.gateways)
	{
		if ((gateway.name == lowername) || (gateway.address == name))
		{
			entry = gateway;
			return true;
		}
	}
	return false;
}
