/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Response parsing
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionParser.hpp"
#include "motionMessage.hpp"
#include "motionErrors.hpp"
#include "motionLog.hpp"
#include <stdexcept>


namespace {

	// Logs only when a field turns Unknown, not while it stays Unknown
	void track_unknown(const bool known, const int raw, const char *field, const std::string &mac, const unsigned int flag, unsigned int &reported)
	{
		if (known)
		{
			reported &= ~flag;
			return;
		}
		if (!(reported & flag))
		{
			MOTION_WARNING("device " << mac << " reported unknown " << field << " " << raw << ", using Unknown");
			reported |= flag;
		}
	}

	bool is_error_signal(const Json::Value &response)
	{
		return response.isMember("actionResult");
	}

	const Json::Value &data_of(const Json::Value &response)
	{
		const Json::Value &data = response["data"];
		if (!data.isObject())
			throw std::invalid_argument("'data' is missing or not an object");
		return data;
	}

	void parse_status(const Json::Value &data, const char *key, Motion::MotorState &motor, const std::string &mac, const unsigned int flag, unsigned int &reported)
	{
		if (!data.isMember(key))
			return;
		int raw = data[key].asInt();
		bool known = Motion::toBlindStatus(raw, motor.status);
		track_unknown(known, raw, key, mac, flag, reported);
	}

	void parse_limit_status(const Json::Value &data, const char *key, Motion::MotorState &motor, const std::string &mac, const unsigned int flag, unsigned int &reported)
	{
		if (!data.isMember(key))
			return;
		int raw = data[key].asInt();
		bool known = Motion::toLimitStatus(raw, motor.limit_status);
		track_unknown(known, raw, key, mac, flag, reported);
	}

	void parse_battery(const Json::Value &data, const char *key, const char *chargingkey, Motion::MotorState &motor, const std::string &mac)
	{
		if (data.isMember(chargingkey))
			motor.charging = (data[chargingkey].asInt() != 0);

		if (!data.isMember(key))
			return;
		motor.battery_voltage = data[key].asInt() / 100.0;
		motor.has_battery_level = Motion::CalculateBatteryLevel(motor.battery_voltage, motor.battery_level);
		if (motor.has_battery_level && (motor.battery_level >= MOTION_BATTERY_OUT_OF_RANGE))
			MOTION_WARNING("device " << mac << " reported battery voltage " << motor.battery_voltage << "V outside the known battery ranges");
	}

	void parse_position(const Json::Value &data, const char *key, Motion::MotorState &motor)
	{
		motor.has_position = data.isMember(key);
		motor.position = motor.has_position ? data[key].asInt() : 1;
	}

	void parse_cover(const Json::Value &response, Motion::CoverState &state, const bool dualMotor)
	{
		const std::string mac = response["mac"].asString();
		const Json::Value &data = data_of(response);

		if (response.isMember("deviceType"))
		{
			const std::string deviceType = response["deviceType"].asString();
			if (!Motion::Parser::isKnownCoverType(deviceType))
				MOTION_WARNING("device type " << deviceType << " of " << mac << " is not a known blind type, trying anyway");
		}

		if (data.isMember("type"))
		{
			int raw = data["type"].asInt();
			bool known = Motion::toBlindType(raw, state.type);
			track_unknown(known, raw, "blind type", mac, Motion::UNKNOWN_BLIND_TYPE, state.reported_unknown);
		}
		else
		{
			MOTION_INFO("device " << mac << " did not report a blind type, assuming RollerBlind");
			state.type = Motion::BlindType::RollerBlind;
		}

		if (data.isMember("wirelessMode"))
		{
			int raw = data["wirelessMode"].asInt();
			bool known = Motion::toWirelessMode(raw, state.wireless_mode);
			track_unknown(known, raw, "wireless mode", mac, Motion::UNKNOWN_WIRELESS_MODE, state.reported_unknown);
		}

		if (data.isMember("voltageMode"))
		{
			int raw = data["voltageMode"].asInt();
			bool known = Motion::toVoltageMode(raw, state.voltage_mode);
			track_unknown(known, raw, "voltage mode", mac, Motion::UNKNOWN_VOLTAGE_MODE, state.reported_unknown);
		}

		// this model reports its angle on a 0-90 scale
		if (state.type == Motion::BlindType::ShangriLaBlind)
			state.max_angle = MOTION_REDUCED_MAX_ANGLE;

		state.available = true;

		if (state.wireless_mode == Motion::WirelessMode::UniDirection)
		{
			// send-only radio: only the echoed operation is known
			if (dualMotor)
			{
				parse_status(data, "operation_T", state.top, mac, Motion::UNKNOWN_STATUS_TOP, state.reported_unknown);
				parse_status(data, "operation_B", state.bottom, mac, Motion::UNKNOWN_STATUS_BOTTOM, state.reported_unknown);
			}
			else
				parse_status(data, "operation", state.motor, mac, Motion::UNKNOWN_STATUS, state.reported_unknown);
			return;
		}

		if (data.isMember("RSSI"))
			state.rssi = data["RSSI"].asInt();

		if (dualMotor)
		{
			parse_status(data, "operation_T", state.top, mac, Motion::UNKNOWN_STATUS_TOP, state.reported_unknown);
			parse_status(data, "operation_B", state.bottom, mac, Motion::UNKNOWN_STATUS_BOTTOM, state.reported_unknown);
			parse_limit_status(data, "currentState_T", state.top, mac, Motion::UNKNOWN_LIMIT_STATUS_TOP, state.reported_unknown);
			parse_limit_status(data, "currentState_B", state.bottom, mac, Motion::UNKNOWN_LIMIT_STATUS_BOTTOM, state.reported_unknown);
			parse_battery(data, "batteryLevel_T", "chargingState_T", state.top, mac);
			parse_battery(data, "batteryLevel_B", "chargingState_B", state.bottom, mac);
		}
		else
		{
			parse_status(data, "operation", state.motor, mac, Motion::UNKNOWN_STATUS, state.reported_unknown);
			parse_limit_status(data, "currentState", state.motor, mac, Motion::UNKNOWN_LIMIT_STATUS, state.reported_unknown);
			parse_battery(data, "batteryLevel", "chargingState", state.motor, mac);
		}

		if (state.wireless_mode == Motion::WirelessMode::BiDirectionLimits)
			return;

		if (state.wireless_mode == Motion::WirelessMode::VirtualPercentageLimits)
		{
			bool limits = dualMotor ?
				((state.top.limit_status == Motion::LimitStatus::Limits) && (state.bottom.limit_status == Motion::LimitStatus::Limits)) :
				(state.motor.limit_status == Motion::LimitStatus::Limits);
			if (!limits)
			{
				MOTION_WARNING("device " << mac << " has no limits detected, ignoring its position");
				return;
			}
		}

		if (dualMotor)
		{
			parse_position(data, "currentPosition_T", state.top);
			parse_position(data, "currentPosition_B", state.bottom);
			return;
		}

		parse_position(data, "currentPosition", state.motor);
		if (data.isMember("currentAngle"))
		{
			int raw = data["currentAngle"].asInt();
			state.angle = raw * (180.0 / state.max_angle);
			if (raw != 0)
				state.restore_angle = raw;
		}
	}

}; // namespace


bool Motion::Parser::isKnownCoverType(const std::string &deviceType)
{
	return ((deviceType == MOTION_DEVICE_TYPE_BLIND) ||
		(deviceType == MOTION_DEVICE_TYPE_TDBU) ||
		(deviceType == MOTION_DEVICE_TYPE_DR) ||
		Motion::Message::isWifiType(deviceType));
}


bool Motion::Parser::ParseDeviceList(const Json::Value &response, GatewayState &state, DeviceList &list)
{
	if (is_error_signal(response))
		return false;

	try
	{
		const std::string msgType = response["msgType"].asString();
		if (msgType != MOTION_MSG_GET_DEVICE_LIST_ACK)
			throw std::invalid_argument("reply is a '" + msgType + "', not a " MOTION_MSG_GET_DEVICE_LIST_ACK);

		const std::string mac = response["mac"].asString();
		if (mac.empty())
			throw std::invalid_argument("reply has no gateway mac");

		const std::string deviceType = response["deviceType"].asString();
		if (!Motion::Message::isControllerType(deviceType))
			MOTION_WARNING("device type " << deviceType << " does not correspond to a gateway");

		const Json::Value &devices = response["data"];
		if (!devices.isArray())
			throw std::invalid_argument("'data' is missing or not a list");

		DeviceList parsed;
		parsed.token = response["token"].asString();
		for (Json::ArrayIndex i = 0; i < devices.size(); i++)
		{
			DeviceListEntry entry;
			entry.mac = devices[i]["mac"].asString();
			entry.device_type = devices[i]["deviceType"].asString();
			if (entry.mac.empty())
				throw std::invalid_argument("device entry without mac");
			parsed.devices.push_back(entry);
		}

		state.mac = mac;
		state.device_type = deviceType;
		state.protocol_version = response["ProtocolVersion"].asString();
		if (response.isMember("fwVersion"))
			state.firmware_version = response["fwVersion"].asString();
		state.available = true;
		list = parsed;
	}
	catch (const std::exception &e)
	{
		MOTION_ERROR("cannot parse device list: " << e.what() << ", response: " << Motion::Message::describe(response));
		throw Motion::ParseError(std::string("cannot parse device list: ") + e.what());
	}
	return true;
}


bool Motion::Parser::ParseGatewayStatus(const Json::Value &response, GatewayState &state)
{
	if (is_error_signal(response))
		return false;

	try
	{
		const Json::Value &data = data_of(response);
		GatewayState parsed = state;

		if (response.isMember("deviceType") && !Motion::Message::isControllerType(response["deviceType"].asString()))
			MOTION_WARNING("device type " << response["deviceType"].asString() << " does not correspond to a gateway");

		if (data.isMember("currentState"))
		{
			int raw = data["currentState"].asInt();
			if (Motion::toGatewayStatus(raw, parsed.status))
				parsed.status_reported_unknown = false;
			else if (!parsed.status_reported_unknown)
			{
				MOTION_WARNING("gateway " << parsed.mac << " reported unknown status " << raw << ", using Unknown");
				parsed.status_reported_unknown = true;
			}
		}
		if (data.isMember("numberOfDevices"))
			parsed.device_count = data["numberOfDevices"].asInt();
		if (data.isMember("RSSI"))
			parsed.rssi = data["RSSI"].asInt();
		parsed.available = true;
		state = parsed;
	}
	catch (const std::exception &e)
	{
		MOTION_ERROR("cannot parse gateway status: " << e.what() << ", response: " << Motion::Message::describe(response));
		throw Motion::ParseError(std::string("cannot parse gateway status: ") + e.what());
	}
	return true;
}


bool Motion::Parser::ParseCover(const Json::Value &response, CoverState &state, const bool dualMotor)
{
	if (is_error_signal(response))
		return false;

	// work on a copy so a failing message leaves no half applied state
	CoverState parsed = state;
	try
	{
		parse_cover(response, parsed, dualMotor);
	}
	catch (const std::exception &e)
	{
		MOTION_ERROR("cannot parse blind state: " << e.what() << ", response: " << Motion::Message::describe(response));
		throw Motion::ParseError(std::string("cannot parse blind state: ") + e.what());
	}
	state = parsed;
	return true;
}
