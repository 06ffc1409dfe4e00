/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Request envelopes and JSON decoding
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#define REDACT_PLACEHOLDER '*'

#include "motionMessage.hpp"
#include "motionErrors.hpp"
#include <chrono>
#include <ctime>
#include <cctype>
#include <cstdio>
#include <memory>


namespace {
	const char* const redacted_keys[] = { "token", "AccessToken" };

	bool is_redacted_key(const std::string &key)
	{
		for (const char *redacted : redacted_keys)
		{
			if (key == redacted)
				return true;
		}
		return false;
	}

	std::string mask(const std::string &value)
	{
		std::string masked = value;
		for (size_t i = 0; i < masked.length(); i++)
		{
			if (isalnum((unsigned char)masked[i]))
				masked[i] = REDACT_PLACEHOLDER;
		}
		return masked;
	}
}


std::string Motion::Message::timestamp()
{
	std::chrono::system_clock::time_point now = std::chrono::system_clock::now();
	time_t seconds = std::chrono::system_clock::to_time_t(now);
	int millis = (int)(std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

	struct tm utc;
	gmtime_r(&seconds, &utc);

	// year, day, month - the order the gateway uses
	char cTimestamp[32];
	strftime(cTimestamp, sizeof(cTimestamp), "%Y%d%m%H%M%S", &utc);
	char cMillis[4];
	snprintf(cMillis, sizeof(cMillis), "%03d", millis);
	return std::string(cTimestamp) + cMillis;
}


Json::Value Motion::Message::GetDeviceList()
{
	Json::Value message;
	message["msgType"] = MOTION_MSG_GET_DEVICE_LIST;
	message["msgID"] = timestamp();
	return message;
}


Json::Value Motion::Message::ReadDevice(const std::string &mac, const std::string &deviceType)
{
	Json::Value message;
	message["msgType"] = MOTION_MSG_READ_DEVICE;
	message["mac"] = mac;
	message["deviceType"] = deviceType;
	message["msgID"] = timestamp();
	return message;
}


Json::Value Motion::Message::WriteDevice(const std::string &mac, const std::string &deviceType, const std::string &accessToken, const Json::Value &data)
{
	Json::Value message;
	message["msgType"] = MOTION_MSG_WRITE_DEVICE;
	message["mac"] = mac;
	message["deviceType"] = deviceType;
	message["AccessToken"] = accessToken;
	message["msgID"] = timestamp();
	message["data"] = data;
	return message;
}


std::string Motion::Message::encode(const Json::Value &message)
{
	Json::StreamWriterBuilder jBuilder;
	jBuilder["indentation"] = "";
	return Json::writeString(jBuilder, message);
}


Json::Value Motion::Message::decode(const char *buffer, const int size)
{
	if ((buffer == nullptr) || (size <= 0))
		throw Motion::DecodeError("empty message");

	Json::Value jMessage;
	std::string szErrors;
	Json::CharReaderBuilder jBuilder;
	std::unique_ptr<Json::CharReader> jReader(jBuilder.newCharReader());
	if (!jReader->parse(buffer, buffer + size, &jMessage, &szErrors))
		throw Motion::DecodeError("invalid JSON: " + szErrors);
	if (!jMessage.isObject())
		throw Motion::DecodeError("message is not a JSON object");
	return jMessage;
}


Json::Value Motion::Message::decode(const std::string &payload)
{
	return decode(payload.c_str(), (int)payload.length());
}


Json::Value Motion::Message::redact(const Json::Value &message)
{
	Json::Value redacted = message;
	if (redacted.isObject())
	{
		for (const std::string &key : redacted.getMemberNames())
		{
			if (is_redacted_key(key) && redacted[key].isString())
				redacted[key] = mask(redacted[key].asString());
			else if (redacted[key].isObject() || redacted[key].isArray())
				redacted[key] = redact(redacted[key]);
		}
	}
	else if (redacted.isArray())
	{
		for (Json::ArrayIndex i = 0; i < redacted.size(); i++)
			redacted[i] = redact(redacted[i]);
	}
	return redacted;
}


// Raw variant for payloads that failed to decode
std::string Motion::Message::redact(const std::string &payload)
{
	std::string redacted = payload;
	for (const char *key : redacted_keys)
	{
		std::string szPattern = std::string("\"") + key + "\"";
		size_t pos = redacted.find(szPattern);
		while (pos != std::string::npos)
		{
			size_t valuepos = redacted.find_first_not_of(" \t\r\n", pos + szPattern.length());
			if ((valuepos != std::string::npos) && (redacted[valuepos] == ':'))
			{
				valuepos = redacted.find_first_not_of(" \t\r\n", valuepos + 1);
				if ((valuepos != std::string::npos) && (redacted[valuepos] == '"'))
				{
					valuepos++;
					while ((valuepos < redacted.length()) && (redacted[valuepos] != '"'))
					{
						if (isalnum((unsigned char)redacted[valuepos]))
							redacted[valuepos] = REDACT_PLACEHOLDER;
						valuepos++;
					}
				}
			}
			pos = redacted.find(szPattern, pos + szPattern.length());
		}
	}
	return redacted;
}


std::string Motion::Message::describe(const Json::Value &message)
{
	return encode(redact(message));
}


bool Motion::Message::isGatewayType(const std::string &deviceType)
{
	return ((deviceType == MOTION_DEVICE_TYPE_GATEWAY) || (deviceType == MOTION_DEVICE_TYPE_GATEWAY_OLD));
}


bool Motion::Message::isWifiType(const std::string &deviceType)
{
	return ((deviceType == MOTION_DEVICE_TYPE_WIFI_CURTAIN) ||
		(deviceType == MOTION_DEVICE_TYPE_WIFI_TUBULAR) ||
		(deviceType == MOTION_DEVICE_TYPE_WIFI_RECEIVER));
}


bool Motion::Message::isControllerType(const std::string &deviceType)
{
	return (isGatewayType(deviceType) || isWifiType(deviceType));
}
