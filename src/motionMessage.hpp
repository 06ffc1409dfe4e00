/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Request envelopes and JSON decoding
 *
 *	Requests are single JSON objects carried in one UDP datagram:
 *	 - GetDeviceList()
 *		Unauthenticated, answered with GetDeviceListAck holding the gateway
 *		mac, its session token and the list of attached devices
 *	 - ReadDevice(mac, deviceType)
 *		Unauthenticated, answered with the gateway's cached device state
 *	 - WriteDevice(mac, deviceType, accessToken, data)
 *		Authenticated command, `data` holds the command fields
 *
 *	Every request carries a msgID, the current UTC time in the
 *	`YYYYDDMMHHMMSSmmm` form the gateway firmware uses.
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionMessage
#define _motionMessage

// Motion gateway UDP ports
#define MOTION_UDP_PORT_SEND 32100
#define MOTION_UDP_PORT_RECEIVE 32101

#define MOTION_MULTICAST_IP "238.0.0.18"

// replies of 90% of this size or larger are followed by another datagram
#define MOTION_SOCKET_BUFSIZE 2048
#define MOTION_FRAGMENT_THRESHOLD ((MOTION_SOCKET_BUFSIZE * 9) / 10)

// message types
#define MOTION_MSG_GET_DEVICE_LIST "GetDeviceList"
#define MOTION_MSG_GET_DEVICE_LIST_ACK "GetDeviceListAck"
#define MOTION_MSG_READ_DEVICE "ReadDevice"
#define MOTION_MSG_READ_DEVICE_ACK "ReadDeviceAck"
#define MOTION_MSG_WRITE_DEVICE "WriteDevice"
#define MOTION_MSG_WRITE_DEVICE_ACK "WriteDeviceAck"
#define MOTION_MSG_REPORT "Report"
#define MOTION_MSG_HEARTBEAT "Heartbeat"

// device type codes
#define MOTION_DEVICE_TYPE_GATEWAY "02000002"
#define MOTION_DEVICE_TYPE_GATEWAY_OLD "02000001"
#define MOTION_DEVICE_TYPE_BLIND "10000000"
#define MOTION_DEVICE_TYPE_TDBU "10000001"
#define MOTION_DEVICE_TYPE_DR "10000002"
#define MOTION_DEVICE_TYPE_WIFI_CURTAIN "22000000"
#define MOTION_DEVICE_TYPE_WIFI_TUBULAR "22000002"
#define MOTION_DEVICE_TYPE_WIFI_RECEIVER "22000005"

#include <json/json.h>
#include <string>


namespace Motion {
  namespace Message {

	std::string timestamp();

	Json::Value GetDeviceList();
	Json::Value ReadDevice(const std::string &mac, const std::string &deviceType);
	Json::Value WriteDevice(const std::string &mac, const std::string &deviceType, const std::string &accessToken, const Json::Value &data);

	// compact single line JSON
	std::string encode(const Json::Value &message);

	// Throws Motion::DecodeError unless the buffer holds a JSON object
	Json::Value decode(const char *buffer, const int size);
	Json::Value decode(const std::string &payload);

	// Masks token and AccessToken values, keeping their length
	Json::Value redact(const Json::Value &message);
	std::string redact(const std::string &payload);

	// redacted compact JSON, for log lines
	std::string describe(const Json::Value &message);

	bool isGatewayType(const std::string &deviceType);
	bool isWifiType(const std::string &deviceType);
	bool isControllerType(const std::string &deviceType);

  }; // namespace Message
}; // namespace Motion

#endif
