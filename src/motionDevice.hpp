/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Typed device state
 *
 *  Wire values are small integers. Anything outside the values listed here
 *  maps to `Unknown`; such values are logged once when a field first turns
 *  Unknown and are otherwise accepted.
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionDevice
#define _motionDevice

#define MOTION_DEFAULT_MAX_ANGLE 180
#define MOTION_REDUCED_MAX_ANGLE 90
#define MOTION_BATTERY_AC_VOLTAGE 220.0
#define MOTION_BATTERY_OUT_OF_RANGE 200.0

#include <string>
#include <ctime>


namespace Motion {

enum class GatewayStatus {
	Unknown = -1,
	Working = 1,
	Pairing = 2,
	Updating = 3
};

enum class BlindType {
	Unknown = -1,
	RollerBlind = 1,
	VenetianBlind = 2,
	RomanBlind = 3,
	HoneycombBlind = 4,
	ShangriLaBlind = 5,
	RollerShutter = 6,
	RollerGate = 7,
	Awning = 8,
	TopDownBottomUp = 9,
	DayNightBlind = 10,
	DimmingBlind = 11,
	Curtain = 12,
	CurtainLeft = 13,
	CurtainRight = 14,
	DoubleRoller = 17,
	VerticalBlind = 18,
	WoodShutter = 19,
	SkylightBlind = 20,
	VerticalBlindLeft = 21,
	VerticalBlindRight = 22,
	Switch = 43
};

enum class WirelessMode {
	Unknown = -1,
	UniDirection = 0,
	BiDirection = 1,
	BiDirectionLimits = 2,
	WiFi = 3,
	VirtualPercentageLimits = 4
};

enum class VoltageMode {
	Unknown = -1,
	AC = 0,
	DC = 1
};

// motion status as reported, and operation codes as sent
enum class BlindStatus {
	Unknown = -1,
	Closing = 0,
	Opening = 1,
	Stopped = 2,
	StatusQuery = 5,
	JogUp = 7,
	JogDown = 8
};

enum class LimitStatus {
	Unknown = -1,
	NoLimit = 0,
	TopLimit = 1,
	BottomLimit = 2,
	Limits = 3,
	Limit3 = 4
};

// motor selector of a top-down/bottom-up blind
enum class Motor {
	Top,
	Bottom,
	Combined
};

// Each returns false when `raw` is not a known value; `value` is then Unknown
bool toGatewayStatus(const int raw, GatewayStatus &value);
bool toBlindType(const int raw, BlindType &value);
bool toWirelessMode(const int raw, WirelessMode &value);
bool toVoltageMode(const int raw, VoltageMode &value);
bool toBlindStatus(const int raw, BlindStatus &value);
bool toLimitStatus(const int raw, LimitStatus &value);

const char* toString(const GatewayStatus value);
const char* toString(const BlindType value);
const char* toString(const WirelessMode value);
const char* toString(const VoltageMode value);
const char* toString(const BlindStatus value);
const char* toString(const LimitStatus value);

/*
 * Battery percentage for a pack voltage, by pack size:
 *   <= 9.4V   2 cells, 6.2V .. 8.4V
 *   <= 13.6V  3 cells, 10.4V .. 12.6V
 *   <= 19.0V  4 cells, 14.6V .. 16.8V
 * Returns false for 220V (mains powered, no percentage). Voltages at or
 * below zero give 0%, any other voltage gives MOTION_BATTERY_OUT_OF_RANGE.
 */
bool CalculateBatteryLevel(const double voltage, double &level);


struct GatewayState
{
	std::string mac;
	std::string device_type;
	std::string protocol_version;
	std::string firmware_version;
	GatewayStatus status = GatewayStatus::Unknown;
	int device_count = 0;
	int rssi = 0;
	bool available = false;
	bool status_reported_unknown = false;
};

struct MotorState
{
	BlindStatus status = BlindStatus::Unknown;
	LimitStatus limit_status = LimitStatus::Unknown;
	int position = 0;
	bool has_position = false;
	double battery_voltage = 0.0;
	double battery_level = 0.0;
	bool has_battery_level = false;
	bool charging = false;
};

// fields whose last Unknown value has been logged already
enum UnknownField {
	UNKNOWN_BLIND_TYPE = 0x01,
	UNKNOWN_WIRELESS_MODE = 0x02,
	UNKNOWN_VOLTAGE_MODE = 0x04,
	UNKNOWN_STATUS = 0x08,
	UNKNOWN_LIMIT_STATUS = 0x10,
	UNKNOWN_STATUS_TOP = 0x20,
	UNKNOWN_LIMIT_STATUS_TOP = 0x40,
	UNKNOWN_STATUS_BOTTOM = 0x80,
	UNKNOWN_LIMIT_STATUS_BOTTOM = 0x100
};

struct CoverState
{
	std::string device_type;
	BlindType type = BlindType::Unknown;
	WirelessMode wireless_mode = WirelessMode::Unknown;
	VoltageMode voltage_mode = VoltageMode::Unknown;

	// single motor, also holds the shared battery of a standard blind
	MotorState motor;

	// top-down/bottom-up blinds
	MotorState top;
	MotorState bottom;

	double angle = 0.0;
	int restore_angle = 0;  // raw, last nonzero angle reported
	int max_angle = MOTION_DEFAULT_MAX_ANGLE;

	int rssi = 0;
	bool available = false;
	time_t last_report = 0;

	unsigned int reported_unknown = 0;
};

}; // namespace Motion

#endif
