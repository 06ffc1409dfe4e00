/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Typed device state
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionDevice.hpp"
#include <cmath>


bool Motion::toGatewayStatus(const int raw, GatewayStatus &value)
{
	switch (raw)
	{
		case 1:
		case 2:
		case 3:
			value = static_cast<GatewayStatus>(raw);
			return true;
		default:
			break;
	}
	value = GatewayStatus::Unknown;
	return false;
}


bool Motion::toBlindType(const int raw, BlindType &value)
{
	if (((raw >= 1) && (raw <= 14)) || ((raw >= 17) && (raw <= 22)) || (raw == 43))
	{
		value = static_cast<BlindType>(raw);
		return true;
	}
	value = BlindType::Unknown;
	return false;
}


bool Motion::toWirelessMode(const int raw, WirelessMode &value)
{
	if ((raw >= 0) && (raw <= 4))
	{
		value = static_cast<WirelessMode>(raw);
		return true;
	}
	value = WirelessMode::Unknown;
	return false;
}


bool Motion::toVoltageMode(const int raw, VoltageMode &value)
{
	if ((raw == 0) || (raw == 1))
	{
		value = static_cast<VoltageMode>(raw);
		return true;
	}
	value = VoltageMode::Unknown;
	return false;
}


bool Motion::toBlindStatus(const int raw, BlindStatus &value)
{
	switch (raw)
	{
		case 0:
		case 1:
		case 2:
		case 5:
		case 7:
		case 8:
			value = static_cast<BlindStatus>(raw);
			return true;
		default:
			break;
	}
	value = BlindStatus::Unknown;
	return false;
}


bool Motion::toLimitStatus(const int raw, LimitStatus &value)
{
	if ((raw >= 0) && (raw <= 4))
	{
		value = static_cast<LimitStatus>(raw);
		return true;
	}
	value = LimitStatus::Unknown;
	return false;
}


const char* Motion::toString(const GatewayStatus value)
{
	switch (value)
	{
		case GatewayStatus::Working:
			return "Working";
		case GatewayStatus::Pairing:
			return "Pairing";
		case GatewayStatus::Updating:
			return "Updating";
		default:
			break;
	}
	return "Unknown";
}


const char* Motion::toString(const BlindType value)
{
	switch (value)
	{
		case BlindType::RollerBlind:
			return "RollerBlind";
		case BlindType::VenetianBlind:
			return "VenetianBlind";
		case BlindType::RomanBlind:
			return "RomanBlind";
		case BlindType::HoneycombBlind:
			return "HoneycombBlind";
		case BlindType::ShangriLaBlind:
			return "ShangriLaBlind";
		case BlindType::RollerShutter:
			return "RollerShutter";
		case BlindType::RollerGate:
			return "RollerGate";
		case BlindType::Awning:
			return "Awning";
		case BlindType::TopDownBottomUp:
			return "TopDownBottomUp";
		case BlindType::DayNightBlind:
			return "DayNightBlind";
		case BlindType::DimmingBlind:
			return "DimmingBlind";
		case BlindType::Curtain:
			return "Curtain";
		case BlindType::CurtainLeft:
			return "CurtainLeft";
		case BlindType::CurtainRight:
			return "CurtainRight";
		case BlindType::DoubleRoller:
			return "DoubleRoller";
		case BlindType::VerticalBlind:
			return "VerticalBlind";
		case BlindType::WoodShutter:
			return "WoodShutter";
		case BlindType::SkylightBlind:
			return "SkylightBlind";
		case BlindType::VerticalBlindLeft:
			return "VerticalBlindLeft";
		case BlindType::VerticalBlindRight:
			return "VerticalBlindRight";
		case BlindType::Switch:
			return "Switch";
		default:
			break;
	}
	return "Unknown";
}


const char* Motion::toString(const WirelessMode value)
{
	switch (value)
	{
		case WirelessMode::UniDirection:
			return "UniDirection";
		case WirelessMode::BiDirection:
			return "BiDirection";
		case WirelessMode::BiDirectionLimits:
			return "BiDirectionLimits";
		case WirelessMode::WiFi:
			return "WiFi";
		case WirelessMode::VirtualPercentageLimits:
			return "VirtualPercentageLimits";
		default:
			break;
	}
	return "Unknown";
}


const char* Motion::toString(const VoltageMode value)
{
	switch (value)
	{
		case VoltageMode::AC:
			return "AC";
		case VoltageMode::DC:
			return "DC";
		default:
			break;
	}
	return "Unknown";
}


const char* Motion::toString(const BlindStatus value)
{
	switch (value)
	{
		case BlindStatus::Closing:
			return "Closing";
		case BlindStatus::Opening:
			return "Opening";
		case BlindStatus::Stopped:
			return "Stopped";
		case BlindStatus::StatusQuery:
			return "StatusQuery";
		case BlindStatus::JogUp:
			return "JogUp";
		case BlindStatus::JogDown:
			return "JogDown";
		default:
			break;
	}
	return "Unknown";
}


const char* Motion::toString(const LimitStatus value)
{
	switch (value)
	{
		case LimitStatus::NoLimit:
			return "NoLimit";
		case LimitStatus::TopLimit:
			return "TopLimit";
		case LimitStatus::BottomLimit:
			return "BottomLimit";
		case LimitStatus::Limits:
			return "Limits";
		case LimitStatus::Limit3:
			return "Limit3";
		default:
			break;
	}
	return "Unknown";
}


namespace {
	double scale(const double voltage, const double empty, const double full)
	{
		double level = 100.0 * (voltage - empty) / (full - empty);
		if (level > 100.0)
			level = 100.0;
		if (level < 0.0)
			level = 0.0;
		return std::round(level);
	}
}


bool Motion::CalculateBatteryLevel(const double voltage, double &level)
{
	if ((voltage > 0.0) && (voltage <= 9.4))
	{
		// 2 cell battery pack (8.4V)
		level = scale(voltage, 6.2, 8.4);
		return true;
	}
	if ((voltage > 9.4) && (voltage <= 13.6))
	{
		// 3 cell battery pack (12.6V)
		level = scale(voltage, 10.4, 12.6);
		return true;
	}
	if ((voltage > 13.6) && (voltage <= 19.0))
	{
		// 4 cell battery pack (16.8V)
		level = scale(voltage, 14.6, 16.8);
		return true;
	}
	if (voltage == MOTION_BATTERY_AC_VOLTAGE)
	{
		level = 0.0;
		return false;
	}
	if (voltage <= 0.0)
	{
		level = 0.0;
		return true;
	}
	level = MOTION_BATTERY_OUT_OF_RANGE;
	return true;
}
