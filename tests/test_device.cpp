/*
 *  Tests for typed device values and battery levels
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include <gtest/gtest.h>
#include "motionDevice.hpp"
#include <cstring>


TEST(DeviceTest, KnownGatewayStatus) {
	Motion::GatewayStatus status;
	EXPECT_TRUE(Motion::toGatewayStatus(1, status));
	EXPECT_EQ(status, Motion::GatewayStatus::Working);
	EXPECT_TRUE(Motion::toGatewayStatus(3, status));
	EXPECT_EQ(status, Motion::GatewayStatus::Updating);
}

TEST(DeviceTest, UnknownValuesMapToUnknown) {
	Motion::GatewayStatus status;
	EXPECT_FALSE(Motion::toGatewayStatus(9, status));
	EXPECT_EQ(status, Motion::GatewayStatus::Unknown);

	Motion::BlindType type;
	EXPECT_FALSE(Motion::toBlindType(15, type));
	EXPECT_EQ(type, Motion::BlindType::Unknown);
	EXPECT_FALSE(Motion::toBlindType(0, type));

	Motion::WirelessMode mode;
	EXPECT_FALSE(Motion::toWirelessMode(7, mode));
	EXPECT_EQ(mode, Motion::WirelessMode::Unknown);

	Motion::VoltageMode voltage;
	EXPECT_FALSE(Motion::toVoltageMode(2, voltage));
	EXPECT_EQ(voltage, Motion::VoltageMode::Unknown);

	Motion::BlindStatus blindstatus;
	EXPECT_FALSE(Motion::toBlindStatus(3, blindstatus));
	EXPECT_EQ(blindstatus, Motion::BlindStatus::Unknown);

	Motion::LimitStatus limit;
	EXPECT_FALSE(Motion::toLimitStatus(-1, limit));
	EXPECT_EQ(limit, Motion::LimitStatus::Unknown);
}

TEST(DeviceTest, BlindTypeTable) {
	Motion::BlindType type;
	EXPECT_TRUE(Motion::toBlindType(5, type));
	EXPECT_EQ(type, Motion::BlindType::ShangriLaBlind);
	EXPECT_TRUE(Motion::toBlindType(17, type));
	EXPECT_EQ(type, Motion::BlindType::DoubleRoller);
	EXPECT_TRUE(Motion::toBlindType(43, type));
	EXPECT_EQ(type, Motion::BlindType::Switch);
	EXPECT_STREQ(Motion::toString(type), "Switch");
}

TEST(DeviceTest, StatusNames) {
	EXPECT_STREQ(Motion::toString(Motion::BlindStatus::Opening), "Opening");
	EXPECT_STREQ(Motion::toString(Motion::LimitStatus::Unknown), "Unknown");
	EXPECT_STREQ(Motion::toString(Motion::WirelessMode::BiDirection), "BiDirection");
}

TEST(DeviceTest, BatteryFullAndEmpty) {
	double level = -1.0;
	EXPECT_TRUE(Motion::CalculateBatteryLevel(8.4, level));
	EXPECT_DOUBLE_EQ(level, 100.0);
	EXPECT_TRUE(Motion::CalculateBatteryLevel(6.2, level));
	EXPECT_DOUBLE_EQ(level, 0.0);
}

TEST(DeviceTest, BatteryPackSizes) {
	double level;
	EXPECT_TRUE(Motion::CalculateBatteryLevel(7.3, level));
	EXPECT_DOUBLE_EQ(level, 50.0);
	EXPECT_TRUE(Motion::CalculateBatteryLevel(12.0, level));
	EXPECT_DOUBLE_EQ(level, 73.0);
	EXPECT_TRUE(Motion::CalculateBatteryLevel(16.8, level));
	EXPECT_DOUBLE_EQ(level, 100.0);
}

TEST(DeviceTest, BatteryClampsWithinPack) {
	double level;
	EXPECT_TRUE(Motion::CalculateBatteryLevel(9.0, level));
	EXPECT_DOUBLE_EQ(level, 100.0);
	EXPECT_TRUE(Motion::CalculateBatteryLevel(5.0, level));
	EXPECT_DOUBLE_EQ(level, 0.0);
}

TEST(DeviceTest, MainsPoweredHasNoLevel) {
	double level;
	EXPECT_FALSE(Motion::CalculateBatteryLevel(220.0, level));
}

TEST(DeviceTest, NoVoltageIsEmpty) {
	double level = -1.0;
	EXPECT_TRUE(Motion::CalculateBatteryLevel(0.0, level));
	EXPECT_DOUBLE_EQ(level, 0.0);
}

TEST(DeviceTest, OutOfRangeVoltage) {
	double level;
	EXPECT_TRUE(Motion::CalculateBatteryLevel(25.0, level));
	EXPECT_DOUBLE_EQ(level, 200.0);
}
