/*
 *  Tests for the settings file
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
#include "motionConfig.hpp"
#include "motionErrors.hpp"
#include <fstream>
#include <cstdio>


TEST(ConfigTest, Defaults) {
	Motion::Config::Settings settings = Motion::Config::ParseConfig("{}");
	EXPECT_EQ(settings.interface, "any");
	EXPECT_EQ(settings.timeout_ms, 3000);
	EXPECT_EQ(settings.discovery_window_ms, 10000);
	EXPECT_TRUE(settings.gateways.empty());
}

TEST(ConfigTest, FullSettings) {
	Motion::Config::Settings settings = Motion::Config::ParseConfig(
		"{ \"interface\": \"192.168.1.2\", \"timeout\": 1.5, \"discovery_window\": 4,"
		"  \"gateways\": [ { \"name\": \"LivingRoom\", \"address\": \"192.168.1.100\", \"key\": \"12ab345c-d67e-8f\" } ] }");
	EXPECT_EQ(settings.interface, "192.168.1.2");
	EXPECT_EQ(settings.timeout_ms, 1500);
	EXPECT_EQ(settings.discovery_window_ms, 4000);
	ASSERT_EQ(settings.gateways.size(), 1u);
	EXPECT_EQ(settings.gateways[0].name, "livingroom");
	EXPECT_EQ(settings.gateways[0].address, "192.168.1.100");
	EXPECT_EQ(settings.gateways[0].key, "12ab345c-d67e-8f");
}

TEST(ConfigTest, FindGatewayByNameOrAddress) {
	Motion::Config::Settings settings = Motion::Config::ParseConfig(
		"{ \"gateways\": [ { \"name\": \"attic\", \"address\": \"192.168.1.100\", \"key\": \"12ab345c-d67e-8f\" },"
		"                  { \"name\": \"garage\", \"address\": \"192.168.1.101\", \"key\": \"98ab345c-d67e-8f\" } ] }");
	Motion::Config::GatewayEntry entry;
	EXPECT_TRUE(Motion::Config::FindGateway(settings, "GARAGE", entry));
	EXPECT_EQ(entry.address, "192.168.1.101");
	EXPECT_TRUE(Motion::Config::FindGateway(settings, "192.168.1.100", entry));
	EXPECT_EQ(entry.name, "attic");
	EXPECT_FALSE(Motion::Config::FindGateway(settings, "kitchen", entry));
}

TEST(ConfigTest, InvalidJson) {
	EXPECT_THROW(Motion::Config::ParseConfig("{ \"gateways\": "), Motion::DecodeError);
	EXPECT_THROW(Motion::Config::ParseConfig("[]"), Motion::DecodeError);
}

TEST(ConfigTest, IncompleteGatewayEntry) {
	EXPECT_THROW(Motion::Config::ParseConfig("{ \"gateways\": [ { \"name\": \"attic\", \"address\": \"192.168.1.100\" } ] }"), Motion::ParseError);
	EXPECT_THROW(Motion::Config::ParseConfig("{ \"gateways\": { \"name\": \"attic\" } }"), Motion::ParseError);
	EXPECT_THROW(Motion::Config::ParseConfig("{ \"timeout\": \"slow\" }"), Motion::ParseError);
}

TEST(ConfigTest, LoadFromFile) {
	std::string path = testing::TempDir() + "motionpp_test_settings.json";
	{
		std::ofstream myfile(path);
		myfile << "{ \"gateways\": [ { \"name\": \"attic\", \"address\": \"192.168.1.100\", \"key\": \"12ab345c-d67e-8f\" } ] }";
	}
	Motion::Config::Settings settings = Motion::Config::LoadConfig(path);
	EXPECT_EQ(settings.gateways.size(), 1u);
	remove(path.c_str());
}

TEST(ConfigTest, MissingFile) {
	EXPECT_THROW(Motion::Config::LoadConfig("/nonexistent/motion-gateways.json"), Motion::DecodeError);
}
