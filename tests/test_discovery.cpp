/*
 *  Tests for gateway discovery
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
#include "fake_datagram.hpp"
#include "motionDiscovery.hpp"
#include "motionErrors.hpp"
#include "motionLog.hpp"


class DiscoveryTest : public ::testing::Test {
protected:
	void SetUp() override
	{
		Motion::Log::setLevel(Motion::Log::Level::None);
		network = std::make_shared<FakeNetwork>();
	}

	void TearDown() override
	{
		Motion::Log::setLevel(Motion::Log::Level::Warning);
	}

	static Json::Value deviceListAck(const std::string &mac, const std::string &deviceType = "02000002")
	{
		Json::Value reply;
		reply["msgType"] = "GetDeviceListAck";
		reply["mac"] = mac;
		reply["deviceType"] = deviceType;
		reply["token"] = "0123456789ABCDEF";
		reply["data"] = Json::Value(Json::arrayValue);
		return reply;
	}

	std::shared_ptr<FakeNetwork> network;
};


TEST_F(DiscoveryTest, SendsToMulticastGroup) {
	motionDiscovery discovery("any", network->factory());
	discovery.discover(20);

	std::vector<SentDatagram> sent = network->getSent();
	ASSERT_EQ(sent.size(), 1u);
	EXPECT_EQ(sent[0].address, "238.0.0.18");
	EXPECT_EQ(sent[0].port, 32100);
	EXPECT_EQ(sent[0].json()["msgType"].asString(), "GetDeviceList");
	EXPECT_EQ(network->multicast_opens, 1);
}

TEST_F(DiscoveryTest, CollectsRepliesByAddress) {
	Json::Value heartbeat;
	heartbeat["msgType"] = "Heartbeat";
	heartbeat["mac"] = "abcdef123400";
	network->push("192.168.1.100", heartbeat);
	network->push("192.168.1.100", deviceListAck("abcdef123400"));
	network->push("192.168.1.101", deviceListAck("abcdef123401", "22000005"));

	motionDiscovery discovery("any", network->factory());
	std::map<std::string, Json::Value> discovered = discovery.discover(200);

	ASSERT_EQ(discovered.size(), 2u);
	EXPECT_EQ(discovered["192.168.1.100"]["mac"].asString(), "abcdef123400");
	EXPECT_EQ(discovered["192.168.1.101"]["mac"].asString(), "abcdef123401");
}

TEST_F(DiscoveryTest, LastReplyPerAddressWins) {
	network->push("192.168.1.100", deviceListAck("abcdef123400"));
	network->push("192.168.1.100", deviceListAck("abcdef123499"));

	motionDiscovery discovery("any", network->factory());
	std::map<std::string, Json::Value> discovered = discovery.discover(200);

	ASSERT_EQ(discovered.size(), 1u);
	EXPECT_EQ(discovered["192.168.1.100"]["mac"].asString(), "abcdef123499");
}

TEST_F(DiscoveryTest, SkipsNonGatewaysAndGarbage) {
	network->push("192.168.1.100", std::string("not json"));
	network->push("192.168.1.101", deviceListAck("abcdef123456", "10000000"));
	Json::Value report;
	report["msgType"] = "Report";
	network->push("192.168.1.102", report);

	motionDiscovery discovery("any", network->factory());
	EXPECT_TRUE(discovery.discover(200).empty());
}

TEST_F(DiscoveryTest, EmptyWindowReturnsNothing) {
	motionDiscovery discovery("any", network->factory());
	EXPECT_TRUE(discovery.discover(50).empty());
}

TEST_F(DiscoveryTest, SocketFailureThrows) {
	network->fail_multicast = true;
	motionDiscovery discovery("any", network->factory());
	EXPECT_THROW(discovery.discover(50), Motion::Error);
}
