/*
 *  Tests for the gateway client
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "gateway_fixture.hpp"
#include "motionMulticast.hpp"
#include "motionErrors.hpp"


class GatewayTest : public GatewayFixture {
protected:
	void SetUp() override
	{
		GatewayFixture::SetUp();
		gateway.reset(new motionGateway(TEST_GATEWAY_IP, TEST_KEY, nullptr, network->factory()));
	}

	std::unique_ptr<motionGateway> gateway;
};


TEST_F(GatewayTest, NotReadyBeforeDeviceList) {
	EXPECT_FALSE(gateway->isReady());
	EXPECT_FALSE(gateway->isAvailable());
	EXPECT_TRUE(gateway->getCovers().empty());
	EXPECT_THROW(gateway->getAccessToken(), Motion::CredentialError);
	EXPECT_TRUE(network->getSent().empty());
}

TEST_F(GatewayTest, ListDevicesLearnsIdentity) {
	std::map<std::string, motionCover*> covers = gateway->ListDevices();

	EXPECT_TRUE(gateway->isReady());
	EXPECT_TRUE(gateway->isAvailable());
	EXPECT_EQ(gateway->getMac(), TEST_GATEWAY_MAC);
	EXPECT_EQ(gateway->getDeviceType(), "02000002");
	EXPECT_EQ(gateway->getProtocolVersion(), "0.9");
	EXPECT_EQ(gateway->getToken(), TEST_TOKEN);
	EXPECT_EQ(gateway->getAccessToken(), TEST_ACCESS_TOKEN);

	ASSERT_EQ(covers.size(), 2u);
	EXPECT_NE(dynamic_cast<motionBlind*>(covers[TEST_BLIND_MAC]), nullptr);
	EXPECT_NE(dynamic_cast<motionTDBU*>(covers[TEST_TDBU_MAC]), nullptr);
	EXPECT_EQ(gateway->getCover(TEST_GATEWAY_MAC), nullptr);
}

TEST_F(GatewayTest, ListDevicesKeepsExistingCovers) {
	gateway->ListDevices();
	motionCover *first = gateway->getCover(TEST_BLIND_MAC);

	devices["abcdef123458"] = "22000002";
	std::map<std::string, motionCover*> covers = gateway->ListDevices();
	EXPECT_EQ(covers.size(), 3u);
	EXPECT_EQ(gateway->getCover(TEST_BLIND_MAC), first);
	EXPECT_NE(dynamic_cast<motionBlind*>(gateway->getCover("abcdef123458")), nullptr);
}

TEST_F(GatewayTest, UnknownDeviceTypeBecomesStandardBlind) {
	devices["abcdef123459"] = "99999999";
	gateway->ListDevices();
	motionCover *cover = gateway->getCover("abcdef123459");
	ASSERT_NE(cover, nullptr);
	EXPECT_FALSE(cover->isDualMotor());
	EXPECT_EQ(cover->getDeviceType(), "99999999");
}

TEST_F(GatewayTest, ListDevicesAcrossFragments) {
	network->responder = [this](const Json::Value &request) {
		std::vector<std::string> replies;
		if (request["msgType"].asString() != "GetDeviceList")
			return replies;
		Json::Value first = deviceListAck();
		first["data"].resize(2);
		Json::Value second = deviceListAck();
		Json::Value device;
		device["mac"] = "abcdef123458";
		device["deviceType"] = "10000000";
		second["data"] = Json::Value(Json::arrayValue);
		second["data"].append(device);
		replies.push_back(padded(first, MOTION_FRAGMENT_THRESHOLD));
		replies.push_back(Motion::Message::encode(second));
		return replies;
	};

	std::map<std::string, motionCover*> covers = gateway->ListDevices();
	EXPECT_EQ(covers.size(), 2u);
	EXPECT_NE(gateway->getCover("abcdef123458"), nullptr);
	EXPECT_TRUE(gateway->isReady());
}

TEST_F(GatewayTest, ListDevicesTimeout) {
	online = false;
	EXPECT_THROW(gateway->ListDevices(), Motion::TimeoutError);
	EXPECT_FALSE(gateway->isReady());
	EXPECT_FALSE(gateway->isAvailable());
	EXPECT_EQ(network->getSent().size(), 3u);
}

TEST_F(GatewayTest, MalformedDeviceListIsParseError) {
	network->responder = [](const Json::Value &) {
		Json::Value reply;
		reply["msgType"] = "GetDeviceListAck";
		reply["mac"] = TEST_GATEWAY_MAC;
		return std::vector<std::string>{ Motion::Message::encode(reply) };
	};
	EXPECT_THROW(gateway->ListDevices(), Motion::ParseError);
	EXPECT_FALSE(gateway->isReady());
}

TEST_F(GatewayTest, RefreshListsDevicesFirst) {
	gateway->Refresh();
	std::vector<SentDatagram> sent = network->getSent();
	ASSERT_EQ(sent.size(), 2u);
	EXPECT_EQ(sent[0].json()["msgType"].asString(), "GetDeviceList");
	EXPECT_EQ(sent[1].json()["msgType"].asString(), "ReadDevice");
	EXPECT_EQ(sent[1].json()["mac"].asString(), TEST_GATEWAY_MAC);

	EXPECT_EQ(gateway->getStatus(), Motion::GatewayStatus::Working);
	EXPECT_EQ(gateway->getDeviceCount(), 2);
	EXPECT_EQ(gateway->getRSSI(), -45);

	gateway->Refresh();
	EXPECT_EQ(network->getSent().size(), 3u);
}

TEST_F(GatewayTest, RecoversAvailabilityAfterTimeout) {
	gateway->ListDevices();
	online = false;
	EXPECT_THROW(gateway->Refresh(), Motion::TimeoutError);
	EXPECT_FALSE(gateway->isAvailable());

	online = true;
	gateway->Refresh();
	EXPECT_TRUE(gateway->isAvailable());
}

TEST_F(GatewayTest, CallbacksFireOnNewState) {
	int notified = 0;
	gateway->RegisterCallback("test", [&notified]() { notified++; });
	gateway->ListDevices();
	EXPECT_GE(notified, 1);

	int before = notified;
	gateway->UnregisterCallback("test");
	gateway->Refresh();
	EXPECT_EQ(notified, before);
}

TEST_F(GatewayTest, HeartbeatUpdatesGateway) {
	gateway->ListDevices();
	Json::Value heartbeat;
	heartbeat["msgType"] = "Heartbeat";
	heartbeat["mac"] = TEST_GATEWAY_MAC;
	heartbeat["deviceType"] = "02000002";
	heartbeat["data"]["currentState"] = 2;
	heartbeat["data"]["numberOfDevices"] = 2;
	heartbeat["data"]["RSSI"] = -50;

	gateway->ProcessMulticast(heartbeat);
	EXPECT_EQ(gateway->getStatus(), Motion::GatewayStatus::Pairing);
	EXPECT_EQ(gateway->getRSSI(), -50);
}

TEST_F(GatewayTest, ReportRoutedToCover) {
	gateway->ListDevices();
	Json::Value report;
	report["msgType"] = "Report";
	report["mac"] = TEST_BLIND_MAC;
	report["deviceType"] = "10000000";
	report["data"] = device_data[TEST_BLIND_MAC];
	report["data"]["currentPosition"] = 75;

	gateway->ProcessMulticast(report);
	motionBlind *blind = dynamic_cast<motionBlind*>(gateway->getCover(TEST_BLIND_MAC));
	ASSERT_NE(blind, nullptr);
	EXPECT_EQ(blind->getPosition(), 75);
	EXPECT_NE(blind->getLastReport(), 0);

	motionCover *other = gateway->getCover(TEST_TDBU_MAC);
	EXPECT_EQ(other->getLastReport(), 0);
}

TEST_F(GatewayTest, ReportForUnknownDeviceDropped) {
	gateway->ListDevices();
	Json::Value report;
	report["msgType"] = "Report";
	report["mac"] = "ffffffffffff";
	report["data"] = device_data[TEST_BLIND_MAC];

	EXPECT_NO_THROW(gateway->ProcessMulticast(report));
	EXPECT_EQ(gateway->getCovers().size(), 2u);
}

TEST_F(GatewayTest, ReportForGatewayUpdatesGateway) {
	gateway->ListDevices();
	Json::Value report;
	report["msgType"] = "Report";
	report["mac"] = TEST_GATEWAY_MAC;
	report["data"]["currentState"] = 3;

	gateway->ProcessMulticast(report);
	EXPECT_EQ(gateway->getStatus(), Motion::GatewayStatus::Updating);
}

TEST_F(GatewayTest, RegistersWithListener) {
	motionMulticast multicast("192.168.1.2", network->factory());
	{
		motionGateway listened(TEST_GATEWAY_IP, TEST_KEY, &multicast, network->factory());
		EXPECT_TRUE(multicast.isRegistered(TEST_GATEWAY_IP));
		EXPECT_EQ(listened.getInterface(), "192.168.1.2");
		EXPECT_EQ(listened.getMulticast(), &multicast);
	}
	EXPECT_FALSE(multicast.isRegistered(TEST_GATEWAY_IP));
}

TEST_F(GatewayTest, ListenerDeliversToGateway) {
	motionMulticast multicast("any", network->factory());
	motionGateway listened(TEST_GATEWAY_IP, TEST_KEY, &multicast, network->factory());
	listened.ListDevices();

	std::mutex mutex;
	std::condition_variable cv;
	bool notified = false;
	listened.RegisterCallback("test", [&]() {
		std::lock_guard<std::mutex> lock(mutex);
		notified = true;
		cv.notify_all();
	});

	ASSERT_TRUE(multicast.Start());
	Json::Value heartbeat;
	heartbeat["msgType"] = "Heartbeat";
	heartbeat["mac"] = TEST_GATEWAY_MAC;
	heartbeat["data"]["currentState"] = 1;
	heartbeat["data"]["numberOfDevices"] = 5;
	network->push(TEST_GATEWAY_IP, heartbeat);

	{
		std::unique_lock<std::mutex> lock(mutex);
		EXPECT_TRUE(cv.wait_for(lock, std::chrono::seconds(2), [&notified] { return notified; }));
	}
	multicast.Stop();
	EXPECT_EQ(listened.getDeviceCount(), 5);
}

TEST_F(GatewayTest, TimeoutSettings) {
	EXPECT_EQ(gateway->getTimeout(), 3000);
	EXPECT_EQ(gateway->getPushTimeout(), 3000);
	gateway->setTimeout(1500);
	gateway->setPushTimeout(0);
	EXPECT_EQ(gateway->getTimeout(), 1500);
	EXPECT_EQ(gateway->getPushTimeout(), 3000);
}
