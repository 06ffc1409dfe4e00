/*
 *  Tests for request envelopes, decoding and redaction
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
#include "motionMessage.hpp"
#include "motionErrors.hpp"
#include <cctype>


TEST(MessageTest, TimestampIsSeventeenDigits) {
	std::string msgID = Motion::Message::timestamp();
	ASSERT_EQ(msgID.length(), 17u);
	for (char c : msgID)
		EXPECT_TRUE(isdigit((unsigned char)c));
	// day and month follow the year
	int day = std::stoi(msgID.substr(4, 2));
	int month = std::stoi(msgID.substr(6, 2));
	EXPECT_GE(day, 1);
	EXPECT_LE(day, 31);
	EXPECT_GE(month, 1);
	EXPECT_LE(month, 12);
}

TEST(MessageTest, GetDeviceListCarriesNoCredentials) {
	Json::Value message = Motion::Message::GetDeviceList();
	EXPECT_EQ(message["msgType"].asString(), "GetDeviceList");
	EXPECT_TRUE(message["msgID"].isString());
	EXPECT_FALSE(message.isMember("AccessToken"));
}

TEST(MessageTest, ReadDeviceAddressesOneDevice) {
	Json::Value message = Motion::Message::ReadDevice("abcdef123456", "10000000");
	EXPECT_EQ(message["msgType"].asString(), "ReadDevice");
	EXPECT_EQ(message["mac"].asString(), "abcdef123456");
	EXPECT_EQ(message["deviceType"].asString(), "10000000");
	EXPECT_FALSE(message.isMember("AccessToken"));
}

TEST(MessageTest, WriteDeviceCarriesAccessTokenAndData) {
	Json::Value data;
	data["operation"] = 1;
	Json::Value message = Motion::Message::WriteDevice("abcdef123456", "10000000", "B37EED04A1374559EC2E213B6AC0BCDF", data);
	EXPECT_EQ(message["msgType"].asString(), "WriteDevice");
	EXPECT_EQ(message["AccessToken"].asString(), "B37EED04A1374559EC2E213B6AC0BCDF");
	EXPECT_EQ(message["data"]["operation"].asInt(), 1);
}

TEST(MessageTest, EncodeIsSingleLine) {
	Json::Value data;
	data["targetPosition"] = 50;
	std::string payload = Motion::Message::encode(Motion::Message::WriteDevice("abcdef123456", "10000000", "TOKEN", data));
	EXPECT_EQ(payload.find('\n'), std::string::npos);
	EXPECT_EQ(Motion::Message::decode(payload)["data"]["targetPosition"].asInt(), 50);
}

TEST(MessageTest, DecodeRejectsGarbage) {
	EXPECT_THROW(Motion::Message::decode("not json"), Motion::DecodeError);
	EXPECT_THROW(Motion::Message::decode("{\"msgType\":"), Motion::DecodeError);
}

TEST(MessageTest, DecodeRejectsNonObject) {
	EXPECT_THROW(Motion::Message::decode("[1,2,3]"), Motion::DecodeError);
	EXPECT_THROW(Motion::Message::decode("42"), Motion::DecodeError);
}

TEST(MessageTest, DecodeAcceptsTrailingPadding) {
	std::string payload = "{\"msgType\":\"Heartbeat\"}    ";
	EXPECT_EQ(Motion::Message::decode(payload.c_str(), (int)payload.size())["msgType"].asString(), "Heartbeat");
}

TEST(MessageTest, RedactMasksTokens) {
	Json::Value message;
	message["msgType"] = "GetDeviceListAck";
	message["token"] = "0123456789ABCDEF";
	message["data"]["AccessToken"] = "B37EED04";
	message["data"]["mac"] = "abcdef123456";

	Json::Value redacted = Motion::Message::redact(message);
	EXPECT_EQ(redacted["token"].asString(), "****************");
	EXPECT_EQ(redacted["data"]["AccessToken"].asString(), "********");
	EXPECT_EQ(redacted["data"]["mac"].asString(), "abcdef123456");
	EXPECT_EQ(message["token"].asString(), "0123456789ABCDEF");
}

TEST(MessageTest, RedactRawPayload) {
	std::string redacted = Motion::Message::redact(std::string("{\"token\": \"abc-123\", \"mac\": \"abcdef\"}"));
	EXPECT_EQ(redacted, "{\"token\": \"***-***\", \"mac\": \"abcdef\"}");
}

TEST(MessageTest, DescribeHidesToken) {
	Json::Value message;
	message["token"] = "0123456789ABCDEF";
	EXPECT_EQ(Motion::Message::describe(message).find("0123456789ABCDEF"), std::string::npos);
}

TEST(MessageTest, DeviceTypeClasses) {
	EXPECT_TRUE(Motion::Message::isGatewayType("02000001"));
	EXPECT_TRUE(Motion::Message::isGatewayType("02000002"));
	EXPECT_FALSE(Motion::Message::isGatewayType("10000000"));
	EXPECT_TRUE(Motion::Message::isWifiType("22000005"));
	EXPECT_TRUE(Motion::Message::isControllerType("22000002"));
	EXPECT_TRUE(Motion::Message::isControllerType("02000002"));
	EXPECT_FALSE(Motion::Message::isControllerType("10000001"));
}
