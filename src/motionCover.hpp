/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Blinds attached to a gateway
 *
 *	Blinds are created by motionGateway::ListDevices(), once per mac, and
 *	are updated in place from then on, so pointers to them stay valid for
 *	the lifetime of their gateway.
 *
 *	Common functions:
 *	 - Refresh(waitForPush)
 *		Sends a status query. The immediate reply only holds the gateway's
 *		cached state; the blind's own answer arrives later as a multicast
 *		Report. With `waitForPush` the call blocks until that Report was
 *		parsed, retrying the query up to MOTION_PUSH_ATTEMPTS times.
 *		UniDirection blinds never report, for them only the query is sent.
 *	 - RefreshFromCache()
 *		Reads the gateway's cached state of the blind without a radio query
 *	 - Open(), Close(), Stop(), JogUp(), JogDown(), SetPosition(position)
 *		Motion commands. The reply is parsed, but the state after the
 *		motion only arrives later through a push.
 *
 *	motionBlind has a single motor with position and tilt angle.
 *	motionTDBU is a top-down/bottom-up blind with two rails; positions are
 *	0 (top of the window) .. 100 (bottom) and the top rail is kept above
 *	the bottom rail by command validation.
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionCover
#define _motionCover

#define MOTION_PUSH_ATTEMPTS 5
#define MOTION_PUSH_TIMEOUT_MS 3000

#include "motionEntity.hpp"
#include "motionDevice.hpp"
#include <json/json.h>
#include <string>
#include <condition_variable>
#include <ctime>

class motionGateway;


class motionCover : public motionEntity
{
public:
	motionCover(motionGateway &gateway, const std::string &mac, const std::string &deviceType, const int maxAngle = MOTION_DEFAULT_MAX_ANGLE);
	virtual ~motionCover() {}

	const std::string &getMac() const { return m_mac; }
	const std::string &getDeviceType() const { return m_device_type; }
	virtual bool isDualMotor() const = 0;

	// consistent copy of all fields
	Motion::CoverState getState() const;

	Motion::BlindType getType() const;
	Motion::WirelessMode getWirelessMode() const;
	Motion::VoltageMode getVoltageMode() const;
	int getRSSI() const;
	bool isAvailable() const;
	time_t getLastReport() const;

	void Refresh(const bool waitForPush = true);
	void RefreshFromCache();

	virtual void Open() = 0;
	virtual void Close() = 0;
	virtual void Stop() = 0;
	virtual void JogUp() = 0;
	virtual void JogDown() = 0;
	virtual void SetPosition(const int position) = 0;

	// reply to one of our requests
	void ApplyResponse(const Json::Value &response);
	// Report push from the multicast group
	void ProcessPush(const Json::Value &message);
	void MarkUnavailable();

protected:
	virtual Json::Value StatusQueryData() const = 0;
	void Write(const Json::Value &data);

	static void CheckPosition(const int position);

	motionGateway &m_gateway;
	const std::string m_mac;
	const std::string m_device_type;
	Motion::CoverState m_state;

private:
	void WaitForListenerPush();
	void WaitForAdHocPush();

	std::condition_variable m_report_cv;
	unsigned long m_report_count;
};


class motionBlind : public motionCover
{
public:
	motionBlind(motionGateway &gateway, const std::string &mac, const std::string &deviceType, const int maxAngle = MOTION_DEFAULT_MAX_ANGLE);

	bool isDualMotor() const override { return false; }

	int getPosition() const;
	double getAngle() const;
	int getMaxAngle() const;
	Motion::BlindStatus getStatus() const;
	Motion::LimitStatus getLimitStatus() const;
	double getBatteryVoltage() const;
	// false for mains powered blinds
	bool getBatteryLevel(double &level) const;
	bool isCharging() const;

	void Open() override;
	void Close() override;
	void Stop() override;
	void JogUp() override;
	void JogDown() override;
	void SetPosition(const int position) override;
	// with `restoreAngle` the last nonzero tilt angle is applied again
	void SetPosition(const int position, const bool restoreAngle);
	// degrees, 0 .. 180
	void SetAngle(const double angle);

protected:
	Json::Value StatusQueryData() const override;

private:
	void Operate(const Motion::BlindStatus operation);
};


class motionTDBU : public motionCover
{
public:
	motionTDBU(motionGateway &gateway, const std::string &mac, const std::string &deviceType);

	bool isDualMotor() const override { return true; }

	// Combined gives the mean of both rails
	double getPosition(const Motion::Motor motor) const;
	// closed band between the rails
	int getWidth() const;
	Motion::BlindStatus getStatus(const Motion::Motor motor) const;
	Motion::LimitStatus getLimitStatus(const Motion::Motor motor) const;
	double getBatteryVoltage(const Motion::Motor motor) const;
	bool getBatteryLevel(const Motion::Motor motor, double &level) const;
	bool isCharging(const Motion::Motor motor) const;

	// without a motor these address the bottom rail
	void Open() override;
	void Close() override;
	void Stop() override;
	void JogUp() override;
	void JogDown() override;
	void SetPosition(const int position) override;

	void Open(const Motion::Motor motor);
	void Close(const Motion::Motor motor);
	void Stop(const Motion::Motor motor);
	void JogUp(const Motion::Motor motor);
	void JogDown(const Motion::Motor motor);
	// Combined moves the band between the rails, keeping `width` or the
	// current width when `width` is negative, centred on `position`.
	// Rail order is only checked against a rail the gateway has reported;
	// a combined move without a width needs both rails reported and in order.
	void SetPosition(const int position, const Motion::Motor motor, const int width = -1);

protected:
	Json::Value StatusQueryData() const override;

private:
	void Operate(const Motion::Motor motor, const Motion::BlindStatus operation);
	const Motion::MotorState &motorState(const Motion::Motor motor) const;
};

#endif
