/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Blinds attached to a gateway
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionCover.hpp"
#include "motionGateway.hpp"
#include "motionMulticast.hpp"
#include "motionUDP.hpp"
#include "motionParser.hpp"
#include "motionMessage.hpp"
#include "motionErrors.hpp"
#include "motionLog.hpp"
#include <chrono>
#include <cstring>
#include <errno.h>


motionCover::motionCover(motionGateway &gateway, const std::string &mac, const std::string &deviceType, const int maxAngle) :
	m_gateway(gateway),
	m_mac(mac),
	m_device_type(deviceType),
	m_report_count(0)
{
	m_state.device_type = deviceType;
	m_state.max_angle = maxAngle;
}


Motion::CoverState motionCover::getState() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state;
}


Motion::BlindType motionCover::getType() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.type;
}


Motion::WirelessMode motionCover::getWirelessMode() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.wireless_mode;
}


Motion::VoltageMode motionCover::getVoltageMode() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.voltage_mode;
}


int motionCover::getRSSI() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.rssi;
}


bool motionCover::isAvailable() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.available;
}


time_t motionCover::getLastReport() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.last_report;
}


void motionCover::Refresh(const bool waitForPush)
{
	if ((!waitForPush) || (getWirelessMode() == Motion::WirelessMode::UniDirection))
	{
		Write(StatusQueryData());
		return;
	}

	motionMulticast *multicast = m_gateway.getMulticast();
	if ((multicast != nullptr) && multicast->isRunning())
		WaitForListenerPush();
	else
		WaitForAdHocPush();
}


void motionCover::RefreshFromCache()
{
	Json::Value jReply;
	try
	{
		jReply = m_gateway.ReadDevice(m_mac, m_device_type);
	}
	catch (const Motion::TimeoutError &)
	{
		MarkUnavailable();
		throw;
	}
	ApplyResponse(jReply);
}


void motionCover::ApplyResponse(const Json::Value &response)
{
	bool applied;
	{
		std::lock_guard<std::mutex> lock(m_state_mutex);
		applied = Motion::Parser::ParseCover(response, m_state, isDualMotor());
	}
	if (applied)
		NotifyCallbacks();
}


void motionCover::ProcessPush(const Json::Value &message)
{
	bool applied;
	{
		std::lock_guard<std::mutex> lock(m_state_mutex);
		applied = Motion::Parser::ParseCover(message, m_state, isDualMotor());
		if (applied)
		{
			m_state.last_report = time(NULL);
			m_report_count++;
		}
	}
	if (!applied)
		return;
	m_report_cv.notify_all();
	NotifyCallbacks();
}


void motionCover::MarkUnavailable()
{
	{
		std::lock_guard<std::mutex> lock(m_state_mutex);
		if (!m_state.available)
			return;
		m_state.available = false;
	}
	MOTION_WARNING("blind " << m_mac << " marked unavailable");
	NotifyCallbacks();
}


/* protected */ void motionCover::Write(const Json::Value &data)
{
	Json::Value jReply;
	try
	{
		jReply = m_gateway.WriteDevice(m_mac, m_device_type, data);
	}
	catch (const Motion::TimeoutError &)
	{
		MarkUnavailable();
		throw;
	}
	ApplyResponse(jReply);
}


/* protected */ void motionCover::CheckPosition(const int position)
{
	if ((position < 0) || (position > 100))
		throw Motion::CommandError("position " + std::to_string(position) + " is outside 0..100");
}


/* private */ void motionCover::WaitForListenerPush()
{
	const int timeout = m_gateway.getPushTimeout();
	for (int i = 1; i <= MOTION_PUSH_ATTEMPTS; i++)
	{
		unsigned long reports;
		{
			std::lock_guard<std::mutex> lock(m_state_mutex);
			reports = m_report_count;
		}

		Write(StatusQueryData());

		std::unique_lock<std::mutex> lock(m_state_mutex);
		if (m_report_cv.wait_for(lock, std::chrono::milliseconds(timeout), [this, reports] { return m_report_count != reports; }))
			return;
		lock.unlock();
		MOTION_WARNING("no status report from blind " << m_mac << " within " << timeout << " ms, attempt " << i << "/" << MOTION_PUSH_ATTEMPTS);
	}

	MarkUnavailable();
	throw Motion::TimeoutError("no status report from blind " + m_mac + " after " + std::to_string(MOTION_PUSH_ATTEMPTS) + " attempts");
}


/* private */ void motionCover::WaitForAdHocPush()
{
	const int timeout = m_gateway.getPushTimeout();
	std::unique_ptr<motionDatagram> udpclient = m_gateway.getDatagramFactory()();
	if (!udpclient->OpenMulticast(m_gateway.getInterface()))
		throw Motion::Error(std::string("cannot open multicast socket to wait for a status report: ") + strerror(udpclient->getlasterror()));

	unsigned char message_buffer[MOTION_SOCKET_BUFSIZE];
	std::string source;
	for (int i = 1; i <= MOTION_PUSH_ATTEMPTS; i++)
	{
		Write(StatusQueryData());

		std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout);
		while (true)
		{
			int remaining = (int)std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
			if (remaining <= 0)
				break;

			int numbytes = udpclient->receive(message_buffer, MOTION_SOCKET_BUFSIZE, remaining, &source);
			if (numbytes < 0)
			{
				if (udpclient->getlasterror() != EAGAIN)
					MOTION_ERROR("error waiting for status report: " << strerror(udpclient->getlasterror()));
				break;
			}
			if (source != m_gateway.getAddress())
				continue;

			Json::Value jMessage;
			try
			{
				jMessage = Motion::Message::decode((const char*)message_buffer, numbytes);
			}
			catch (const Motion::DecodeError &e)
			{
				MOTION_WARNING("cannot decode multicast message from " << source << ": " << e.what());
				continue;
			}

			if ((jMessage.get("msgType", "").asString() == MOTION_MSG_REPORT) && (jMessage.get("mac", "").asString() == m_mac))
			{
				udpclient->disconnect();
				ProcessPush(jMessage);
				return;
			}
		}
		MOTION_WARNING("no status report from blind " << m_mac << " within " << timeout << " ms, attempt " << i << "/" << MOTION_PUSH_ATTEMPTS);
	}

	udpclient->disconnect();
	MarkUnavailable();
	throw Motion::TimeoutError("no status report from blind " + m_mac + " after " + std::to_string(MOTION_PUSH_ATTEMPTS) + " attempts");
}


/*
 * motionBlind
 */

motionBlind::motionBlind(motionGateway &gateway, const std::string &mac, const std::string &deviceType, const int maxAngle) :
	motionCover(gateway, mac, deviceType, maxAngle)
{
}


int motionBlind::getPosition() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.motor.position;
}


double motionBlind::getAngle() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.angle;
}


int motionBlind::getMaxAngle() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.max_angle;
}


Motion::BlindStatus motionBlind::getStatus() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.motor.status;
}


Motion::LimitStatus motionBlind::getLimitStatus() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.motor.limit_status;
}


double motionBlind::getBatteryVoltage() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.motor.battery_voltage;
}


bool motionBlind::getBatteryLevel(double &level) const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	level = m_state.motor.battery_level;
	return m_state.motor.has_battery_level;
}


bool motionBlind::isCharging() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.motor.charging;
}


void motionBlind::Open()
{
	Operate(Motion::BlindStatus::Opening);
}


void motionBlind::Close()
{
	Operate(Motion::BlindStatus::Closing);
}


void motionBlind::Stop()
{
	Operate(Motion::BlindStatus::Stopped);
}


void motionBlind::JogUp()
{
	Operate(Motion::BlindStatus::JogUp);
}


void motionBlind::JogDown()
{
	Operate(Motion::BlindStatus::JogDown);
}


void motionBlind::SetPosition(const int position)
{
	SetPosition(position, false);
}


void motionBlind::SetPosition(const int position, const bool restoreAngle)
{
	CheckPosition(position);

	Json::Value data;
	data["targetPosition"] = position;
	if (restoreAngle)
	{
		std::lock_guard<std::mutex> lock(m_state_mutex);
		if (m_state.restore_angle != 0)
			data["targetAngle"] = m_state.restore_angle;
	}
	Write(data);
}


void motionBlind::SetAngle(const double angle)
{
	if ((angle < 0.0) || (angle > 180.0))
		throw Motion::CommandError("angle " + std::to_string(angle) + " is outside 0..180");

	Json::Value data;
	data["targetAngle"] = (int)(angle * getMaxAngle() / 180.0 + 0.5);
	Write(data);
}


/* protected */ Json::Value motionBlind::StatusQueryData() const
{
	Json::Value data;
	data["operation"] = static_cast<int>(Motion::BlindStatus::StatusQuery);
	return data;
}


/* private */ void motionBlind::Operate(const Motion::BlindStatus operation)
{
	Json::Value data;
	data["operation"] = static_cast<int>(operation);
	Write(data);
}


/*
 * motionTDBU
 */

motionTDBU::motionTDBU(motionGateway &gateway, const std::string &mac, const std::string &deviceType) :
	motionCover(gateway, mac, deviceType, MOTION_DEFAULT_MAX_ANGLE)
{
}


double motionTDBU::getPosition(const Motion::Motor motor) const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	if (motor == Motion::Motor::Combined)
		return (m_state.top.position + m_state.bottom.position) / 2.0;
	return motorState(motor).position;
}


int motionTDBU::getWidth() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.bottom.position - m_state.top.position;
}


Motion::BlindStatus motionTDBU::getStatus(const Motion::Motor motor) const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return motorState(motor).status;
}


Motion::LimitStatus motionTDBU::getLimitStatus(const Motion::Motor motor) const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return motorState(motor).limit_status;
}


double motionTDBU::getBatteryVoltage(const Motion::Motor motor) const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return motorState(motor).battery_voltage;
}


bool motionTDBU::getBatteryLevel(const Motion::Motor motor, double &level) const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	level = motorState(motor).battery_level;
	return motorState(motor).has_battery_level;
}


bool motionTDBU::isCharging(const Motion::Motor motor) const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return motorState(motor).charging;
}


void motionTDBU::Open()
{
	Open(Motion::Motor::Bottom);
}


void motionTDBU::Close()
{
	Close(Motion::Motor::Bottom);
}


void motionTDBU::Stop()
{
	Stop(Motion::Motor::Bottom);
}


void motionTDBU::JogUp()
{
	JogUp(Motion::Motor::Bottom);
}


void motionTDBU::JogDown()
{
	JogDown(Motion::Motor::Bottom);
}


void motionTDBU::SetPosition(const int position)
{
	SetPosition(position, Motion::Motor::Bottom);
}


void motionTDBU::Open(const Motion::Motor motor)
{
	Operate(motor, Motion::BlindStatus::Opening);
}


void motionTDBU::Close(const Motion::Motor motor)
{
	if (motor != Motion::Motor::Combined)
	{
		Operate(motor, Motion::BlindStatus::Closing);
		return;
	}

	// TODO: confirm with a gateway capture that the combined close should
	// target top 0 / bottom 100 rather than a symmetric position
	Json::Value data;
	data["targetPosition_T"] = 0;
	data["targetPosition_B"] = 100;
	Write(data);
}


void motionTDBU::Stop(const Motion::Motor motor)
{
	Operate(motor, Motion::BlindStatus::Stopped);
}


void motionTDBU::JogUp(const Motion::Motor motor)
{
	Operate(motor, Motion::BlindStatus::JogUp);
}


void motionTDBU::JogDown(const Motion::Motor motor)
{
	Operate(motor, Motion::BlindStatus::JogDown);
}


void motionTDBU::SetPosition(const int position, const Motion::Motor motor, const int width)
{
	CheckPosition(position);

	int top, bottom;
	bool top_known, bottom_known;
	{
		std::lock_guard<std::mutex> lock(m_state_mutex);
		top = m_state.top.position;
		bottom = m_state.bottom.position;
		top_known = m_state.top.has_position;
		bottom_known = m_state.bottom.has_position;
	}

	Json::Value data;
	switch (motor)
	{
		case Motion::Motor::Top:
			if (bottom_known && (position > bottom))
				throw Motion::CommandError("top position " + std::to_string(position) + " would be below the bottom rail at " + std::to_string(bottom));
			data["targetPosition_T"] = position;
			break;
		case Motion::Motor::Bottom:
			if (top_known && (position < top))
				throw Motion::CommandError("bottom position " + std::to_string(position) + " would be above the top rail at " + std::to_string(top));
			data["targetPosition_B"] = position;
			break;
		case Motion::Motor::Combined:
		{
			if ((width < 0) && !(top_known && bottom_known))
				throw Motion::CommandError("rail positions are not known yet, give a width or refresh first");
			int band = (width < 0) ? (bottom - top) : width;
			if (band < 0)
				throw Motion::CommandError("rails are reported inverted (top at " + std::to_string(top) + ", bottom at " + std::to_string(bottom) + "), refresh before a combined move");
			if (band > 100)
				throw Motion::CommandError("width " + std::to_string(band) + " is outside 0..100");
			int target_top = position - band / 2;
			int target_bottom = target_top + band;
			if ((target_top < 0) || (target_bottom > 100))
				throw Motion::CommandError("a band of " + std::to_string(band) + " centred on " + std::to_string(position) + " does not fit in 0..100");
			data["targetPosition_T"] = target_top;
			data["targetPosition_B"] = target_bottom;
			break;
		}
	}
	Write(data);
}


/* protected */ Json::Value motionTDBU::StatusQueryData() const
{
	Json::Value data;
	data["operation_T"] = static_cast<int>(Motion::BlindStatus::StatusQuery);
	data["operation_B"] = static_cast<int>(Motion::BlindStatus::StatusQuery);
	return data;
}


/* private */ void motionTDBU::Operate(const Motion::Motor motor, const Motion::BlindStatus operation)
{
	Json::Value data;
	if (motor != Motion::Motor::Bottom)
		data["operation_T"] = static_cast<int>(operation);
	if (motor != Motion::Motor::Top)
		data["operation_B"] = static_cast<int>(operation);
	Write(data);
}


// Combined reads as the bottom rail; callers hold m_state_mutex
/* private */ const Motion::MotorState &motionTDBU::motorState(const Motion::Motor motor) const
{
	if (motor == Motion::Motor::Top)
		return m_state.top;
	return m_state.bottom;
}
