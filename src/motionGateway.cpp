/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Gateway client
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionGateway.hpp"
#include "motionMulticast.hpp"
#include "motionParser.hpp"
#include "motionMessage.hpp"
#include "motionErrors.hpp"
#include "motionLog.hpp"


motionGateway::motionGateway(const std::string &address, const std::string &key, motionMulticast *multicast, motionDatagramFactory factory) :
	m_address(address),
	m_credentials(key),
	m_factory(factory),
	m_unicast(factory),
	m_multicast(multicast),
	m_interface("any"),
	m_push_timeout(MOTION_PUSH_TIMEOUT_MS)
{
	if (m_multicast)
	{
		m_interface = m_multicast->getInterface();
		m_multicast->Register(m_address, [this](const Json::Value &message) { ProcessMulticast(message); });
	}
}


motionGateway::~motionGateway()
{
	if (m_multicast)
		m_multicast->Unregister(m_address);
}


void motionGateway::setTimeout(const int timeout_ms)
{
	m_unicast.setTimeout(timeout_ms);
}


int motionGateway::getTimeout() const
{
	return m_unicast.getTimeout();
}


void motionGateway::setPushTimeout(const int timeout_ms)
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	m_push_timeout = (timeout_ms > 0) ? timeout_ms : MOTION_PUSH_TIMEOUT_MS;
}


int motionGateway::getPushTimeout() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_push_timeout;
}


void motionGateway::setInterface(const std::string &interface)
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	m_interface = interface;
}


std::string motionGateway::getInterface() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_interface;
}


std::map<std::string, motionCover*> motionGateway::ListDevices()
{
	std::vector<Json::Value> replies = Send(Motion::Message::GetDeviceList(), true);

	std::string szToken;
	bool parsed = false;
	{
		std::lock_guard<std::mutex> lock(m_state_mutex);
		for (const Json::Value &reply : replies)
		{
			Motion::Parser::DeviceList list;
			if (!Motion::Parser::ParseDeviceList(reply, m_state, list))
				continue;
			parsed = true;
			if (!list.token.empty())
				szToken = list.token;

			for (const Motion::Parser::DeviceListEntry &entry : list.devices)
			{
				if (Motion::Message::isGatewayType(entry.device_type))
					continue;
				if (m_covers.find(entry.mac) != m_covers.end())
					continue;
				m_covers[entry.mac] = CreateCover(entry.mac, entry.device_type);
			}
		}
	}

	if (!parsed)
		throw Motion::ParseError("gateway " + m_address + " did not return a usable device list");

	if (szToken.empty())
		MOTION_WARNING("gateway " << m_address << " did not hand out a session token");
	else
		m_credentials.setToken(szToken);

	NotifyCallbacks();
	return getCovers();
}


void motionGateway::Refresh()
{
	if (!isReady())
		ListDevices();

	std::vector<Json::Value> replies = Send(Motion::Message::ReadDevice(getMac(), getDeviceType()), false);

	bool applied;
	{
		std::lock_guard<std::mutex> lock(m_state_mutex);
		applied = Motion::Parser::ParseGatewayStatus(replies.front(), m_state);
	}
	if (applied)
		NotifyCallbacks();
}


bool motionGateway::isReady() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return ((!m_state.mac.empty()) && (!m_credentials.getToken().empty()));
}


std::string motionGateway::getMac() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.mac;
}


std::string motionGateway::getDeviceType() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.device_type;
}


std::string motionGateway::getProtocolVersion() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.protocol_version;
}


std::string motionGateway::getFirmwareVersion() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.firmware_version;
}


Motion::GatewayStatus motionGateway::getStatus() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.status;
}


int motionGateway::getDeviceCount() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.device_count;
}


int motionGateway::getRSSI() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.rssi;
}


bool motionGateway::isAvailable() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state.available;
}


Motion::GatewayState motionGateway::getState() const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	return m_state;
}


std::string motionGateway::getToken() const
{
	return m_credentials.getToken();
}


std::string motionGateway::getAccessToken()
{
	return m_credentials.getAccessToken();
}


std::map<std::string, motionCover*> motionGateway::getCovers() const
{
	std::map<std::string, motionCover*> covers;
	std::lock_guard<std::mutex> lock(m_state_mutex);
	for (const std::pair<const std::string, std::unique_ptr<motionCover> > &cover : m_covers)
		covers[cover.first] = cover.second.get();
	return covers;
}


motionCover *motionGateway::getCover(const std::string &mac) const
{
	std::lock_guard<std::mutex> lock(m_state_mutex);
	std::map<std::string, std::unique_ptr<motionCover> >::const_iterator it = m_covers.find(mac);
	if (it == m_covers.end())
		return nullptr;
	return it->second.get();
}


Json::Value motionGateway::ReadDevice(const std::string &mac, const std::string &deviceType)
{
	return Send(Motion::Message::ReadDevice(mac, deviceType), false).front();
}


Json::Value motionGateway::WriteDevice(const std::string &mac, const std::string &deviceType, const Json::Value &data)
{
	return Send(Motion::Message::WriteDevice(mac, deviceType, m_credentials.getAccessToken(), data), false).front();
}


void motionGateway::ProcessMulticast(const Json::Value &message)
{
	const std::string msgType = message.get("msgType", "").asString();
	const std::string mac = message.get("mac", "").asString();

	bool gateway = (msgType == MOTION_MSG_HEARTBEAT);
	if (msgType == MOTION_MSG_REPORT)
	{
		if (mac == getMac())
			gateway = true;
		else
		{
			motionCover *cover = getCover(mac);
			if (cover == nullptr)
			{
				MOTION_DEBUG("report for unknown device " << mac << " from gateway " << m_address << " dropped");
				return;
			}
			cover->ProcessPush(message);
			return;
		}
	}

	if (!gateway)
	{
		MOTION_DEBUG("ignoring multicast '" << msgType << "' from gateway " << m_address);
		return;
	}

	bool applied;
	{
		std::lock_guard<std::mutex> lock(m_state_mutex);
		applied = Motion::Parser::ParseGatewayStatus(message, m_state);
	}
	if (applied)
		NotifyCallbacks();
}


/* private */ std::vector<Json::Value> motionGateway::Send(const Json::Value &message, const bool expectMultiple)
{
	std::vector<Json::Value> replies;
	try
	{
		replies = m_unicast.exchange(m_address, message, expectMultiple, &m_credentials);
	}
	catch (const Motion::TimeoutError &)
	{
		MarkAvailable(false);
		throw;
	}
	MarkAvailable(true);
	return replies;
}


/* private */ void motionGateway::MarkAvailable(const bool available)
{
	{
		std::lock_guard<std::mutex> lock(m_state_mutex);
		if (m_state.available == available)
			return;
		m_state.available = available;
	}
	if (!available)
		MOTION_WARNING("gateway " << m_address << " marked unavailable");
	NotifyCallbacks();
}


/* private */ std::unique_ptr<motionCover> motionGateway::CreateCover(const std::string &mac, const std::string &deviceType)
{
	if (deviceType == MOTION_DEVICE_TYPE_TDBU)
		return std::unique_ptr<motionCover>(new motionTDBU(*this, mac, deviceType));
	if (deviceType == MOTION_DEVICE_TYPE_DR)
		return std::unique_ptr<motionCover>(new motionBlind(*this, mac, deviceType, MOTION_REDUCED_MAX_ANGLE));
	if ((deviceType != MOTION_DEVICE_TYPE_BLIND) && !Motion::Message::isWifiType(deviceType))
		MOTION_WARNING("device " << mac << " has unknown device type " << deviceType << ", treating it as a standard blind");
	return std::unique_ptr<motionCover>(new motionBlind(*this, mac, deviceType));
}
