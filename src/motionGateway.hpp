/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Gateway client
 *
 *	A gateway is constructed from its address and pairing key only. The
 *	first ListDevices() learns its mac, session token and attached blinds;
 *	from then on it is ready for authenticated commands.
 *
 *	Common functions:
 *	 - ListDevices()
 *		Requests the device list, stores the gateway's identity and token
 *		and creates a blind object for each newly seen mac
 *		Returns the blinds by mac
 *	 - Refresh()
 *		Reads the gateway's status, listing devices first if not yet ready
 *	 - getCover(mac), getCovers()
 *		Blinds created by ListDevices(), owned by the gateway
 *
 *	A gateway handed a running motionMulticast registers itself for its IP
 *	address and from then on applies Report and Heartbeat pushes to itself
 *	and its blinds. Stop the listener before destroying gateways registered
 *	with it.
 *
 *	A request that times out marks the gateway unavailable; any later
 *	successful exchange marks it available again.
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionGateway
#define _motionGateway

#include "motionEntity.hpp"
#include "motionCover.hpp"
#include "motionCredentials.hpp"
#include "motionUnicast.hpp"
#include "motionDevice.hpp"
#include "motionUDP.hpp"
#include <json/json.h>
#include <string>
#include <map>
#include <memory>

class motionMulticast;


class motionGateway : public motionEntity
{
public:
	motionGateway(const std::string &address, const std::string &key, motionMulticast *multicast = nullptr, motionDatagramFactory factory = motionUDP::create);
	~motionGateway();

	void setTimeout(const int timeout_ms);
	int getTimeout() const;
	void setPushTimeout(const int timeout_ms);
	int getPushTimeout() const;
	void setInterface(const std::string &interface);
	std::string getInterface() const;

	std::map<std::string, motionCover*> ListDevices();
	void Refresh();

	// mac and token known
	bool isReady() const;

	const std::string &getAddress() const { return m_address; }
	std::string getMac() const;
	std::string getDeviceType() const;
	std::string getProtocolVersion() const;
	std::string getFirmwareVersion() const;
	Motion::GatewayStatus getStatus() const;
	int getDeviceCount() const;
	int getRSSI() const;
	bool isAvailable() const;
	Motion::GatewayState getState() const;

	std::string getToken() const;
	// Throws Motion::CredentialError before the first ListDevices()
	std::string getAccessToken();

	std::map<std::string, motionCover*> getCovers() const;
	motionCover *getCover(const std::string &mac) const;

	// requests on behalf of a blind
	Json::Value ReadDevice(const std::string &mac, const std::string &deviceType);
	Json::Value WriteDevice(const std::string &mac, const std::string &deviceType, const Json::Value &data);

	// multicast callback
	void ProcessMulticast(const Json::Value &message);

	motionMulticast *getMulticast() const { return m_multicast; }
	const motionDatagramFactory &getDatagramFactory() const { return m_factory; }

private:
	std::vector<Json::Value> Send(const Json::Value &message, const bool expectMultiple);
	void MarkAvailable(const bool available);
	std::unique_ptr<motionCover> CreateCover(const std::string &mac, const std::string &deviceType);

	const std::string m_address;
	motionCredentials m_credentials;
	motionDatagramFactory m_factory;
	motionUnicast m_unicast;
	motionMulticast *m_multicast;
	std::string m_interface;
	int m_push_timeout;

	Motion::GatewayState m_state;
	std::map<std::string, std::unique_ptr<motionCover> > m_covers;
};

#endif
