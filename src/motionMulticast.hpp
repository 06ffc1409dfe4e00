/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Multicast push listener
 *
 *	Gateways announce state changes (`Report`) and keep-alives
 *	(`Heartbeat`) on the multicast group. One listener serves any number of
 *	gateways: each registers a callback for its IP address and receives
 *	every decoded message sent from that address.
 *
 *	Functions:
 *	 - Register(ip, callback)
 *		Routes messages from `ip` to `callback`, replacing any earlier one
 *	 - Unregister(ip)
 *		Drops the callback for `ip`, waiting for a call to it in progress
 *	 - Start()
 *		Opens the multicast socket and starts the receive thread
 *		Returns false if already running or the socket cannot be opened
 *	 - Stop()
 *		Ends the receive thread within one poll interval and closes the
 *		socket. Safe to call more than once. From a callback it only ends
 *		the receive thread; the next Stop() or Start() joins it.
 *
 *	Callbacks run on the receive thread. A callback that blocks holds up
 *	all later messages.
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionMulticast
#define _motionMulticast

#define MOTION_MULTICAST_POLL_MS 500

#include "motionUDP.hpp"
#include <json/json.h>
#include <string>
#include <map>
#include <mutex>
#include <thread>
#include <atomic>
#include <functional>


class motionMulticast
{
public:
	typedef std::function<void(const Json::Value &message)> Callback;

	explicit motionMulticast(const std::string &interface = "any", motionDatagramFactory factory = motionUDP::create);
	~motionMulticast();

	const std::string &getInterface() const { return m_interface; }
	bool isRunning() const { return m_running; }

	void Register(const std::string &ip, Callback callback);
	void Unregister(const std::string &ip);
	bool isRegistered(const std::string &ip);

	bool Start();
	void Stop();

	// Decodes and routes one datagram; called by the receive thread
	void Dispatch(const std::string &source, const unsigned char *buffer, const int size);

private:
	void Loop();

	std::string m_interface;
	motionDatagramFactory m_factory;
	std::unique_ptr<motionDatagram> m_socket;
	std::thread m_thread;
	std::atomic<bool> m_running;
	std::mutex m_control_mutex;
	std::mutex m_callback_mutex;
	std::recursive_mutex m_dispatch_mutex;
	std::map<std::string, Callback> m_callbacks;
};

#endif
