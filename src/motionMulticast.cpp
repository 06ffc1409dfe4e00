/*
 *	Client interface for local Motion blinds gateway access
 *
 *	Multicast push listener
 *
 *
 *	Copyright 2026 - motionpp authors
 *
 *	Licensed under GNU General Public License 3.0 or later.
 *	Some rights reserved. See COPYING, AUTHORS.
 *
 *	@license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionMulticast.hpp"
#include "motionMessage.hpp"
#include "motionLog.hpp"
#include <chrono>
#include <cstring>
#include <errno.h>


motionMulticast::motionMulticast(const std::string &interface, motionDatagramFactory factory) :
	m_interface(interface),
	m_factory(factory),
	m_running(false)
{
}


motionMulticast::~motionMulticast()
{
	Stop();
}


void motionMulticast::Register(const std::string &ip, Callback callback)
{
	std::lock_guard<std::mutex> lock(m_callback_mutex);
	if (m_callbacks.find(ip) != m_callbacks.end())
		MOTION_ERROR("a callback for ip " << ip << " was already registered, overwriting previous callback");
	m_callbacks[ip] = callback;
}


void motionMulticast::Unregister(const std::string &ip)
{
	{
		std::lock_guard<std::mutex> lock(m_callback_mutex);
		m_callbacks.erase(ip);
	}
	// wait out a callback for `ip` that is already running
	std::lock_guard<std::recursive_mutex> dispatch_lock(m_dispatch_mutex);
}


bool motionMulticast::isRegistered(const std::string &ip)
{
	std::lock_guard<std::mutex> lock(m_callback_mutex);
	return (m_callbacks.find(ip) != m_callbacks.end());
}


bool motionMulticast::Start()
{
	std::lock_guard<std::mutex> lock(m_control_mutex);
	if (m_running)
	{
		MOTION_ERROR("multicast listener already started, not starting another one");
		return false;
	}

	if (!m_socket)
	{
		m_socket = m_factory();
		if (!m_socket->OpenMulticast(m_interface))
		{
			MOTION_ERROR("cannot open multicast socket on interface " << m_interface << ": " << strerror(m_socket->getlasterror()));
			m_socket.reset();
			return false;
		}
	}

	if (m_thread.joinable())
		m_thread.join();
	m_running = true;
	m_thread = std::thread(&motionMulticast::Loop, this);
	MOTION_INFO("multicast listener started on interface " << m_interface);
	return true;
}


void motionMulticast::Stop()
{
	if (std::this_thread::get_id() == m_thread.get_id())
	{
		// called from a callback, the loop ends after this dispatch and a
		// later Stop() or Start() from another thread joins it
		m_running = false;
		return;
	}

	std::lock_guard<std::mutex> lock(m_control_mutex);
	m_running = false;
	if (m_thread.joinable())
	{
		MOTION_DEBUG("multicast listener shutting down");
		m_thread.join();
		MOTION_INFO("multicast listener stopped");
	}
	if (m_socket)
	{
		m_socket->disconnect();
		m_socket.reset();
	}
}


void motionMulticast::Dispatch(const std::string &source, const unsigned char *buffer, const int size)
{
	try
	{
		Json::Value jMessage = Motion::Message::decode((const char*)buffer, size);

		std::lock_guard<std::recursive_mutex> dispatch_lock(m_dispatch_mutex);
		Callback callback;
		{
			std::lock_guard<std::mutex> lock(m_callback_mutex);
			std::map<std::string, Callback>::iterator it = m_callbacks.find(source);
			if (it != m_callbacks.end())
				callback = it->second;
		}
		if (!callback)
		{
			MOTION_DEBUG("message from unknown gateway ip " << source << " dropped");
			return;
		}
		callback(jMessage);
	}
	catch (const std::exception &e)
	{
		MOTION_ERROR("cannot process multicast message from " << source << ": " << e.what() << ", raw: '" << Motion::Message::redact(std::string((const char*)buffer, size)) << "'");
	}
}


/* private */ void motionMulticast::Loop()
{
	unsigned char message_buffer[MOTION_SOCKET_BUFSIZE];
	std::string source;
	while (m_running)
	{
		int numbytes = m_socket->receive(message_buffer, MOTION_SOCKET_BUFSIZE, MOTION_MULTICAST_POLL_MS, &source);
		if (numbytes < 0)
		{
			if (m_socket->getlasterror() != EAGAIN)
			{
				MOTION_ERROR("UDP error in multicast listener: " << strerror(m_socket->getlasterror()));
				std::this_thread::sleep_for(std::chrono::milliseconds(MOTION_MULTICAST_POLL_MS));
			}
			continue;
		}
		Dispatch(source, message_buffer, numbytes);
	}
}
