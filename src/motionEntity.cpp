/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Base class of gateways and blinds
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionEntity.hpp"
#include "motionLog.hpp"
#include <vector>
#include <stdexcept>


void motionEntity::RegisterCallback(const std::string &id, Callback callback)
{
	std::lock_guard<std::mutex> lock(m_callback_mutex);
	if (m_callbacks.find(id) != m_callbacks.end())
		MOTION_WARNING("callback '" << id << "' was already registered, overwriting previous callback");
	m_callbacks[id] = callback;
}


void motionEntity::UnregisterCallback(const std::string &id)
{
	std::lock_guard<std::mutex> lock(m_callback_mutex);
	m_callbacks.erase(id);
}


void motionEntity::NotifyCallbacks()
{
	std::vector<std::pair<std::string, Callback> > callbacks;
	{
		std::lock_guard<std::mutex> lock(m_callback_mutex);
		callbacks.assign(m_callbacks.begin(), m_callbacks.end());
	}

	for (const std::pair<std::string, Callback> &callback : callbacks)
	{
		try
		{
			callback.second();
		}
		catch (const std::exception &e)
		{
			MOTION_ERROR("callback '" << callback.first << "' failed: " << e.what());
		}
	}
}
