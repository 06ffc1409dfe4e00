/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Base class of gateways and blinds: the state lock and the callbacks that
 *  are told about new state.
 *
 *  Callbacks take no arguments; they are expected to read the entity's
 *  accessors. They run on whichever thread parsed the new state, which is
 *  the multicast listener thread for pushes.
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionEntity
#define _motionEntity

#include <string>
#include <map>
#include <mutex>
#include <functional>


class motionEntity
{
public:
	typedef std::function<void()> Callback;

	motionEntity() {}
	virtual ~motionEntity() {}

	motionEntity(const motionEntity&) = delete;
	motionEntity& operator=(const motionEntity&) = delete;

	void RegisterCallback(const std::string &id, Callback callback);
	void UnregisterCallback(const std::string &id);

protected:
	void NotifyCallbacks();

	mutable std::mutex m_state_mutex;

private:
	std::mutex m_callback_mutex;
	std::map<std::string, Callback> m_callbacks;
};

#endif
