/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Log sink shared by the request thread and the multicast listener thread
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#include "motionLog.hpp"
#include <iostream>
#include <mutex>


namespace {
	std::mutex m_log_mutex;
	std::ostream *m_out = &std::cerr;
	Motion::Log::Level m_level = Motion::Log::Level::Warning;

	const char* levelname(Motion::Log::Level level)
	{
		switch (level)
		{
			case Motion::Log::Level::Debug:
				return "debug";
			case Motion::Log::Level::Info:
				return "info";
			case Motion::Log::Level::Warning:
				return "warning";
			case Motion::Log::Level::Error:
				return "error";
			default:
				break;
		}
		return "";
	}
}


void Motion::Log::setOutput(std::ostream *out)
{
	std::lock_guard<std::mutex> lock(m_log_mutex);
	m_out = out ? out : &std::cerr;
}


void Motion::Log::setLevel(Level level)
{
	std::lock_guard<std::mutex> lock(m_log_mutex);
	m_level = level;
}


Motion::Log::Level Motion::Log::getLevel()
{
	std::lock_guard<std::mutex> lock(m_log_mutex);
	return m_level;
}


bool Motion::Log::enabled(Level level)
{
	if (level == Level::None)
		return false;
	std::lock_guard<std::mutex> lock(m_log_mutex);
	return (level >= m_level);
}


void Motion::Log::write(Level level, const std::string &message)
{
	std::lock_guard<std::mutex> lock(m_log_mutex);
	if ((level == Level::None) || (level < m_level))
		return;
	*m_out << "motion " << levelname(level) << ": " << message << "\n";
	m_out->flush();
}
