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

#ifndef _motionLog
#define _motionLog

#include <string>
#include <sstream>
#include <ostream>


namespace Motion {
  namespace Log {
    enum class Level {
      Debug,
      Info,
      Warning,
      Error,
      None
    };

    // Output goes to std::cerr until a different stream is set
    void setOutput(std::ostream *out);
    void setLevel(Level level);
    Level getLevel();

    bool enabled(Level level);
    void write(Level level, const std::string &message);
  }; // namespace Log
}; // namespace Motion


#define MOTION_LOG(level, expr) \
	do { \
		if (Motion::Log::enabled(level)) \
		{ \
			std::ostringstream _motion_log_line; \
			_motion_log_line << expr; \
			Motion::Log::write(level, _motion_log_line.str()); \
		} \
	} while (0)

#define MOTION_DEBUG(expr) MOTION_LOG(Motion::Log::Level::Debug, expr)
#define MOTION_INFO(expr) MOTION_LOG(Motion::Log::Level::Info, expr)
#define MOTION_WARNING(expr) MOTION_LOG(Motion::Log::Level::Warning, expr)
#define MOTION_ERROR(expr) MOTION_LOG(Motion::Log::Level::Error, expr)

#endif
