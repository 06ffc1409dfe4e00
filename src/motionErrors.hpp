/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Error types raised by the protocol layer
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionErrors
#define _motionErrors

#include <stdexcept>
#include <string>


namespace Motion {

class Error : public std::runtime_error
{
public:
	explicit Error(const std::string &what) : std::runtime_error(what) {}
};

// key or token missing, or not usable as an AES-128 key/block
class CredentialError : public Error
{
public:
	explicit CredentialError(const std::string &what) : Error(what) {}
};

// unicast retries exhausted or no multicast push within the wait
class TimeoutError : public Error
{
public:
	explicit TimeoutError(const std::string &what) : Error(what) {}
};

// bytes on the wire are not a JSON document
class DecodeError : public Error
{
public:
	explicit DecodeError(const std::string &what) : Error(what) {}
};

// valid JSON that does not have the shape the protocol promises
class ParseError : public Error
{
public:
	explicit ParseError(const std::string &what) : Error(what) {}
};

// motion command arguments out of range
class CommandError : public Error
{
public:
	explicit CommandError(const std::string &what) : Error(what) {}
};

}; // namespace Motion

#endif
