/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Access token derivation
 *
 *  The gateway authenticates write requests with an AccessToken, which is
 *  the uppercase hex form of AES-128-ECB(token, key). The key is the
 *  16 character pairing key shown in the vendor app, the token is handed
 *  out by the gateway and rotates. The derived value is cached until the
 *  token changes.
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motionCredentials
#define _motionCredentials

#include <string>
#include <mutex>


class motionCredentials
{
public:
	motionCredentials(const std::string &key, const std::string &token = "");

	const std::string &getKey() const { return m_key; }
	std::string getToken() const;

	// Replaces the session token, dropping the cached access token if it differs.
	// Returns true if the token actually changed.
	bool setToken(const std::string &token);

	// Throws Motion::CredentialError if key or token are missing or unusable
	std::string getAccessToken();

	bool hasAccessToken() const;

	static std::string DeriveAccessToken(const std::string &key, const std::string &token);

private:
	const std::string m_key;
	std::string m_token;
	std::string m_access_token;
	mutable std::mutex m_mutex;
};

#endif
