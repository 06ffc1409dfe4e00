/*
 *  Client interface for local Motion blinds gateway access
 *
 *  Access token derivation
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#define MOTION_KEY_SIZE 16

#include "motionCredentials.hpp"
#include "motionErrors.hpp"
#include "motionLog.hpp"
#include "crypt/aes_128_ecb.hpp"
#include <vector>


motionCredentials::motionCredentials(const std::string &key, const std::string &token) :
	m_key(key),
	m_token(token)
{
}


std::string motionCredentials::getToken() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_token;
}


bool motionCredentials::setToken(const std::string &token)
{
	std::lock_guard<std::mutex> lock(m_mutex);
	if (token == m_token)
		return false;
	m_token = token;
	m_access_token.clear();
	return true;
}


bool motionCredentials::hasAccessToken() const
{
	std::lock_guard<std::mutex> lock(m_mutex);
	return !m_access_token.empty();
}


std::string motionCredentials::getAccessToken()
{
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_access_token.empty())
		m_access_token = DeriveAccessToken(m_key, m_token);
	return m_access_token;
}


std::string motionCredentials::DeriveAccessToken(const std::string &key, const std::string &token)
{
	if (key.empty())
		throw Motion::CredentialError("no key specified, cannot calculate the AccessToken");
	if (token.empty())
		throw Motion::CredentialError("no token available, cannot calculate the AccessToken");
	if (key.length() != MOTION_KEY_SIZE)
		throw Motion::CredentialError("key must be 16 characters long, got " + std::to_string(key.length()));
	if (token.length() % MOTION_KEY_SIZE != 0)
		throw Motion::CredentialError("token length " + std::to_string(token.length()) + " is not a multiple of 16");

	std::vector<unsigned char> cEncrypted(token.length() + MOTION_KEY_SIZE);
	int encryptedSize = 0;
	if (!Motion::aes_128_ecb_encrypt((const unsigned char*)key.c_str(), (const unsigned char*)token.c_str(), (int)token.length(), cEncrypted.data(), &encryptedSize))
		throw Motion::CredentialError("AES encryption of the token failed");

	static const char hexdigits[] = "0123456789ABCDEF";
	std::string szAccessToken;
	szAccessToken.reserve(encryptedSize * 2);
	for (int i = 0; i < encryptedSize; i++)
	{
		szAccessToken.push_back(hexdigits[(cEncrypted[i] >> 4) & 0x0F]);
		szAccessToken.push_back(hexdigits[cEncrypted[i] & 0x0F]);
	}
	MOTION_DEBUG("derived new AccessToken");
	return szAccessToken;
}
