/*
 *  Client interface for local Motion blinds gateway access
 *
 *  AES-128 ECB encrypt module
 *
 *  The gateway expects a single raw cipher block per 16 byte input block,
 *  so padding is disabled and the input size must be a multiple of 16.
 *
 *
 *  Copyright 2026 - motionpp authors
 *
 *  Licensed under GNU General Public License 3.0 or later.
 *  Some rights reserved. See COPYING, AUTHORS.
 *
 *  @license GPL-3.0+ <https://www.gnu.org/licenses/gpl-3.0.html>
 */

#ifndef _motion_aes_128_ecb
#define _motion_aes_128_ecb

#include <openssl/evp.h>


namespace Motion {

static bool aes_128_ecb_encrypt(const unsigned char *cEncryptionKey, const unsigned char *cInputBuffer, int inputSize, unsigned char *cOutputBuffer, int *outputSize)
{
	int len;
	*outputSize = 0;

	if ((inputSize <= 0) || (inputSize % 16 != 0))
		return false;

	EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
	if (!ctx)
		return false;

	if (EVP_EncryptInit_ex(ctx, EVP_aes_128_ecb(), nullptr, cEncryptionKey, nullptr) == 1)
	{
		EVP_CIPHER_CTX_set_padding(ctx, 0);
		if (EVP_EncryptUpdate(ctx, cOutputBuffer, &len, cInputBuffer, inputSize) == 1)
		{
			*outputSize = len;
			if (EVP_EncryptFinal_ex(ctx, cOutputBuffer + len, &len) == 1)
			{
				*outputSize += len;
				EVP_CIPHER_CTX_free(ctx);
				return true;
			}
		}
	}

	EVP_CIPHER_CTX_free(ctx);
	return false;
}

}; // namespace Motion

#endif
