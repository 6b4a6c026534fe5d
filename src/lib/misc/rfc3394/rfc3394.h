/*
* AES Key Wrap (RFC 3394) and with padding (RFC 5649)
* (C) 2011 Jack Lloyd
*     2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_RFC3394_H_
#define KEYWRAP_RFC3394_H_

#include <keywrap/secmem.h>
#include <span>

namespace Keywrap {

/**
* One-shot AES-KW. Each call runs the AES key schedule; use AES_Key_Wrap
* to wrap several keys under one KEK.
*
* @param key the key to wrap, a multiple of 8 bytes and at least 16
* @param kek 16, 24 or 32 bytes, selecting AES-128, AES-192 or AES-256
* @throws Invalid_Key_Length for any other kek length
*/
secure_vector<uint8_t> KEYWRAP_PUBLIC_API(1, 0)
   rfc3394_keywrap(std::span<const uint8_t> key, std::span<const uint8_t> kek);

/**
* Inverse of rfc3394_keywrap
* @throws Invalid_Authentication_Tag if key was not wrapped under kek
*/
secure_vector<uint8_t> KEYWRAP_PUBLIC_API(1, 0)
   rfc3394_keyunwrap(std::span<const uint8_t> key, std::span<const uint8_t> kek);

/**
* One-shot AES-KWP, for keys of 1 to 2^32-1 bytes
*/
secure_vector<uint8_t> KEYWRAP_PUBLIC_API(1, 0)
   rfc5649_keywrap(std::span<const uint8_t> key, std::span<const uint8_t> kek);

/**
* Decrypt the output of rfc5649_keywrap
*/
secure_vector<uint8_t> KEYWRAP_PUBLIC_API(1, 0)
   rfc5649_keyunwrap(std::span<const uint8_t> key, std::span<const uint8_t> kek);

}  // namespace Keywrap

#endif
