/*
* (C) 2011,2017 Jack Lloyd
*     2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_NIST_KEY_WRAP_H_
#define KEYWRAP_NIST_KEY_WRAP_H_

#include <keywrap/secmem.h>
#include <span>
#include <vector>

namespace Keywrap {

class BlockCipher;

/**
* Key wrap. See RFC 3394 and NIST SP800-38F
* @param input the value to be encrypted
* @param input_len length of input, must be a multiple of 8 and at least 16
* @param bc a keyed 128-bit block cipher that will be used to encrypt input
* @return input encrypted under NIST key wrap algorithm
*/
std::vector<uint8_t> KEYWRAP_PUBLIC_API(1, 0)
   nist_key_wrap(const uint8_t input[], size_t input_len, const BlockCipher& bc);

/**
* @param input the value to be decrypted, output of nist_key_wrap
* @param input_len length of input, must be a multiple of 8 and at least 24
* @param bc a keyed 128-bit block cipher that will be used to decrypt input
* @return input decrypted under NIST key wrap algorithm
* Throws an exception if decryption fails.
*/
secure_vector<uint8_t> KEYWRAP_PUBLIC_API(1, 0)
   nist_key_unwrap(const uint8_t input[], size_t input_len, const BlockCipher& bc);

/**
* KWP (key wrap with padding). See RFC 5649 and NIST SP800-38F
* @param input the value to be encrypted
* @param input_len length of input, between 1 and 2^32-1 bytes
* @param bc a keyed 128-bit block cipher that will be used to encrypt input
* @return input encrypted under NIST key wrap algorithm
*/
std::vector<uint8_t> KEYWRAP_PUBLIC_API(1, 0)
   nist_key_wrap_padded(const uint8_t input[], size_t input_len, const BlockCipher& bc);

/**
* @param input the value to be decrypted, output of nist_key_wrap_padded
* @param input_len length of input, must be a multiple of 8 and at least 16
* @param bc a keyed 128-bit block cipher that will be used to decrypt input
* @return input decrypted under NIST key wrap algorithm
* Throws an exception if decryption fails.
*/
secure_vector<uint8_t> KEYWRAP_PUBLIC_API(1, 0)
   nist_key_unwrap_padded(const uint8_t input[], size_t input_len, const BlockCipher& bc);

/*
* Caller buffer variants. Each returns the number of bytes written to output,
* or throws Buffer_Too_Small without writing anything if output is too short.
*/

size_t KEYWRAP_PUBLIC_API(1, 0)
   nist_key_wrap(std::span<const uint8_t> input, std::span<uint8_t> output, const BlockCipher& bc);

size_t KEYWRAP_PUBLIC_API(1, 0)
   nist_key_unwrap(std::span<const uint8_t> input, std::span<uint8_t> output, const BlockCipher& bc);

size_t KEYWRAP_PUBLIC_API(1, 0)
   nist_key_wrap_padded(std::span<const uint8_t> input, std::span<uint8_t> output, const BlockCipher& bc);

/**
* Unlike the other caller buffer variants, the required output length is
* only known once the input has been authenticated. If output is shorter
* than the unwrapped key Buffer_Too_Small is thrown after authentication,
* still without writing to output.
*/
size_t KEYWRAP_PUBLIC_API(1, 0)
   nist_key_unwrap_padded(std::span<const uint8_t> input, std::span<uint8_t> output, const BlockCipher& bc);

/**
* @return length of nist_key_wrap output for an input of input_len bytes
*/
inline constexpr size_t nist_key_wrap_output_length(size_t input_len) {
   return input_len + 8;
}

/**
* @return length of nist_key_wrap_padded output for an input of input_len bytes
*/
inline constexpr size_t nist_key_wrap_padded_output_length(size_t input_len) {
   return input_len + (8 - input_len % 8) % 8 + 8;
}

/**
* @return the length of nist_key_unwrap output, or an upper bound on the
* length of nist_key_unwrap_padded output, for a wrapped input of
* wrapped_len bytes
*/
inline constexpr size_t nist_key_unwrap_output_length(size_t wrapped_len) {
   return (wrapped_len >= 8) ? wrapped_len - 8 : 0;
}

}  // namespace Keywrap

#endif
