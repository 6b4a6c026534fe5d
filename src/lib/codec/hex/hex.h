/*
* Hex codec
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_HEX_CODEC_H_
#define KEYWRAP_HEX_CODEC_H_

#include <keywrap/secmem.h>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace Keywrap {

/**
* Write 2 * input_length hex digits to output
*/
void KEYWRAP_PUBLIC_API(1, 0)
   hex_encode(char output[], const uint8_t input[], size_t input_length, bool uppercase = true);

std::string KEYWRAP_PUBLIC_API(1, 0) hex_encode(const uint8_t input[], size_t input_length, bool uppercase = true);

inline std::string hex_encode(std::span<const uint8_t> input, bool uppercase = true) {
   return hex_encode(input.data(), input.size(), uppercase);
}

/**
* Decode hex digits of either case. Spaces, tabs and newlines are
* skipped if ignore_ws is set.
* @return the number of bytes written to output
* @throws Invalid_Argument on a bad character, an odd number of digits,
*         or if output is too short
*/
size_t KEYWRAP_PUBLIC_API(1, 0) hex_decode(std::span<uint8_t> output, std::string_view input, bool ignore_ws = true);

std::vector<uint8_t> KEYWRAP_PUBLIC_API(1, 0) hex_decode(std::string_view input, bool ignore_ws = true);

/**
* hex_decode into a secure_vector, for key material
*/
secure_vector<uint8_t> KEYWRAP_PUBLIC_API(1, 0) hex_decode_locked(std::string_view input, bool ignore_ws = true);

}  // namespace Keywrap

#endif
