/*
* Hex codec
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/hex.h>

#include <keywrap/exceptn.h>
#include <keywrap/internal/ct_utils.h>
#include <keywrap/internal/fmt.h>

namespace Keywrap {

namespace {

/*
* Key material is hex encoded and decoded, so neither direction indexes
* a table or branches on the data
*/
char nibble_to_hex(uint8_t n, bool uppercase) {
   const uint8_t letter = static_cast<uint8_t>((uppercase ? 'A' : 'a') + n - 10);
   const uint8_t digit = static_cast<uint8_t>('0' + n);
   return static_cast<char>(CT::Mask<uint8_t>::is_gte(n, 10).select(letter, digit));
}

const uint8_t HEX_WHITESPACE = 0x80;
const uint8_t HEX_INVALID = 0xFF;

uint8_t hex_to_nibble(char ch) {
   const uint8_t c = static_cast<uint8_t>(ch);

   uint8_t r = HEX_INVALID;
   r = CT::Mask<uint8_t>::is_within_range(c, '0', '9').select(static_cast<uint8_t>(c - '0'), r);
   r = CT::Mask<uint8_t>::is_within_range(c, 'a', 'f').select(static_cast<uint8_t>(c - 'a' + 10), r);
   r = CT::Mask<uint8_t>::is_within_range(c, 'A', 'F').select(static_cast<uint8_t>(c - 'A' + 10), r);
   r = CT::Mask<uint8_t>::is_any_of(c, {' ', '\t', '\n', '\r'}).select(HEX_WHITESPACE, r);
   return r;
}

std::string printable(char c) {
   if(c >= 0x20 && c < 0x7F) {
      return std::string(1, c);
   }
   const uint8_t b = static_cast<uint8_t>(c);
   return "0x" + hex_encode(&b, 1);
}

template <typename Alloc>
std::vector<uint8_t, Alloc> decode_to_vector(std::string_view input, bool ignore_ws) {
   std::vector<uint8_t, Alloc> out(input.size() / 2);
   out.resize(hex_decode(out, input, ignore_ws));
   return out;
}

}  // namespace

void hex_encode(char output[], const uint8_t input[], size_t input_length, bool uppercase) {
   for(size_t i = 0; i != input_length; ++i) {
      output[2 * i] = nibble_to_hex(input[i] >> 4, uppercase);
      output[2 * i + 1] = nibble_to_hex(input[i] & 0x0F, uppercase);
   }
}

std::string hex_encode(const uint8_t input[], size_t input_length, bool uppercase) {
   std::string out(2 * input_length, '0');
   hex_encode(out.data(), input, input_length, uppercase);
   return out;
}

size_t hex_decode(std::span<uint8_t> output, std::string_view input, bool ignore_ws) {
   size_t written = 0;
   size_t digits = 0;
   uint8_t high = 0;

   for(char c : input) {
      const uint8_t nibble = hex_to_nibble(c);

      if(nibble == HEX_WHITESPACE && ignore_ws) {
         continue;
      }
      if(nibble > 0x0F) {
         throw Invalid_Argument(fmt("hex_decode: invalid character '{}'", printable(c)));
      }

      if(digits % 2 == 0) {
         high = nibble;
      } else {
         if(written == output.size()) {
            throw Invalid_Argument("hex_decode: output buffer too small");
         }
         output[written++] = static_cast<uint8_t>((high << 4) | nibble);
      }
      ++digits;
   }

   if(digits % 2 != 0) {
      throw Invalid_Argument("hex_decode: input did not have full bytes");
   }

   return written;
}

std::vector<uint8_t> hex_decode(std::string_view input, bool ignore_ws) {
   return decode_to_vector<std::allocator<uint8_t>>(input, ignore_ws);
}

secure_vector<uint8_t> hex_decode_locked(std::string_view input, bool ignore_ws) {
   return decode_to_vector<secure_allocator<uint8_t>>(input, ignore_ws);
}

}  // namespace Keywrap
