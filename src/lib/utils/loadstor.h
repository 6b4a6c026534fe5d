/*
* Endian conversions between words and byte arrays
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_LOAD_STORE_H_
#define KEYWRAP_LOAD_STORE_H_

#include <keywrap/types.h>
#include <concepts>

namespace Keywrap {

/**
* Byte B of x, counting from the most significant byte
*/
template <size_t B, std::unsigned_integral T>
inline constexpr uint8_t get_byte(T x)
   requires(B < sizeof(T))
{
   return static_cast<uint8_t>(x >> (8 * (sizeof(T) - 1 - B)));
}

/**
* Read the off'th big-endian T from in
*/
template <std::unsigned_integral T>
inline constexpr T load_be(const uint8_t in[], size_t off) {
   const uint8_t* p = in + off * sizeof(T);
   T w = 0;
   for(size_t i = 0; i != sizeof(T); ++i) {
      w = static_cast<T>((w << 8) | p[i]);
   }
   return w;
}

/**
* Read the off'th little-endian T from in
*/
template <std::unsigned_integral T>
inline constexpr T load_le(const uint8_t in[], size_t off) {
   const uint8_t* p = in + off * sizeof(T);
   T w = 0;
   for(size_t i = 0; i != sizeof(T); ++i) {
      w |= static_cast<T>(static_cast<T>(p[i]) << (8 * i));
   }
   return w;
}

template <std::unsigned_integral T>
inline constexpr void load_le(T out[], const uint8_t in[], size_t count) {
   for(size_t i = 0; i != count; ++i) {
      out[i] = load_le<T>(in, i);
   }
}

template <std::unsigned_integral T>
inline constexpr void store_be(T w, uint8_t out[sizeof(T)]) {
   for(size_t i = 0; i != sizeof(T); ++i) {
      out[sizeof(T) - 1 - i] = static_cast<uint8_t>(w >> (8 * i));
   }
}

template <std::unsigned_integral T>
inline constexpr void store_le(T w, uint8_t out[sizeof(T)]) {
   for(size_t i = 0; i != sizeof(T); ++i) {
      out[i] = static_cast<uint8_t>(w >> (8 * i));
   }
}

template <std::unsigned_integral T>
inline constexpr void store_le(uint8_t out[], const T in[], size_t count) {
   for(size_t i = 0; i != count; ++i) {
      store_le(in[i], out + i * sizeof(T));
   }
}

}  // namespace Keywrap

#endif
