/*
* Word rotations
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_ROTATE_H_
#define KEYWRAP_ROTATE_H_

#include <keywrap/types.h>

namespace Keywrap {

/**
* Rotate left by a compile time constant
*/
template <size_t R, typename T>
inline constexpr T rotl(T x)
   requires(R > 0 && R < 8 * sizeof(T))
{
   return static_cast<T>((x << R) | (x >> (8 * sizeof(T) - R)));
}

/**
* Rotate right by a compile time constant
*/
template <size_t R, typename T>
inline constexpr T rotr(T x)
   requires(R > 0 && R < 8 * sizeof(T))
{
   return static_cast<T>((x >> R) | (x << (8 * sizeof(T) - R)));
}

}  // namespace Keywrap

#endif
