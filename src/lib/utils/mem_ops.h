/*
* Memory helpers
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_MEMORY_OPS_H_
#define KEYWRAP_MEMORY_OPS_H_

#include <keywrap/types.h>
#include <cstring>
#include <span>
#include <type_traits>

namespace Keywrap {

/**
* Zero n bytes at ptr with a write the compiler may not drop, even
* when the memory is about to be freed
*/
KEYWRAP_PUBLIC_API(1, 0) void secure_scrub_memory(void* ptr, size_t n);

/**
* Compare two byte ranges without an early exit on the first mismatch
* @return true if x and y have the same length and contents
*/
KEYWRAP_PUBLIC_API(1, 0) bool constant_time_compare(std::span<const uint8_t> x, std::span<const uint8_t> y);

template <typename T>
   requires std::is_trivially_copyable_v<T>
inline void clear_mem(T* ptr, size_t n) {
   if(n > 0) {
      std::memset(ptr, 0, sizeof(T) * n);
   }
}

template <typename T>
   requires std::is_trivially_copyable_v<T>
inline void clear_mem(std::span<T> mem) {
   clear_mem(mem.data(), mem.size());
}

/**
* Copy n elements; the ranges may overlap
*/
template <typename T>
   requires std::is_trivially_copyable_v<T>
inline void copy_mem(T* out, const T* in, size_t n) {
   if(out != nullptr && in != nullptr && n > 0) {
      std::memmove(out, in, sizeof(T) * n);
   }
}

template <typename T>
   requires std::is_trivially_copyable_v<T>
inline void copy_mem(std::span<T> out, std::span<const T> in) {
   KEYWRAP_ARG_CHECK(out.size() == in.size(), "copy_mem ranges must have equal length");
   copy_mem(out.data(), in.data(), out.size());
}

/**
* out[i] ^= in[i] for i < length
*/
inline void xor_buf(uint8_t out[], const uint8_t in[], size_t length) {
   for(size_t i = 0; i != length; ++i) {
      out[i] ^= in[i];
   }
}

/**
* out[i] = a[i] ^ b[i] for i < length
*/
inline void xor_buf(uint8_t out[], const uint8_t a[], const uint8_t b[], size_t length) {
   for(size_t i = 0; i != length; ++i) {
      out[i] = a[i] ^ b[i];
   }
}

inline void xor_buf(std::span<uint8_t> out, std::span<const uint8_t> in) {
   KEYWRAP_ARG_CHECK(out.size() == in.size(), "xor_buf ranges must have equal length");
   xor_buf(out.data(), in.data(), out.size());
}

}  // namespace Keywrap

#endif
