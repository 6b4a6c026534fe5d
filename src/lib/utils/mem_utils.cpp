/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/mem_ops.h>

#include <keywrap/internal/ct_utils.h>

#if defined(KEYWRAP_TARGET_OS_HAS_EXPLICIT_BZERO)
   #include <string.h>
#endif

namespace Keywrap {

void secure_scrub_memory(void* ptr, size_t n) {
#if defined(KEYWRAP_TARGET_OS_HAS_EXPLICIT_BZERO)
   ::explicit_bzero(ptr, n);
#else
   // a volatile function pointer keeps the call from being optimized out
   static void* (*const volatile scrub)(void*, int, size_t) = std::memset;
   scrub(ptr, 0, n);
#endif
}

bool constant_time_compare(std::span<const uint8_t> x, std::span<const uint8_t> y) {
   if(x.size() != y.size()) {
      return false;
   }
   return CT::is_equal(x.data(), y.data(), x.size()).as_bool();
}

}  // namespace Keywrap
