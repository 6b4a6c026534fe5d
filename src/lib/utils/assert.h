/*
* Runtime checks
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_ASSERTION_CHECKING_H_
#define KEYWRAP_ASSERTION_CHECKING_H_

#include <keywrap/api.h>

namespace Keywrap {

/**
* Throws Internal_Error describing the failed expression
*/
[[noreturn]] void KEYWRAP_PUBLIC_API(1, 0)
   assertion_failure(const char* expr_str, const char* assertion_made, const char* func, const char* file, int line);

/**
* Throws Invalid_Argument
*/
[[noreturn]] void KEYWRAP_UNSTABLE_API throw_invalid_argument(const char* message, const char* func, const char* file);

/**
* Throws Invalid_State
*/
[[noreturn]] void KEYWRAP_UNSTABLE_API throw_invalid_state(const char* expr, const char* func, const char* file);

}  // namespace Keywrap

/*
* Argument and state checks are caller errors; the ASSERT forms signal
* a bug in the library itself
*/
#define KEYWRAP_ARG_CHECK(expr, msg)                               \
   do {                                                            \
      if(!(expr)) {                                                \
         Keywrap::throw_invalid_argument(msg, __func__, __FILE__); \
      }                                                            \
   } while(0)

#define KEYWRAP_STATE_CHECK(expr)                                 \
   do {                                                           \
      if(!(expr)) {                                               \
         Keywrap::throw_invalid_state(#expr, __func__, __FILE__); \
      }                                                           \
   } while(0)

#define KEYWRAP_ASSERT(expr, assertion_made)                                              \
   do {                                                                                   \
      if(!(expr)) {                                                                       \
         Keywrap::assertion_failure(#expr, assertion_made, __func__, __FILE__, __LINE__); \
      }                                                                                   \
   } while(0)

#define KEYWRAP_ASSERT_NOMSG(expr) KEYWRAP_ASSERT(expr, "")

#if defined(KEYWRAP_ENABLE_DEBUG_ASSERTS)
   #define KEYWRAP_DEBUG_ASSERT(expr) KEYWRAP_ASSERT_NOMSG(expr)
#else
   #define KEYWRAP_DEBUG_ASSERT(expr) \
      do {                            \
      } while(0)
#endif

namespace Keywrap {

template <typename... T>
constexpr void ignore_params(T&&... /*args*/) {}

}  // namespace Keywrap

/*
* Silences unused parameter warnings in configuration dependent code
*/
#define KEYWRAP_UNUSED Keywrap::ignore_params

#endif
