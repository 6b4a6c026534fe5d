/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/assert.h>

#include <keywrap/exceptn.h>
#include <keywrap/internal/fmt.h>

namespace Keywrap {

void throw_invalid_argument(const char* message, const char* func, const char* file) {
   throw Invalid_Argument(fmt("{} in {}:{}", message, func, file));
}

void throw_invalid_state(const char* expr, const char* func, const char* file) {
   throw Invalid_State(fmt("Invalid state: {} does not hold in {}:{}", expr, func, file));
}

void assertion_failure(const char* expr_str, const char* assertion_made, const char* func, const char* file, int line) {
   const std::string what = (assertion_made != nullptr && assertion_made[0] != '\0')
                               ? fmt("'{}' ({})", assertion_made, expr_str)
                               : std::string(expr_str);

   throw Internal_Error(fmt("failed assertion {} in {} at {}:{}", what, func, file, line));
}

}  // namespace Keywrap
