/*
* Helpers shared by the C API implementation
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_FFI_UTILS_H_
#define KEYWRAP_FFI_UTILS_H_

#include <keywrap/exceptn.h>
#include <keywrap/ffi.h>
#include <keywrap/mem_ops.h>
#include <concepts>
#include <exception>
#include <new>
#include <span>

namespace Keywrap_FFI {

void ffi_clear_last_exception();

/**
* Record exn as the message of the last exception in this thread
* @return rc
*/
int ffi_error_exception_thrown(const char* func_name, const char* exn, int rc);

int ffi_map_error_type(Keywrap::ErrorType err);

/**
* Call fn and turn anything it throws into a return code. No exception
* may cross into C.
*/
template <std::invocable Fn>
int ffi_guard_thunk(const char* func_name, Fn fn) {
   ffi_clear_last_exception();

   try {
      return fn();
   } catch(std::bad_alloc&) {
      return ffi_error_exception_thrown(func_name, "bad_alloc", KEYWRAP_FFI_ERROR_OUT_OF_MEMORY);
   } catch(Keywrap::Exception& e) {
      return ffi_error_exception_thrown(func_name, e.what(), ffi_map_error_type(e.error_type()));
   } catch(std::exception& e) {
      return ffi_error_exception_thrown(func_name, e.what(), KEYWRAP_FFI_ERROR_EXCEPTION_THROWN);
   } catch(...) {
      return ffi_error_exception_thrown(func_name, "unknown exception", KEYWRAP_FFI_ERROR_UNKNOWN_ERROR);
   }
}

template <typename... Ptrs>
bool any_null_pointers(Ptrs... ptr) {
   return ((ptr == nullptr) || ...);
}

/**
* Copy buf to out following the length protocol of ffi.h: *out_len is
* always set to buf.size(), and a short buffer is zeroed instead
*/
template <typename T>
   requires(sizeof(T) == 1)
int write_output(T out[], size_t* out_len, std::span<const T> buf) {
   if(out_len == nullptr) {
      return KEYWRAP_FFI_ERROR_NULL_POINTER;
   }

   const size_t avail = *out_len;
   *out_len = buf.size();

   if(out == nullptr || avail < buf.size()) {
      if(out != nullptr) {
         Keywrap::clear_mem(out, avail);
      }
      return KEYWRAP_FFI_ERROR_INSUFFICIENT_BUFFER_SPACE;
   }

   Keywrap::copy_mem(out, buf.data(), buf.size());
   return KEYWRAP_FFI_SUCCESS;
}

}  // namespace Keywrap_FFI

#endif
