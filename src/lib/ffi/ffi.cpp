/*
* C API: errors, versions and utilities
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/ffi.h>

#include <keywrap/hex.h>
#include <keywrap/mem_ops.h>
#include <keywrap/version.h>
#include <keywrap/internal/ffi_util.h>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace Keywrap_FFI {

namespace {

// NOLINTNEXTLINE(*-avoid-non-const-global-variables)
thread_local std::string g_last_exception_what;

bool print_exceptions() {
   const char* env = std::getenv("KEYWRAP_FFI_PRINT_EXCEPTIONS");
   return env != nullptr && env[0] != '\0';
}

}  // namespace

int ffi_map_error_type(Keywrap::ErrorType err) {
   switch(err) {
      case Keywrap::ErrorType::OutOfMemory:
         return KEYWRAP_FFI_ERROR_OUT_OF_MEMORY;
      case Keywrap::ErrorType::InternalError:
         return KEYWRAP_FFI_ERROR_INTERNAL_ERROR;
      case Keywrap::ErrorType::OpenSSLError:
         return KEYWRAP_FFI_ERROR_SYSTEM_ERROR;
      case Keywrap::ErrorType::InvalidObjectState:
         return KEYWRAP_FFI_ERROR_INVALID_OBJECT_STATE;
      case Keywrap::ErrorType::KeyNotSet:
         return KEYWRAP_FFI_ERROR_KEY_NOT_SET;
      case Keywrap::ErrorType::InvalidArgument:
         return KEYWRAP_FFI_ERROR_BAD_PARAMETER;
      case Keywrap::ErrorType::InvalidKeyLength:
         return KEYWRAP_FFI_ERROR_INVALID_KEY_LENGTH;
      case Keywrap::ErrorType::InvalidDataLength:
         return KEYWRAP_FFI_ERROR_INVALID_INPUT;
      case Keywrap::ErrorType::LookupError:
         return KEYWRAP_FFI_ERROR_NOT_IMPLEMENTED;
      case Keywrap::ErrorType::InvalidTag:
         return KEYWRAP_FFI_ERROR_BAD_MAC;
      case Keywrap::ErrorType::BufferTooSmall:
         return KEYWRAP_FFI_ERROR_INSUFFICIENT_BUFFER_SPACE;
      case Keywrap::ErrorType::Unknown:
         return KEYWRAP_FFI_ERROR_UNKNOWN_ERROR;
   }

   return KEYWRAP_FFI_ERROR_UNKNOWN_ERROR;
}

void ffi_clear_last_exception() {
   g_last_exception_what.clear();
}

int ffi_error_exception_thrown(const char* func_name, const char* exn, int rc) {
   g_last_exception_what.assign(exn);

   if(print_exceptions()) {
      // NOLINTNEXTLINE(*-vararg)
      std::fprintf(stderr, "%s: caught '%s', returning %d\n", func_name, exn, rc);
   }
   return rc;
}

}  // namespace Keywrap_FFI

extern "C" {

using namespace Keywrap_FFI;

const char* keywrap_error_last_exception_message() {
   return g_last_exception_what.c_str();
}

const char* keywrap_error_description(int err) {
   switch(err) {
      case KEYWRAP_FFI_SUCCESS:
         return "OK";
      case KEYWRAP_FFI_ERROR_INVALID_INPUT:
         return "Invalid input";
      case KEYWRAP_FFI_ERROR_BAD_MAC:
         return "Invalid authentication code";
      case KEYWRAP_FFI_ERROR_INSUFFICIENT_BUFFER_SPACE:
         return "Insufficient buffer space";
      case KEYWRAP_FFI_ERROR_EXCEPTION_THROWN:
         return "Exception thrown";
      case KEYWRAP_FFI_ERROR_OUT_OF_MEMORY:
         return "Out of memory";
      case KEYWRAP_FFI_ERROR_SYSTEM_ERROR:
         return "Error in the underlying crypto library";
      case KEYWRAP_FFI_ERROR_INTERNAL_ERROR:
         return "Internal error";
      case KEYWRAP_FFI_ERROR_NULL_POINTER:
         return "Null pointer argument";
      case KEYWRAP_FFI_ERROR_BAD_PARAMETER:
         return "Bad parameter";
      case KEYWRAP_FFI_ERROR_KEY_NOT_SET:
         return "Key not set on object";
      case KEYWRAP_FFI_ERROR_INVALID_KEY_LENGTH:
         return "Invalid key length";
      case KEYWRAP_FFI_ERROR_INVALID_OBJECT_STATE:
         return "Invalid object state";
      case KEYWRAP_FFI_ERROR_NOT_IMPLEMENTED:
         return "Not implemented";
      default:
         return "Unknown error";
   }
}

uint32_t keywrap_ffi_api_version() {
   return KEYWRAP_FFI_API_VERSION;
}

int keywrap_ffi_supports_api(uint32_t api_version) {
   return api_version == KEYWRAP_FFI_API_VERSION ? KEYWRAP_FFI_SUCCESS : -1;
}

const char* keywrap_version_string() {
   return Keywrap::version_cstr();
}

uint32_t keywrap_version_major() {
   return Keywrap::version_major();
}

uint32_t keywrap_version_minor() {
   return Keywrap::version_minor();
}

uint32_t keywrap_version_patch() {
   return Keywrap::version_patch();
}

uint32_t keywrap_version_datestamp() {
   return Keywrap::version_datestamp();
}

int keywrap_constant_time_compare(const uint8_t* x, const uint8_t* y, size_t len) {
   return Keywrap::constant_time_compare({x, len}, {y, len}) ? KEYWRAP_FFI_SUCCESS : -1;
}

int keywrap_scrub_mem(void* mem, size_t bytes) {
   Keywrap::secure_scrub_memory(mem, bytes);
   return KEYWRAP_FFI_SUCCESS;
}

int keywrap_hex_encode(const uint8_t* in, size_t len, char* out, uint32_t flags) {
   return ffi_guard_thunk(__func__, [=]() -> int {
      if(len > 0 && any_null_pointers(in, out)) {
         return KEYWRAP_FFI_ERROR_NULL_POINTER;
      }
      Keywrap::hex_encode(out, in, len, (flags & KEYWRAP_FFI_HEX_LOWER_CASE) == 0);
      return KEYWRAP_FFI_SUCCESS;
   });
}

int keywrap_hex_decode(const char* hex_str, size_t in_len, uint8_t* out, size_t* out_len) {
   return ffi_guard_thunk(__func__, [=]() -> int {
      if(in_len > 0 && hex_str == nullptr) {
         return KEYWRAP_FFI_ERROR_NULL_POINTER;
      }
      const auto bin = Keywrap::hex_decode(std::string_view(hex_str, in_len));
      return write_output<uint8_t>(out, out_len, bin);
   });
}
}
