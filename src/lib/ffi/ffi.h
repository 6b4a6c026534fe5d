/*
* C89 API
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_FFI_H_
#define KEYWRAP_FFI_H_

#ifdef __cplusplus
extern "C" {
#endif

/*
Conventions:

- Every call returns an int status, 0 on success and a negative
  KEYWRAP_FFI_ERROR value otherwise. The version queries return their value.

- Memory never changes owner. Output goes into a caller buffer described
  by a pointer and a size_t* length. On return the length holds the size
  the output needs. If the buffer is too small (or null) it is zeroed and
  KEYWRAP_FFI_ERROR_INSUFFICIENT_BUFFER_SPACE is returned, so a call with
  a null buffer and a length of 0 queries the size.

- A failed unwrap zeroes the caller's output buffer.
*/

#include <stddef.h>
#include <stdint.h>

/**
* Matches keywrap_ffi_api_version()
*/
#define KEYWRAP_FFI_API_VERSION 20250101

/**
* The arguments name the release that first carried a function
*/
#if defined(KEYWRAP_DLL)
   #define KEYWRAP_FFI_EXPORT(maj, min) KEYWRAP_DLL
#elif defined(__GNUC__) || defined(__clang__)
   #define KEYWRAP_FFI_EXPORT(maj, min) __attribute__((visibility("default")))
#else
   #define KEYWRAP_FFI_EXPORT(maj, min)
#endif

/*
* Keep keywrap_error_description in step with this list
*/
enum KEYWRAP_FFI_ERROR {
   KEYWRAP_FFI_SUCCESS = 0,

   KEYWRAP_FFI_ERROR_INVALID_INPUT = -1,
   KEYWRAP_FFI_ERROR_BAD_MAC = -2,

   KEYWRAP_FFI_ERROR_INSUFFICIENT_BUFFER_SPACE = -10,

   KEYWRAP_FFI_ERROR_EXCEPTION_THROWN = -20,
   KEYWRAP_FFI_ERROR_OUT_OF_MEMORY = -21,
   KEYWRAP_FFI_ERROR_SYSTEM_ERROR = -22,
   KEYWRAP_FFI_ERROR_INTERNAL_ERROR = -23,

   KEYWRAP_FFI_ERROR_NULL_POINTER = -31,
   KEYWRAP_FFI_ERROR_BAD_PARAMETER = -32,
   KEYWRAP_FFI_ERROR_KEY_NOT_SET = -33,
   KEYWRAP_FFI_ERROR_INVALID_KEY_LENGTH = -34,
   KEYWRAP_FFI_ERROR_INVALID_OBJECT_STATE = -35,

   KEYWRAP_FFI_ERROR_NOT_IMPLEMENTED = -40,

   KEYWRAP_FFI_ERROR_UNKNOWN_ERROR = -100,
};

/**
* A static string describing err, "Unknown error" for unknown codes
*/
KEYWRAP_FFI_EXPORT(1, 0) const char* keywrap_error_description(int err);

/**
* The message of the exception behind the last failure in this thread.
* Valid until this thread makes another call.
*/
KEYWRAP_FFI_EXPORT(1, 0) const char* keywrap_error_last_exception_message(void);

/**
* The API version as YYYYMMDD
*/
KEYWRAP_FFI_EXPORT(1, 0) uint32_t keywrap_ffi_api_version(void);

/**
* 0 if api_version is supported, otherwise -1
*/
KEYWRAP_FFI_EXPORT(1, 0) int keywrap_ffi_supports_api(uint32_t api_version);

KEYWRAP_FFI_EXPORT(1, 0) const char* keywrap_version_string(void);

KEYWRAP_FFI_EXPORT(1, 0) uint32_t keywrap_version_major(void);
KEYWRAP_FFI_EXPORT(1, 0) uint32_t keywrap_version_minor(void);
KEYWRAP_FFI_EXPORT(1, 0) uint32_t keywrap_version_patch(void);
KEYWRAP_FFI_EXPORT(1, 0) uint32_t keywrap_version_datestamp(void);

/**
* 0 if x[0..len) equals y[0..len), otherwise -1
*/
KEYWRAP_FFI_EXPORT(1, 0) int keywrap_constant_time_compare(const uint8_t* x, const uint8_t* y, size_t len);

KEYWRAP_FFI_EXPORT(1, 0) int keywrap_scrub_mem(void* mem, size_t bytes);

#define KEYWRAP_FFI_HEX_LOWER_CASE 1

/**
* Write 2*len hex digits to out (upper case unless KEYWRAP_FFI_HEX_LOWER_CASE)
*/
KEYWRAP_FFI_EXPORT(1, 0) int keywrap_hex_encode(const uint8_t* x, size_t len, char* out, uint32_t flags);

/**
* Decode in_len hex digits, skipping whitespace
*/
KEYWRAP_FFI_EXPORT(1, 0) int keywrap_hex_decode(const char* hex_str, size_t in_len, uint8_t* out, size_t* out_len);

/**
* AES-KW (RFC 3394), or AES-KWP (RFC 5649) if padded is 1
* @param cipher_algo a 128-bit cipher, eg "AES-256"
*/
KEYWRAP_FFI_EXPORT(1, 0)
int keywrap_nist_kw_enc(const char* cipher_algo,
                        int padded,
                        const uint8_t key[],
                        size_t key_len,
                        const uint8_t kek[],
                        size_t kek_len,
                        uint8_t wrapped_key[],
                        size_t* wrapped_key_len);

/**
* Returns KEYWRAP_FFI_ERROR_BAD_MAC if wrapped_key does not authenticate
*/
KEYWRAP_FFI_EXPORT(1, 0)
int keywrap_nist_kw_dec(const char* cipher_algo,
                        int padded,
                        const uint8_t wrapped_key[],
                        size_t wrapped_key_len,
                        const uint8_t kek[],
                        size_t kek_len,
                        uint8_t key[],
                        size_t* key_len);

/**
* AES-KW with AES-128, AES-192 or AES-256 chosen by kek_len
*/
KEYWRAP_FFI_EXPORT(1, 0)
int keywrap_key_wrap3394(const uint8_t key[],
                         size_t key_len,
                         const uint8_t kek[],
                         size_t kek_len,
                         uint8_t wrapped_key[],
                         size_t* wrapped_key_len);

KEYWRAP_FFI_EXPORT(1, 0)
int keywrap_key_unwrap3394(const uint8_t wrapped_key[],
                           size_t wrapped_key_len,
                           const uint8_t kek[],
                           size_t kek_len,
                           uint8_t key[],
                           size_t* key_len);

/**
* BelT-KWP (STB 34.101.31-2020) under a 32 byte kek with a 16 byte header.
* key_len must be a multiple of 16, at least 16.
*/
KEYWRAP_FFI_EXPORT(1, 0)
int keywrap_belt_kwp_wrap(const uint8_t kek[],
                          size_t kek_len,
                          const uint8_t header[16],
                          const uint8_t key[],
                          size_t key_len,
                          uint8_t wrapped_key[],
                          size_t* wrapped_key_len);

KEYWRAP_FFI_EXPORT(1, 0)
int keywrap_belt_kwp_unwrap(const uint8_t kek[],
                            size_t kek_len,
                            const uint8_t header[16],
                            const uint8_t wrapped_key[],
                            size_t wrapped_key_len,
                            uint8_t key[],
                            size_t* key_len);

#ifdef __cplusplus
}
#endif

#endif
