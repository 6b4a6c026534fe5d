/*
* Fixed width types and the build configuration
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_TYPES_H_
#define KEYWRAP_TYPES_H_

#include <keywrap/api.h>     // IWYU pragma: export
#include <keywrap/assert.h>  // IWYU pragma: export
#include <keywrap/build.h>   // IWYU pragma: export
#include <cstddef>           // IWYU pragma: export
#include <cstdint>           // IWYU pragma: export
#include <memory>            // IWYU pragma: export

namespace Keywrap {

/**
* @mainpage Keywrap API Reference
*
* Key wrapping: @ref nist_keywrap.h "AES-KW and AES-KWP", @ref rfc3394.h "RFC 3394 / RFC 5649",
* @ref AES_Key_Wrap and @ref BelT_KWP. Ciphers are reached through BlockCipher.
* The C API is in @ref ffi.h.
*/

using std::size_t;
using std::uint16_t;
using std::uint32_t;
using std::uint64_t;
using std::uint8_t;

}  // namespace Keywrap

#endif
