/*
* C API: key wrapping
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/ffi.h>

#include <keywrap/block_cipher.h>
#include <keywrap/nist_keywrap.h>
#include <keywrap/internal/ffi_util.h>
#include <string>

#if defined(KEYWRAP_HAS_BELT_KWP)
   #include <keywrap/belt_kwp.h>
#endif

namespace {

std::unique_ptr<Keywrap::BlockCipher> keyed_cipher(const char* algo, const uint8_t kek[], size_t kek_len) {
   auto bc = Keywrap::BlockCipher::create_or_throw(algo);
   bc->set_key(kek, kek_len);
   return bc;
}

/*
* Empty for a KEK length no AES variant takes
*/
std::string aes_for_kek_length(size_t kek_len) {
   if(kek_len == 16 || kek_len == 24 || kek_len == 32) {
      return "AES-" + std::to_string(8 * kek_len);
   }
   return "";
}

}  // namespace

extern "C" {

using namespace Keywrap_FFI;

int keywrap_nist_kw_enc(const char* cipher_algo,
                        int padded,
                        const uint8_t key[],
                        size_t key_len,
                        const uint8_t kek[],
                        size_t kek_len,
                        uint8_t wrapped_key[],
                        size_t* wrapped_key_len) {
   return ffi_guard_thunk(__func__, [=]() -> int {
      if(any_null_pointers(cipher_algo, key, kek, wrapped_key_len)) {
         return KEYWRAP_FFI_ERROR_NULL_POINTER;
      }
      if(padded != 0 && padded != 1) {
         return KEYWRAP_FFI_ERROR_NOT_IMPLEMENTED;
      }

      const auto bc = keyed_cipher(cipher_algo, kek, kek_len);
      const auto wrapped = padded ? Keywrap::nist_key_wrap_padded(key, key_len, *bc)
                                  : Keywrap::nist_key_wrap(key, key_len, *bc);
      return write_output<uint8_t>(wrapped_key, wrapped_key_len, wrapped);
   });
}

int keywrap_nist_kw_dec(const char* cipher_algo,
                        int padded,
                        const uint8_t wrapped_key[],
                        size_t wrapped_key_len,
                        const uint8_t kek[],
                        size_t kek_len,
                        uint8_t key[],
                        size_t* key_len) {
   return ffi_guard_thunk(__func__, [=]() -> int {
      if(any_null_pointers(cipher_algo, wrapped_key, kek, key_len)) {
         return KEYWRAP_FFI_ERROR_NULL_POINTER;
      }
      if(key != nullptr) {
         Keywrap::clear_mem(key, *key_len);
      }
      if(padded != 0 && padded != 1) {
         return KEYWRAP_FFI_ERROR_NOT_IMPLEMENTED;
      }

      const auto bc = keyed_cipher(cipher_algo, kek, kek_len);
      const auto unwrapped = padded ? Keywrap::nist_key_unwrap_padded(wrapped_key, wrapped_key_len, *bc)
                                    : Keywrap::nist_key_unwrap(wrapped_key, wrapped_key_len, *bc);
      return write_output<uint8_t>(key, key_len, unwrapped);
   });
}

int keywrap_key_wrap3394(const uint8_t key[],
                         size_t key_len,
                         const uint8_t kek[],
                         size_t kek_len,
                         uint8_t wrapped_key[],
                         size_t* wrapped_key_len) {
   const std::string aes = aes_for_kek_length(kek_len);
   if(aes.empty()) {
      return KEYWRAP_FFI_ERROR_INVALID_KEY_LENGTH;
   }
   return keywrap_nist_kw_enc(aes.c_str(), 0, key, key_len, kek, kek_len, wrapped_key, wrapped_key_len);
}

int keywrap_key_unwrap3394(const uint8_t wrapped_key[],
                           size_t wrapped_key_len,
                           const uint8_t kek[],
                           size_t kek_len,
                           uint8_t key[],
                           size_t* key_len) {
   const std::string aes = aes_for_kek_length(kek_len);
   if(aes.empty()) {
      return KEYWRAP_FFI_ERROR_INVALID_KEY_LENGTH;
   }
   return keywrap_nist_kw_dec(aes.c_str(), 0, wrapped_key, wrapped_key_len, kek, kek_len, key, key_len);
}

int keywrap_belt_kwp_wrap(const uint8_t kek[],
                          size_t kek_len,
                          const uint8_t header[16],
                          const uint8_t key[],
                          size_t key_len,
                          uint8_t wrapped_key[],
                          size_t* wrapped_key_len) {
#if defined(KEYWRAP_HAS_BELT_KWP)
   return ffi_guard_thunk(__func__, [=]() -> int {
      if(any_null_pointers(kek, header, key, wrapped_key_len)) {
         return KEYWRAP_FFI_ERROR_NULL_POINTER;
      }

      const Keywrap::BelT_KWP kwp(std::span{kek, kek_len});
      const auto wrapped = kwp.wrap(std::span{key, key_len}, std::span{header, Keywrap::BelT_KWP::HEADER_LENGTH});
      return write_output<uint8_t>(wrapped_key, wrapped_key_len, wrapped);
   });
#else
   KEYWRAP_UNUSED(kek, kek_len, header, key, key_len, wrapped_key, wrapped_key_len);
   return KEYWRAP_FFI_ERROR_NOT_IMPLEMENTED;
#endif
}

int keywrap_belt_kwp_unwrap(const uint8_t kek[],
                            size_t kek_len,
                            const uint8_t header[16],
                            const uint8_t wrapped_key[],
                            size_t wrapped_key_len,
                            uint8_t key[],
                            size_t* key_len) {
#if defined(KEYWRAP_HAS_BELT_KWP)
   return ffi_guard_thunk(__func__, [=]() -> int {
      if(any_null_pointers(kek, header, wrapped_key, key_len)) {
         return KEYWRAP_FFI_ERROR_NULL_POINTER;
      }
      if(key != nullptr) {
         Keywrap::clear_mem(key, *key_len);
      }

      const Keywrap::BelT_KWP kwp(std::span{kek, kek_len});
      const auto unwrapped =
         kwp.unwrap(std::span{wrapped_key, wrapped_key_len}, std::span{header, Keywrap::BelT_KWP::HEADER_LENGTH});
      return write_output<uint8_t>(key, key_len, unwrapped);
   });
#else
   KEYWRAP_UNUSED(kek, kek_len, header, wrapped_key, wrapped_key_len, key, key_len);
   return KEYWRAP_FFI_ERROR_NOT_IMPLEMENTED;
#endif
}
}
