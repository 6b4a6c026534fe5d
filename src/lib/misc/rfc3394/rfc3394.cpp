/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/rfc3394.h>

#include <keywrap/aes_kw.h>

namespace Keywrap {

secure_vector<uint8_t> rfc3394_keywrap(std::span<const uint8_t> key, std::span<const uint8_t> kek) {
   const auto wrapped = AES_Key_Wrap(kek).wrap(key);
   return secure_vector<uint8_t>(wrapped.begin(), wrapped.end());
}

secure_vector<uint8_t> rfc3394_keyunwrap(std::span<const uint8_t> key, std::span<const uint8_t> kek) {
   return AES_Key_Wrap(kek).unwrap(key);
}

secure_vector<uint8_t> rfc5649_keywrap(std::span<const uint8_t> key, std::span<const uint8_t> kek) {
   const auto wrapped = AES_Key_Wrap(kek).wrap_padded(key);
   return secure_vector<uint8_t>(wrapped.begin(), wrapped.end());
}

secure_vector<uint8_t> rfc5649_keyunwrap(std::span<const uint8_t> key, std::span<const uint8_t> kek) {
   return AES_Key_Wrap(kek).unwrap_padded(key);
}

}  // namespace Keywrap
