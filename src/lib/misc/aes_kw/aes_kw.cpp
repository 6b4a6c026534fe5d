/*
* AES key wrapping under a fixed KEK
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/aes_kw.h>

#include <keywrap/exceptn.h>
#include <keywrap/nist_keywrap.h>
#include <keywrap/internal/fmt.h>

namespace Keywrap {

AES_Key_Wrap::AES_Key_Wrap(std::span<const uint8_t> kek) {
   if(kek.size() != 16 && kek.size() != 24 && kek.size() != 32) {
      throw Invalid_Key_Length("AES key wrap", kek.size());
   }

   m_cipher = BlockCipher::create_or_throw(fmt("AES-{}", 8 * kek.size()));
   m_cipher->set_key(kek);
}

const BlockCipher& AES_Key_Wrap::cipher() const {
   KEYWRAP_STATE_CHECK(m_cipher != nullptr);
   return *m_cipher;
}

std::string AES_Key_Wrap::name() const {
   return cipher().name();
}

std::vector<uint8_t> AES_Key_Wrap::wrap(std::span<const uint8_t> key) const {
   return nist_key_wrap(key.data(), key.size(), cipher());
}

secure_vector<uint8_t> AES_Key_Wrap::unwrap(std::span<const uint8_t> wrapped) const {
   return nist_key_unwrap(wrapped.data(), wrapped.size(), cipher());
}

std::vector<uint8_t> AES_Key_Wrap::wrap_padded(std::span<const uint8_t> key) const {
   return nist_key_wrap_padded(key.data(), key.size(), cipher());
}

secure_vector<uint8_t> AES_Key_Wrap::unwrap_padded(std::span<const uint8_t> wrapped) const {
   return nist_key_unwrap_padded(wrapped.data(), wrapped.size(), cipher());
}

size_t AES_Key_Wrap::wrap(std::span<const uint8_t> key, std::span<uint8_t> output) const {
   return nist_key_wrap(key, output, cipher());
}

size_t AES_Key_Wrap::unwrap(std::span<const uint8_t> wrapped, std::span<uint8_t> output) const {
   return nist_key_unwrap(wrapped, output, cipher());
}

size_t AES_Key_Wrap::wrap_padded(std::span<const uint8_t> key, std::span<uint8_t> output) const {
   return nist_key_wrap_padded(key, output, cipher());
}

size_t AES_Key_Wrap::unwrap_padded(std::span<const uint8_t> wrapped, std::span<uint8_t> output) const {
   return nist_key_unwrap_padded(wrapped, output, cipher());
}

}  // namespace Keywrap
