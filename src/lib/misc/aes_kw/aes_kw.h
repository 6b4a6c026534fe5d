/*
* AES key wrapping under a fixed KEK
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_AES_KEY_WRAP_H_
#define KEYWRAP_AES_KEY_WRAP_H_

#include <keywrap/block_cipher.h>
#include <keywrap/secmem.h>
#include <array>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace Keywrap {

/**
* AES-KW (RFC 3394) and AES-KWP (RFC 5649) under a single key encryption key.
*
* The AES key schedule is computed once at construction and reused by every
* call. All operations are const, so one object may be used from several
* threads at once. A moved-from object throws Invalid_State when used.
*/
class KEYWRAP_PUBLIC_API(1, 0) AES_Key_Wrap final {
   public:
      /**
      * @param kek a 16, 24 or 32 byte key encryption key
      * @throws Invalid_Key_Length for any other length
      */
      explicit AES_Key_Wrap(std::span<const uint8_t> kek);

      AES_Key_Wrap(const AES_Key_Wrap& other) = delete;
      AES_Key_Wrap& operator=(const AES_Key_Wrap& other) = delete;
      AES_Key_Wrap(AES_Key_Wrap&& other) noexcept = default;
      AES_Key_Wrap& operator=(AES_Key_Wrap&& other) noexcept = default;
      ~AES_Key_Wrap() = default;

      /**
      * @return the underlying cipher name, eg "AES-256"
      */
      std::string name() const;

      /**
      * Wrap key data whose length is a multiple of 8 and at least 16
      */
      std::vector<uint8_t> wrap(std::span<const uint8_t> key) const;

      /**
      * Unwrap the output of wrap
      * @throws Invalid_Authentication_Tag if the wrapped key was modified
      */
      secure_vector<uint8_t> unwrap(std::span<const uint8_t> wrapped) const;

      /**
      * Wrap key data of any length from 1 to 2^32-1 bytes
      */
      std::vector<uint8_t> wrap_padded(std::span<const uint8_t> key) const;

      /**
      * Unwrap the output of wrap_padded
      * @throws Invalid_Authentication_Tag if the wrapped key was modified
      */
      secure_vector<uint8_t> unwrap_padded(std::span<const uint8_t> wrapped) const;

      /*
      * Caller buffer variants, returning the number of bytes written.
      * Buffer_Too_Small is thrown if output is too short.
      */
      size_t wrap(std::span<const uint8_t> key, std::span<uint8_t> output) const;
      size_t unwrap(std::span<const uint8_t> wrapped, std::span<uint8_t> output) const;
      size_t wrap_padded(std::span<const uint8_t> key, std::span<uint8_t> output) const;
      size_t unwrap_padded(std::span<const uint8_t> wrapped, std::span<uint8_t> output) const;

      /**
      * Wrap a key whose size is known at compile time, without allocating
      */
      template <size_t N>
         requires(N % 8 == 0 && N >= 16)
      std::array<uint8_t, N + 8> wrap_fixed(const std::array<uint8_t, N>& key) const {
         std::array<uint8_t, N + 8> out;
         wrap(key, out);
         return out;
      }

      /**
      * Unwrap a wrapped key whose size is known at compile time
      */
      template <size_t N>
         requires(N % 8 == 0 && N >= 24)
      std::array<uint8_t, N - 8> unwrap_fixed(const std::array<uint8_t, N>& wrapped) const {
         std::array<uint8_t, N - 8> out;
         unwrap(wrapped, out);
         return out;
      }

   private:
      /*
      * The keyed cipher; throws Invalid_State on a moved-from object
      */
      const BlockCipher& cipher() const;

      std::unique_ptr<BlockCipher> m_cipher;
};

}  // namespace Keywrap

#endif
