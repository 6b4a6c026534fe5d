/*
* BelT-KWP key wrapping (STB 34.101.31-2020)
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_BELT_KWP_H_
#define KEYWRAP_BELT_KWP_H_

#include <keywrap/block_cipher.h>
#include <keywrap/secmem.h>
#include <array>
#include <memory>
#include <span>
#include <vector>

namespace Keywrap {

class BelT;

/**
* BelT-KWP: key wrapping over the belt-wblock wide block transform.
*
* The wrapped value is belt-wblock(X || I) where X is the key data and I is a
* 16 byte public header which is authenticated on unwrap. A moved-from
* object throws Invalid_State when used.
*/
class KEYWRAP_PUBLIC_API(1, 0) BelT_KWP final {
   public:
      static constexpr size_t HEADER_LENGTH = 16;
      static constexpr size_t BLOCK_LENGTH = 16;

      /**
      * @param kek a 32 byte key encryption key
      * @throws Invalid_Key_Length for any other length
      */
      explicit BelT_KWP(std::span<const uint8_t> kek);

      BelT_KWP(const BelT_KWP& other) = delete;
      BelT_KWP& operator=(const BelT_KWP& other) = delete;
      BelT_KWP(BelT_KWP&& other) noexcept;
      BelT_KWP& operator=(BelT_KWP&& other) noexcept;
      ~BelT_KWP();

      /**
      * Wrap key data whose length is a multiple of 16 and at least 16
      * @param key the key data
      * @param header the 16 byte header
      */
      std::vector<uint8_t> wrap(std::span<const uint8_t> key, std::span<const uint8_t> header) const;

      /**
      * Unwrap and check the header
      * @throws Invalid_Authentication_Tag if the header does not match
      */
      secure_vector<uint8_t> unwrap(std::span<const uint8_t> wrapped, std::span<const uint8_t> header) const;

      /*
      * Caller buffer variants, returning the number of bytes written.
      * Buffer_Too_Small is thrown if output is too short.
      */
      size_t wrap(std::span<const uint8_t> key, std::span<const uint8_t> header, std::span<uint8_t> output) const;
      size_t unwrap(std::span<const uint8_t> wrapped,
                    std::span<const uint8_t> header,
                    std::span<uint8_t> output) const;

      template <size_t N>
         requires(N % BLOCK_LENGTH == 0 && N >= BLOCK_LENGTH)
      std::array<uint8_t, N + HEADER_LENGTH> wrap_fixed(const std::array<uint8_t, N>& key,
                                                        const std::array<uint8_t, HEADER_LENGTH>& header) const {
         std::array<uint8_t, N + HEADER_LENGTH> out;
         wrap(key, header, out);
         return out;
      }

      template <size_t N>
         requires(N % BLOCK_LENGTH == 0 && N >= 2 * BLOCK_LENGTH)
      std::array<uint8_t, N - HEADER_LENGTH> unwrap_fixed(const std::array<uint8_t, N>& wrapped,
                                                          const std::array<uint8_t, HEADER_LENGTH>& header) const {
         std::array<uint8_t, N - HEADER_LENGTH> out;
         unwrap(wrapped, header, out);
         return out;
      }

   private:
      /*
      * The keyed cipher; throws Invalid_State on a moved-from object
      */
      const BelT& cipher() const;

      std::unique_ptr<BelT> m_cipher;
};

}  // namespace Keywrap

#endif
