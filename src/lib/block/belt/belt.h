/*
* BelT block cipher (STB 34.101.31-2020)
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_BELT_H_
#define KEYWRAP_BELT_H_

#include <keywrap/block_cipher.h>
#include <keywrap/secmem.h>

namespace Keywrap {

/**
* BelT, the Belarusian standard 128-bit block cipher with a 256-bit key
*/
class BelT final : public Block_Cipher_Fixed_Params<16, 32> {
   public:
      void encrypt_n(const uint8_t in[], uint8_t out[], size_t blocks) const override;
      void decrypt_n(const uint8_t in[], uint8_t out[], size_t blocks) const override;

      void clear() override;

      std::string name() const override { return "BelT"; }

      std::unique_ptr<BlockCipher> new_object() const override { return std::make_unique<BelT>(); }

      bool has_keying_material() const override;

   private:
      void key_schedule(std::span<const uint8_t> key) override;

      secure_vector<uint32_t> m_K;
};

/**
* belt-wblock wide block encryption (STB 34.101.31-2020 6.2), in place.
* Only whole blocks are supported.
* @param buf the buffer to encrypt, a multiple of 16 bytes and at least 32
* @param cipher a keyed BelT instance
* @throws Invalid_Data_Length for any other buffer length
*/
void belt_wblock_encrypt(std::span<uint8_t> buf, const BelT& cipher);

/**
* Inverse of belt_wblock_encrypt, in place
*/
void belt_wblock_decrypt(std::span<uint8_t> buf, const BelT& cipher);

}  // namespace Keywrap

#endif
