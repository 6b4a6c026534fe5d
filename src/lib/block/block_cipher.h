/*
* Block ciphers
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_BLOCK_CIPHER_H_
#define KEYWRAP_BLOCK_CIPHER_H_

#include <keywrap/sym_algo.h>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace Keywrap {

/**
* A block cipher: a keyed permutation of block_size() byte blocks.
*
* Once keyed, a cipher is only used through its const members, so one
* keyed object may be shared between threads.
*/
class KEYWRAP_PUBLIC_API(1, 0) BlockCipher : public SymmetricAlgorithm {
   public:
      /**
      * Create an unkeyed cipher
      * @param algo_spec "AES-128", "AES-192", "AES-256" or "BelT"
      * @param provider an implementation name, or empty for the preferred one
      * @return null if the algorithm or provider is not available
      */
      static std::unique_ptr<BlockCipher> create(std::string_view algo_spec, std::string_view provider = "");

      /**
      * As create, but throws Lookup_Error instead of returning null
      */
      static std::unique_ptr<BlockCipher> create_or_throw(std::string_view algo_spec,
                                                          std::string_view provider = "");

      /**
      * @return the providers which implement algo_spec, empty if none do
      */
      static std::vector<std::string> providers(std::string_view algo_spec);

      virtual size_t block_size() const = 0;

      /**
      * @return the implementation, "base" for the in-tree code
      */
      virtual std::string provider() const { return "base"; }

      void encrypt(const uint8_t in[], uint8_t out[]) const { encrypt_n(in, out, 1); }

      void decrypt(const uint8_t in[], uint8_t out[]) const { decrypt_n(in, out, 1); }

      void encrypt(uint8_t block[]) const { encrypt_n(block, block, 1); }

      void decrypt(uint8_t block[]) const { decrypt_n(block, block, 1); }

      /**
      * Encrypt in place; the size of buf must be a multiple of block_size()
      */
      void encrypt(std::span<uint8_t> buf) const { encrypt_n(buf.data(), buf.data(), buf.size() / block_size()); }

      void decrypt(std::span<uint8_t> buf) const { decrypt_n(buf.data(), buf.data(), buf.size() / block_size()); }

      /**
      * Encrypt blocks consecutive blocks. in and out may be the same buffer.
      */
      virtual void encrypt_n(const uint8_t in[], uint8_t out[], size_t blocks) const = 0;

      virtual void decrypt_n(const uint8_t in[], uint8_t out[], size_t blocks) const = 0;

      /**
      * @return an unkeyed instance of the same algorithm and provider
      */
      virtual std::unique_ptr<BlockCipher> new_object() const = 0;
};

/**
* A cipher with a fixed block size and key lengths
*/
template <size_t BS, size_t KMIN, size_t KMAX = KMIN, size_t KMOD = 1>
class Block_Cipher_Fixed_Params : public BlockCipher {
   public:
      enum { BLOCK_SIZE = BS };

      size_t block_size() const final { return BS; }

      Key_Length_Specification key_spec() const final { return Key_Length_Specification(KMIN, KMAX, KMOD); }
};

}  // namespace Keywrap

#endif
