/*
* OpenSSL block ciphers
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/internal/openssl.h>

#include <keywrap/internal/fmt.h>
#include <algorithm>
#include <climits>
#include <string>
#include <openssl/err.h>
#include <openssl/evp.h>

namespace Keywrap {

namespace {

std::string describe_error(std::string_view what, unsigned long err) {
   char buf[256] = {0};
   ERR_error_string_n(err, buf, sizeof(buf));
   return fmt("OpenSSL {} failed: {}", what, buf);
}

}  // namespace

OpenSSL_Error::OpenSSL_Error(std::string_view what, unsigned long err) :
      Exception(describe_error(what, err)), m_err(static_cast<int>(err)) {}

namespace {

struct EVP_CIPHER_CTX_Deleter {
      void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); }
};

typedef std::unique_ptr<EVP_CIPHER_CTX, EVP_CIPHER_CTX_Deleter> EVP_CIPHER_CTX_ptr;

[[noreturn]] void throw_openssl_error(std::string_view what) {
   throw OpenSSL_Error(what, ERR_get_error());
}

EVP_CIPHER_CTX_ptr new_cipher_ctx() {
   EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new());
   if(!ctx) {
      throw_openssl_error("EVP_CIPHER_CTX_new");
   }
   return ctx;
}

/*
* An ECB mode EVP cipher with padding disabled. The keyed contexts are
* never used directly: each call runs on a copy, so the const members
* may be called from several threads at once.
*/
class EVP_BlockCipher final : public BlockCipher {
   public:
      EVP_BlockCipher(std::string_view name, const EVP_CIPHER* cipher) :
            m_name(name),
            m_cipher(cipher),
            m_block_size(static_cast<size_t>(EVP_CIPHER_get_block_size(cipher))),
            m_key_length(static_cast<size_t>(EVP_CIPHER_get_key_length(cipher))) {}

      std::string name() const override { return m_name; }

      std::string provider() const override { return "openssl"; }

      size_t block_size() const override { return m_block_size; }

      Key_Length_Specification key_spec() const override { return Key_Length_Specification(m_key_length); }

      bool has_keying_material() const override { return m_encrypt != nullptr; }

      void clear() override {
         m_encrypt.reset();
         m_decrypt.reset();
      }

      std::unique_ptr<BlockCipher> new_object() const override {
         return std::make_unique<EVP_BlockCipher>(m_name, m_cipher);
      }

      void encrypt_n(const uint8_t in[], uint8_t out[], size_t blocks) const override {
         assert_key_material_set();
         run(m_encrypt.get(), in, out, blocks);
      }

      void decrypt_n(const uint8_t in[], uint8_t out[], size_t blocks) const override {
         assert_key_material_set();
         run(m_decrypt.get(), in, out, blocks);
      }

   private:
      void key_schedule(std::span<const uint8_t> key) override {
         auto enc = new_cipher_ctx();
         auto dec = new_cipher_ctx();

         if(EVP_EncryptInit_ex(enc.get(), m_cipher, nullptr, key.data(), nullptr) != 1) {
            throw_openssl_error("EVP_EncryptInit_ex");
         }
         if(EVP_DecryptInit_ex(dec.get(), m_cipher, nullptr, key.data(), nullptr) != 1) {
            throw_openssl_error("EVP_DecryptInit_ex");
         }

         EVP_CIPHER_CTX_set_padding(enc.get(), 0);
         EVP_CIPHER_CTX_set_padding(dec.get(), 0);

         m_encrypt = std::move(enc);
         m_decrypt = std::move(dec);
      }

      void run(const EVP_CIPHER_CTX* keyed, const uint8_t in[], uint8_t out[], size_t blocks) const {
         if(blocks == 0) {
            return;
         }

         auto ctx = new_cipher_ctx();
         if(EVP_CIPHER_CTX_copy(ctx.get(), keyed) != 1) {
            throw_openssl_error("EVP_CIPHER_CTX_copy");
         }

         const size_t max_blocks_per_call = (INT_MAX / m_block_size);

         while(blocks > 0) {
            const size_t take = std::min(blocks, max_blocks_per_call);
            const int len = static_cast<int>(take * m_block_size);

            int written = 0;
            if(EVP_CipherUpdate(ctx.get(), out, &written, in, len) != 1) {
               throw_openssl_error("EVP_CipherUpdate");
            }
            KEYWRAP_ASSERT(written == len, "ECB mode without padding processes every block");

            in += take * m_block_size;
            out += take * m_block_size;
            blocks -= take;
         }
      }

      std::string m_name;
      const EVP_CIPHER* m_cipher;
      size_t m_block_size;
      size_t m_key_length;
      EVP_CIPHER_CTX_ptr m_encrypt;
      EVP_CIPHER_CTX_ptr m_decrypt;
};

}  // namespace

std::unique_ptr<BlockCipher> make_openssl_block_cipher(std::string_view name) {
   if(name == "AES-128") {
      return std::make_unique<EVP_BlockCipher>(name, EVP_aes_128_ecb());
   }
   if(name == "AES-192") {
      return std::make_unique<EVP_BlockCipher>(name, EVP_aes_192_ecb());
   }
   if(name == "AES-256") {
      return std::make_unique<EVP_BlockCipher>(name, EVP_aes_256_ecb());
   }
   return nullptr;
}

}  // namespace Keywrap
