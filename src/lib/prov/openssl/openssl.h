/*
* Algorithms backed by OpenSSL's libcrypto
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_OPENSSL_H_
#define KEYWRAP_OPENSSL_H_

#include <keywrap/block_cipher.h>
#include <keywrap/exceptn.h>
#include <memory>
#include <string_view>

namespace Keywrap {

/**
* A libcrypto call failed. error_code() holds the value of ERR_get_error.
*/
class OpenSSL_Error final : public Exception {
   public:
      OpenSSL_Error(std::string_view what, unsigned long err);

      ErrorType error_type() const noexcept override { return ErrorType::OpenSSLError; }

      int error_code() const noexcept override { return m_err; }

   private:
      int m_err;
};

/**
* @return an unkeyed EVP backed cipher for "AES-128", "AES-192" or "AES-256",
*         or null for any other name
*/
std::unique_ptr<BlockCipher> make_openssl_block_cipher(std::string_view name);

}  // namespace Keywrap

#endif
