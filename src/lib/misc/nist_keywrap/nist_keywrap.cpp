/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/nist_keywrap.h>

#include <keywrap/block_cipher.h>
#include <keywrap/exceptn.h>
#include <keywrap/mem_ops.h>
#include <keywrap/internal/ct_utils.h>
#include <keywrap/internal/loadstor.h>

namespace Keywrap {

namespace {

const uint64_t KW_ICV = 0xA6A6A6A6A6A6A6A6;
const uint32_t KWP_ICV = 0xA65959A6;

void check_cipher(const BlockCipher& bc) {
   if(bc.block_size() != 16) {
      throw Invalid_Argument("NIST key wrap algorithm requires a 128-bit cipher");
   }
}

void check_output_space(std::span<uint8_t> output, size_t required) {
   if(output.size() < required) {
      throw Buffer_Too_Small("NIST key wrap", required, output.size());
   }
}

/*
* W: R holds A || P[1] || ... || P[n] with n >= 2, and is encrypted in place
*/
void raw_nist_key_wrap(std::span<uint8_t> R, const BlockCipher& bc) {
   const size_t n = (R.size() - 8) / 8;

   uint8_t A[16];
   copy_mem(A, R.data(), 8);

   for(size_t j = 0; j <= 5; ++j) {
      for(size_t i = 1; i <= n; ++i) {
         const uint64_t t = (n * j) + i;

         copy_mem(&A[8], &R[8 * i], 8);

         bc.encrypt(A);
         copy_mem(&R[8 * i], &A[8], 8);

         uint8_t t_buf[8] = {0};
         store_be(t, t_buf);
         xor_buf(&A[0], &t_buf[0], 8);
      }
   }

   copy_mem(R.data(), A, 8);
   secure_scrub_memory(A, sizeof(A));
}

/*
* W^-1: R holds C[0] || ... || C[n] and is decrypted in place. Returns A,
* which the caller must check in constant time.
*/
uint64_t raw_nist_key_unwrap(std::span<uint8_t> R, const BlockCipher& bc) {
   const size_t n = (R.size() - 8) / 8;

   uint8_t A[16];
   copy_mem(A, R.data(), 8);

   for(size_t j = 0; j <= 5; ++j) {
      for(size_t i = n; i != 0; --i) {
         const uint64_t t = (5 - j) * n + i;

         uint8_t t_buf[8] = {0};
         store_be(t, t_buf);

         xor_buf(&A[0], &t_buf[0], 8);

         copy_mem(&A[8], &R[8 * i], 8);

         bc.decrypt(A);

         copy_mem(&R[8 * i], &A[8], 8);
      }
   }

   const uint64_t ICV = load_be<uint64_t>(A, 0);
   store_be(ICV, R.data());
   secure_scrub_memory(A, sizeof(A));
   return ICV;
}

}  // namespace

size_t nist_key_wrap(std::span<const uint8_t> input, std::span<uint8_t> output, const BlockCipher& bc) {
   check_cipher(bc);

   if(input.size() < 16 || input.size() % 8 != 0 || static_cast<uint64_t>(input.size() / 8) > 0xFFFFFFFF) {
      throw Invalid_Data_Length("NIST key wrap", input.size());
   }

   const size_t out_len = nist_key_wrap_output_length(input.size());
   check_output_space(output, out_len);

   secure_vector<uint8_t> R(out_len);
   store_be(KW_ICV, R.data());
   copy_mem(&R[8], input.data(), input.size());

   raw_nist_key_wrap(R, bc);

   copy_mem(output.first(out_len), std::span<const uint8_t>(R));
   return out_len;
}

size_t nist_key_unwrap(std::span<const uint8_t> input, std::span<uint8_t> output, const BlockCipher& bc) {
   check_cipher(bc);

   if(input.size() < 24 || input.size() % 8 != 0) {
      throw Invalid_Data_Length("NIST key unwrap", input.size());
   }

   const size_t out_len = nist_key_unwrap_output_length(input.size());
   check_output_space(output, out_len);

   secure_vector<uint8_t> R(input.begin(), input.end());

   const uint64_t ICV = raw_nist_key_unwrap(R, bc);

   if(!CT::Mask<uint64_t>::is_equal(ICV, KW_ICV).as_bool()) {
      clear_mem(output.first(out_len));
      throw Invalid_Authentication_Tag("NIST key unwrap failed");
   }

   copy_mem(output.first(out_len), std::span<const uint8_t>(R).subspan(8));
   return out_len;
}

size_t nist_key_wrap_padded(std::span<const uint8_t> input, std::span<uint8_t> output, const BlockCipher& bc) {
   check_cipher(bc);

   if(input.empty() || static_cast<uint64_t>(input.size()) > 0xFFFFFFFF) {
      throw Invalid_Data_Length("NIST key wrap with padding", input.size());
   }

   const size_t out_len = nist_key_wrap_padded_output_length(input.size());
   check_output_space(output, out_len);

   const uint64_t ICV = (static_cast<uint64_t>(KWP_ICV) << 32) | static_cast<uint32_t>(input.size());

   // zero padded by construction
   secure_vector<uint8_t> R(out_len);
   store_be(ICV, R.data());
   copy_mem(&R[8], input.data(), input.size());

   if(out_len == 16) {
      bc.encrypt(R.data());
   } else {
      raw_nist_key_wrap(R, bc);
   }

   copy_mem(output.first(out_len), std::span<const uint8_t>(R));
   return out_len;
}

size_t nist_key_unwrap_padded(std::span<const uint8_t> input, std::span<uint8_t> output, const BlockCipher& bc) {
   check_cipher(bc);

   if(input.size() < 16 || input.size() % 8 != 0) {
      throw Invalid_Data_Length("NIST key unwrap with padding", input.size());
   }

   secure_vector<uint8_t> R(input.begin(), input.end());

   uint64_t ICV = 0;
   if(R.size() == 16) {
      bc.decrypt(R.data());
      ICV = load_be<uint64_t>(R.data(), 0);
   } else {
      ICV = raw_nist_key_unwrap(R, bc);
   }

   const uint64_t padded_len = R.size() - 8;
   const uint64_t mli = ICV & 0xFFFFFFFF;

   // The ICV, the length range and the padding bytes are checked together
   auto valid = CT::Mask<uint64_t>::is_equal(ICV >> 32, KWP_ICV);
   valid &= CT::Mask<uint64_t>::is_gt(mli, padded_len - 8);
   valid &= CT::Mask<uint64_t>::is_lte(mli, padded_len);

   uint8_t bad_padding = 0;
   for(size_t i = 0; i != padded_len; ++i) {
      const CT::Mask<uint8_t> in_padding(CT::Mask<uint64_t>::is_gte(i, mli));
      bad_padding |= in_padding.if_set_return(R[8 + i]);
   }
   valid &= CT::Mask<uint64_t>::is_zero(bad_padding);

   if(!valid.as_bool()) {
      clear_mem(output);
      throw Invalid_Authentication_Tag("NIST key unwrap failed");
   }

   const size_t key_len = static_cast<size_t>(mli);

   if(output.size() < key_len) {
      throw Buffer_Too_Small("NIST key unwrap with padding", key_len, output.size());
   }

   copy_mem(output.first(key_len), std::span<const uint8_t>(R).subspan(8, key_len));
   return key_len;
}

std::vector<uint8_t> nist_key_wrap(const uint8_t input[], size_t input_len, const BlockCipher& bc) {
   std::vector<uint8_t> output(nist_key_wrap_output_length(input_len));
   nist_key_wrap(std::span{input, input_len}, output, bc);
   return output;
}

secure_vector<uint8_t> nist_key_unwrap(const uint8_t input[], size_t input_len, const BlockCipher& bc) {
   secure_vector<uint8_t> output(nist_key_unwrap_output_length(input_len));
   nist_key_unwrap(std::span{input, input_len}, output, bc);
   return output;
}

std::vector<uint8_t> nist_key_wrap_padded(const uint8_t input[], size_t input_len, const BlockCipher& bc) {
   std::vector<uint8_t> output(nist_key_wrap_padded_output_length(input_len));
   nist_key_wrap_padded(std::span{input, input_len}, output, bc);
   return output;
}

secure_vector<uint8_t> nist_key_unwrap_padded(const uint8_t input[], size_t input_len, const BlockCipher& bc) {
   secure_vector<uint8_t> output(nist_key_unwrap_output_length(input_len));
   const size_t written = nist_key_unwrap_padded(std::span{input, input_len}, output, bc);
   output.resize(written);
   return output;
}

}  // namespace Keywrap
