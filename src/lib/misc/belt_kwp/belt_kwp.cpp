/*
* BelT-KWP key wrapping (STB 34.101.31-2020)
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/belt_kwp.h>

#include <keywrap/exceptn.h>
#include <keywrap/mem_ops.h>
#include <keywrap/internal/belt.h>
#include <keywrap/internal/ct_utils.h>

namespace Keywrap {

namespace {

void check_header(std::span<const uint8_t> header) {
   if(header.size() != BelT_KWP::HEADER_LENGTH) {
      throw Invalid_Argument("BelT-KWP header must be 16 bytes");
   }
}

}  // namespace

BelT_KWP::BelT_KWP(std::span<const uint8_t> kek) : m_cipher(std::make_unique<BelT>()) {
   if(kek.size() != 32) {
      throw Invalid_Key_Length("BelT-KWP", kek.size());
   }
   m_cipher->set_key(kek);
}

BelT_KWP::BelT_KWP(BelT_KWP&& other) noexcept = default;
BelT_KWP& BelT_KWP::operator=(BelT_KWP&& other) noexcept = default;
BelT_KWP::~BelT_KWP() = default;

const BelT& BelT_KWP::cipher() const {
   KEYWRAP_STATE_CHECK(m_cipher != nullptr);
   return *m_cipher;
}

size_t BelT_KWP::wrap(std::span<const uint8_t> key, std::span<const uint8_t> header, std::span<uint8_t> output) const {
   check_header(header);

   if(key.size() < BLOCK_LENGTH || key.size() % BLOCK_LENGTH != 0) {
      throw Invalid_Data_Length("BelT-KWP", key.size());
   }

   const size_t out_len = key.size() + HEADER_LENGTH;
   if(output.size() < out_len) {
      throw Buffer_Too_Small("BelT-KWP", out_len, output.size());
   }

   secure_vector<uint8_t> buf(out_len);
   copy_mem(buf.data(), key.data(), key.size());
   copy_mem(buf.data() + key.size(), header.data(), HEADER_LENGTH);

   belt_wblock_encrypt(buf, cipher());

   copy_mem(output.first(out_len), std::span<const uint8_t>(buf));
   return out_len;
}

size_t BelT_KWP::unwrap(std::span<const uint8_t> wrapped,
                        std::span<const uint8_t> header,
                        std::span<uint8_t> output) const {
   check_header(header);

   if(wrapped.size() < 2 * BLOCK_LENGTH || wrapped.size() % BLOCK_LENGTH != 0) {
      throw Invalid_Data_Length("BelT-KWP", wrapped.size());
   }

   const size_t out_len = wrapped.size() - HEADER_LENGTH;
   if(output.size() < out_len) {
      throw Buffer_Too_Small("BelT-KWP", out_len, output.size());
   }

   secure_vector<uint8_t> buf(wrapped.begin(), wrapped.end());

   belt_wblock_decrypt(buf, cipher());

   if(!constant_time_compare(std::span<const uint8_t>(buf).subspan(out_len), header)) {
      clear_mem(output.first(out_len));
      throw Invalid_Authentication_Tag("BelT-KWP unwrap failed");
   }

   copy_mem(output.first(out_len), std::span<const uint8_t>(buf).first(out_len));
   return out_len;
}

std::vector<uint8_t> BelT_KWP::wrap(std::span<const uint8_t> key, std::span<const uint8_t> header) const {
   std::vector<uint8_t> output(key.size() + HEADER_LENGTH);
   wrap(key, header, output);
   return output;
}

secure_vector<uint8_t> BelT_KWP::unwrap(std::span<const uint8_t> wrapped, std::span<const uint8_t> header) const {
   secure_vector<uint8_t> output(wrapped.size() >= HEADER_LENGTH ? wrapped.size() - HEADER_LENGTH : 0);
   unwrap(wrapped, header, output);
   return output;
}

}  // namespace Keywrap
