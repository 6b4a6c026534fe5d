/*
* BelT block cipher
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/internal/belt.h>

#include <keywrap/exceptn.h>
#include <keywrap/mem_ops.h>
#include <keywrap/internal/loadstor.h>
#include <keywrap/internal/rotate.h>
#include <cstring>
#include <utility>

namespace Keywrap {

namespace {

alignas(64) const uint8_t BELT_H[256] = {
   0xB1, 0x94, 0xBA, 0xC8, 0x0A, 0x08, 0xF5, 0x3B, 0x36, 0x6D, 0x00, 0x8E, 0x58, 0x4A, 0x5D, 0xE4,
   0x85, 0x04, 0xFA, 0x9D, 0x1B, 0xB6, 0xC7, 0xAC, 0x25, 0x2E, 0x72, 0xC2, 0x02, 0xFD, 0xCE, 0x0D,
   0x5B, 0xE3, 0xD6, 0x12, 0x17, 0xB9, 0x61, 0x81, 0xFE, 0x67, 0x86, 0xAD, 0x71, 0x6B, 0x89, 0x0B,
   0x5C, 0xB0, 0xC0, 0xFF, 0x33, 0xC3, 0x56, 0xB8, 0x35, 0xC4, 0x05, 0xAE, 0xD8, 0xE0, 0x7F, 0x99,
   0xE1, 0x2B, 0xDC, 0x1A, 0xE2, 0x82, 0x57, 0xEC, 0x70, 0x3F, 0xCC, 0xF0, 0x95, 0xEE, 0x8D, 0xF1,
   0xC1, 0xAB, 0x76, 0x38, 0x9F, 0xE6, 0x78, 0xCA, 0xF7, 0xC6, 0xF8, 0x60, 0xD5, 0xBB, 0x9C, 0x4F,
   0xF3, 0x3C, 0x65, 0x7B, 0x63, 0x7C, 0x30, 0x6A, 0xDD, 0x4E, 0xA7, 0x79, 0x9E, 0xB2, 0x3D, 0x31,
   0x3E, 0x98, 0xB5, 0x6E, 0x27, 0xD3, 0xBC, 0xCF, 0x59, 0x1E, 0x18, 0x1F, 0x4C, 0x5A, 0xB7, 0x93,
   0xE9, 0xDE, 0xE7, 0x2C, 0x8F, 0x0C, 0x0F, 0xA6, 0x2D, 0xDB, 0x49, 0xF4, 0x6F, 0x73, 0x96, 0x47,
   0x06, 0x07, 0x53, 0x16, 0xED, 0x24, 0x7A, 0x37, 0x39, 0xCB, 0xA3, 0x83, 0x03, 0xA9, 0x8B, 0xF6,
   0x92, 0xBD, 0x9B, 0x1C, 0xE5, 0xD1, 0x41, 0x01, 0x54, 0x45, 0xFB, 0xC9, 0x5E, 0x4D, 0x0E, 0xF2,
   0x68, 0x20, 0x80, 0xAA, 0x22, 0x7D, 0x64, 0x2F, 0x26, 0x87, 0xF9, 0x34, 0x90, 0x40, 0x55, 0x11,
   0xBE, 0x32, 0x97, 0x13, 0x43, 0xFC, 0x9A, 0x48, 0xA0, 0x2A, 0x88, 0x5F, 0x19, 0x4B, 0x09, 0xA1,
   0x7E, 0xCD, 0xA4, 0xD0, 0x15, 0x44, 0xAF, 0x8C, 0xA5, 0x84, 0x50, 0xBF, 0x66, 0xD2, 0xE8, 0x8A,
   0xA2, 0xD7, 0x46, 0x52, 0x42, 0xA8, 0xDF, 0xB3, 0x69, 0x74, 0xC5, 0x51, 0xEB, 0x23, 0x29, 0x21,
   0xD4, 0xEF, 0xD9, 0xB4, 0x3A, 0x62, 0x28, 0x75, 0x91, 0x14, 0x10, 0xEA, 0x77, 0x6C, 0xDA, 0x1D
};

/*
* G_r: substitute each byte of x through H, then rotate left by R
*/
template <size_t R>
inline uint32_t G(uint32_t x) {
   const uint32_t s = static_cast<uint32_t>(BELT_H[get_byte<3>(x)]) |
                      (static_cast<uint32_t>(BELT_H[get_byte<2>(x)]) << 8) |
                      (static_cast<uint32_t>(BELT_H[get_byte<1>(x)]) << 16) |
                      (static_cast<uint32_t>(BELT_H[get_byte<0>(x)]) << 24);
   return rotl<R>(s);
}

}  // namespace

/*
* The round key for step j of round i is K[(7*i + j) % 8]
*/
void BelT::encrypt_n(const uint8_t in[], uint8_t out[], size_t blocks) const {
   assert_key_material_set();

   const uint32_t* K = m_K.data();

   for(size_t blk = 0; blk != blocks; ++blk) {
      uint32_t a = load_le<uint32_t>(in, 0);
      uint32_t b = load_le<uint32_t>(in, 1);
      uint32_t c = load_le<uint32_t>(in, 2);
      uint32_t d = load_le<uint32_t>(in, 3);

      for(size_t i = 0; i != 8; ++i) {
         const size_t k = 7 * i;

         b ^= G<5>(a + K[k % 8]);
         c ^= G<21>(d + K[(k + 1) % 8]);
         a -= G<13>(b + K[(k + 2) % 8]);
         const uint32_t e = G<21>(b + c + K[(k + 3) % 8]) ^ static_cast<uint32_t>(i + 1);
         b += e;
         c -= e;
         d += G<13>(c + K[(k + 4) % 8]);
         b ^= G<21>(a + K[(k + 5) % 8]);
         c ^= G<5>(d + K[(k + 6) % 8]);

         std::swap(a, b);
         std::swap(c, d);
         std::swap(b, c);
      }

      store_le(b, out);
      store_le(d, out + 4);
      store_le(a, out + 8);
      store_le(c, out + 12);

      in += BLOCK_SIZE;
      out += BLOCK_SIZE;
   }
}

void BelT::decrypt_n(const uint8_t in[], uint8_t out[], size_t blocks) const {
   assert_key_material_set();

   const uint32_t* K = m_K.data();

   for(size_t blk = 0; blk != blocks; ++blk) {
      uint32_t a = load_le<uint32_t>(in, 0);
      uint32_t b = load_le<uint32_t>(in, 1);
      uint32_t c = load_le<uint32_t>(in, 2);
      uint32_t d = load_le<uint32_t>(in, 3);

      for(size_t i = 8; i != 0; --i) {
         const size_t k = 7 * (i - 1);

         b ^= G<5>(a + K[(k + 6) % 8]);
         c ^= G<21>(d + K[(k + 5) % 8]);
         a -= G<13>(b + K[(k + 4) % 8]);
         const uint32_t e = G<21>(b + c + K[(k + 3) % 8]) ^ static_cast<uint32_t>(i);
         b += e;
         c -= e;
         d += G<13>(c + K[(k + 2) % 8]);
         b ^= G<21>(a + K[(k + 1) % 8]);
         c ^= G<5>(d + K[k % 8]);

         std::swap(a, b);
         std::swap(c, d);
         std::swap(a, d);
      }

      store_le(c, out);
      store_le(a, out + 4);
      store_le(d, out + 8);
      store_le(b, out + 12);

      in += BLOCK_SIZE;
      out += BLOCK_SIZE;
   }
}

bool BelT::has_keying_material() const {
   return !m_K.empty();
}

void BelT::key_schedule(std::span<const uint8_t> key) {
   m_K.resize(8);
   load_le(m_K.data(), key.data(), 8);
}

void BelT::clear() {
   zap(m_K);
}

namespace {

/*
* E(s) xor <r>, with the round number as a little-endian 128-bit integer
*/
void wblock_round_mask(const BelT& cipher, const uint8_t s[16], uint64_t r, uint8_t mask[16]) {
   cipher.encrypt(s, mask);
   uint8_t r_buf[8];
   store_le(r, r_buf);
   xor_buf(mask, r_buf, 8);
}

}  // namespace

void belt_wblock_encrypt(std::span<uint8_t> buf, const BelT& cipher) {
   const size_t cnt = buf.size();

   if(cnt < 32 || cnt % 16 != 0) {
      throw Invalid_Data_Length("belt-wblock", cnt);
   }

   const size_t n = cnt / 16;
   uint8_t* b = buf.data();

   uint8_t s[16];
   uint8_t mask[16];

   for(uint64_t r = 1; r <= 2 * n; ++r) {
      copy_mem(s, b, 16);
      for(size_t i = 16; i + 16 < cnt; i += 16) {
         xor_buf(s, b + i, 16);
      }

      std::memmove(b, b + 16, cnt - 16);
      copy_mem(b + cnt - 16, s, 16);

      wblock_round_mask(cipher, s, r, mask);
      xor_buf(b + cnt - 32, mask, 16);
   }

   secure_scrub_memory(s, sizeof(s));
   secure_scrub_memory(mask, sizeof(mask));
}

void belt_wblock_decrypt(std::span<uint8_t> buf, const BelT& cipher) {
   const size_t cnt = buf.size();

   if(cnt < 32 || cnt % 16 != 0) {
      throw Invalid_Data_Length("belt-wblock", cnt);
   }

   const size_t n = cnt / 16;
   uint8_t* b = buf.data();

   uint8_t s[16];
   uint8_t mask[16];

   for(uint64_t r = 2 * n; r >= 1; --r) {
      copy_mem(s, b + cnt - 16, 16);
      std::memmove(b + 16, b, cnt - 16);
      copy_mem(b, s, 16);

      wblock_round_mask(cipher, s, r, mask);
      xor_buf(b + cnt - 16, mask, 16);

      for(size_t i = 16; i + 16 < cnt; i += 16) {
         xor_buf(b, b + i, 16);
      }
   }

   secure_scrub_memory(s, sizeof(s));
   secure_scrub_memory(mask, sizeof(mask));
}

}  // namespace Keywrap
