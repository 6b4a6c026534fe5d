/*
* (C) 2015 Jack Lloyd
* (C) 2018 Ribose Inc
*     2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include "tests.h"
#include <keywrap/version.h>
#include <algorithm>

#if defined(KEYWRAP_HAS_FFI)
   #include <keywrap/ffi.h>
   #include <keywrap/hex.h>
#endif

namespace Keywrap_Tests {

namespace {

#if defined(KEYWRAP_HAS_FFI)

   // NOLINTNEXTLINE(*-macro-usage)
   #define _TEST_FFI_STR_HELPER(x) #x
   // NOLINTNEXTLINE(*-macro-usage)
   #define _TEST_FFI_STR(x) _TEST_FFI_STR_HELPER(x)
   // NOLINTNEXTLINE(*-macro-usage)
   #define _TEST_FFI_SOURCE_LOCATION(func, file, line) (func " invoked at " file ":" _TEST_FFI_STR(line))

   // NOLINTNEXTLINE(*-macro-usage)
   #define TEST_FFI_OK(func, args) result.test_rc_ok(_TEST_FFI_SOURCE_LOCATION(#func, __FILE__, __LINE__), func args)
   // NOLINTNEXTLINE(*-macro-usage)
   #define TEST_FFI_RC(rc, func, args) \
      result.test_rc(_TEST_FFI_SOURCE_LOCATION(#func, __FILE__, __LINE__), rc, func args)

class FFI_Test : public Test {
   public:
      std::vector<Test::Result> run() override {
         Test::Result result(this->name());

         result.start_timer();
         ffi_test(result);
         result.end_timer();

         return {result};
      }

   private:
      virtual std::string name() const = 0;
      virtual void ffi_test(Test::Result& result) = 0;
};

class FFI_Utils_Test final : public FFI_Test {
   public:
      std::string name() const override { return "FFI Utils"; }

      void ffi_test(Test::Result& result) override {
         result.test_is_eq("FFI API version macro", uint32_t(KEYWRAP_FFI_API_VERSION), uint32_t(KEYWRAP_HAS_FFI));
         result.test_is_eq("FFI API version function", keywrap_ffi_api_version(), uint32_t(KEYWRAP_HAS_FFI));
         result.test_is_eq("Major version", keywrap_version_major(), Keywrap::version_major());
         result.test_is_eq("Minor version", keywrap_version_minor(), Keywrap::version_minor());
         result.test_is_eq("Patch version", keywrap_version_patch(), Keywrap::version_patch());
         result.test_eq("Keywrap version", std::string(keywrap_version_string()), Keywrap::version_string());
         result.test_is_eq("Version datestamp", keywrap_version_datestamp(), Keywrap::version_datestamp());
         result.test_is_eq("FFI supports its own version", keywrap_ffi_supports_api(keywrap_ffi_api_version()), 0);
         result.test_is_eq("FFI doesn't support bogus version", keywrap_ffi_supports_api(20160229), -1);

         result.test_eq("SUCCESS description", std::string(keywrap_error_description(KEYWRAP_FFI_SUCCESS)), "OK");
         result.test_eq("BAD_MAC description",
                        std::string(keywrap_error_description(KEYWRAP_FFI_ERROR_BAD_MAC)),
                        "Invalid authentication code");
         result.test_eq("INVALID_KEY_LENGTH description",
                        std::string(keywrap_error_description(KEYWRAP_FFI_ERROR_INVALID_KEY_LENGTH)),
                        "Invalid key length");
         result.test_eq("unknown code description", std::string(keywrap_error_description(-9999)), "Unknown error");

         const std::vector<uint8_t> mem1 = {0xFF, 0xAA, 0xFF};
         const std::vector<uint8_t> mem2 = {0xFF, 0xA9, 0xFF};

         TEST_FFI_RC(0, keywrap_constant_time_compare, (mem1.data(), mem1.data(), mem1.size()));
         TEST_FFI_RC(-1, keywrap_constant_time_compare, (mem1.data(), mem2.data(), mem1.size()));

         std::vector<uint8_t> to_zero = {0xFF, 0xA0};
         TEST_FFI_OK(keywrap_scrub_mem, (to_zero.data(), to_zero.size()));
         result.confirm("scrub_memory zeros", to_zero[0] == 0 && to_zero[1] == 0);

         const std::vector<uint8_t> bin = {0xAA, 0xDE, 0x01};

         std::string outstr;
         outstr.resize(2 * bin.size());
         TEST_FFI_OK(keywrap_hex_encode, (bin.data(), bin.size(), &outstr[0], 0));
         result.test_eq("uppercase hex", outstr, "AADE01");

         TEST_FFI_OK(keywrap_hex_encode, (bin.data(), bin.size(), &outstr[0], KEYWRAP_FFI_HEX_LOWER_CASE));
         result.test_eq("lowercase hex", outstr, "aade01");

         std::vector<uint8_t> outbuf(bin.size());
         size_t out_len = outbuf.size();
         TEST_FFI_OK(keywrap_hex_decode, (outstr.data(), outstr.size(), outbuf.data(), &out_len));
         result.test_eq("hex decode", outbuf, bin);

         out_len = 1;
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_INSUFFICIENT_BUFFER_SPACE,
                     keywrap_hex_decode,
                     (outstr.data(), outstr.size(), outbuf.data(), &out_len));
         result.test_eq("hex decode output length", out_len, bin.size());

         const std::string bad_hex = "AAZZ";
         out_len = outbuf.size();
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_BAD_PARAMETER,
                     keywrap_hex_decode,
                     (bad_hex.data(), bad_hex.size(), outbuf.data(), &out_len));
         result.confirm("last exception message is set", std::string(keywrap_error_last_exception_message()).empty(), false);
      }
};

class FFI_Keywrap_Test final : public FFI_Test {
   public:
      std::string name() const override { return "FFI Keywrap"; }

      void ffi_test(Test::Result& result) override {
         const uint8_t key[16] = {0};
         const uint8_t kek[16] = {0xFF, 0};

         uint8_t wrapped[16 + 8] = {0};
         size_t wrapped_keylen = sizeof(wrapped);

         if(TEST_FFI_OK(keywrap_key_wrap3394, (key, sizeof(key), kek, sizeof(kek), wrapped, &wrapped_keylen))) {
            const uint8_t expected_wrapped_key[16 + 8] = {0x04, 0x13, 0x37, 0x39, 0x82, 0xCF, 0xFA, 0x31,
                                                          0x81, 0xCA, 0x4F, 0x59, 0x74, 0x4D, 0xED, 0x29,
                                                          0x1F, 0x3F, 0xE5, 0x24, 0x00, 0x1B, 0x93, 0x20};

            result.test_eq("Expected wrapped keylen size", wrapped_keylen, 16 + 8);

            result.test_eq(
               nullptr, "Wrapped key", wrapped, wrapped_keylen, expected_wrapped_key, sizeof(expected_wrapped_key));

            uint8_t dec_key[16] = {0};
            size_t dec_keylen = sizeof(dec_key);
            TEST_FFI_OK(keywrap_key_unwrap3394, (wrapped, sizeof(wrapped), kek, sizeof(kek), dec_key, &dec_keylen));

            result.test_eq(nullptr, "Unwrapped key", dec_key, dec_keylen, key, sizeof(key));

            // Tampered input is reported as a bad MAC and the output is zeroed
            uint8_t tampered[16 + 8];
            std::copy(wrapped, wrapped + sizeof(wrapped), tampered);
            tampered[10] ^= 0x04;
            std::fill(dec_key, dec_key + sizeof(dec_key), 0xAA);
            dec_keylen = sizeof(dec_key);
            TEST_FFI_RC(KEYWRAP_FFI_ERROR_BAD_MAC,
                        keywrap_key_unwrap3394,
                        (tampered, sizeof(tampered), kek, sizeof(kek), dec_key, &dec_keylen));
            result.test_all_zero("output zeroed after integrity failure", dec_key);
         }

         // A too small buffer reports the required length
         size_t short_len = 8;
         uint8_t short_buf[8] = {0x55, 0x55, 0x55, 0x55, 0x55, 0x55, 0x55, 0x55};
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_INSUFFICIENT_BUFFER_SPACE,
                     keywrap_key_wrap3394,
                     (key, sizeof(key), kek, sizeof(kek), short_buf, &short_len));
         result.test_eq("required output length", short_len, 24);
         result.test_all_zero("short buffer zeroed", short_buf);

         size_t query_len = 0;
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_INSUFFICIENT_BUFFER_SPACE,
                     keywrap_nist_kw_enc,
                     ("AES-128", 1, key, 5, kek, sizeof(kek), nullptr, &query_len));
         result.test_eq("KWP length query", query_len, 16);

         size_t out_len = sizeof(wrapped);
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_INVALID_KEY_LENGTH,
                     keywrap_key_wrap3394,
                     (key, sizeof(key), kek, 15, wrapped, &out_len));
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_INVALID_KEY_LENGTH,
                     keywrap_nist_kw_enc,
                     ("AES-256", 0, key, sizeof(key), kek, sizeof(kek), wrapped, &out_len));
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_INVALID_INPUT,
                     keywrap_nist_kw_enc,
                     ("AES-128", 0, key, 12, kek, sizeof(kek), wrapped, &out_len));
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_NOT_IMPLEMENTED,
                     keywrap_nist_kw_enc,
                     ("AES-128", 2, key, sizeof(key), kek, sizeof(kek), wrapped, &out_len));
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_NOT_IMPLEMENTED,
                     keywrap_nist_kw_enc,
                     ("Twofish", 0, key, sizeof(key), kek, sizeof(kek), wrapped, &out_len));
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_NULL_POINTER,
                     keywrap_nist_kw_enc,
                     (nullptr, 0, key, sizeof(key), kek, sizeof(kek), wrapped, &out_len));
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_NULL_POINTER,
                     keywrap_nist_kw_dec,
                     ("AES-128", 0, wrapped, sizeof(wrapped), kek, sizeof(kek), wrapped, nullptr));

         // RFC 5649 section 6 through the generic entry points
         const auto kwp_kek = Keywrap::hex_decode("5840DF6E29B02AF1AB493B705BF16EA1AE8338F4DCC176A8");
         const auto kwp_key = Keywrap::hex_decode("466F7250617369");
         std::vector<uint8_t> kwp_wrapped(16);
         size_t kwp_wrapped_len = kwp_wrapped.size();
         TEST_FFI_OK(keywrap_nist_kw_enc,
                     ("AES-192",
                      1,
                      kwp_key.data(),
                      kwp_key.size(),
                      kwp_kek.data(),
                      kwp_kek.size(),
                      kwp_wrapped.data(),
                      &kwp_wrapped_len));
         result.test_eq("KWP wrap", kwp_wrapped, "AFBEB0F07DFBF5419200F2CCB50BB24F");

         std::vector<uint8_t> kwp_unwrapped(kwp_wrapped.size());
         size_t kwp_unwrapped_len = kwp_unwrapped.size();
         TEST_FFI_OK(keywrap_nist_kw_dec,
                     ("AES-192",
                      1,
                      kwp_wrapped.data(),
                      kwp_wrapped.size(),
                      kwp_kek.data(),
                      kwp_kek.size(),
                      kwp_unwrapped.data(),
                      &kwp_unwrapped_len));
         result.test_eq("KWP unwrap", std::span{kwp_unwrapped}.first(kwp_unwrapped_len), kwp_key);
      }
};

class FFI_BelT_KWP_Test final : public FFI_Test {
   public:
      std::string name() const override { return "FFI BelT-KWP"; }

      void ffi_test(Test::Result& result) override {
         // STB 34.101.31-2020 table A.21
         const auto kek = Keywrap::hex_decode("E9DEE72C8F0C0FA62DDB49F46F73964706075316ED247A3739CBA38303A98BF6");
         const auto header = Keywrap::hex_decode("5BE3D61217B96181FE6786AD716B890B");
         const auto key = Keywrap::hex_decode("B194BAC80A08F53B366D008E584A5DE48504FA9D1BB6C7AC252E72C202FDCE0D");

   #if defined(KEYWRAP_HAS_BELT_KWP)
         std::vector<uint8_t> wrapped(48);
         size_t wrapped_len = wrapped.size();
         TEST_FFI_OK(keywrap_belt_kwp_wrap,
                     (kek.data(), kek.size(), header.data(), key.data(), key.size(), wrapped.data(), &wrapped_len));
         result.test_eq("wrapped length", wrapped_len, 48);
         result.test_eq("wrapped",
                        wrapped,
                        "49A38EE108D6C742E52B774F00A6EF98B106CBD13EA4FB0680323051BC04DF76"
                        "E487B055C69BCF541176169F1DC9F6C8");

         std::vector<uint8_t> unwrapped(32);
         size_t unwrapped_len = unwrapped.size();
         TEST_FFI_OK(keywrap_belt_kwp_unwrap,
                     (kek.data(), kek.size(), header.data(), wrapped.data(), wrapped.size(), unwrapped.data(), &unwrapped_len));
         result.test_eq("unwrapped", unwrapped, key);

         auto other_header = header;
         other_header[15] ^= 0x01;
         unwrapped_len = unwrapped.size();
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_BAD_MAC,
                     keywrap_belt_kwp_unwrap,
                     (kek.data(), kek.size(), other_header.data(), wrapped.data(), wrapped.size(), unwrapped.data(), &unwrapped_len));

         wrapped_len = wrapped.size();
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_INVALID_KEY_LENGTH,
                     keywrap_belt_kwp_wrap,
                     (kek.data(), 16, header.data(), key.data(), key.size(), wrapped.data(), &wrapped_len));
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_INVALID_INPUT,
                     keywrap_belt_kwp_wrap,
                     (kek.data(), kek.size(), header.data(), key.data(), 20, wrapped.data(), &wrapped_len));
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_NULL_POINTER,
                     keywrap_belt_kwp_wrap,
                     (kek.data(), kek.size(), nullptr, key.data(), key.size(), wrapped.data(), &wrapped_len));
   #else
         size_t wrapped_len = 0;
         TEST_FFI_RC(KEYWRAP_FFI_ERROR_NOT_IMPLEMENTED,
                     keywrap_belt_kwp_wrap,
                     (kek.data(), kek.size(), header.data(), key.data(), key.size(), nullptr, &wrapped_len));
   #endif
      }
};

KEYWRAP_REGISTER_TEST("ffi", "ffi_utils", FFI_Utils_Test);
KEYWRAP_REGISTER_TEST("ffi", "ffi_keywrap", FFI_Keywrap_Test);
KEYWRAP_REGISTER_TEST("ffi", "ffi_belt_kwp", FFI_BelT_KWP_Test);

#endif

}  // namespace

}  // namespace Keywrap_Tests
