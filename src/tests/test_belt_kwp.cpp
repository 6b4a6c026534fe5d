/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include "tests.h"
#include <utility>

#if defined(KEYWRAP_HAS_BELT_KWP)
   #include <keywrap/belt_kwp.h>
   #include <keywrap/internal/belt.h>
#endif

namespace Keywrap_Tests {

namespace {

#if defined(KEYWRAP_HAS_BELT_KWP)

class BelT_KWP_Tests final : public Text_Based_Test {
   public:
      BelT_KWP_Tests() : Text_Based_Test("keywrap/belt_kwp.vec", "Key,Header,Input,Output") {}

      Test::Result run_one_test(const std::string& /*header*/, const VarMap& vars) override {
         Test::Result result("BelT-KWP");

         const std::vector<uint8_t> kek = vars.get_req_bin("Key");
         const std::vector<uint8_t> header = vars.get_req_bin("Header");
         const std::vector<uint8_t> input = vars.get_req_bin("Input");
         const std::vector<uint8_t> expected = vars.get_req_bin("Output");

         const Keywrap::BelT_KWP kwp(kek);

         result.test_eq("wrap", kwp.wrap(input, header), expected);
         result.test_eq("unwrap", kwp.unwrap(expected, header), input);

         std::vector<uint8_t> out(expected.size());
         result.test_eq("caller buffer wrap length", kwp.wrap(input, header, out), expected.size());
         result.test_eq("caller buffer wrap", out, expected);

         auto bad_header = header;
         bad_header[0] ^= 0x01;
         result.test_throws<Keywrap::Invalid_Authentication_Tag>("unwrap with another header",
                                                                 [&] { kwp.unwrap(expected, bad_header); });

         auto modified = expected;
         modified[expected.size() / 2] ^= 0x80;
         std::vector<uint8_t> recovered(input.size(), 0xAA);
         result.test_throws<Keywrap::Invalid_Authentication_Tag>("unwrap of modified input",
                                                                 [&] { kwp.unwrap(modified, header, recovered); });
         result.test_all_zero("output after integrity failure", recovered);

         auto other_kek = kek;
         other_kek[31] ^= 0x01;
         const Keywrap::BelT_KWP other(other_kek);
         result.test_throws<Keywrap::Invalid_Authentication_Tag>("unwrap under another KEK",
                                                                 [&] { other.unwrap(expected, header); });

         return result;
      }
};

KEYWRAP_REGISTER_TEST("keywrap", "belt_kwp", BelT_KWP_Tests);

Test::Result belt_kwp_argument_checks() {
   Test::Result result("BelT-KWP argument checks");

   const std::vector<uint8_t> kek(32, 0x5A);
   const std::vector<uint8_t> header(16);
   const Keywrap::BelT_KWP kwp(kek);

   for(size_t kek_len : {0, 16, 24, 31, 33, 64}) {
      result.test_throws<Keywrap::Invalid_Key_Length>("KEK of " + std::to_string(kek_len) + " bytes", [&] {
         const std::vector<uint8_t> bad_kek(kek_len);
         const Keywrap::BelT_KWP bad(bad_kek);
      });
   }

   for(size_t header_len : {0, 8, 15, 17, 32}) {
      const std::vector<uint8_t> bad_header(header_len);
      result.test_throws<Keywrap::Invalid_Argument>("header of " + std::to_string(header_len) + " bytes",
                                                    [&] { kwp.wrap(std::vector<uint8_t>(32), bad_header); });
      result.test_throws<Keywrap::Invalid_Argument>("unwrap header of " + std::to_string(header_len) + " bytes",
                                                    [&] { kwp.unwrap(std::vector<uint8_t>(48), bad_header); });
   }

   for(size_t len : {0, 8, 15, 17, 31, 33}) {
      result.test_throws<Keywrap::Invalid_Data_Length>("wrap of " + std::to_string(len) + " bytes",
                                                       [&] { kwp.wrap(std::vector<uint8_t>(len), header); });
   }

   for(size_t len : {0, 16, 31, 33, 47}) {
      result.test_throws<Keywrap::Invalid_Data_Length>("unwrap of " + std::to_string(len) + " bytes",
                                                       [&] { kwp.unwrap(std::vector<uint8_t>(len), header); });
   }

   const std::vector<uint8_t> data(32, 0x11);
   std::vector<uint8_t> small(47, 0xAA);
   try {
      kwp.wrap(data, header, small);
      result.test_failure("wrap accepted a short output buffer");
   } catch(Keywrap::Buffer_Too_Small& e) {
      result.test_eq("required length", e.required_length(), 48);
      result.test_eq("output untouched", small, std::vector<uint8_t>(47, 0xAA));
   }

   Keywrap::BelT_KWP moved_to(std::vector<uint8_t>(32, 0x11));
   Keywrap::BelT_KWP moved_from(kek);
   moved_to = std::move(moved_from);
   result.test_eq("moved object works", moved_to.wrap(data, header).size(), 48);
   // NOLINTNEXTLINE(*-use-after-move)
   result.test_throws<Keywrap::Invalid_State>("wrap with a moved-from object",
                                              [&] { moved_from.wrap(data, header); });
   // NOLINTNEXTLINE(*-use-after-move)
   result.test_throws<Keywrap::Invalid_State>("unwrap with a moved-from object",
                                              [&] { moved_from.unwrap(std::vector<uint8_t>(48), header); });

   return result;
}

Test::Result belt_kwp_fixed_size() {
   Test::Result result("BelT-KWP fixed size");

   // STB 34.101.31-2020 table A.21
   const auto kek = Keywrap::hex_decode("E9DEE72C8F0C0FA62DDB49F46F73964706075316ED247A3739CBA38303A98BF6");
   const Keywrap::BelT_KWP kwp(kek);

   std::array<uint8_t, 16> header;
   Keywrap::hex_decode(header, "5BE3D61217B96181FE6786AD716B890B");

   std::array<uint8_t, 32> key;
   Keywrap::hex_decode(key, "B194BAC80A08F53B366D008E584A5DE48504FA9D1BB6C7AC252E72C202FDCE0D");

   const std::array<uint8_t, 48> wrapped = kwp.wrap_fixed(key, header);
   result.test_eq("wrap_fixed",
                  wrapped,
                  "49A38EE108D6C742E52B774F00A6EF98B106CBD13EA4FB0680323051BC04DF76"
                  "E487B055C69BCF541176169F1DC9F6C8");

   const std::array<uint8_t, 32> unwrapped = kwp.unwrap_fixed(wrapped, header);
   result.test_eq("unwrap_fixed", unwrapped, key);

   return result;
}

KEYWRAP_REGISTER_TEST_FN("keywrap", "belt_kwp_args", belt_kwp_argument_checks, belt_kwp_fixed_size);

class BelT_WBlock_Tests final : public Test {
   public:
      std::vector<Test::Result> run() override {
         Test::Result result("belt-wblock");

         Keywrap::BelT belt;
         belt.set_key(rng().random_vec(32));

         for(size_t len = 32; len <= 128; len += 16) {
            const auto input = rng().random_vec(len);

            std::vector<uint8_t> buf = input;
            Keywrap::belt_wblock_encrypt(buf, belt);
            result.test_ne("encrypt changes " + std::to_string(len) + " bytes", buf, input);

            Keywrap::belt_wblock_decrypt(buf, belt);
            result.test_eq("round trip of " + std::to_string(len) + " bytes", buf, input);
         }

         // only whole blocks, at least two of them
         for(size_t len : {0, 1, 16, 31, 33, 40, 47, 63}) {
            std::vector<uint8_t> buf(len);
            result.test_throws<Keywrap::Invalid_Data_Length>("encrypt of " + std::to_string(len) + " bytes",
                                                             [&] { Keywrap::belt_wblock_encrypt(buf, belt); });
            result.test_throws<Keywrap::Invalid_Data_Length>("decrypt of " + std::to_string(len) + " bytes",
                                                             [&] { Keywrap::belt_wblock_decrypt(buf, belt); });
         }

         // BelT-KWP wrap is belt-wblock over the key followed by the header (table A.21)
         belt.set_key(Keywrap::hex_decode("E9DEE72C8F0C0FA62DDB49F46F73964706075316ED247A3739CBA38303A98BF6"));
         auto block = Keywrap::hex_decode(
            "B194BAC80A08F53B366D008E584A5DE48504FA9D1BB6C7AC252E72C202FDCE0D5BE3D61217B96181FE6786AD716B890B");
         Keywrap::belt_wblock_encrypt(block, belt);
         result.test_eq("wblock known answer",
                        block,
                        "49A38EE108D6C742E52B774F00A6EF98B106CBD13EA4FB0680323051BC04DF76"
                        "E487B055C69BCF541176169F1DC9F6C8");

         Keywrap::BelT unkeyed;
         std::vector<uint8_t> buf(32);
         result.test_throws<Keywrap::Key_Not_Set>("unkeyed cipher", [&] { Keywrap::belt_wblock_encrypt(buf, unkeyed); });

         return {result};
      }
};

KEYWRAP_REGISTER_TEST("keywrap", "belt_wblock", BelT_WBlock_Tests);

#endif

}  // namespace

}  // namespace Keywrap_Tests
