/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include "cli.h"

#include <keywrap/block_cipher.h>
#include <keywrap/hex.h>
#include <keywrap/nist_keywrap.h>

#if defined(KEYWRAP_HAS_BELT_KWP)
   #include <keywrap/belt_kwp.h>
#endif

namespace Keywrap_CLI {

namespace {

/*
* With no --cipher the AES variant follows from the KEK length
*/
std::unique_ptr<Keywrap::BlockCipher> make_kw_cipher(const std::string& cipher_name,
                                                     const Keywrap::secure_vector<uint8_t>& kek) {
   const std::string algo = cipher_name.empty() ? "AES-" + std::to_string(8 * kek.size()) : cipher_name;

   auto bc = Keywrap::BlockCipher::create(algo);
   if(!bc) {
      throw CLI_Error_Unsupported("NIST key wrap", algo);
   }

   bc->set_key(kek);
   return bc;
}

}  // namespace

class NIST_KW_Wrap final : public Command {
   public:
      NIST_KW_Wrap() : Command("nist_kw_wrap --padded --cipher= kek key") {}

      std::string group() const override { return "keywrap"; }

      std::string description() const override { return "Wrap a key with AES-KW (RFC 3394) or AES-KWP (RFC 5649)"; }

      void go() override {
         const auto kek = get_hex_arg("kek");
         const auto key = get_hex_arg("key");

         auto bc = make_kw_cipher(get_arg("cipher"), kek);

         const std::vector<uint8_t> wrapped = flag_set("padded")
                                                 ? Keywrap::nist_key_wrap_padded(key.data(), key.size(), *bc)
                                                 : Keywrap::nist_key_wrap(key.data(), key.size(), *bc);

         if(verbose()) {
            error_output() << (flag_set("padded") ? "KWP" : "KW") << " with " << bc->name() << "\n";
         }

         output() << Keywrap::hex_encode(wrapped) << "\n";
      }
};

KEYWRAP_REGISTER_COMMAND("nist_kw_wrap", NIST_KW_Wrap);

class NIST_KW_Unwrap final : public Command {
   public:
      NIST_KW_Unwrap() : Command("nist_kw_unwrap --padded --cipher= kek wrapped") {}

      std::string group() const override { return "keywrap"; }

      std::string description() const override {
         return "Unwrap and verify a key wrapped with AES-KW or AES-KWP";
      }

      void go() override {
         const auto kek = get_hex_arg("kek");
         const auto wrapped = get_hex_arg("wrapped");

         auto bc = make_kw_cipher(get_arg("cipher"), kek);

         const Keywrap::secure_vector<uint8_t> key =
            flag_set("padded") ? Keywrap::nist_key_unwrap_padded(wrapped.data(), wrapped.size(), *bc)
                               : Keywrap::nist_key_unwrap(wrapped.data(), wrapped.size(), *bc);

         output() << Keywrap::hex_encode(key) << "\n";
      }
};

KEYWRAP_REGISTER_COMMAND("nist_kw_unwrap", NIST_KW_Unwrap);

#if defined(KEYWRAP_HAS_BELT_KWP)

class BelT_KWP_Wrap final : public Command {
   public:
      BelT_KWP_Wrap() : Command("belt_kwp_wrap kek header data") {}

      std::string group() const override { return "keywrap"; }

      std::string description() const override { return "Wrap a key with BelT-KWP (STB 34.101.31)"; }

      void go() override {
         const auto kek = get_hex_arg("kek");
         const auto header = get_hex_arg("header");
         const auto data = get_hex_arg("data");

         const Keywrap::BelT_KWP kwp(kek);
         output() << Keywrap::hex_encode(kwp.wrap(data, header)) << "\n";
      }
};

KEYWRAP_REGISTER_COMMAND("belt_kwp_wrap", BelT_KWP_Wrap);

class BelT_KWP_Unwrap final : public Command {
   public:
      BelT_KWP_Unwrap() : Command("belt_kwp_unwrap kek header wrapped") {}

      std::string group() const override { return "keywrap"; }

      std::string description() const override { return "Unwrap a BelT-KWP value and check its header"; }

      void go() override {
         const auto kek = get_hex_arg("kek");
         const auto header = get_hex_arg("header");
         const auto wrapped = get_hex_arg("wrapped");

         const Keywrap::BelT_KWP kwp(kek);
         output() << Keywrap::hex_encode(kwp.unwrap(wrapped, header)) << "\n";
      }
};

KEYWRAP_REGISTER_COMMAND("belt_kwp_unwrap", BelT_KWP_Unwrap);

#endif

}  // namespace Keywrap_CLI
