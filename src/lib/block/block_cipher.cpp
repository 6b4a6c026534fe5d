/*
* Block cipher lookup
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/block_cipher.h>

#include <keywrap/exceptn.h>

#if defined(KEYWRAP_HAS_OPENSSL)
   #include <keywrap/internal/openssl.h>
#endif

#if defined(KEYWRAP_HAS_BELT)
   #include <keywrap/internal/belt.h>
#endif

namespace Keywrap {

std::unique_ptr<BlockCipher> BlockCipher::create(std::string_view algo, std::string_view provider) {
#if defined(KEYWRAP_HAS_OPENSSL)
   if(provider.empty() || provider == "openssl") {
      if(auto bc = make_openssl_block_cipher(algo)) {
         return bc;
      }
   }
#endif

   if(!provider.empty() && provider != "base") {
      return nullptr;
   }

#if defined(KEYWRAP_HAS_BELT)
   if(algo == "BelT" || algo == "BelT-256") {
      return std::make_unique<BelT>();
   }
#endif

   return nullptr;
}

std::unique_ptr<BlockCipher> BlockCipher::create_or_throw(std::string_view algo, std::string_view provider) {
   if(auto bc = BlockCipher::create(algo, provider)) {
      return bc;
   }
   throw Lookup_Error("Block cipher", algo, provider);
}

std::vector<std::string> BlockCipher::providers(std::string_view algo) {
   std::vector<std::string> providers;
   for(const char* prov : {"base", "openssl"}) {
      if(BlockCipher::create(algo, prov)) {
         providers.push_back(prov);
      }
   }
   return providers;
}

}  // namespace Keywrap
