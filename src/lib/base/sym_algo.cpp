/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/sym_algo.h>

#include <keywrap/exceptn.h>

namespace Keywrap {

void SymmetricAlgorithm::assert_key_material_set() const {
   if(!has_keying_material()) {
      throw Key_Not_Set(name());
   }
}

void SymmetricAlgorithm::set_key(std::span<const uint8_t> key) {
   if(!valid_keylength(key.size())) {
      throw Invalid_Key_Length(name(), key.size());
   }
   key_schedule(key);
}

}  // namespace Keywrap
