/*
* Keyed symmetric algorithms
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_SYMMETRIC_ALGORITHM_H_
#define KEYWRAP_SYMMETRIC_ALGORITHM_H_

#include <keywrap/types.h>
#include <span>
#include <string>

namespace Keywrap {

/**
* The key lengths an algorithm accepts: every multiple of keylen_mod
* between min_keylen and max_keylen inclusive
*/
class KEYWRAP_PUBLIC_API(1, 0) Key_Length_Specification final {
   public:
      explicit Key_Length_Specification(size_t keylen) : Key_Length_Specification(keylen, keylen) {}

      Key_Length_Specification(size_t min_keylen, size_t max_keylen, size_t keylen_mod = 1) :
            m_min_keylen(min_keylen), m_max_keylen(max_keylen), m_keylen_mod(keylen_mod) {}

      bool valid_keylength(size_t length) const {
         return length >= m_min_keylen && length <= m_max_keylen && length % m_keylen_mod == 0;
      }

      size_t minimum_keylength() const { return m_min_keylen; }

      size_t maximum_keylength() const { return m_max_keylen; }

   private:
      size_t m_min_keylen;
      size_t m_max_keylen;
      size_t m_keylen_mod;
};

/**
* Base of everything that is keyed once with set_key and then used
*/
class KEYWRAP_PUBLIC_API(1, 0) SymmetricAlgorithm {
   public:
      virtual ~SymmetricAlgorithm() = default;

      /**
      * Forget the key
      */
      virtual void clear() = 0;

      virtual Key_Length_Specification key_spec() const = 0;

      size_t maximum_keylength() const { return key_spec().maximum_keylength(); }

      size_t minimum_keylength() const { return key_spec().minimum_keylength(); }

      bool valid_keylength(size_t length) const { return key_spec().valid_keylength(length); }

      /**
      * @throws Invalid_Key_Length if key_spec() rejects the length of key
      */
      void set_key(std::span<const uint8_t> key);

      void set_key(const uint8_t key[], size_t length) { set_key(std::span{key, length}); }

      virtual std::string name() const = 0;

      virtual bool has_keying_material() const = 0;

   protected:
      /**
      * @throws Key_Not_Set unless has_keying_material()
      */
      void assert_key_material_set() const;

   private:
      virtual void key_schedule(std::span<const uint8_t> key) = 0;
};

}  // namespace Keywrap

#endif
