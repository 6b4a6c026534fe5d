/*
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#include <keywrap/secmem.h>

#include <keywrap/mem_ops.h>
#include <cstdlib>
#include <limits>
#include <new>

namespace Keywrap {

void* allocate_memory(size_t elems, size_t elem_size) {
   if(elems == 0 || elem_size == 0) {
      return nullptr;
   }

   if(elems > std::numeric_limits<size_t>::max() / elem_size) {
      throw std::bad_alloc();
   }

   void* p = std::calloc(elems, elem_size);  // NOLINT(*-no-malloc)
   if(p == nullptr) {
      throw std::bad_alloc();
   }
   return p;
}

void deallocate_memory(void* p, size_t elems, size_t elem_size) {
   if(p != nullptr) {
      secure_scrub_memory(p, elems * elem_size);
      std::free(p);  // NOLINT(*-no-malloc)
   }
}

}  // namespace Keywrap
