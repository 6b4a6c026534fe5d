/*
* Secure memory buffers
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_SECURE_MEMORY_BUFFERS_H_
#define KEYWRAP_SECURE_MEMORY_BUFFERS_H_

#include <keywrap/types.h>  // IWYU pragma: export
#include <algorithm>
#include <type_traits>
#include <vector>  // IWYU pragma: export

namespace Keywrap {

/**
* Zeroed allocation of elems * elem_size bytes
* @throws std::bad_alloc on failure or overflow
*/
KEYWRAP_PUBLIC_API(1, 0) void* allocate_memory(size_t elems, size_t elem_size);

/**
* Scrub and free memory returned by allocate_memory
*/
KEYWRAP_PUBLIC_API(1, 0) void deallocate_memory(void* p, size_t elems, size_t elem_size);

/**
* Allocator which scrubs memory before handing it back to the heap.
* Key schedules, unwrapped keys and the scratch buffers of the wrapping
* code all live in vectors using it.
*/
template <typename T>
   requires std::is_integral_v<T>
class secure_allocator {
   public:
      typedef T value_type;
      typedef std::size_t size_type;

      secure_allocator() noexcept = default;

      template <typename U>
      secure_allocator(const secure_allocator<U>&) noexcept {}

      T* allocate(std::size_t n) { return static_cast<T*>(allocate_memory(n, sizeof(T))); }

      void deallocate(T* p, std::size_t n) { deallocate_memory(p, n, sizeof(T)); }
};

template <typename T, typename U>
inline bool operator==(const secure_allocator<T>&, const secure_allocator<U>&) {
   return true;
}

template <typename T>
using secure_vector = std::vector<T, secure_allocator<T>>;

/**
* Set every element to zero, keeping the size
*/
template <typename T, typename Alloc>
void zeroise(std::vector<T, Alloc>& vec) {
   std::fill(vec.begin(), vec.end(), static_cast<T>(0));
}

/**
* Zeroise, then release the storage
*/
template <typename T, typename Alloc>
void zap(std::vector<T, Alloc>& vec) {
   zeroise(vec);
   vec.clear();
   vec.shrink_to_fit();
}

}  // namespace Keywrap

#endif
