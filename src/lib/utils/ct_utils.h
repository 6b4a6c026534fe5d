/*
* Constant time helpers
* (C) 2025 Keywrap Developers
*
* Keywrap is released under the Simplified BSD License (see license.txt)
*/

#ifndef KEYWRAP_CT_UTILS_H_
#define KEYWRAP_CT_UTILS_H_

#include <keywrap/types.h>
#include <initializer_list>
#include <span>
#include <type_traits>

#if defined(KEYWRAP_HAS_VALGRIND)
   #include <valgrind/memcheck.h>
#endif

namespace Keywrap::CT {

/**
* Mark memory as secret for valgrind. Any later branch or memory index
* that depends on it is reported as a use of uninitialized data.
*/
template <typename T>
inline void poison(const T* p, size_t n) {
#if defined(KEYWRAP_HAS_VALGRIND)
   VALGRIND_MAKE_MEM_UNDEFINED(p, n * sizeof(T));
#endif
   KEYWRAP_UNUSED(p, n);
}

template <typename T>
inline void unpoison(const T* p, size_t n) {
#if defined(KEYWRAP_HAS_VALGRIND)
   VALGRIND_MAKE_MEM_DEFINED(p, n * sizeof(T));
#endif
   KEYWRAP_UNUSED(p, n);
}

template <typename T>
inline void poison(std::span<T> s) {
   poison(s.data(), s.size());
}

template <typename T>
   requires std::is_integral_v<T>
inline void unpoison(T& v) {
   unpoison(&v, 1);
}

/**
* Hide a value from the optimizer so it cannot turn mask arithmetic
* back into a branch
*/
template <typename T>
constexpr inline T value_barrier(T x) {
   if(!std::is_constant_evaluated()) {
#if defined(__GNUC__) || defined(__clang__)
      asm("" : "+r"(x));
#endif
   }
   return x;
}

/**
* An unsigned word that is either all zero bits or all one bits.
* Comparisons return a Mask instead of a bool so the result can be
* combined without branching on secret data.
*/
template <typename T>
class Mask final {
   public:
      static_assert(std::is_unsigned_v<T> && !std::is_same_v<bool, T>, "CT::Mask needs an unsigned word type");

      /**
      * Narrow a mask of a wider word
      */
      template <typename U>
      constexpr Mask(Mask<U> o) : m_mask(static_cast<T>(o.value())) {
         static_assert(sizeof(U) > sizeof(T), "CT::Mask can only narrow");
      }

      static constexpr Mask<T> set() { return Mask<T>(static_cast<T>(~0)); }

      static constexpr Mask<T> cleared() { return Mask<T>(0); }

      static constexpr Mask<T> expand_top_bit(T v) {
         return Mask<T>(static_cast<T>(T(0) - (value_barrier<T>(v) >> (8 * sizeof(T) - 1))));
      }

      static constexpr Mask<T> is_zero(T v) {
         v = value_barrier<T>(v);
         return Mask<T>::expand_top_bit(static_cast<T>(~v & (v - 1)));
      }

      /**
      * Set if v is non-zero
      */
      static constexpr Mask<T> expand(T v) { return ~Mask<T>::is_zero(v); }

      static constexpr Mask<T> is_equal(T x, T y) { return Mask<T>::is_zero(static_cast<T>(x ^ y)); }

      static constexpr Mask<T> is_lt(T x, T y) {
         // top bit of the borrow out of x - y
         const T borrow = static_cast<T>(x ^ ((x ^ y) | ((x - y) ^ x)));
         return Mask<T>::expand_top_bit(borrow);
      }

      static constexpr Mask<T> is_gt(T x, T y) { return Mask<T>::is_lt(y, x); }

      static constexpr Mask<T> is_lte(T x, T y) { return ~Mask<T>::is_gt(x, y); }

      static constexpr Mask<T> is_gte(T x, T y) { return ~Mask<T>::is_lt(x, y); }

      /**
      * Set if lo <= v <= hi
      */
      static constexpr Mask<T> is_within_range(T v, T lo, T hi) {
         return Mask<T>::is_gte(v, lo) & Mask<T>::is_lte(v, hi);
      }

      static constexpr Mask<T> is_any_of(T v, std::initializer_list<T> accepted) {
         auto m = Mask<T>::cleared();
         for(T a : accepted) {
            m |= Mask<T>::is_equal(v, a);
         }
         return m;
      }

      constexpr Mask<T>& operator&=(Mask<T> o) {
         m_mask &= o.value();
         return *this;
      }

      constexpr Mask<T>& operator|=(Mask<T> o) {
         m_mask |= o.value();
         return *this;
      }

      friend constexpr Mask<T> operator&(Mask<T> x, Mask<T> y) { return Mask<T>(x.value() & y.value()); }

      friend constexpr Mask<T> operator|(Mask<T> x, Mask<T> y) { return Mask<T>(x.value() | y.value()); }

      friend constexpr Mask<T> operator^(Mask<T> x, Mask<T> y) { return Mask<T>(x.value() ^ y.value()); }

      constexpr Mask<T> operator~() const { return Mask<T>(static_cast<T>(~value())); }

      constexpr T if_set_return(T x) const { return value() & x; }

      constexpr T if_not_set_return(T x) const { return static_cast<T>(~value() & x); }

      /**
      * x if the mask is set, else y
      */
      constexpr T select(T x, T y) const { return static_cast<T>(y ^ (value() & (x ^ y))); }

      /**
      * Collapse to a bool. Only call this once the outcome may be revealed.
      */
      constexpr bool as_bool() const {
         T r = value();
         if(!std::is_constant_evaluated()) {
            CT::unpoison(r);
         }
         return r != 0;
      }

      constexpr T value() const { return value_barrier<T>(m_mask); }

   private:
      constexpr explicit Mask(T m) : m_mask(m) {}

      T m_mask;
};

/**
* Set if x[0..len) and y[0..len) are identical
*/
template <typename T>
inline Mask<T> is_equal(const T x[], const T y[], size_t len) {
   volatile T difference = 0;
   for(size_t i = 0; i != len; ++i) {
      difference = difference | static_cast<T>(x[i] ^ y[i]);
   }
   return Mask<T>::is_zero(difference);
}

template <typename T>
inline Mask<T> is_not_equal(const T x[], const T y[], size_t len) {
   return ~CT::is_equal(x, y, len);
}

template <typename T>
inline Mask<T> all_zeros(const T buf[], size_t len) {
   T combined = 0;
   for(size_t i = 0; i != len; ++i) {
      combined |= buf[i];
   }
   return Mask<T>::is_zero(combined);
}

}  // namespace Keywrap::CT

#endif
