#pragma once

#include <algorithm>
#include <bit>
#include <cstring>
#include <type_traits>

namespace binread
{
   enum class endian
   {
      big,
      little,
      native,
   };

   // Maps native onto the host byte order. Only called right before raw
   // bytes are interpreted.
   constexpr endian resolve(endian e)
   {
      if (e != endian::native)
         return e;
      if constexpr (std::endian::native == std::endian::big)
         return endian::big;
      else
         return endian::little;
   }

   template <typename T>
   T from_bytes(const char (&src)[sizeof(T)], endian e)
   {
      static_assert(std::is_trivially_copyable_v<T>);
      char buf[sizeof(T)];
      std::memcpy(buf, src, sizeof(T));
      if (resolve(e) != resolve(endian::native))
         std::reverse(buf, buf + sizeof(T));
      T result;
      std::memcpy(&result, buf, sizeof(T));
      return result;
   }
}  // namespace binread
