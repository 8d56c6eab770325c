#pragma once

#include <binread/endian.hpp>

namespace binread
{
   /**
    * Settings shared by every reader in one decode. Passed by const
    * reference down the whole call graph and never modified; a reader that
    * needs a different byte order for a sub-value makes a new one with
    * with_endian().
    */
   struct read_options
   {
      endian byte_order = endian::native;

      constexpr read_options with_endian(endian e) const
      {
         read_options result = *this;
         result.byte_order   = e;
         return result;
      }

      constexpr endian resolved_order() const { return resolve(byte_order); }

      friend constexpr bool operator==(const read_options&, const read_options&) = default;
   };
}  // namespace binread
