#pragma once

#include <binread/reader.hpp>

#include <cstdint>

namespace binread
{
   template <typename T>
   concept ReadableNumeric =          //
       std::is_same_v<T, std::uint8_t> ||   //
       std::is_same_v<T, std::uint16_t> ||  //
       std::is_same_v<T, std::uint32_t> ||  //
       std::is_same_v<T, std::uint64_t> ||  //
       std::is_same_v<T, std::int8_t> ||    //
       std::is_same_v<T, std::int16_t> ||   //
       std::is_same_v<T, std::int32_t> ||   //
       std::is_same_v<T, std::int64_t> ||   //
#ifdef __SIZEOF_INT128__
       std::is_same_v<T, __int128> ||           //
       std::is_same_v<T, unsigned __int128> ||  //
#endif
       std::is_same_v<T, float> ||  //
       std::is_same_v<T, double>;

   // Fixed-width numbers. Unlike composites, a failed read leaves the stream
   // where it was.
   template <ReadableNumeric T>
   struct reader<T> : base_reader<T>
   {
      using args_type = unit;

      template <ReadSeekStream S>
      static T read(S& stream, const read_options& options, args_type)
      {
         char buf[sizeof(T)];
         auto pos = stream.tell();
         try
         {
            read_exact(stream, buf, sizeof(T));
         }
         catch (...)
         {
            try
            {
               stream.seek(pos);
            }
            catch (const error&)
            {
               // Report the read failure, not the failed rollback
            }
            throw;
         }
         return from_bytes<T>(buf, options.byte_order);
      }
   };

   // Widens a single byte to a code point. Multi-byte encodings are not
   // decoded; callers rely on the one-byte behavior.
   template <>
   struct reader<char32_t> : base_reader<char32_t>
   {
      using args_type = unit;

      template <ReadSeekStream S>
      static char32_t read(S& stream, const read_options& options, args_type)
      {
         return reader<std::uint8_t>::read(stream, options, {});
      }
   };
}  // namespace binread
