#pragma once

#include <binread/reader.hpp>

#include <array>
#include <utility>

namespace binread
{
   // Every slot gets a copy of the same arguments. Either all N elements are
   // read or the read fails; a partially read array is never returned.
   template <Readable T, std::size_t N>
   struct reader<std::array<T, N>>
   {
      using args_type = args_of<T>;

      template <ReadSeekStream S>
      static std::array<T, N> read(S& stream, const read_options& options, args_type args)
      {
         if constexpr (std::is_default_constructible_v<T>)
         {
            std::array<T, N> result;
            for (auto& item : result)
               item = read_value<T>(stream, options, args);
            return result;
         }
         else
         {
            return [&]<std::size_t... I>(std::index_sequence<I...>)
            {
               return std::array<T, N>{{(void(I), read_value<T>(stream, options, args))...}};
            }(std::make_index_sequence<N>{});
         }
      }

      template <ReadSeekStream S>
      static void after_parse(std::array<T, N>&   value,
                              S&                  stream,
                              const read_options& options,
                              args_type           args)
      {
         for (auto& item : value)
            binread::after_parse(item, stream, options, args);
      }
   };
}  // namespace binread
