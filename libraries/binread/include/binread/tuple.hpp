#pragma once

#include <binread/reader.hpp>

#include <tuple>
#include <utility>

namespace binread
{
   template <typename T>
   concept ReadableWithUnit = Readable<T> && std::is_same_v<args_of<T>, unit>;

   // Positions are read in order and take no arguments. std::tuple<> is the
   // unit value and reads nothing.
   template <ReadableWithUnit... Ts>
   struct reader<std::tuple<Ts...>>
   {
      using args_type = unit;

      template <ReadSeekStream S>
      static std::tuple<Ts...> read(S& stream, const read_options& options, args_type)
      {
         // Braced initialization reads the positions left to right
         return std::tuple<Ts...>{read_value<Ts>(stream, options, {})...};
      }

      template <ReadSeekStream S>
      static void after_parse(std::tuple<Ts...>&  value,
                              S&                  stream,
                              const read_options& options,
                              args_type)
      {
         std::apply([&](auto&... item) { (binread::after_parse(item, stream, options, {}), ...); },
                    value);
      }
   };

   template <ReadableWithUnit A, ReadableWithUnit B>
   struct reader<std::pair<A, B>>
   {
      using args_type = unit;

      template <ReadSeekStream S>
      static std::pair<A, B> read(S& stream, const read_options& options, args_type)
      {
         return std::pair<A, B>{read_value<A>(stream, options, {}),
                                read_value<B>(stream, options, {})};
      }

      template <ReadSeekStream S>
      static void after_parse(std::pair<A, B>&    value,
                              S&                  stream,
                              const read_options& options,
                              args_type)
      {
         binread::after_parse(value.first, stream, options, {});
         binread::after_parse(value.second, stream, options, {});
      }
   };
}  // namespace binread
