#pragma once

#include <binread/named_args.hpp>
#include <binread/primitives.hpp>

#include <vector>

namespace binread
{
   /**
    * Arguments for reading a std::vector.
    *
    *    auto args = make_builder<vec_args<args_of<element>>>()
    *                    .set<"count">(header.count)
    *                    .set<"inner">(element_args{...})
    *                    .finalize();
    *
    * inner may be left out when the element type's arguments have a default.
    */
   template <typename Inner>
   struct vec_args
   {
      // The number of elements to read
      std::size_t count;

      // Arguments passed to each element
      Inner inner;
   };
   BINREAD_NAMED_ARGS(template(typename) vec_args, required(count), try_optional(inner))

   template <Readable T>
   struct reader<std::vector<T>>
   {
      using args_type = vec_args<args_of<T>>;

      template <ReadSeekStream S>
      static std::vector<T> read(S& stream, const read_options& options, args_type args)
      {
         std::vector<T> result;
         if constexpr (std::is_same_v<T, std::uint8_t>)
         {
            // Bulk path for raw bytes; gives the same bytes as reading them one at a time
            result.resize(args.count);
            read_exact(stream, result.data(), args.count);
         }
         else
         {
            result.reserve(args.count);
            for (std::size_t i = 0; i < args.count; ++i)
               result.push_back(read_value<T>(stream, options, args.inner));
         }
         return result;
      }

      template <ReadSeekStream S>
      static void after_parse(std::vector<T>&     value,
                              S&                  stream,
                              const read_options& options,
                              args_type           args)
      {
         for (auto& item : value)
            binread::after_parse(item, stream, options, args.inner);
      }
   };
}  // namespace binread
