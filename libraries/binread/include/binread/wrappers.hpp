#pragma once

#include <binread/reader.hpp>

#include <memory>
#include <optional>
#include <type_traits>

namespace binread
{
   // Always engaged. Whether a value is present at all is decided by the
   // caller, not by this reader.
   template <Readable T>
   struct reader<std::optional<T>>
   {
      using args_type = args_of<T>;

      template <ReadSeekStream S>
      static std::optional<T> read(S& stream, const read_options& options, args_type args)
      {
         return std::optional<T>{read_value<T>(stream, options, std::move(args))};
      }

      template <ReadSeekStream S>
      static void after_parse(std::optional<T>&   value,
                              S&                  stream,
                              const read_options& options,
                              args_type           args)
      {
         if (value)
            binread::after_parse(*value, stream, options, std::move(args));
      }
   };

   template <Readable T>
   struct reader<std::unique_ptr<T>>
   {
      using args_type = args_of<T>;

      template <ReadSeekStream S>
      static std::unique_ptr<T> read(S& stream, const read_options& options, args_type args)
      {
         return std::make_unique<T>(read_value<T>(stream, options, std::move(args)));
      }

      template <ReadSeekStream S>
      static void after_parse(std::unique_ptr<T>& value,
                              S&                  stream,
                              const read_options& options,
                              args_type           args)
      {
         if (value)
            binread::after_parse(*value, stream, options, std::move(args));
      }
   };

   // Zero-sized marker carrying a type
   template <typename T>
   struct reader<std::type_identity<T>> : base_reader<std::type_identity<T>>
   {
      using args_type = unit;

      template <ReadSeekStream S>
      static std::type_identity<T> read(S&, const read_options&, args_type)
      {
         return {};
      }
   };
}  // namespace binread
