#pragma once

#include <binread/options.hpp>
#include <binread/stream.hpp>

#include <concepts>
#include <tuple>
#include <type_traits>

namespace binread
{
   // Argument type of readers that need nothing, and the value of an empty read
   using unit = std::tuple<>;

   // Specialize reader<T> to make T readable. A specialization provides:
   //
   //    using args_type = ...;
   //
   //    template <ReadSeekStream S>
   //    static T read(S& stream, const read_options& options, args_type args);
   //
   // and a second phase, run after the whole value tree has been read:
   //
   //    template <ReadSeekStream S>
   //    static void after_parse(T& value, S& stream, const read_options& options, args_type args);
   //
   // Deriving from base_reader<T> supplies an empty second phase.
   // args_type is copied whenever it has to be reused (once per element of a
   // collection, and between the two phases), so copying must not lose
   // information.
   template <typename T>
   struct reader;

   template <typename T>
   concept Readable = requires { typename reader<T>::args_type; } &&
                      std::copy_constructible<typename reader<T>::args_type>;

   template <Readable T>
   using args_of = typename reader<T>::args_type;

   template <typename T>
   concept HasDefaultArgs = Readable<T> && std::default_initializable<args_of<T>>;

   // Default implementations for reader<T>
   template <typename T>
   struct base_reader
   {
      template <ReadSeekStream S, typename Args>
      static void after_parse(T&, S&, const read_options&, const Args&)
      {
      }
   };

   // Runs the first phase only
   template <Readable T, ReadSeekStream S>
   T read_value(S& stream, const read_options& options, args_of<T> args)
   {
      return reader<T>::read(stream, options, std::move(args));
   }

   template <typename T, typename S>
   concept HasAfterParse =
       Readable<T> &&
       requires(T& value, S& stream, const read_options& options, args_of<T> args) {
          reader<T>::after_parse(value, stream, options, std::move(args));
       };

   // Runs the second phase of value
   template <Readable T, ReadSeekStream S>
   void after_parse(T& value, S& stream, const read_options& options, args_of<T> args)
   {
      static_assert(HasAfterParse<T, S>,
                    "reader<T>::after_parse must accept (T&, S&, const read_options&, args_type); "
                    "derive from base_reader<T> if T has no second phase");
      reader<T>::after_parse(value, stream, options, std::move(args));
   }
}  // namespace binread
