#pragma once

#include <binread/log.hpp>
#include <binread/reader.hpp>

#include <boost/core/demangle.hpp>

#include <typeinfo>

namespace binread
{
   /**
    * Reads a complete T: the first phase for the whole value tree, then
    * after_parse with the same options and a copy of args.
    *
    * Throws binread::error. If T is a primitive the stream is back where it
    * started; otherwise its position is unspecified and the caller must seek
    * before reusing it.
    */
   template <Readable T, ReadSeekStream S>
   T read_with_options(S& stream, const read_options& options, args_of<T> args)
   {
      auto start = stream.tell();
      try
      {
         T result = reader<T>::read(stream, options, args);
         after_parse(result, stream, options, std::move(args));
         return result;
      }
      catch (const error& e)
      {
         BINREAD_LOG(loggers::generic::get(), debug)
             << "Failed to read " << boost::core::demangle(typeid(T).name()) << " starting at "
             << start << ": " << e.what();
         throw;
      }
   }

   template <Readable T, ReadSeekStream S>
   T read_type_args(S& stream, endian e, args_of<T> args)
   {
      return read_with_options<T>(stream, read_options{}.with_endian(e), std::move(args));
   }

   template <HasDefaultArgs T, ReadSeekStream S>
   T read_type(S& stream, endian e)
   {
      return read_type_args<T>(stream, e, args_of<T>{});
   }

   // Native byte order, default arguments
   template <HasDefaultArgs T, ReadSeekStream S>
   T read(S& stream)
   {
      return read_with_options<T>(stream, read_options{}, args_of<T>{});
   }

   template <Readable T, ReadSeekStream S>
   T read_args(S& stream, args_of<T> args)
   {
      return read_with_options<T>(stream, read_options{}, std::move(args));
   }

   template <HasDefaultArgs T, ReadSeekStream S>
   T read_be(S& stream)
   {
      return read_type<T>(stream, endian::big);
   }

   template <HasDefaultArgs T, ReadSeekStream S>
   T read_le(S& stream)
   {
      return read_type<T>(stream, endian::little);
   }

   template <HasDefaultArgs T, ReadSeekStream S>
   T read_ne(S& stream)
   {
      return read_type<T>(stream, endian::native);
   }

   template <Readable T, ReadSeekStream S>
   T read_be_args(S& stream, args_of<T> args)
   {
      return read_type_args<T>(stream, endian::big, std::move(args));
   }

   template <Readable T, ReadSeekStream S>
   T read_le_args(S& stream, args_of<T> args)
   {
      return read_type_args<T>(stream, endian::little, std::move(args));
   }

   template <Readable T, ReadSeekStream S>
   T read_ne_args(S& stream, args_of<T> args)
   {
      return read_type_args<T>(stream, endian::native, std::move(args));
   }
}  // namespace binread
