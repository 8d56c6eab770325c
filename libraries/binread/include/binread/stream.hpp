#pragma once

#include <binread/error.hpp>

#include <concepts>
#include <cstdint>
#include <cstring>
#include <istream>
#include <span>
#include <string_view>
#include <vector>

namespace binread
{
   // read() may return fewer bytes than requested and returns 0 at the end
   // of the stream; seek() is absolute.
   template <typename S>
   concept ReadSeekStream = requires(S& s, char* dest, std::size_t size, std::uint64_t pos) {
                               {
                                  s.read(dest, size)
                                  } -> std::convertible_to<std::size_t>;
                               s.seek(pos);
                               {
                                  s.tell()
                                  } -> std::convertible_to<std::uint64_t>;
                            };

   /**
    * Seekable cursor over a borrowed region of memory. Seeking past the end
    * is allowed; reads there return nothing.
    */
   struct input_stream
   {
      const char*   data;
      std::size_t   size;
      std::uint64_t offset = 0;

      constexpr input_stream() : data{nullptr}, size{0} {}
      constexpr input_stream(const char* data, std::size_t size) : data{data}, size{size} {}
      input_stream(const std::uint8_t* data, std::size_t size)
          : input_stream(reinterpret_cast<const char*>(data), size)
      {
      }
      input_stream(const std::vector<char>& v) : input_stream(v.data(), v.size()) {}
      input_stream(const std::vector<std::uint8_t>& v) : input_stream(v.data(), v.size()) {}
      constexpr input_stream(std::string_view v) : input_stream(v.data(), v.size()) {}
      constexpr input_stream(std::span<const char> v) : input_stream(v.data(), v.size()) {}

      std::size_t remaining() const { return offset < size ? size - offset : 0; }

      std::size_t read(char* dest, std::size_t n)
      {
         if (n > remaining())
            n = remaining();
         if (n)
            std::memcpy(dest, data + offset, n);
         offset += n;
         return n;
      }

      void          seek(std::uint64_t pos) { offset = pos; }
      std::uint64_t tell() const { return offset; }
   };

   /**
    * Adapts a caller-owned std::istream. The stream must support seekg and
    * tellg.
    */
   class std_stream
   {
     public:
      explicit std_stream(std::istream& is) : is(is) {}

      std::size_t read(char* dest, std::size_t size)
      {
         is.read(dest, size);
         auto result = is.gcount();
         if (is.bad())
            abort_error(read_error::io_failure, unknown_position);
         // A short read sets eof and fail; clear them so tell and seek keep working.
         if (is.eof())
            is.clear();
         return result;
      }

      void seek(std::uint64_t offset)
      {
         // A bad stream stays bad
         if (is.bad())
            abort_error(read_error::io_failure, unknown_position);
         if (!is.seekg(static_cast<std::streamoff>(offset)))
         {
            is.clear(is.rdstate() & std::ios_base::badbit);
            abort_error(read_error::seek_failure, offset);
         }
      }

      std::uint64_t tell()
      {
         auto result = is.tellg();
         if (result < 0)
            abort_error(read_error::io_failure, unknown_position);
         return result;
      }

     private:
      std::istream& is;
   };

   // Reads exactly size bytes or fails with not_enough_bytes, reporting the
   // position the read started at. Does not seek back.
   template <ReadSeekStream S>
   void read_exact(S& stream, void* dest, std::size_t size)
   {
      auto start = stream.tell();
      auto out   = static_cast<char*>(dest);
      while (size)
      {
         std::size_t n = stream.read(out, size);
         if (n == 0)
            abort_error(read_error::not_enough_bytes, start);
         out += n;
         size -= n;
      }
   }
}  // namespace binread
