#pragma once

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <string_view>

namespace binread
{
   enum class error_kind
   {
      io,
      semantic,
      argument,
   };

   enum class read_error
   {
      no_error,
      not_enough_bytes,
      io_failure,
      seek_failure,
      bad_magic,
      assert_fail,
      no_variant_match,
      custom,
      missing_required_arg,
      missing_default_arg,
   };  // read_error

   constexpr inline std::string_view error_to_str(read_error e)
   {
      switch (e)
      {
            // clang-format off
         case read_error::no_error:             return "No error";
         case read_error::not_enough_bytes:     return "not enough bytes in reader";
         case read_error::io_failure:           return "I/O failure";
         case read_error::seek_failure:         return "Seek failure";
         case read_error::bad_magic:            return "Bad magic";
         case read_error::assert_fail:          return "Assertion failed";
         case read_error::no_variant_match:     return "No variant matched";
         case read_error::custom:               return "Custom error";
         case read_error::missing_required_arg: return "Required argument was not set";
         case read_error::missing_default_arg:  return "Optional argument has no default";
            // clang-format on

         default:
            return "unknown";
      }
   }

   constexpr inline error_kind kind_of(read_error e)
   {
      switch (e)
      {
         case read_error::bad_magic:
         case read_error::assert_fail:
         case read_error::no_variant_match:
         case read_error::custom:
            return error_kind::semantic;
         case read_error::missing_required_arg:
         case read_error::missing_default_arg:
            return error_kind::argument;
         default:
            return error_kind::io;
      }
   }

   constexpr inline std::uint64_t unknown_position = std::numeric_limits<std::uint64_t>::max();

   class error : public std::runtime_error
   {
     public:
      error(read_error code, std::uint64_t pos, std::string context = {});

      read_error         code() const { return code_; }
      error_kind         kind() const { return kind_of(code_); }
      std::uint64_t      position() const { return pos_; }
      bool               has_position() const { return pos_ != unknown_position; }
      const std::string& context() const { return context_; }

     private:
      read_error    code_;
      std::uint64_t pos_;
      std::string   context_;
   };

   [[noreturn]] void abort_error(read_error e, std::uint64_t pos);
   [[noreturn]] void abort_error(read_error e, std::string context);
   [[noreturn]] void abort_error(read_error e, std::uint64_t pos, std::string context);

   inline void check(bool cond, read_error e, std::uint64_t pos)
   {
      if (!cond)
         abort_error(e, pos);
   }
}  // namespace binread
