#include <binread/error.hpp>

#include <charconv>
#include <utility>

namespace binread
{
   namespace
   {
      std::string format_message(read_error code, std::uint64_t pos, const std::string& context)
      {
         std::string result(error_to_str(code));
         if (!context.empty())
         {
            result += " (";
            result += context;
            result += ')';
         }
         if (pos != unknown_position)
         {
            char buf[16];
            auto r = std::to_chars(buf, buf + sizeof(buf), pos, 16);
            result += " at 0x";
            result.append(buf, r.ptr);
         }
         return result;
      }
   }  // namespace

   error::error(read_error code, std::uint64_t pos, std::string context)
       : std::runtime_error(format_message(code, pos, context)),
         code_(code),
         pos_(pos),
         context_(std::move(context))
   {
   }

   void abort_error(read_error e, std::uint64_t pos)
   {
      throw error(e, pos);
   }

   void abort_error(read_error e, std::string context)
   {
      throw error(e, unknown_position, std::move(context));
   }

   void abort_error(read_error e, std::uint64_t pos, std::string context)
   {
      throw error(e, pos, std::move(context));
   }
}  // namespace binread
