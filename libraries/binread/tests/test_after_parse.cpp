#include "test_read.hpp"

using namespace binread;

namespace
{
   std::vector<int> parse_log;
   std::vector<int> after_log;

   void reset_logs()
   {
      parse_log.clear();
      after_log.clear();
   }

   struct tracked
   {
      int id;
   };

   // Multiplied by its argument in the second phase
   struct scaled
   {
      std::uint32_t value;
   };

   struct scale_args
   {
      std::uint32_t factor = 1;
   };

   // Resolved in the second phase by seeking to offset
   template <typename T>
   struct offset_ptr
   {
      std::uint32_t    offset;
      std::optional<T> value;
   };

   // Consumes a byte in the second phase
   struct skipper
   {
   };

   // Records the stream position seen by its second phase
   struct position_mark
   {
      std::uint64_t seen = 0;
   };

   // Second phase takes its arguments by non-const reference
   struct mistyped
   {
      std::uint8_t value;
   };
}  // namespace

namespace binread
{
   template <>
   struct reader<tracked>
   {
      using args_type = unit;

      template <ReadSeekStream S>
      static tracked read(S& stream, const read_options& options, args_type)
      {
         tracked result{read_value<std::uint8_t>(stream, options, {})};
         parse_log.push_back(result.id);
         return result;
      }

      template <ReadSeekStream S>
      static void after_parse(tracked& value, S&, const read_options&, args_type)
      {
         after_log.push_back(value.id);
      }
   };

   template <>
   struct reader<scaled>
   {
      using args_type = scale_args;

      template <ReadSeekStream S>
      static scaled read(S& stream, const read_options& options, args_type)
      {
         return scaled{read_value<std::uint32_t>(stream, options, {})};
      }

      template <ReadSeekStream S>
      static void after_parse(scaled& value, S&, const read_options&, args_type args)
      {
         value.value *= args.factor;
      }
   };

   template <typename T>
   struct reader<offset_ptr<T>>
   {
      using args_type = args_of<T>;

      template <ReadSeekStream S>
      static offset_ptr<T> read(S& stream, const read_options& options, args_type)
      {
         return offset_ptr<T>{read_value<std::uint32_t>(stream, options, {}), std::nullopt};
      }

      template <ReadSeekStream S>
      static void after_parse(offset_ptr<T>&      ptr,
                              S&                  stream,
                              const read_options& options,
                              args_type           args)
      {
         auto saved = stream.tell();
         stream.seek(ptr.offset);
         ptr.value = read_value<T>(stream, options, args);
         binread::after_parse(*ptr.value, stream, options, std::move(args));
         stream.seek(saved);
      }
   };

   template <>
   struct reader<skipper>
   {
      using args_type = unit;

      template <ReadSeekStream S>
      static skipper read(S&, const read_options&, args_type)
      {
         return {};
      }

      template <ReadSeekStream S>
      static void after_parse(skipper&, S& stream, const read_options& options, args_type)
      {
         read_value<std::uint8_t>(stream, options, {});
      }
   };

   template <>
   struct reader<position_mark>
   {
      using args_type = unit;

      template <ReadSeekStream S>
      static position_mark read(S&, const read_options&, args_type)
      {
         return {};
      }

      template <ReadSeekStream S>
      static void after_parse(position_mark& value, S& stream, const read_options&, args_type)
      {
         value.seen = stream.tell();
      }
   };

   template <>
   struct reader<mistyped>
   {
      using args_type = unit;

      template <ReadSeekStream S>
      static mistyped read(S& stream, const read_options& options, args_type)
      {
         return mistyped{read_value<std::uint8_t>(stream, options, {})};
      }

      template <ReadSeekStream S>
      static void after_parse(mistyped& value, S&, const read_options&, args_type&)
      {
         value.value = 99;
      }
   };
}  // namespace binread

// A second phase that cannot be called with the reader's arguments is a
// compile error rather than being skipped
static_assert(Readable<mistyped>);
static_assert(!HasAfterParse<mistyped, input_stream>);
static_assert(HasAfterParse<tracked, input_stream>);
static_assert(HasAfterParse<offset_ptr<std::uint16_t>, input_stream>);
static_assert(HasAfterParse<std::uint32_t, input_stream>);
static_assert(HasAfterParse<std::vector<tracked>, input_stream>);
static_assert(HasAfterParse<std::tuple<tracked, std::optional<position_mark>>, input_stream>);

TEST_CASE("second phase runs once per value after the whole tree is read")
{
   reset_logs();
   auto         data = bytes({1, 2, 3, 4, 5, 6});
   input_stream s{data};
   using tree = std::tuple<tracked, std::optional<tracked>, std::unique_ptr<tracked>,
                           std::array<tracked, 2>, std::pair<tracked, unit>>;
   auto t     = read<tree>(s);

   CHECK(parse_log == std::vector<int>{1, 2, 3, 4, 5, 6});
   CHECK(after_log == std::vector<int>{1, 2, 3, 4, 5, 6});
   CHECK(std::get<2>(t)->id == 3);
}

TEST_CASE("vector elements get their second phase in order")
{
   reset_logs();
   auto         data = bytes({7, 8, 9});
   input_stream s{data};
   auto         v = read_args<std::vector<tracked>>(s, {.count = 3, .inner = {}});
   REQUIRE(v.size() == 3);
   CHECK(after_log == std::vector<int>{7, 8, 9});

   // Nested collections
   reset_logs();
   s.seek(0);
   read_args<std::vector<std::vector<tracked>>>(s, {.count = 1, .inner = {.count = 3, .inner = {}}});
   CHECK(parse_log == std::vector<int>{7, 8, 9});
   CHECK(after_log == std::vector<int>{7, 8, 9});
}

TEST_CASE("read_value skips the second phase")
{
   reset_logs();
   auto         data = bytes({1, 2});
   input_stream s{data};
   auto         t = read_value<std::tuple<tracked, tracked>>(s, {}, {});
   CHECK(parse_log.size() == 2);
   CHECK(after_log.empty());

   binread::after_parse(t, s, {}, {});
   CHECK(after_log == std::vector<int>{1, 2});
}

TEST_CASE("second phase receives the same arguments")
{
   auto         data = bytes({2, 0, 0, 0, 3, 0, 0, 0});
   input_stream s{data};
   auto         v = read_le_args<std::vector<scaled>>(s, {.count = 2, .inner = {.factor = 10}});
   REQUIRE(v.size() == 2);
   CHECK(v[0].value == 20);
   CHECK(v[1].value == 30);

   s.seek(0);
   CHECK(read_le_args<std::array<scaled, 2>>(s, {.factor = 3})[1].value == 9);

   s.seek(0);
   CHECK(read_le<scaled>(s).value == 2);
}

TEST_CASE("second phase can follow offsets")
{
   // offset, trailing field, padding, target
   auto         data = bytes({0x08, 0x00, 0x00, 0x00, 0x55, 0x00, 0x00, 0x00, 0x34, 0x12});
   input_stream s{data};
   auto         t = read_le<std::tuple<offset_ptr<std::uint16_t>, std::uint32_t>>(s);
   auto&        ptr = std::get<0>(t);
   CHECK(ptr.offset == 8);
   REQUIRE(ptr.value);
   CHECK(*ptr.value == 0x1234);
   CHECK(std::get<1>(t) == 0x55);
   CHECK(s.tell() == 8);

   // The same layout read big-endian points past the end
   s.seek(0);
   CHECK(error_of([&] { read_be<std::tuple<offset_ptr<std::uint16_t>, std::uint32_t>>(s); }) ==
         read_error::not_enough_bytes);
}

TEST_CASE("offset targets get their own second phase")
{
   reset_logs();
   auto         data = bytes({0x04, 0x00, 0x00, 0x00, 0x2a});
   input_stream s{data};
   auto         ptr = read_le<offset_ptr<tracked>>(s);
   REQUIRE(ptr.value);
   CHECK(ptr.value->id == 42);
   CHECK(after_log == std::vector<int>{42});
}

TEST_CASE("second phases see the position left by earlier ones")
{
   auto         data = bytes({0xaa, 0xbb, 0xcc});
   input_stream s{data};
   using marks =
       std::tuple<std::uint8_t, position_mark, skipper, position_mark, skipper, position_mark>;
   auto t = read<marks>(s);
   CHECK(std::get<1>(t).seen == 1);
   CHECK(std::get<3>(t).seen == 2);
   CHECK(std::get<5>(t).seen == 3);
   CHECK(s.tell() == 3);
}
