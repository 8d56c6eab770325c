#pragma once

#include <binread/binread.hpp>

#include <algorithm>
#include <bit>
#include <cstring>
#include <initializer_list>
#include <vector>

#include <catch2/catch.hpp>

inline std::vector<char> bytes(std::initializer_list<int> values)
{
   std::vector<char> result;
   for (auto v : values)
      result.push_back(static_cast<char>(v));
   return result;
}

template <typename T>
std::vector<char> le_bytes(const T& value)
{
   std::vector<char> result(sizeof(T));
   std::memcpy(result.data(), &value, sizeof(T));
   if constexpr (std::endian::native == std::endian::big)
      std::reverse(result.begin(), result.end());
   return result;
}

template <typename T>
std::vector<char> be_bytes(const T& value)
{
   auto result = le_bytes(value);
   std::reverse(result.begin(), result.end());
   return result;
}

// The code of the binread::error thrown by f, or no_error
template <typename F>
binread::read_error error_of(F&& f)
{
   try
   {
      f();
   }
   catch (const binread::error& e)
   {
      return e.code();
   }
   return binread::read_error::no_error;
}

template <>
struct Catch::StringMaker<binread::read_error>
{
   static std::string convert(binread::read_error e)
   {
      return std::string(binread::error_to_str(e));
   }
};
