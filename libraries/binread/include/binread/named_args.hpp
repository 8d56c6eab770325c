#pragma once

#include <binread/error.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

#include <boost/preprocessor/cat.hpp>
#include <boost/preprocessor/control/iif.hpp>
#include <boost/preprocessor/punctuation/comma_if.hpp>
#include <boost/preprocessor/repetition/enum.hpp>
#include <boost/preprocessor/repetition/enum_params.hpp>
#include <boost/preprocessor/seq/for_each_i.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/preprocessor/tuple/eat.hpp>
#include <boost/preprocessor/tuple/elem.hpp>
#include <boost/preprocessor/variadic/size.hpp>
#include <boost/preprocessor/variadic/to_seq.hpp>

namespace binread
{
   template <unsigned N>
   struct FixedString
   {
      char buf[N + 1]{};

      constexpr FixedString(const char (&s)[N + 1])
      {
         for (unsigned i = 0; i < N; ++i)
            buf[i] = s[i];
      }

      constexpr operator std::string_view() const { return {buf, N}; }
      constexpr const char* c_str() const { return buf; }
   };
   template <unsigned N>
   FixedString(const char (&)[N]) -> FixedString<N - 1>;

   enum class field_policy
   {
      // The caller must set the field
      required,
      // An unset field is value-initialized; finalize() fails if its type has no default
      try_optional,
   };

   template <typename R, typename C>
   R member_type_of(R C::*);

   template <FixedString Name, field_policy Policy, auto Member>
   struct named_field
   {
      static constexpr std::string_view name   = Name;
      static constexpr field_policy     policy = Policy;
      using type                               = decltype(member_type_of(Member));
   };

   // Types declared with BINREAD_NAMED_ARGS
   template <typename Args>
   concept NamedArgs = requires(Args* p) { binread_named_args_fields(p); };

   template <NamedArgs Args>
   using named_fields_of = decltype(binread_named_args_fields((Args*)nullptr));

   template <FixedString Name, typename... Fields>
   constexpr std::size_t field_index(std::tuple<Fields...>*)
   {
      constexpr std::string_view names[] = {Fields::name..., {}};
      for (std::size_t i = 0; i < sizeof...(Fields); ++i)
         if (names[i] == std::string_view(Name))
            return i;
      return sizeof...(Fields);
   }

   /**
    * Assembles an argument aggregate field by field, in any order.
    *
    * Values are only checked once, in finalize(): every required field must
    * have been set, and unset try_optional fields get their default. A field
    * type only needs a default constructor if it is try_optional and left
    * unset.
    *
    * finalize() moves the recorded values out; the builder is spent afterwards.
    */
   template <NamedArgs Args>
   class builder
   {
      using fields = named_fields_of<Args>;

      template <typename T>
      struct storage_of;

      template <typename... F>
      struct storage_of<std::tuple<F...>>
      {
         using type = std::tuple<std::optional<typename F::type>...>;
      };

      template <FixedString Name>
      static constexpr std::size_t index_of()
      {
         constexpr auto i = field_index<Name>((fields*)nullptr);
         static_assert(i < std::tuple_size_v<fields>, "no argument with this name");
         return i;
      }

     public:
      template <FixedString Name, typename V>
      builder& set(V&& value) &
      {
         std::get<index_of<Name>()>(values).emplace(std::forward<V>(value));
         return *this;
      }

      template <FixedString Name, typename V>
      builder&& set(V&& value) &&
      {
         std::get<index_of<Name>()>(values).emplace(std::forward<V>(value));
         return std::move(*this);
      }

      template <FixedString Name>
      bool is_set() const
      {
         return std::get<index_of<Name>()>(values).has_value();
      }

      Args finalize()
      {
         return [&]<std::size_t... I>(std::index_sequence<I...>)
         {
            // Braced initialization evaluates take<I>() in field order
            return Args{take<I>()...};
         }(std::make_index_sequence<std::tuple_size_v<fields>>{});
      }

     private:
      template <std::size_t I>
      typename std::tuple_element_t<I, fields>::type take()
      {
         using field = std::tuple_element_t<I, fields>;
         using type  = typename field::type;
         auto& slot  = std::get<I>(values);
         if (slot)
            return std::move(*slot);
         if constexpr (field::policy == field_policy::required)
            abort_error(read_error::missing_required_arg, std::string(field::name));
         else if constexpr (std::is_default_constructible_v<type>)
            return type{};
         else
            abort_error(read_error::missing_default_arg, std::string(field::name));
      }

      typename storage_of<fields>::type values;
   };

   template <NamedArgs Args>
   builder<Args> make_builder()
   {
      return {};
   }
}  // namespace binread

// (c, params, name) for both `name` and `template(typename, ...) name`
#define BINREAD_TEMPLATE_I(STRUCT) BINREAD_TEMPLATE_II(BINREAD_MATCH_TEMPLATE##STRUCT, 0, STRUCT)
#define BINREAD_TEMPLATE_II(...) BINREAD_TEMPLATE_III(__VA_ARGS__)
#define BINREAD_TEMPLATE_III(params, n, ...) \
   BOOST_PP_IIF(n, BINREAD_TEMPLATE_TEMPLATE, BINREAD_TEMPLATE_NONTEMPLATE)(params, __VA_ARGS__)
#define BINREAD_MATCH_TEMPLATEtemplate(...) (__VA_ARGS__), 1, ~

#define BINREAD_TEMPLATE_NONTEMPLATE(blah, ...) (0, (), __VA_ARGS__)
#define BINREAD_TEMPLATE_TEMPLATE(params, n, z, args) (1, params, BINREAD_REMOVE_TEMPLATE##args)

#define BINREAD_REMOVE_TEMPLATEtemplate(...)

#define BINREAD_ARGS_TYPE(INFO) BINREAD_ARGS_TYPE_I INFO
#define BINREAD_ARGS_TYPE_I(c, params, name) \
   BOOST_PP_IIF(c, BINREAD_ARGS_TYPE_TEMPLATE, BINREAD_ARGS_TYPE_NONTEMPLATE)(params, name)
#define BINREAD_ARGS_TYPE_TEMPLATE(params, name) \
   name<BOOST_PP_ENUM_PARAMS(BOOST_PP_VARIADIC_SIZE params, T)>
#define BINREAD_ARGS_TYPE_NONTEMPLATE(params, name) name

#define BINREAD_TEMPLATE_DECL(INFO) BINREAD_TEMPLATE_DECL_I INFO
#define BINREAD_TEMPLATE_DECL_I(c, params, name) \
   BOOST_PP_IIF(c, BINREAD_TEMPLATE_DECL_TEMPLATE, BOOST_PP_TUPLE_EAT(1))(params)
#define BINREAD_TEMPLATE_DECL_TEMPLATE(params) \
   template <BOOST_PP_ENUM(BOOST_PP_VARIADIC_SIZE params, BINREAD_TPL_PARAM, params)>
#define BINREAD_TPL_PARAM(z, i, data) BOOST_PP_TUPLE_ELEM(i, data) T##i

// required(ident) / try_optional(ident)
#define BINREAD_FIELD_IDENT_required(ident) ident
#define BINREAD_FIELD_IDENT_try_optional(ident) ident
#define BINREAD_FIELD_POLICY_required(ident) required
#define BINREAD_FIELD_POLICY_try_optional(ident) try_optional

#define BINREAD_NAMED_FIELD(r, INFO, i, item)                                               \
   BOOST_PP_COMMA_IF(i)                                                                     \
   ::binread::named_field<BOOST_PP_STRINGIZE(BOOST_PP_CAT(BINREAD_FIELD_IDENT_, item)),     \
                          ::binread::field_policy::BOOST_PP_CAT(BINREAD_FIELD_POLICY_, item), \
                          &BINREAD_ARGS_TYPE(INFO)::BOOST_PP_CAT(BINREAD_FIELD_IDENT_, item)>

/**
 * Declares the named fields of an argument aggregate so that
 * binread::builder can assemble it. Fields must be listed in declaration
 * order, each as required(member) or try_optional(member).
 *
 *    struct element_args { std::uint32_t count; unit inner; };
 *    BINREAD_NAMED_ARGS(element_args, required(count), try_optional(inner))
 *
 *    template <typename Inner> struct vec_args { ... };
 *    BINREAD_NAMED_ARGS(template(typename) vec_args, required(count), try_optional(inner))
 *
 * Must appear in the namespace of the type.
 */
#define BINREAD_NAMED_ARGS(STRUCT, ...) BINREAD_NAMED_ARGS_I(BINREAD_TEMPLATE_I(STRUCT), __VA_ARGS__)
#define BINREAD_NAMED_ARGS_I(INFO, ...)                                                  \
   BINREAD_TEMPLATE_DECL(INFO)                                                           \
   auto binread_named_args_fields(BINREAD_ARGS_TYPE(INFO)*)                              \
       ->std::tuple<BOOST_PP_SEQ_FOR_EACH_I(BINREAD_NAMED_FIELD, INFO,                   \
                                            BOOST_PP_VARIADIC_TO_SEQ(__VA_ARGS__))>;
