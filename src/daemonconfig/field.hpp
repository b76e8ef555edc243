/**
 * @file field.hpp
 * @author Ruan Formigoni
 * @brief Field descriptors for configuration types
 *
 * Every configuration type provides a `fields(t)` overload that lists its members as
 * `(key, value, secret, omit_empty)` descriptors. Serialization and redaction are pure
 * functions over that list.
 *
 * @code
 * inline ns_field::Fields fields(MirrorConfig const& mirror)
 * {
 *   using namespace ns_field;
 *   return {
 *       make("host", mirror.host, omitempty)
 *     , make("failure_limit", mirror.failure_limit, omitempty)
 *   };
 * }
 * @endcode
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "../db/db.hpp"
#include "../std/concept.hpp"

namespace ns_daemonconfig::ns_field
{

struct Field;

using Fields = std::vector<Field>;

using Map = std::map<std::string,std::string>;

/**
 * @brief A struct member, always serialized
 */
struct Nested
{
  Fields fields;
};

/**
 * @brief An optional struct member, nullopt when unset
 */
struct Pointer
{
  std::optional<Fields> fields;
};

/**
 * @brief An ordered list of struct elements
 */
struct Sequence
{
  std::vector<Fields> elements;
};

using Data = std::variant<std::string, bool, int64_t, uint64_t, Map, Nested, Pointer, Sequence>;

struct Tags
{
  bool secret = false;
  bool omit_empty = false;
};

inline constexpr Tags omitempty{.secret = false, .omit_empty = true};
inline constexpr Tags secret{.secret = true, .omit_empty = true};

struct Field
{
  std::string key;
  Data data;
  Tags tags;
};

template<typename T>
concept Described = requires(T const& t)
{
  { fields(t) } -> std::same_as<Fields>;
};

/**
 * @brief Creates a descriptor from a member value
 *
 * Integers are widened, described structs become Nested, optional described structs
 * become Pointer and vectors of described structs become Sequence.
 *
 * @param key Serialization key
 * @param value Member value
 * @param tags Secret and omitempty flags
 * @return Field The descriptor
 */
template<typename T>
[[nodiscard]] Field make(std::string key, T const& value, Tags tags = {})
{
  if constexpr ( std::same_as<T,bool> )
  {
    return Field{std::move(key), value, tags};
  }
  else if constexpr ( std::signed_integral<T> )
  {
    return Field{std::move(key), static_cast<int64_t>(value), tags};
  }
  else if constexpr ( std::unsigned_integral<T> )
  {
    return Field{std::move(key), static_cast<uint64_t>(value), tags};
  }
  else if constexpr ( std::same_as<T,std::string> )
  {
    return Field{std::move(key), value, tags};
  }
  else if constexpr ( ns_concept::IsStringMap<T> )
  {
    return Field{std::move(key), Map(value), tags};
  }
  else if constexpr ( Described<T> )
  {
    return Field{std::move(key), Nested{fields(value)}, tags};
  }
  else if constexpr ( ns_concept::IsInstanceOf<T,std::optional> and Described<typename T::value_type> )
  {
    return Field{std::move(key)
      , Pointer{ value? std::optional<Fields>(fields(*value)) : std::nullopt }
      , tags
    };
  }
  else if constexpr ( ns_concept::IsVector<T> and Described<typename T::value_type> )
  {
    Sequence sequence;
    for(auto const& element : value)
    {
      sequence.elements.push_back(fields(element));
    }
    return Field{std::move(key), std::move(sequence), tags};
  }
  else
  {
    static_assert(std::is_same_v<T,T> == false, "Unsupported member type for make()");
  }
}

/**
 * @brief Checks whether a member holds the zero value of its type
 *
 * A struct is zero when all of its members are zero.
 */
[[nodiscard]] inline bool is_zero(Data const& data)
{
  return std::visit([]<typename T>(T const& value) -> bool
  {
    if constexpr ( std::same_as<T,bool> ) { return not value; }
    else if constexpr ( std::same_as<T,int64_t> or std::same_as<T,uint64_t> ) { return value == 0; }
    else if constexpr ( std::same_as<T,std::string> or std::same_as<T,Map> ) { return value.empty(); }
    else if constexpr ( std::same_as<T,Pointer> ) { return not value.fields.has_value(); }
    else if constexpr ( std::same_as<T,Sequence> ) { return value.elements.empty(); }
    else
    {
      return std::ranges::all_of(value.fields, [](Field const& field){ return is_zero(field.data); });
    }
  }, data);
}

namespace
{

ns_db::json_t to_json_impl(Fields const& fields);
ns_db::json_t redact_impl(Fields const& fields);

template<typename Fn>
ns_db::json_t scalar_to_json(Data const& data, Fn&& recurse)
{
  return std::visit([&]<typename T>(T const& value) -> ns_db::json_t
  {
    if constexpr ( std::same_as<T,Nested> )
    {
      return recurse(value.fields);
    }
    else if constexpr ( std::same_as<T,Pointer> )
    {
      return value.fields? recurse(*value.fields) : ns_db::json_t(nullptr);
    }
    else if constexpr ( std::same_as<T,Sequence> )
    {
      ns_db::json_t array = ns_db::json_t::array();
      for(Fields const& element : value.elements)
      {
        array.push_back(recurse(element));
      }
      return array;
    }
    else
    {
      return ns_db::json_t(value);
    }
  }, data);
}

inline ns_db::json_t to_json_impl(Fields const& fields)
{
  ns_db::json_t json = ns_db::json_t::object();
  for(Field const& field : fields)
  {
    // Struct members are always written, regardless of omitempty
    bool const is_struct = std::holds_alternative<Nested>(field.data);
    continue_if(field.tags.omit_empty and not is_struct and is_zero(field.data));
    json[field.key] = scalar_to_json(field.data, to_json_impl);
  }
  return json;
}

inline ns_db::json_t redact_impl(Fields const& fields)
{
  ns_db::json_t json = ns_db::json_t::object();
  for(Field const& field : fields)
  {
    continue_if(field.tags.secret);
    continue_if(std::holds_alternative<Pointer>(field.data)
      and not std::get<Pointer>(field.data).fields.has_value()
    );
    continue_if(field.tags.omit_empty and is_zero(field.data));
    json[field.key] = scalar_to_json(field.data, redact_impl);
  }
  return json;
}

} // anonymous namespace

/**
 * @brief Serializes every member, secrets included
 *
 * Follows the json conventions of the daemon: omitempty members with a zero value are
 * left out, struct members are always written and an unset optional struct without
 * omitempty is written as null.
 *
 * @param t The configuration object
 * @return ns_db::Db The json representation
 */
template<Described T>
[[nodiscard]] ns_db::Db to_json(T const& t)
{
  return ns_db::Db{to_json_impl(fields(t))};
}

/**
 * @brief Serializes a configuration object without its secrets
 *
 * Secret members are never written. Unset optional structs and omitempty members with a
 * zero value (including structs whose members are all zero) are left out, no null is ever
 * written for them. Nested structs and list elements are redacted recursively.
 *
 * @param t The configuration object
 * @return ns_db::Db The redacted json representation
 */
template<Described T>
[[nodiscard]] ns_db::Db redact(T const& t)
{
  return ns_db::Db{redact_impl(fields(t))};
}

} // namespace ns_daemonconfig::ns_field

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
