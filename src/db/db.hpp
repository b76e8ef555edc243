/**
 * @file db.hpp
 * @author Ruan Formigoni
 * @brief A database that interfaces with nlohmann json
 *
 * @copyright Copyright (c) 2025 Ruan Formigoni
 */

#pragma once

#include <algorithm>
#include <filesystem>
#include <optional>
#include <fstream>
#include <limits>
#include <map>
#include <nlohmann/json.hpp>
#include <variant>

#include "../std/expected.hpp"
#include "../std/concept.hpp"
#include "../macro.hpp"


namespace ns_db
{

class Db;

namespace
{

namespace fs = std::filesystem;

template<typename T>
concept IsString =
     std::convertible_to<std::decay_t<T>, std::string>
  or std::constructible_from<std::string, std::decay_t<T>>;

} // anonymous namespace

using json_t = nlohmann::json;
using KeyType = json_t::value_t;

/**
 * @brief Converts a json element to a C++ type
 *
 * Supported targets are strings, booleans, integers (range checked), vectors of strings
 * and string to string maps. A type mismatch is reported as an error, nlohmann's
 * implicit conversions are never used.
 *
 * @tparam V The target type
 * @param json The element to convert
 * @return Value<V> The converted value or the respective error
 */
template<typename V>
[[nodiscard]] Value<V> convert(json_t const& json) noexcept
{
  if constexpr ( std::same_as<V,bool> )
  {
    return_if(not json.is_boolean(), Error("D::Json element is not a boolean"));
    return json.get<bool>();
  }
  else if constexpr ( std::integral<V> )
  {
    return_if(not json.is_number_integer(), Error("D::Json element is not an integer"));
    if ( json.is_number_unsigned() )
    {
      uint64_t value = json.get<uint64_t>();
      return_if(value > static_cast<uint64_t>(std::numeric_limits<V>::max())
        , Error("D::Integer '{}' out of range", value)
      );
      return static_cast<V>(value);
    }
    int64_t value = json.get<int64_t>();
    return_if(std::cmp_less(value, std::numeric_limits<V>::min())
        or std::cmp_greater(value, std::numeric_limits<V>::max())
      , Error("D::Integer '{}' out of range", value)
    );
    return static_cast<V>(value);
  }
  else if constexpr ( ns_concept::IsVector<V> and ns_concept::Uniform<typename V::value_type, std::string>)
  {
    return_if(not json.is_array(), Error("D::Tried to create array with non-array entry"));
    return_if(std::any_of(json.begin(), json.end(), [](auto&& e){ return not e.is_string(); })
      , Error("D::Invalid key type for string array")
    );
    return std::ranges::subrange(json.begin(), json.end())
      | std::views::transform([](auto&& e){ return e.template get<std::string>(); })
      | std::ranges::to<V>();
  }
  else if constexpr ( ns_concept::IsStringMap<V> )
  {
    return_if(not json.is_object(), Error("D::Tried to create map with non-object entry"));
    V map;
    for(auto&& [key, value] : json.items())
    {
      return_if(not value.is_string(), Error("D::Value of key '{}' is not a string", key));
      map.emplace(key, value.template get<std::string>());
    }
    return map;
  }
  else if constexpr (ns_concept::StringConstructible<V>)
  {
    return ( json.is_string() )?
        Value<V>(json.get<std::string>())
      : Error("D::Json element is not a string");
  }
  else
  {
    static_assert(std::is_same_v<V, V> == false, "Unsupported type V for convert()");
  }
}

/**
 * @class Db
 * @brief A type-safe wrapper around nlohmann::json for database operations
 *
 * The Db class either owns its JSON data or wraps a reference to external JSON, enabling
 * nested access like db("config")("backend_config") on a single document. All fallible
 * operations return Value<T>.
 */
class Db
{
  private:
    std::variant<json_t, std::reference_wrapper<json_t>> m_json;
  public:
    // Constructors
    Db() noexcept;
    template<typename T> requires std::same_as<std::remove_cvref_t<T>, json_t>
    explicit Db(T&& json) noexcept;
    template<typename T> requires std::same_as<std::remove_cvref_t<T>, json_t>
    explicit Db(std::reference_wrapper<T> const& json) noexcept;
    // Element access
    [[nodiscard]] std::vector<std::string> keys() const noexcept;
    [[nodiscard]] std::vector<std::pair<std::string, Db>> items() const noexcept;
    template<typename V = Db>
    [[nodiscard]] Value<V> value() noexcept;
    template<typename V>
    [[nodiscard]] Value<V> value_or(std::string const& key, V fallback) const noexcept;
    [[nodiscard]] Value<Db> child(std::string const& key) const noexcept;
    [[nodiscard]] Value<std::vector<Db>> children(std::string const& key) const noexcept;
    [[nodiscard]] Value<std::string> dump(int indent = 2) const;
    // Capacity
    [[nodiscard]] bool empty() const noexcept;
    // Lookup
    template<IsString T>
    [[nodiscard]] bool contains(T&& t) const noexcept;
    [[nodiscard]] KeyType type() const noexcept;
    // Modifiers
    json_t& data();
    json_t const& data() const;
    // Operators
    template<typename T>
    Db& operator=(T&& t);
    [[nodiscard]] Db operator()(std::string const& t);
    // Friends
    friend std::ostream& operator<<(std::ostream& os, Db const& db);
};

/**
 * @brief Constructs a new Db object with an empty JSON object
 */
inline Db::Db() noexcept : m_json(json_t::object())
{
}

/**
 * @brief Constructs a Db that references an existing JSON object
 *
 * @param json Reference wrapper containing the nlohmann::json object to wrap
 */
template<typename T> requires std::same_as<std::remove_cvref_t<T>, json_t>
inline Db::Db(std::reference_wrapper<T> const& json) noexcept : m_json(json)
{
}

/**
 * @brief Constructs a Db that owns a JSON object (move or copy)
 *
 * @param json The nlohmann::json object to store in the database (forwarded)
 */
template<typename T> requires std::same_as<std::remove_cvref_t<T>, json_t>
inline Db::Db(T&& json) noexcept : m_json(std::forward<T>(json))
{
}

/**
 * @brief Retrieves a mutable reference to the underlying JSON data
 */
inline json_t& Db::data()
{
  if (std::holds_alternative<std::reference_wrapper<json_t>>(m_json))
  {
    return std::get<std::reference_wrapper<json_t>>(m_json).get();
  }

  return std::get<json_t>(m_json);
}

inline json_t const& Db::data() const
{
  return const_cast<Db*>(this)->data();
}

/**
 * @brief Retrieves all keys from the current JSON object or array
 *
 * @return std::vector<std::string> The keys, or an empty vector for non-structured json
 */
inline std::vector<std::string> Db::keys() const noexcept
{
  json_t const& json = data();
  return_if(not json.is_structured(), {}, "E::Invalid non-structured json access");
  return json.items()
    | std::views::transform([&](auto&& e) { return e.key(); })
    | std::ranges::to<std::vector<std::string>>();
}

/**
 * @brief Retrieves key-value pairs as Db objects from the current JSON
 *
 * Array elements are returned in order with their index as key.
 *
 * @return std::vector<std::pair<std::string,Db>> The pairs, or empty for non-structured json
 */
inline std::vector<std::pair<std::string,Db>> Db::items() const noexcept
{
  json_t const& json = data();
  return_if(not json.is_structured(), {}, "E::Invalid non-structured json access");
  return json.items()
    | std::views::transform([](auto&& e){ return std::make_pair(e.key(), Db{json_t(e.value())}); })
    | std::ranges::to<std::vector<std::pair<std::string,Db>>>();
}

/**
 * @brief Converts the current JSON entry to a specified type
 *
 * @tparam V The target type to convert to (default: Db)
 * @return Value<V> The converted object on success, or error on type mismatch
 */
template<typename V>
Value<V> Db::value() noexcept
{
  json_t& json = data();
  if constexpr ( std::same_as<V,Db> )
  {
    return Db{std::reference_wrapper<json_t>(json)};
  }
  else
  {
    return convert<V>(json);
  }
}

/**
 * @brief Reads an optional member of the current object
 *
 * A missing or null member yields the fallback, a member of the wrong type is an error.
 * Unlike operator(), the lookup never inserts the key.
 *
 * @tparam V The target type
 * @param key The member name
 * @param fallback The value to use when the member is absent
 * @return Value<V> The member value, the fallback, or the respective error
 */
template<typename V>
Value<V> Db::value_or(std::string const& key, V fallback) const noexcept
{
  json_t const& json = data();
  return_if(not json.is_object(), Error("D::Tried to read key '{}' from a non-object", key));
  auto it = json.find(key);
  return_if(it == json.end() or it->is_null(), fallback);
  return Pop(convert<V>(*it), "D::Invalid value for key '{}'", key);
}

/**
 * @brief Copies a nested object member into a new Db
 *
 * A missing or null member yields an empty object, a member that is not an object is an
 * error. Like value_or(), the lookup never inserts the key.
 *
 * @param key The member name
 * @return Value<Db> The owned copy of the member or the respective error
 */
inline Value<Db> Db::child(std::string const& key) const noexcept
{
  json_t const& json = data();
  return_if(not json.is_object(), Error("D::Tried to read key '{}' from a non-object", key));
  auto it = json.find(key);
  return_if(it == json.end() or it->is_null(), Db{});
  return_if(not it->is_object(), Error("D::Key '{}' is not an object", key));
  return Db{json_t(*it)};
}

/**
 * @brief Copies the objects of a nested array member into new Db objects
 *
 * A missing or null member yields an empty vector. Order is preserved.
 *
 * @param key The member name
 * @return Value<std::vector<Db>> The owned copies of the elements or the respective error
 */
inline Value<std::vector<Db>> Db::children(std::string const& key) const noexcept
{
  json_t const& json = data();
  return_if(not json.is_object(), Error("D::Tried to read key '{}' from a non-object", key));
  auto it = json.find(key);
  return_if(it == json.end() or it->is_null(), std::vector<Db>{});
  return_if(not it->is_array(), Error("D::Key '{}' is not an array", key));
  std::vector<Db> out;
  for(json_t const& element : *it)
  {
    return_if(not element.is_object(), Error("D::Element of '{}' is not an object", key));
    out.push_back(Db{json_t(element)});
  }
  return out;
}

/**
 * @brief Serializes the current JSON data to a string
 *
 * @param indent Indentation width, -1 for the compact representation
 * @return Value<std::string> The JSON string, or error on serialization failure
 */
inline Value<std::string> Db::dump(int indent) const
{
  return Try(data().dump(indent));
}

inline bool Db::empty() const noexcept
{
  return data().empty();
}

/**
 * @brief Checks if the JSON object contains a specific key
 */
template<IsString T>
bool Db::contains(T&& key) const noexcept
{
  json_t const& json = data();
  return json.is_object() && json.contains(key);
}

inline KeyType Db::type() const noexcept
{
  return data().type();
}

/**
 * @brief Assigns a new value to the underlying JSON data
 */
template<typename T>
Db& Db::operator=(T&& value)
{
  data() = std::forward<T>(value);
  return *this;
}

/**
 * @brief Accesses or creates a nested JSON entry by key
 *
 * If the current JSON is an object or empty, accesses (or creates) the key and returns a
 * Db referencing that nested element. Otherwise returns a copy of the current Db.
 *
 * @param key The key to access or create in the JSON object
 * @return Db A new Db with a reference to the nested element
 */
inline Db Db::operator()(std::string const& key)
{
  json_t& json = data();

  if(json.is_object() or json.empty())
  {
    return Db{std::reference_wrapper<json_t>(json[key])};
  }

  return *this;
}

inline std::ostream& operator<<(std::ostream& os, Db const& db)
{
  os << db.data();
  return os;
}

/**
 * @brief Deserializes a JSON file into a Db object
 *
 * @param path_file_db Path to the JSON file to read
 * @return Value<Db> The deserialized Db object on success, or error on file/parse failure
 */
[[nodiscard]] inline Value<Db> read_file(fs::path const& path_file_db)
{
  return_if(not Try(fs::exists(path_file_db)), Error("D::Invalid db file '{}'", path_file_db.string()));
  return_if(Try(fs::is_directory(path_file_db)), Error("D::Db file '{}' is a directory", path_file_db.string()));
  // Open target file as read
  std::ifstream file(path_file_db, std::ios::in);
  return_if(not file.is_open(), Error("D::Failed to open '{}'", path_file_db.string()));
  // Try to parse
  return Db(Try(json_t::parse(file), "D::Could not parse json file '{}'", path_file_db.string()));
}

/**
 * @brief Writes serialized json contents to a file
 *
 * When perms is set, the file is truncated and restricted before the contents are
 * written, so they are never readable with the previous or default permissions.
 *
 * @param path_file_db Path to the target JSON file
 * @param contents The serialized json
 * @param perms The permissions of the file, unchanged if empty
 * @return Value<void> Success indicator, or error on file failure
 */
[[nodiscard]] inline Value<void> write_file(fs::path const& path_file_db
  , std::string const& contents
  , std::optional<fs::perms> perms = std::nullopt)
{
  std::ofstream file(path_file_db, std::ios::out | std::ios::trunc);
  return_if(not file.is_open(), Error("D::Failed to open '{}' for writing", path_file_db.string()));
  if(perms)
  {
    std::error_code ec;
    fs::permissions(path_file_db, *perms, fs::perm_options::replace, ec);
    return_if(ec, Error("D::Failed to set permissions of '{}': {}", path_file_db.string(), ec.message()));
  }
  file << contents;
  file.close();
  return_if(file.fail(), Error("D::Failed to write '{}'", path_file_db.string()));
  return Value<void>{};
}

/**
 * @brief Serializes a Db object and writes it to a JSON file
 *
 * @param path_file_db Path to the target JSON file
 * @param db The database object to serialize and write
 * @param perms The permissions of the file, unchanged if empty
 * @return Value<void> Success indicator, or error on file/serialization failure
 */
[[nodiscard]] inline Value<void> write_file(fs::path const& path_file_db
  , Db const& db
  , std::optional<fs::perms> perms = std::nullopt)
{
  return write_file(path_file_db, Pop(db.dump()), perms);
}

/**
 * @brief Parses a JSON string and creates a Db object
 *
 * @param s The JSON string data to parse
 * @return Value<Db> The parsed database object on success, or error on parse failure
 */
template<ns_concept::StringRepresentable S>
Value<Db> from_string(S&& s)
{
  std::string data = ns_string::to_string(s);
  return_if(data.empty(), Error("D::Empty json data"));
  return Try(Db{json_t::parse(data)}, "D::Could not parse json data");
}

} // namespace ns_db

/* vim: set expandtab fdm=marker ts=2 sw=2 tw=100 et :*/
