/**
 * @file Value.hpp
 * @brief Value type for tree data and type-filter helpers
 *
 * Uses nlohmann::json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])      -- the Sequence shape
 * - Object ({String: Value})  -- the Mapping shape
 *
 * Objects are backed by std::map, so iteration (and therefore wildcard
 * projection over a Mapping) runs in ascending key order.
 */

#ifndef TREEPATH_VALUE_HPP
#define TREEPATH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace treepath {

/**
 * @brief JSON-like value type addressed by path expressions
 *
 * Alias for nlohmann::json. See nlohmann::json documentation for the
 * complete API.
 */
using Value = nlohmann::json;

/**
 * @brief Runtime shape asserted (or created) by a segment type suffix
 *
 * | Suffix | Filter   |
 * |--------|----------|
 * | `$`    | String   |
 * | `#`    | Integer  |
 * | `%`    | Float    |
 * | `{}`   | Mapping  |
 * | `[]`   | Sequence |
 * | `()`   | Tuple    |
 *
 * JSON has no immutable sequence type; Tuple matches and creates arrays.
 */
enum class TypeFilter {
    String,
    Integer,
    Float,
    Mapping,
    Sequence,
    Tuple
};

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    switch (val.type()) {
        case Value::value_t::null: return "null";
        case Value::value_t::boolean: return "boolean";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return "integer";
        case Value::value_t::number_float: return "float";
        case Value::value_t::string: return "string";
        case Value::value_t::array: return "array";
        case Value::value_t::object: return "object";
        case Value::value_t::binary: return "binary";
        case Value::value_t::discarded: return "discarded";
    }
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 * @param val The value to check
 * @return true if val is array or object, false otherwise
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/// Name of a filter as used in error messages ("string", "object", ...)
std::string filter_name(TypeFilter filter);

/// Suffix text for a filter ("$", "{}", ...)
std::string_view filter_suffix(TypeFilter filter);

/// Look up the filter for a one- or two-character suffix
std::optional<TypeFilter> filter_from_suffix(std::string_view suffix);

/// True if the filter names a container shape (Mapping, Sequence, Tuple)
bool is_container_filter(TypeFilter filter) noexcept;

/**
 * @brief Check a value's runtime shape against a filter
 *
 * Booleans never satisfy Integer; unsigned integers do.
 */
bool matches_filter(const Value& val, TypeFilter filter) noexcept;

/**
 * @brief Fresh empty instance of the filtered shape
 *
 * "" for String, 0 for Integer, 0.0 for Float, {} for Mapping and
 * [] for Sequence and Tuple.
 */
Value make_empty(TypeFilter filter);

} // namespace treepath

#endif // TREEPATH_VALUE_HPP
