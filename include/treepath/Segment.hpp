/**
 * @file Segment.hpp
 * @brief Classification of single path segments
 *
 * A segment token is one of:
 * - `*`                    wildcard over every element/value
 * - `@index[suffix]`       element of a sequence; index is `first`,
 *                          `last`, `N` or `-N`
 * - `key[suffix]`          mapping key, escapes resolved
 *
 * Suffixes: `$` string, `#` integer, `%` float, `{}` mapping,
 * `[]` sequence, `()` tuple.
 */

#ifndef TREEPATH_SEGMENT_HPP
#define TREEPATH_SEGMENT_HPP

#include "Value.hpp"
#include "Tokenizer.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace treepath {

/// Wildcard segment token
constexpr std::string_view kWildcard = "*";

/// Prefix of index segments
constexpr char kIndexMarker = '@';

/**
 * @brief Detect and strip a trailing type suffix
 *
 * The two-character suffix is tried first, then the one-character one.
 * A suffix counts only if the run of escape characters right before it
 * has even length; an escaped suffix leaves the token untouched so that
 * unescape() restores the literal characters later.
 *
 * Examples:
 * - "a{}" → {Mapping, "a"}
 * - "a\\{}" → {nullopt, "a\\{}"}
 * - "a\\\\$" → {String, "a\\\\"}
 * - "$" → {nullopt, "$"}  (tokens shorter than two chars carry no suffix)
 *
 * @return Detected filter (if any) and the token without its suffix
 */
std::pair<std::optional<TypeFilter>, std::string> extract_type_suffix(std::string_view token,
                                                                      char escape = kEscape);

/**
 * @brief Translate an index token into a signed offset
 *
 * "@first" → 0, "@last" → -1, "@3" → 3, "@-2" → -2.
 *
 * @param token Index token with any type suffix already removed
 * @throws SyntaxError if the token does not start with '@' or the
 *         reference is not one of the forms above
 */
long long resolve_index(std::string_view token);

/**
 * @brief Map a signed offset onto a container of the given size
 *
 * Negative offsets count from the end.
 *
 * @return Position inside the container, or nullopt if out of range
 */
std::optional<std::size_t> normalize_index(long long index, std::size_t size) noexcept;

/**
 * @brief One classified path segment
 */
struct Segment {
    enum class Kind {
        Key,
        Wildcard,
        Index
    };

    Kind kind = Kind::Key;
    std::string name;                  ///< Unescaped key name (Key only)
    long long index = 0;               ///< Resolved offset (Index only)
    std::optional<TypeFilter> filter;  ///< Type suffix, if any
};

/**
 * @brief Classify a raw segment token
 * @throws SyntaxError for malformed index references
 */
Segment classify_segment(std::string_view token);

} // namespace treepath

#endif // TREEPATH_SEGMENT_HPP
