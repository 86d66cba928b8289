/**
 * @file Tokenizer.hpp
 * @brief Escape-aware splitting of path expressions into segment tokens
 *
 * Paths look like "data.items.@last.name" or "v\.v.t". The escape
 * character protects the separator and the special characters of a
 * segment (`@`, `*`, type suffixes, the escape itself).
 *
 * Splitting is segment-local: an escaped separator collapses into a
 * literal separator inside the token, while any other escape pair is
 * kept verbatim so that type-suffix detection can still count escapes
 * before the token is unescaped.
 */

#ifndef TREEPATH_TOKENIZER_HPP
#define TREEPATH_TOKENIZER_HPP

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace treepath {

/// Default segment separator
constexpr char kSeparator = '.';

/// Default escape character
constexpr char kEscape = '\\';

/**
 * @brief Single-pass generator of segment tokens
 *
 * Not restartable: each call to next() consumes input. Once max_split
 * splits have happened, the rest of the input is returned as one final
 * token without being scanned, so escapes in it are left for the next
 * tokenizer to handle.
 *
 * The tokenizer views the input; the path must outlive it.
 *
 * Example:
 * ```cpp
 * PathTokenizer tok("a\\.b.c.d", '.', 1);
 * std::string t;
 * tok.next(t);  // "a.b"
 * tok.next(t);  // "c.d"
 * tok.next(t);  // returns false
 * ```
 */
class PathTokenizer {
public:
    /**
     * @param path Path expression to split
     * @param separator Segment separator
     * @param max_split Maximum number of splits; negative means unlimited
     * @param escape Escape character
     */
    explicit PathTokenizer(std::string_view path, char separator = kSeparator,
                           int max_split = -1, char escape = kEscape);

    /**
     * @brief Produce the next token
     * @param token Receives the token on success
     * @return false once the input is exhausted
     */
    bool next(std::string& token);

    /// True once every token has been produced
    bool done() const noexcept { return finished_; }

private:
    std::string_view input_;
    std::size_t pos_ = 0;
    char separator_;
    char escape_;
    int splits_left_;
    bool finished_ = false;
};

/**
 * @brief Split a path into all of its segment tokens
 *
 * Examples:
 * - "database.host" → ["database", "host"]
 * - "v\.v.t" → ["v.v", "t"]
 * - "a.\@b" → ["a", "\@b"]  (non-separator escapes kept)
 * - "" → [""]
 */
std::vector<std::string> split_path(std::string_view path, char separator = kSeparator,
                                    int max_split = -1);

/**
 * @brief Split off the first segment
 *
 * @return The first token and the unprocessed remainder. An empty
 *         remainder (e.g. "a.") is reported as no tail.
 */
std::pair<std::string, std::optional<std::string>> split_head(std::string_view path,
                                                              char separator = kSeparator);

/**
 * @brief Split off the last segment at the last unescaped separator
 *
 * Both parts are returned raw (still escaped).
 * - "a.b.c" → {"a.b", "c"}
 * - "a\.b" → {"", "a\.b"}
 *
 * @throws SyntaxError if the path is empty or just a separator
 */
std::pair<std::string, std::string> split_last(std::string_view path,
                                               char separator = kSeparator);

/**
 * @brief Resolve escape sequences one-for-one
 *
 * Every escape character takes the following character literally.
 * A trailing lone escape is dropped.
 */
std::string unescape(std::string_view token, char escape = kEscape);

/**
 * @brief Escape every special character of a literal key
 *
 * Inverse of unescape(): the separator, '@', '*', the escape character
 * and the type-suffix characters `$ # % { } [ ] ( )` are prefixed with
 * the escape character.
 */
std::string escape_key(std::string_view key, char separator = kSeparator);

/**
 * @brief Join (already escaped) segments with the separator
 *
 * Examples:
 * - ["a", "b", "c"] → "a.b.c"
 * - [] → ""
 */
std::string join_path(const std::vector<std::string>& segments, char separator = kSeparator);

} // namespace treepath

#endif // TREEPATH_TOKENIZER_HPP
