/**
 * @file Validate.cpp
 * @brief Implementation of path validation
 */

#include "treepath/Validate.hpp"
#include "treepath/Errors.hpp"
#include "treepath/Segment.hpp"
#include "treepath/Tokenizer.hpp"

#include <string>

namespace treepath {

void validate_path(std::string_view path) {
    PathTokenizer tokenizer(path);
    std::string token;
    while (tokenizer.next(token)) {
        if (token == kWildcard) {
            continue;
        }
        if (!token.empty() && token.front() == kIndexMarker) {
            try {
                resolve_index(token);
            } catch (const SyntaxError&) {
                throw SyntaxError(std::string(path),
                                  "Array index must be either integer or @first or @last");
            }
        }
    }
}

void validate_path_value(const Value& path) {
    if (!path.is_string()) {
        throw SyntaxError(path.dump(), "Path must be a string");
    }
    validate_path(std::string_view(path.get_ref<const std::string&>()));
}

bool is_valid_path(std::string_view path) {
    try {
        validate_path(path);
        return true;
    } catch (const SyntaxError&) {
        return false;
    }
}

} // namespace treepath
