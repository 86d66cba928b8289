/**
 * @file Validate.hpp
 * @brief Static syntax check of path expressions
 *
 * Validation needs no data tree. Each segment token must be `*`, an
 * index (`@first`, `@last`, `@N`, `@-N`) or a key. Keys, including any
 * type suffix they carry, are always accepted. Index tokens are not
 * stripped of suffixes, so "@1#" is rejected here even though lookup()
 * accepts it.
 */

#ifndef TREEPATH_VALIDATE_HPP
#define TREEPATH_VALIDATE_HPP

#include "Value.hpp"
#include <string_view>

namespace treepath {

/**
 * @brief Validate a path expression
 * @throws SyntaxError on the first malformed index segment
 */
void validate_path(std::string_view path);

/**
 * @brief Validate a path held in a JSON value
 * @throws SyntaxError if path is not a string or is malformed
 */
void validate_path_value(const Value& path);

/**
 * @brief Non-throwing form of validate_path()
 */
bool is_valid_path(std::string_view path);

} // namespace treepath

#endif // TREEPATH_VALIDATE_HPP
