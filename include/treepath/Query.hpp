/**
 * @file Query.hpp
 * @brief The load-lookup-print flow behind the treepath tool
 *
 * RULE Q1: Documents come from the input file when one is given, from
 *          the supplied stream otherwise.
 * RULE Q2: Path syntax is left to the engine; only validate_only runs
 *          the static validator.
 * RULE Q3: JSON-lines input (explicit or detected from the file
 *          extension) prints one compact result per line.
 * RULE Q4: Absent results print as null unless strict is set.
 */

#ifndef TREEPATH_QUERY_HPP
#define TREEPATH_QUERY_HPP

#include "treepath/Loader.hpp"
#include "treepath/Value.hpp"
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace treepath {

/**
 * @brief Settings collected from the command line
 */
struct QueryOptions {
    std::string path;
    std::optional<std::string> input;   // stream when unset
    Format format = Format::Auto;
    bool strict = false;
    bool validate_only = false;
    int indent = 2;
};

/**
 * @brief Look up path in one document
 *
 * @return The found value, or null if absent and not strict
 * @throws NotFoundError if strict and the path does not resolve
 */
Value apply_path(const Value& doc, std::string_view path, bool strict);

/**
 * @brief Format the input will be read with
 *
 * Format::Auto becomes the format detected from the input file name;
 * stream input stays Auto (read as JSON).
 */
Format resolve_input_format(const QueryOptions& opts);

/**
 * @brief Run a query and print one result per document
 *
 * @param opts Query settings
 * @param in Stream read when opts.input is unset
 * @param out Destination for results
 * @throws Error for load failures and engine errors
 */
void run_query(const QueryOptions& opts, std::istream& in, std::ostream& out);

} // namespace treepath

#endif // TREEPATH_QUERY_HPP
