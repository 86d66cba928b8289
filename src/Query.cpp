/**
 * @file Query.cpp
 * @brief Implementation of the query flow
 */

#include "treepath/Query.hpp"
#include "treepath/Lookup.hpp"
#include "treepath/Validate.hpp"

#include <glog/logging.h>

#include <istream>
#include <ostream>
#include <vector>

namespace treepath {

Value apply_path(const Value& doc, std::string_view path, bool strict) {
    if (strict) {
        return strict_lookup(doc, path).take();
    }
    return lookup(doc, path).value_or(nullptr);
}

Format resolve_input_format(const QueryOptions& opts) {
    if (opts.format == Format::Auto && opts.input) {
        return detect_format(*opts.input);
    }
    return opts.format;
}

void run_query(const QueryOptions& opts, std::istream& in, std::ostream& out) {
    if (opts.validate_only) {
        validate_path(std::string_view(opts.path));
        out << "valid\n";
        return;
    }

    const Format format = resolve_input_format(opts);
    const std::vector<Value> docs = opts.input ? load_documents(*opts.input, format)
                                               : read_documents(in, format, "<stdin>");
    VLOG(1) << "Applying '" << opts.path << "' to " << docs.size() << " document(s)";

    const bool lines = format == Format::JsonLines;
    for (const auto& doc : docs) {
        const Value found = apply_path(doc, opts.path, opts.strict);
        out << (lines ? found.dump() : found.dump(opts.indent)) << "\n";
    }
}

} // namespace treepath
