/**
 * @file Lookup.cpp
 * @brief Recursive lookup/mutation engine
 *
 * resolve() consumes one segment per call and recurses into the rest of
 * the path, so recursion depth is bounded by the number of segments in
 * the expression and never by the shape of the data.
 */

#include "treepath/Lookup.hpp"
#include "treepath/Segment.hpp"
#include "treepath/Tokenizer.hpp"

#include <glog/logging.h>

#include <string>

namespace treepath {

namespace {

template <typename V>
using Result = BasicLookupResult<V>;

using Tail = std::optional<std::string>;

/**
 * @brief Per-call state shared by every recursion level
 */
struct Context {
    std::string_view full_path;   ///< Path as given by the caller (error messages)
    LookupMode mode;
    std::string missing_segment;  ///< Last segment that did not resolve
};

template <typename V>
Result<V> resolve(V& node, std::string_view path, Context& ctx);

template <typename V>
Result<V> absent(const std::string& segment, Context& ctx) {
    ctx.missing_segment = segment;
    return {};
}

/**
 * @brief `*` segment: filtering projection over elements or values
 */
template <typename V>
Result<V> resolve_wildcard(V& node, const Tail& tail, Context& ctx) {
    if (!is_container(node)) {
        return absent<V>(std::string(kWildcard), ctx);
    }

    Value projection = Value::array();
    for (auto& element : node) {
        if (!tail) {
            projection.push_back(element);
            continue;
        }
        auto sub = resolve(element, *tail, ctx);
        if (sub) {
            projection.push_back(*sub);
        }
    }
    return Result<V>::owned(std::move(projection));
}

/**
 * @brief `@index` segment
 */
template <typename V>
Result<V> resolve_element(V& node, const std::string& head, const Tail& tail, Context& ctx) {
    const auto [filter, cleaned] = extract_type_suffix(head);
    const long long index = resolve_index(cleaned);

    if (!node.is_array() || node.empty()) {
        if (filter) {
            throw TypeMismatchError(std::string(ctx.full_path), "array", type_name(node));
        }
        return absent<V>(head, ctx);
    }

    const auto pos = normalize_index(index, node.size());
    if (!pos) {
        return absent<V>(head, ctx);
    }

    V& value = node[*pos];
    if (filter && !matches_filter(value, *filter)) {
        throw TypeMismatchError(std::string(ctx.full_path), filter_name(*filter), type_name(value));
    }

    if (tail) {
        return resolve(value, *tail, ctx);
    }
    return Result<V>::alias(value);
}

/**
 * @brief Create the value for a missing filtered key
 *
 * The empty value of the filtered type is stored in the parent and the
 * walk continues inside it.
 */
Result<Value> create_key(Value& node, const std::string& key, TypeFilter filter,
                         const Tail& tail, Context& ctx) {
    Value& created = node[key] = make_empty(filter);
    VLOG(1) << "Created " << filter_name(filter) << " at key '" << key
            << "' of path '" << ctx.full_path << "'";
    if (tail) {
        return resolve(created, *tail, ctx);
    }
    return Result<Value>::alias(created);
}

/**
 * @brief Plain (possibly filtered, possibly escaped) key segment
 */
template <typename V>
Result<V> resolve_key(V& node, const std::string& head, const Tail& tail, Context& ctx) {
    const auto [filter, cleaned] = extract_type_suffix(head);
    const std::string key = unescape(cleaned);

    if (node.is_object()) {
        auto it = node.find(key);
        if (it != node.end()) {
            V& value = *it;
            if (filter && !matches_filter(value, *filter)) {
                if (ctx.mode == LookupMode::ReadOrCreate && is_container_filter(*filter)) {
                    throw StructuralConflictError(
                        std::string(ctx.full_path), head,
                        "Cannot create " + filter_name(*filter) + " over existing " +
                            type_name(value));
                }
                throw TypeMismatchError(std::string(ctx.full_path), filter_name(*filter),
                                        type_name(value));
            }
            if (tail) {
                return resolve(value, *tail, ctx);
            }
            return Result<V>::alias(value);
        }
    }

    if (!filter) {
        return absent<V>(head, ctx);
    }

    if (!node.is_object()) {
        throw StructuralConflictError(std::string(ctx.full_path), head,
                                      "Key requires an object parent, found " +
                                          type_name(node));
    }

    if constexpr (std::is_const_v<V>) {
        return absent<V>(head, ctx);
    } else {
        if (ctx.mode == LookupMode::Read) {
            return absent<V>(head, ctx);
        }
        return create_key(node, key, *filter, tail, ctx);
    }
}

template <typename V>
Result<V> resolve(V& node, std::string_view path, Context& ctx) {
    if (path.empty() || (path.size() == 1 && path.front() == kSeparator)) {
        return Result<V>::alias(node);
    }

    auto [head, tail] = split_head(path);
    VLOG(2) << "Segment '" << head << "' on " << type_name(node);

    if (head == kWildcard) {
        return resolve_wildcard(node, tail, ctx);
    }
    if (!head.empty() && head.front() == kIndexMarker) {
        return resolve_element(node, head, tail, ctx);
    }
    return resolve_key(node, head, tail, ctx);
}

template <typename V>
Result<V> require(Result<V> result, std::string_view path,
                  const std::optional<TypeFilter>& expected, const Context& ctx) {
    if (!result) {
        const std::string segment =
            ctx.missing_segment.empty() ? std::string(path) : ctx.missing_segment;
        throw NotFoundError(std::string(path), segment);
    }
    if (expected && !matches_filter(*result, *expected)) {
        throw TypeMismatchError(std::string(path), filter_name(*expected), type_name(*result));
    }
    return result;
}

} // anonymous namespace

LookupResult lookup(Value& data, std::string_view path, bool create) {
    Context ctx{path, create ? LookupMode::ReadOrCreate : LookupMode::Read, {}};
    return resolve(data, path, ctx);
}

ConstLookupResult lookup(const Value& data, std::string_view path) {
    Context ctx{path, LookupMode::Read, {}};
    return resolve(data, path, ctx);
}

LookupResult strict_lookup(Value& data, std::string_view path,
                           std::optional<TypeFilter> expected, bool create) {
    Context ctx{path, create ? LookupMode::ReadOrCreate : LookupMode::Read, {}};
    return require(resolve(data, path, ctx), path, expected, ctx);
}

ConstLookupResult strict_lookup(const Value& data, std::string_view path,
                                std::optional<TypeFilter> expected) {
    Context ctx{path, LookupMode::Read, {}};
    return require(resolve(data, path, ctx), path, expected, ctx);
}

bool contains(const Value& data, std::string_view path) {
    return lookup(data, path).exists();
}

} // namespace treepath
