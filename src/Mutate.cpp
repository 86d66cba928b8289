/**
 * @file Mutate.cpp
 * @brief Implementation of the direct mutation helpers
 */

#include "treepath/Mutate.hpp"
#include "treepath/Errors.hpp"
#include "treepath/Lookup.hpp"
#include "treepath/Segment.hpp"
#include "treepath/Tokenizer.hpp"

#include <glog/logging.h>

namespace treepath {

namespace {

/**
 * @brief Resolve the container to mutate
 *
 * The returned reference points into data.
 */
Value& resolve_parent(Value& data, std::string_view parent_path, TypeFilter expected) {
    auto parent = strict_lookup(data, parent_path, expected, true);
    if (parent.is_owned()) {
        throw StructuralConflictError(std::string(parent_path), std::string(parent_path),
                                      "Cannot mutate a projected value");
    }
    return *parent;
}

std::string index_spec_of(long long index) {
    return std::string(1, kIndexMarker) + std::to_string(index);
}

std::size_t element_position(const Value& array, std::string_view parent_path,
                             long long index) {
    const auto pos = normalize_index(index, array.size());
    if (!pos) {
        throw NotFoundError(std::string(parent_path),
                            index_spec_of(index) + " (index out of range)");
    }
    return *pos;
}

/**
 * @brief Classify the last segment of a full path
 */
Segment last_segment(std::string_view path, std::string& parent) {
    auto [parent_path, last] = split_last(path);
    Segment seg = classify_segment(last);
    if (seg.kind == Segment::Kind::Wildcard) {
        throw SyntaxError(std::string(path), "Cannot address a wildcard for mutation");
    }
    parent = std::move(parent_path);
    return seg;
}

} // anonymous namespace

void set_key(Value& data, std::string_view parent_path, const std::string& key, Value value) {
    Value& parent = resolve_parent(data, parent_path, TypeFilter::Mapping);
    parent[key] = std::move(value);
}

void update_key(Value& data, std::string_view parent_path, const std::string& key,
                const Updater& updater) {
    Value& parent = resolve_parent(data, parent_path, TypeFilter::Mapping);
    auto it = parent.find(key);
    const Value current = it != parent.end() ? *it : Value();
    parent[key] = updater(current);
}

void delete_key(Value& data, std::string_view parent_path, const std::string& key) {
    Value& parent = resolve_parent(data, parent_path, TypeFilter::Mapping);
    parent.erase(key);
}

void set_index(Value& data, std::string_view parent_path, long long index, Value value) {
    Value& parent = resolve_parent(data, parent_path, TypeFilter::Sequence);
    parent[element_position(parent, parent_path, index)] = std::move(value);
}

void set_index(Value& data, std::string_view parent_path, std::string_view index_spec,
               Value value) {
    set_index(data, parent_path, resolve_index(index_spec), std::move(value));
}

void update_index(Value& data, std::string_view parent_path, long long index,
                  const Updater& updater) {
    Value& parent = resolve_parent(data, parent_path, TypeFilter::Sequence);
    Value& element = parent[element_position(parent, parent_path, index)];
    element = updater(element);
}

void update_index(Value& data, std::string_view parent_path, std::string_view index_spec,
                  const Updater& updater) {
    update_index(data, parent_path, resolve_index(index_spec), updater);
}

void delete_index(Value& data, std::string_view parent_path, long long index) {
    Value& parent = resolve_parent(data, parent_path, TypeFilter::Sequence);
    parent.erase(element_position(parent, parent_path, index));
}

void delete_index(Value& data, std::string_view parent_path, std::string_view index_spec) {
    delete_index(data, parent_path, resolve_index(index_spec));
}

void set_path(Value& data, std::string_view path, Value value) {
    std::string parent;
    const Segment seg = last_segment(path, parent);

    if (seg.filter && !matches_filter(value, *seg.filter)) {
        throw TypeMismatchError(std::string(path), filter_name(*seg.filter), type_name(value));
    }

    VLOG(1) << "Assigning " << type_name(value) << " at '" << path << "'";
    if (seg.kind == Segment::Kind::Index) {
        set_index(data, parent, seg.index, std::move(value));
    } else {
        set_key(data, parent, seg.name, std::move(value));
    }
}

void delete_path(Value& data, std::string_view path) {
    std::string parent;
    const Segment seg = last_segment(path, parent);

    if (seg.kind == Segment::Kind::Index) {
        delete_index(data, parent, seg.index);
    } else {
        delete_key(data, parent, seg.name);
    }
}

} // namespace treepath
