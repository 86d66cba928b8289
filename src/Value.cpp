/**
 * @file Value.cpp
 * @brief Type-filter helpers
 */

#include "treepath/Value.hpp"

namespace treepath {

std::string filter_name(TypeFilter filter) {
    switch (filter) {
        case TypeFilter::String: return "string";
        case TypeFilter::Integer: return "integer";
        case TypeFilter::Float: return "float";
        case TypeFilter::Mapping: return "object";
        case TypeFilter::Sequence: return "array";
        case TypeFilter::Tuple: return "tuple";
    }
    return "unknown";
}

std::string_view filter_suffix(TypeFilter filter) {
    switch (filter) {
        case TypeFilter::String: return "$";
        case TypeFilter::Integer: return "#";
        case TypeFilter::Float: return "%";
        case TypeFilter::Mapping: return "{}";
        case TypeFilter::Sequence: return "[]";
        case TypeFilter::Tuple: return "()";
    }
    return "";
}

std::optional<TypeFilter> filter_from_suffix(std::string_view suffix) {
    if (suffix == "$") return TypeFilter::String;
    if (suffix == "#") return TypeFilter::Integer;
    if (suffix == "%") return TypeFilter::Float;
    if (suffix == "{}") return TypeFilter::Mapping;
    if (suffix == "[]") return TypeFilter::Sequence;
    if (suffix == "()") return TypeFilter::Tuple;
    return std::nullopt;
}

bool is_container_filter(TypeFilter filter) noexcept {
    return filter == TypeFilter::Mapping || filter == TypeFilter::Sequence ||
           filter == TypeFilter::Tuple;
}

bool matches_filter(const Value& val, TypeFilter filter) noexcept {
    switch (filter) {
        case TypeFilter::String: return val.is_string();
        case TypeFilter::Integer: return val.is_number_integer();
        case TypeFilter::Float: return val.is_number_float();
        case TypeFilter::Mapping: return val.is_object();
        case TypeFilter::Sequence:
        case TypeFilter::Tuple: return val.is_array();
    }
    return false;
}

Value make_empty(TypeFilter filter) {
    switch (filter) {
        case TypeFilter::String: return Value(std::string());
        case TypeFilter::Integer: return Value(0);
        case TypeFilter::Float: return Value(0.0);
        case TypeFilter::Mapping: return Value::object();
        case TypeFilter::Sequence:
        case TypeFilter::Tuple: return Value::array();
    }
    return Value();
}

} // namespace treepath
