/**
 * @file Document.cpp
 * @brief Document wrapper implementation
 */

#include "treepath/Document.hpp"
#include "treepath/Errors.hpp"
#include "treepath/Lookup.hpp"
#include "treepath/Mutate.hpp"

namespace treepath {

Document Document::from_file(const std::string& path, Format format) {
    return Document(load_document_file(path, format));
}

Value Document::operator[](std::string_view path) const {
    try {
        return strict_lookup(data_, path).take();
    } catch (const Error& e) {
        throw PathIndexError(std::string(path), e.what());
    }
}

Value Document::get(std::string_view path, const Value& fallback) const {
    try {
        return (*this)[path];
    } catch (const PathIndexError&) {
        return fallback;
    }
}

bool Document::contains(std::string_view path) const {
    try {
        return treepath::contains(data_, path);
    } catch (const Error& e) {
        throw PathIndexError(std::string(path), e.what());
    }
}

void Document::set(std::string_view path, Value value) {
    try {
        set_path(data_, path, std::move(value));
    } catch (const Error& e) {
        throw PathIndexError(std::string(path), e.what());
    }
}

void Document::erase(std::string_view path) {
    try {
        delete_path(data_, path);
    } catch (const Error& e) {
        throw PathIndexError(std::string(path), e.what());
    }
}

} // namespace treepath
