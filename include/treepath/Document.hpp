/**
 * @file Document.hpp
 * @brief Subscript-style wrapper around a data tree
 *
 * Document owns a Value and exposes path access with a single error
 * category: every treepath::Error raised by the engine is re-thrown as
 * PathIndexError by operator[], and get() turns that category into a
 * fallback value.
 *
 * Example:
 * ```cpp
 * Document doc(Value{{"db", {{"hosts", {"a", "b"}}}}});
 * doc["db.hosts.@last"];            // "b"
 * doc.get("db.port", 5432);         // 5432
 * doc["db.port"];                   // throws PathIndexError
 * doc.set("db.port", 5433);
 * ```
 */

#ifndef TREEPATH_DOCUMENT_HPP
#define TREEPATH_DOCUMENT_HPP

#include "treepath/Value.hpp"
#include "treepath/Loader.hpp"
#include <string>
#include <string_view>

namespace treepath {

class Document {
public:
    Document() = default;
    explicit Document(Value data) : data_(std::move(data)) {}

    /// Load a single-document JSON or TOML file
    static Document from_file(const std::string& path, Format format = Format::Auto);

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }
    Value& data() noexcept { return data_; }

    /**
     * @brief Copy of the value at path
     * @throws PathIndexError if the path is absent or any engine error occurs
     */
    Value operator[](std::string_view path) const;

    /**
     * @brief Copy of the value at path, or fallback on PathIndexError
     */
    Value get(std::string_view path, const Value& fallback = nullptr) const;

    /**
     * @brief True if the path resolves
     * @throws PathIndexError for malformed paths and type conflicts
     */
    bool contains(std::string_view path) const;

    /**
     * @brief Assign at a full path (see set_path())
     * @throws PathIndexError on any engine error
     */
    void set(std::string_view path, Value value);

    /**
     * @brief Remove the value at a full path (see delete_path())
     * @throws PathIndexError on any engine error
     */
    void erase(std::string_view path);

private:
    Value data_ = Value::object();
};

} // namespace treepath

#endif // TREEPATH_DOCUMENT_HPP
