/**
 * @file Lookup.hpp
 * @brief Path lookup, strict lookup and auto-vivification
 *
 * Behavioral rules:
 * - RULE L1: lookup() never throws for plain absence; the result reports
 *            exists() == false instead
 * - RULE L2: type-filter mismatches and structural conflicts always throw,
 *            whether or not creation is enabled
 * - RULE L3: with create=true, a missing key carrying a `{}`, `[]` or `()`
 *            suffix is created in place as an empty container
 * - RULE L4: with create=true, a missing key carrying a `$`, `#` or `%`
 *            suffix is set to "", 0 or 0.0 and the result aliases it
 * - RULE L5: non-wildcard results alias the caller's tree; wildcard
 *            results are owned copies
 * - RULE L6: strict_lookup() throws NotFoundError for absence
 *
 * Example:
 * ```cpp
 * Value d = {{"data", {{"items", {1, 2, 3}}}}};
 * auto r = lookup(d, "data.items.@last");   // *r == 3, r.exists()
 * *r = 30;                                  // d["data"]["items"][2] == 30
 *
 * auto all = lookup(d, "data.items.*");     // owned [1, 2, 30]
 *
 * Value e = Value::object();
 * lookup(e, "a{}.b{}.c[]", true);           // e == {"a":{"b":{"c":[]}}}
 * ```
 */

#ifndef TREEPATH_LOOKUP_HPP
#define TREEPATH_LOOKUP_HPP

#include "Value.hpp"
#include "Errors.hpp"
#include <memory>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace treepath {

/**
 * @brief Engine mode
 */
enum class LookupMode {
    Read,         ///< Never modifies the tree
    ReadOrCreate  ///< Creates empty values at missing filtered keys
};

/**
 * @brief Outcome of a lookup
 *
 * Three states: absent, alias (points into the caller's tree) or owned
 * (wildcard projections). Move-only; the pointer
 * returned by get() stays valid as long as the result (for owned values)
 * or the source tree (for aliases) does.
 *
 * @tparam V Value or const Value
 */
template <typename V>
class BasicLookupResult {
public:
    /// Absent result
    BasicLookupResult() = default;

    /// The moved-from result becomes absent
    BasicLookupResult(BasicLookupResult&& other) noexcept
        : owned_(std::move(other.owned_))
        , value_(std::exchange(other.value_, nullptr)) {}

    BasicLookupResult& operator=(BasicLookupResult&& other) noexcept {
        if (this != &other) {
            owned_ = std::move(other.owned_);
            value_ = std::exchange(other.value_, nullptr);
        }
        return *this;
    }

    /// Result aliasing a value inside the tree
    static BasicLookupResult alias(V& ref) {
        BasicLookupResult r;
        r.value_ = &ref;
        return r;
    }

    /// Result owning a freshly built value
    static BasicLookupResult owned(Value val) {
        BasicLookupResult r;
        r.owned_ = std::make_unique<Value>(std::move(val));
        r.value_ = r.owned_.get();
        return r;
    }

    bool exists() const noexcept { return value_ != nullptr; }
    explicit operator bool() const noexcept { return exists(); }

    /// True if the value is not part of the caller's tree
    bool is_owned() const noexcept { return owned_ != nullptr; }

    /// Pointer to the value, nullptr if absent
    V* get() const noexcept { return value_; }

    V& operator*() const { return *value_; }
    V* operator->() const { return value_; }

    /// Copy of the value, or fallback if absent
    Value value_or(const Value& fallback) const {
        return value_ ? Value(*value_) : fallback;
    }

    /// Hand over the value (copied if aliased)
    Value take() {
        if (!value_) return Value();
        if (owned_) return std::move(*owned_);
        return *value_;
    }

private:
    std::unique_ptr<Value> owned_;
    V* value_ = nullptr;
};

using LookupResult = BasicLookupResult<Value>;
using ConstLookupResult = BasicLookupResult<const Value>;

/**
 * @brief Resolve a path in a tree
 *
 * @param data Tree to search (modified only when create is true)
 * @param path Path expression; "" and "." address the root
 * @param create Enable auto-vivification of filtered keys
 * @return Result aliasing the found value, owning a projection, or absent
 * @throws SyntaxError for malformed index references
 * @throws TypeMismatchError if a segment filter does not match
 * @throws StructuralConflictError if a filtered key addresses a
 *         non-object parent, or creation would replace an existing value
 */
LookupResult lookup(Value& data, std::string_view path, bool create = false);

/**
 * @brief Resolve a path in a read-only tree
 *
 * Same as lookup(Value&, path, false).
 */
ConstLookupResult lookup(const Value& data, std::string_view path);

/**
 * @brief Resolve a path, failing on absence
 *
 * @param data Tree to search
 * @param path Path expression
 * @param expected Required shape of the final value
 * @param create Enable auto-vivification of filtered keys
 * @return Result that always exists
 * @throws NotFoundError if the path does not resolve (including an
 *         out-of-range index)
 * @throws TypeMismatchError if expected is given and unmet, or a
 *         segment filter does not match
 */
LookupResult strict_lookup(Value& data, std::string_view path,
                           std::optional<TypeFilter> expected = std::nullopt,
                           bool create = false);

/**
 * @brief Read-only strict lookup
 */
ConstLookupResult strict_lookup(const Value& data, std::string_view path,
                                std::optional<TypeFilter> expected = std::nullopt);

/**
 * @brief Check whether a path resolves
 *
 * @throws TypeMismatchError / StructuralConflictError like lookup()
 */
bool contains(const Value& data, std::string_view path);

} // namespace treepath

#endif // TREEPATH_LOOKUP_HPP
