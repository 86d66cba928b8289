/**
 * @file Mutate.hpp
 * @brief Direct assignment, update and removal at a resolved parent
 *
 * Every helper resolves the parent path with strict_lookup() in creation
 * mode, requiring an object (key helpers) or an array (index helpers),
 * then mutates that parent in place.
 *
 * - Keys are literal: no escape processing is applied to `key`.
 * - Index specs use the path syntax ("@first", "@last", "@2", "@-1").
 * - Index helpers throw NotFoundError for an out-of-range index.
 * - A parent that resolves to a wildcard projection is rejected with
 *   StructuralConflictError, since changes to it would be lost.
 *
 * Example:
 * ```cpp
 * Value d = Value::object();
 * set_key(d, "server{}", "port", 8080);      // {"server": {"port": 8080}}
 * update_key(d, "server", "port",
 *            [](const Value& v) { return v.get<int>() + 1; });
 * set_path(d, "server.limits{}.max", 10);     // {"server": {"limits": {"max": 10}, "port": 8081}}
 * ```
 */

#ifndef TREEPATH_MUTATE_HPP
#define TREEPATH_MUTATE_HPP

#include "Value.hpp"
#include <functional>
#include <string>
#include <string_view>

namespace treepath {

/// Callback computing a new value from the current one
using Updater = std::function<Value(const Value&)>;

/**
 * @brief Assign parent[key] = value
 * @throws NotFoundError if the parent path does not resolve
 * @throws TypeMismatchError if the parent is not an object
 */
void set_key(Value& data, std::string_view parent_path, const std::string& key, Value value);

/**
 * @brief Replace parent[key] with updater(parent[key])
 *
 * The updater receives null when the key is absent.
 */
void update_key(Value& data, std::string_view parent_path, const std::string& key,
                const Updater& updater);

/**
 * @brief Remove parent[key]; absent keys are ignored
 */
void delete_key(Value& data, std::string_view parent_path, const std::string& key);

/**
 * @brief Assign parent[index] = value
 * @param index_spec Index token such as "@last" or "@-2"
 * @throws SyntaxError for malformed index specs
 * @throws NotFoundError if the index is out of range
 * @throws TypeMismatchError if the parent is not an array
 */
void set_index(Value& data, std::string_view parent_path, std::string_view index_spec,
               Value value);
void set_index(Value& data, std::string_view parent_path, long long index, Value value);

/**
 * @brief Replace parent[index] with updater(parent[index])
 */
void update_index(Value& data, std::string_view parent_path, std::string_view index_spec,
                  const Updater& updater);
void update_index(Value& data, std::string_view parent_path, long long index,
                  const Updater& updater);

/**
 * @brief Remove parent[index], shifting later elements down
 */
void delete_index(Value& data, std::string_view parent_path, std::string_view index_spec);
void delete_index(Value& data, std::string_view parent_path, long long index);

/**
 * @brief Assign at a full path
 *
 * The path is split at its last unescaped separator. A last segment
 * starting with '@' dispatches to set_index(), anything else to
 * set_key() with the unescaped segment as key. A type suffix on the
 * last segment is checked against the assigned value.
 *
 * @throws SyntaxError if the path is empty or ends in a wildcard
 * @throws TypeMismatchError if the value does not match the suffix
 */
void set_path(Value& data, std::string_view path, Value value);

/**
 * @brief Remove the value at a full path
 *
 * Dispatches like set_path() to delete_index() or delete_key().
 */
void delete_path(Value& data, std::string_view path);

} // namespace treepath

#endif // TREEPATH_MUTATE_HPP
