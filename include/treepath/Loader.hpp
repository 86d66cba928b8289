/**
 * @file Loader.hpp
 * @brief Reading data trees from files and streams
 *
 * Supported inputs:
 * - JSON documents (nlohmann::json)
 * - JSON lines: one JSON document per non-blank line
 * - TOML documents (toml++), converted to the JSON value model
 *
 * RULE F1: Missing files raise FileNotFoundError.
 * RULE F2: Syntax errors raise ParseError with line information when
 *          the parser provides it.
 * RULE F3: Format::Auto picks the format from the file extension:
 *          .json, .jsonl / .ndjson, .toml. Streams default to JSON.
 */

#ifndef TREEPATH_LOADER_HPP
#define TREEPATH_LOADER_HPP

#include "treepath/Value.hpp"
#include <iosfwd>
#include <string>
#include <vector>

namespace treepath {

/**
 * @brief Input document format
 */
enum class Format {
    Auto,
    Json,
    JsonLines,
    Toml
};

/**
 * @brief Parse a format name ("auto", "json", "jsonl", "toml")
 * @throws std::invalid_argument for unknown names
 */
Format parse_format(const std::string& name);

/**
 * @brief Get file extension (lowercase).
 *
 * @param path File path
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Resolve Format::Auto for a file path
 *
 * Unknown extensions resolve to Format::Json.
 */
Format detect_format(const std::string& path);

// ============================================================================
// JSON
// ============================================================================

/**
 * @brief Parse one JSON document
 * @param text JSON text
 * @param origin Name used in error messages
 * @throws ParseError if the text is not valid JSON
 */
Value parse_json(const std::string& text, const std::string& origin = "<string>");

/**
 * @brief Load a JSON file.
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Parse one JSON document per line
 *
 * Blank lines are skipped. A ParseError reports the 1-based line number
 * of the offending line.
 */
std::vector<Value> parse_json_lines(std::istream& in, const std::string& origin = "<stream>");

// ============================================================================
// TOML
// ============================================================================

/**
 * @brief Parse a TOML document into the JSON value model
 *
 * Tables become objects; dates and times become strings.
 *
 * @throws ParseError if TOML syntax is invalid
 */
Value parse_toml(const std::string& text, const std::string& origin = "<string>");

/**
 * @brief Load a TOML file.
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

// ============================================================================
// Any format
// ============================================================================

/**
 * @brief Read every document from a stream
 *
 * Json and Toml streams yield exactly one document; JsonLines yields one
 * per non-blank line. Auto is treated as Json.
 */
std::vector<Value> read_documents(std::istream& in, Format format,
                                  const std::string& origin = "<stdin>");

/**
 * @brief Load every document from a file
 * @throws FileNotFoundError if file doesn't exist
 */
std::vector<Value> load_documents(const std::string& path, Format format = Format::Auto);

/**
 * @brief Load a single-document file (JSON or TOML)
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws ParseError if the file does not hold exactly one document
 */
Value load_document_file(const std::string& path, Format format = Format::Auto);

} // namespace treepath

#endif // TREEPATH_LOADER_HPP
