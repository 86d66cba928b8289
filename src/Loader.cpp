/**
 * @file Loader.cpp
 * @brief File and stream loading implementation
 *
 * RULE F1-F3: see Loader.hpp.
 */

#include "treepath/Loader.hpp"
#include "treepath/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <glog/logging.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <istream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace treepath {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

/**
 * @brief Convert string to lowercase.
 */
std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

/**
 * @brief True if the line holds only whitespace.
 */
bool is_blank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

/**
 * @brief Check if file exists.
 */
bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string read_stream(std::istream& in) {
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

template <typename Node>
std::string stream_to_string(const Node& node) {
    std::ostringstream ss;
    ss << node;
    return ss.str();
}

/**
 * @brief Convert toml++ value to nlohmann::json.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date:
            return Value(stream_to_string(node.as_date()->get()));

        case toml::node_type::time:
            return Value(stream_to_string(node.as_time()->get()));

        case toml::node_type::date_time:
            return Value(stream_to_string(node.as_date_time()->get()));

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

} // anonymous namespace

// ============================================================================
// Format selection
// ============================================================================

Format parse_format(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "auto") return Format::Auto;
    if (lower == "json") return Format::Json;
    if (lower == "jsonl" || lower == "ndjson" || lower == "lines") return Format::JsonLines;
    if (lower == "toml") return Format::Toml;
    throw std::invalid_argument("Unknown input format: " + name +
                                " (expected auto, json, jsonl or toml)");
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Format detect_format(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".toml") return Format::Toml;
    if (ext == ".jsonl" || ext == ".ndjson") return Format::JsonLines;
    return Format::Json;
}

// ============================================================================
// JSON
// ============================================================================

Value parse_json(const std::string& text, const std::string& origin) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ParseError(origin, 0, 0, e.what());
    }
}

Value load_json_file(const std::string& path) {
    return parse_json(read_file(path), path);
}

std::vector<Value> parse_json_lines(std::istream& in, const std::string& origin) {
    std::vector<Value> docs;
    std::string line;
    int line_no = 0;

    while (std::getline(in, line)) {
        ++line_no;
        if (is_blank(line)) {
            continue;
        }
        try {
            docs.push_back(nlohmann::json::parse(line));
        } catch (const nlohmann::json::parse_error& e) {
            throw ParseError(origin, line_no, 0, e.what());
        }
    }

    VLOG(1) << "Read " << docs.size() << " documents from " << origin;
    return docs;
}

// ============================================================================
// TOML
// ============================================================================

Value parse_toml(const std::string& text, const std::string& origin) {
    try {
        toml::table table = toml::parse(text, origin);
        return toml_value_to_json(table);
    } catch (const toml::parse_error& e) {
        throw ParseError(
            origin,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }
}

Value load_toml_file(const std::string& path) {
    return parse_toml(read_file(path), path);
}

// ============================================================================
// Any format
// ============================================================================

std::vector<Value> read_documents(std::istream& in, Format format, const std::string& origin) {
    switch (format) {
        case Format::JsonLines:
            return parse_json_lines(in, origin);
        case Format::Toml:
            return {parse_toml(read_stream(in), origin)};
        case Format::Auto:
        case Format::Json:
            break;
    }
    return {parse_json(read_stream(in), origin)};
}

std::vector<Value> load_documents(const std::string& path, Format format) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const Format resolved = format == Format::Auto ? detect_format(path) : format;
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }
    return read_documents(in, resolved, path);
}

Value load_document_file(const std::string& path, Format format) {
    auto docs = load_documents(path, format);
    if (docs.size() != 1) {
        throw ParseError(path, 0, 0,
                         "Expected one document, found " + std::to_string(docs.size()));
    }
    return std::move(docs.front());
}

} // namespace treepath
