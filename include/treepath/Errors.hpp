/**
 * @file Errors.hpp
 * @brief Exception types for treepath
 *
 * Error taxonomy:
 * - Error: Base class
 * - SyntaxError: Malformed path or index reference
 * - NotFoundError: Strict lookup over an absent key or index
 * - TypeMismatchError: Type filter does not match the resolved value
 * - StructuralConflictError: Filtered key addresses an incompatible parent
 * - PathIndexError: Uniform category raised by the Document wrapper
 * - FileNotFoundError / ParseError: Loader failures
 *
 * Plain absence is never reported through these types by lookup();
 * it is carried by LookupResult instead.
 */

#ifndef TREEPATH_ERRORS_HPP
#define TREEPATH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace treepath {

/**
 * @brief Base class for all treepath exceptions
 */
class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Malformed path expression
 *
 * Raised for unknown index references, indexes not starting with '@',
 * empty paths where a segment is required and non-string paths given
 * to the validator.
 */
class SyntaxError : public Error {
public:
    /**
     * @brief Construct with the offending path and a description
     * @param path Path expression (or the offending token)
     * @param message What is wrong with it
     */
    SyntaxError(std::string path, std::string message)
        : Error(message + ": '" + path + "'")
        , path_(std::move(path))
        , message_(std::move(message))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& message() const noexcept {
        return message_;
    }

private:
    std::string path_;
    std::string message_;
};

/**
 * @brief Path does not resolve to a value
 *
 * Raised by strict lookups and by index-based mutation helpers when the
 * index is out of range.
 */
class NotFoundError : public Error {
public:
    /**
     * @brief Construct with full path and failing segment
     * @param path Full path expression being accessed
     * @param segment Segment that did not resolve (may equal path)
     */
    NotFoundError(std::string path, std::string segment)
        : Error("Path does not exist: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    /**
     * @brief Get the full path that was being accessed
     */
    const std::string& path() const noexcept {
        return path_;
    }

    /**
     * @brief Get the segment that was not found
     */
    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Type filter does not match the runtime shape of a value
 */
class TypeMismatchError : public Error {
public:
    /**
     * @brief Construct with path, expected type, and actual type
     * @param path Full path expression being accessed
     * @param expected Expected type (e.g., "object")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeMismatchError(std::string path, std::string expected, std::string actual)
        : Error("Expected " + expected + " but found " + actual +
                " at path '" + path + "'")
        , path_(std::move(path))
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string path_;
    std::string expected_;
    std::string actual_;
};

/**
 * @brief Filtered key addresses a parent of the wrong shape
 *
 * Examples: forcing object creation under an array parent, asking to
 * create an array where a scalar already lives, or mutating through a
 * wildcard projection.
 */
class StructuralConflictError : public Error {
public:
    /**
     * @brief Construct with path, segment and description
     * @param path Full path expression being accessed
     * @param segment Segment at which the conflict was detected
     * @param message Description of the conflict
     */
    StructuralConflictError(std::string path, std::string segment, std::string message)
        : Error(message + " at segment '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Uniform error raised by Document subscript access
 *
 * Wraps any other treepath::Error; reason() carries the original message.
 */
class PathIndexError : public Error {
public:
    PathIndexError(std::string path, std::string reason)
        : Error("Cannot access '" + path + "': " + reason)
        , path_(std::move(path))
        , reason_(std::move(reason))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string path_;
    std::string reason_;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public Error {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : Error("Input file not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Input document parse error (JSON/TOML syntax)
 */
class ParseError : public Error {
public:
    /**
     * @brief Construct with origin, position and error details
     * @param file File path or stream name ("<stdin>")
     * @param line 1-based line number, 0 if unknown
     * @param column 1-based column, 0 if unknown
     * @param details Detailed error message from parser
     */
    ParseError(std::string file, int line, int column, std::string details)
        : Error(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) msg += ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

} // namespace treepath

#endif // TREEPATH_ERRORS_HPP
