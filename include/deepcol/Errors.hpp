/**
 * @file Errors.hpp
 * @brief Exception types for path access and document loading
 *
 * Path errors (all derive from PathError):
 * - InvalidPathSyntax: malformed path text, or a path shape the operation
 *   does not accept (wildcards outside search, deleting the root)
 * - MemberNotFound: a segment does not resolve
 *   - KeyNotFound: mapping has no such key
 *   - IndexOutOfRange: sequence index beyond its bounds
 * - TypeMismatch: step kind disagrees with the value kind
 * - PathNotCreatable: set() without auto-create hit a missing intermediate
 * - CyclicStructure: search re-entered an ancestor or exceeded max depth
 *
 * Document errors (all derive from DocumentError):
 * - FileNotFoundError, DocumentParseError, UnsupportedFormat
 */

#ifndef DEEPCOL_ERRORS_HPP
#define DEEPCOL_ERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>

namespace deepcol {

/**
 * @brief Base class for all path access errors
 */
class PathError : public std::runtime_error {
public:
    PathError(std::string path, const std::string& message)
        : std::runtime_error(message)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the full path text being accessed
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Path text violates the grammar or is not allowed for the operation
 */
class InvalidPathSyntax : public PathError {
public:
    /**
     * @brief Construct with path, offending offset and reason
     * @param path Full path text
     * @param position Character offset where parsing failed
     * @param reason Human-readable description
     */
    InvalidPathSyntax(std::string path, std::size_t position, std::string reason)
        : PathError(path, "Invalid path '" + path + "' at offset " +
                          std::to_string(position) + ": " + reason)
        , position_(position)
        , reason_(std::move(reason))
    {}

    std::size_t position() const noexcept {
        return position_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::size_t position_;
    std::string reason_;
};

/**
 * @brief A path segment does not resolve to a member
 *
 * Recoverable: get() with a default and erase() with strict=false
 * catch this family.
 */
class MemberNotFound : public PathError {
public:
    MemberNotFound(std::string path, std::string segment, const std::string& message)
        : PathError(std::move(path), message)
        , segment_(std::move(segment))
    {}

    /**
     * @brief Get the rendered segment that was not found (e.g. "host", "[3]")
     */
    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string segment_;
};

/**
 * @brief Key not found in a mapping
 */
class KeyNotFound : public MemberNotFound {
public:
    KeyNotFound(std::string path, std::string key)
        : MemberNotFound(path, key,
                         "Key not found: '" + key + "' in path '" + path + "'")
    {}
};

/**
 * @brief Index outside the bounds of a sequence
 */
class IndexOutOfRange : public MemberNotFound {
public:
    IndexOutOfRange(std::string path, std::int64_t index, std::size_t size)
        : MemberNotFound(path, "[" + std::to_string(index) + "]",
                         "Index " + std::to_string(index) +
                         " out of range for sequence of size " +
                         std::to_string(size) + " in path '" + path + "'")
        , index_(index)
        , size_(size)
    {}

    std::int64_t index() const noexcept {
        return index_;
    }

    std::size_t size() const noexcept {
        return size_;
    }

private:
    std::int64_t index_;
    std::size_t size_;
};

/**
 * @brief Step kind disagrees with the kind of the value it is applied to
 *
 * Raised when keying into a sequence or scalar, or indexing into a
 * mapping or scalar. Never suppressed by defaults.
 */
class TypeMismatch : public PathError {
public:
    /**
     * @brief Construct with path, expected kind, and actual kind
     * @param path Full path being accessed
     * @param expected Expected kind (e.g., "mapping")
     * @param actual Actual type encountered (e.g., "integer")
     */
    TypeMismatch(std::string path, std::string expected, std::string actual)
        : PathError(path, "Cannot traverse into " + actual +
                          " (expected " + expected + ") at path '" + path + "'")
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const std::string& expected() const noexcept {
        return expected_;
    }

    const std::string& actual() const noexcept {
        return actual_;
    }

private:
    std::string expected_;
    std::string actual_;
};

/**
 * @brief set() with auto-create disabled reached a missing intermediate
 */
class PathNotCreatable : public PathError {
public:
    PathNotCreatable(std::string path, std::string segment)
        : PathError(path, "Cannot create missing segment '" + segment +
                          "' in path '" + path + "' (auto-create disabled)")
        , segment_(std::move(segment))
    {}

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string segment_;
};

/**
 * @brief Search re-entered one of its own ancestors or went too deep
 */
class CyclicStructure : public PathError {
public:
    CyclicStructure(std::string path, std::size_t depth)
        : PathError(path, "Cyclic or too deeply nested structure at '" + path +
                          "' (depth " + std::to_string(depth) + ")")
        , depth_(depth)
    {}

    std::size_t depth() const noexcept {
        return depth_;
    }

private:
    std::size_t depth_;
};

/**
 * @brief Base class for document loading and writing errors
 */
class DocumentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Document file not found
 */
class FileNotFoundError : public DocumentError {
public:
    explicit FileNotFoundError(std::string path)
        : DocumentError("Document file not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Document file could not be parsed (JSON/TOML syntax)
 */
class DocumentParseError : public DocumentError {
public:
    /**
     * @brief Construct with file, source position and parser details
     * @param file Path of the file (or "<stdin>")
     * @param line 1-based line, 0 when unknown
     * @param column 1-based column, 0 when unknown
     * @param details Message from the underlying parser
     */
    DocumentParseError(std::string file, int line, int column, std::string details)
        : DocumentError(format_message(file, line, column, details))
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

    static std::string format_message(const std::string& file, int line, int column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) + ", column " + std::to_string(column);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief File extension is neither .json nor .toml
 */
class UnsupportedFormat : public DocumentError {
public:
    UnsupportedFormat(std::string path, std::string extension)
        : DocumentError("Unsupported document type '" + extension + "' for '" + path +
                        "' (expected .json or .toml)")
        , path_(std::move(path))
        , extension_(std::move(extension))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& extension() const noexcept {
        return extension_;
    }

private:
    std::string path_;
    std::string extension_;
};

} // namespace deepcol

#endif // DEEPCOL_ERRORS_HPP
