/**
 * @file Loader.hpp
 * @brief Reading and writing JSON/TOML documents
 *
 * Produces the Value trees the access API operates on, and writes them
 * back:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * TOML tables become mappings, arrays become sequences, and dates/times
 * become their TOML text form. When writing TOML, nulls become empty
 * strings and a root that is not a mapping is wrapped under "value".
 */

#ifndef DEEPCOL_LOADER_HPP
#define DEEPCOL_LOADER_HPP

#include "deepcol/Value.hpp"

#include <iosfwd>
#include <string>

namespace deepcol {

// ============================================================================
// Reading
// ============================================================================

/**
 * @brief Load a document from a JSON file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a document from a JSON stream
 * @param source Name used in error messages
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_stream(std::istream& in, const std::string& source = "<stdin>");

/**
 * @brief Load a document from a TOML file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Load a document, detecting the format by extension
 *
 * ".json" and ".toml" are recognised, case-insensitively.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws UnsupportedFormat for any other extension
 * @throws DocumentParseError if the file has syntax errors
 */
Value load_document_file(const std::string& path);

/**
 * @brief Get file extension (lowercase)
 * @return Extension including the dot (e.g., ".json"), or empty if none
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Turn command-line text into a Value
 *
 * JSON if the text parses as JSON, otherwise the text itself as a string.
 *
 * Examples:
 * - "42" → 42
 * - "[1, 2]" → [1, 2]
 * - "\"quoted\"" → "quoted"
 * - "hello" → "hello"
 */
Value parse_literal(const std::string& text);

// ============================================================================
// Writing
// ============================================================================

/**
 * @brief Render a Value as a TOML document
 */
std::string to_toml_string(const Value& value);

/**
 * @brief Write a Value as JSON
 * @throws DocumentError if the file cannot be opened, or if a string is not
 *         valid UTF-8 (the file is then left untouched)
 */
void write_json_file(const std::string& path, const Value& value, int indent = 2);

/**
 * @brief Write a Value as TOML
 * @throws DocumentError if the file cannot be opened
 */
void write_toml_file(const std::string& path, const Value& value);

/**
 * @brief Write a Value, choosing the format by extension
 * @throws UnsupportedFormat for extensions other than .json and .toml
 * @throws DocumentError if the file cannot be opened
 */
void write_document_file(const std::string& path, const Value& value);

} // namespace deepcol

#endif // DEEPCOL_LOADER_HPP
