/**
 * @file Accessor.hpp
 * @brief Public get/set/erase/has/search API over nested values
 *
 * Every operation exists for two kinds of root:
 * - any ValueView (callers' own tree types);
 * - deepcol::Value directly (wrapped in a JsonView internally).
 *
 * Paths convert implicitly from text (parsed with '.'), or can be built
 * with parse_path() for another delimiter, or with Path::from_segments().
 *
 * Behavior:
 * - get() without default throws KeyNotFound / IndexOutOfRange
 * - get() with default returns the default for absent members, but still
 *   throws TypeMismatch
 * - set() creates missing intermediates unless auto_create is false
 * - erase() throws for absent members unless strict is false
 * - has() is false for absent members and kind mismatches
 * - only search() accepts wildcard and slice steps
 */

#ifndef DEEPCOL_ACCESSOR_HPP
#define DEEPCOL_ACCESSOR_HPP

#include "deepcol/JsonView.hpp"
#include "deepcol/Traversal.hpp"

#include <cstddef>
#include <vector>

namespace deepcol {

/**
 * @brief Access policy shared by Document and the command-line tool
 */
struct AccessOptions {
    bool auto_create = true;               ///< set() materialises missing containers
    bool strict = true;                    ///< erase() throws for absent members
    std::size_t max_depth = kDefaultMaxDepth;
    char delimiter = '.';                  ///< used when parsing path text
};

// ============================================================================
// ValueView roots
// ============================================================================

/**
 * @brief Get the value at a path
 * @return View of the located value
 * @throws KeyNotFound, IndexOutOfRange, TypeMismatch, InvalidPathSyntax
 */
ViewPtr get(const ValueView& root, const Path& path);

/**
 * @brief Get a copy of the value at a path, or default_value if absent
 * @throws TypeMismatch, InvalidPathSyntax
 */
Value get(const ValueView& root, const Path& path, const Value& default_value);

/**
 * @brief Get the value at a path, or nullptr if absent
 * @throws TypeMismatch, InvalidPathSyntax
 */
ViewPtr get_if_present(const ValueView& root, const Path& path);

/**
 * @brief Set the value at a path; on error the root is unchanged
 * @throws TypeMismatch, PathNotCreatable, IndexOutOfRange, InvalidPathSyntax
 */
void set(ValueView& root, const Path& path, const Value& value, bool auto_create = true);

/**
 * @brief Delete the member at a path
 * @return true if something was deleted
 * @throws KeyNotFound, IndexOutOfRange (strict only), TypeMismatch, InvalidPathSyntax
 */
bool erase(ValueView& root, const Path& path, bool strict = true);

/**
 * @brief Check whether a path resolves
 * @throws InvalidPathSyntax
 */
bool has(const ValueView& root, const Path& path);

/**
 * @brief Lazily expand a pattern that may contain wildcards and slices
 */
SearchCursor search(const ValueView& root, const Path& pattern,
                    std::size_t max_depth = kDefaultMaxDepth);

/**
 * @brief Lazily find every location of a field anywhere in the tree
 * @see FieldSearch
 */
FieldSearch paths_to_field(const ValueView& root, const Path& field,
                           std::size_t max_depth = kDefaultMaxDepth);

/**
 * @brief Values located by paths_to_field(), in document order
 */
std::vector<Value> values_for_field(const ValueView& root, const Path& field,
                                    std::size_t max_depth = kDefaultMaxDepth);

/**
 * @brief values_for_field() without duplicates, keeping first occurrences
 */
std::vector<Value> deduped_values_for_field(const ValueView& root, const Path& field,
                                            std::size_t max_depth = kDefaultMaxDepth);

// ============================================================================
// deepcol::Value roots
// ============================================================================

/**
 * @brief Get the value at a path
 *
 * Examples:
 * ```cpp
 * Value doc = {{"db", {{"hosts", {"a", "b"}}}}};
 * get(doc, "db.hosts[-1]");           // "b"
 * get(doc, "db.port", 5432);          // 5432
 * get(doc, "db.hosts.x");             // throws TypeMismatch
 * ```
 *
 * @return Reference into root
 * @throws KeyNotFound, IndexOutOfRange, TypeMismatch, InvalidPathSyntax
 */
const Value& get(const Value& root, const Path& path);

/**
 * @brief Get a copy of the value at a path, or default_value if absent
 * @throws TypeMismatch, InvalidPathSyntax
 */
Value get(const Value& root, const Path& path, const Value& default_value);

/**
 * @brief Get a pointer into root, or nullptr if absent
 * @throws TypeMismatch, InvalidPathSyntax
 */
const Value* get_if_present(const Value& root, const Path& path);

void set(Value& root, const Path& path, const Value& value, bool auto_create = true);

bool erase(Value& root, const Path& path, bool strict = true);

bool has(const Value& root, const Path& path);

/**
 * @brief Search a Value; match views wrap nodes of root (see json_value())
 *
 * root must outlive the cursor.
 */
SearchCursor search(const Value& root, const Path& pattern,
                    std::size_t max_depth = kDefaultMaxDepth);
SearchCursor search(Value&& root, const Path& pattern,
                    std::size_t max_depth = kDefaultMaxDepth) = delete;

FieldSearch paths_to_field(const Value& root, const Path& field,
                           std::size_t max_depth = kDefaultMaxDepth);
FieldSearch paths_to_field(Value&& root, const Path& field,
                           std::size_t max_depth = kDefaultMaxDepth) = delete;

std::vector<Value> values_for_field(const Value& root, const Path& field,
                                    std::size_t max_depth = kDefaultMaxDepth);

std::vector<Value> deduped_values_for_field(const Value& root, const Path& field,
                                            std::size_t max_depth = kDefaultMaxDepth);

} // namespace deepcol

#endif // DEEPCOL_ACCESSOR_HPP
