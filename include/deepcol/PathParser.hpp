/**
 * @file PathParser.hpp
 * @brief Parsing and formatting of path text
 *
 * Grammar (DELIM defaults to '.'):
 *
 *   path    := "" | first rest*
 *   first   := key | bracket
 *   rest    := DELIM key | bracket
 *   key     := "*"                  wildcard (whole segment, unescaped)
 *            | keychar+             literal key
 *   keychar := any char but DELIM [ ] \   |   "\" any char
 *   bracket := "[" int "]" | "[*]" | "[" int? ":" int? (":" int?)? "]"
 *            | '["' qchar* '"]'       quoted literal key, may be empty
 *   qchar   := any char but " \   |   "\" any char
 *   int     := ("+" | "-")? digit+
 *
 * Resolution of edge cases:
 * - Empty key segments are rejected: ".a", "a.", "a..b", "a.[0]";
 *   the empty key is written [""]
 * - ["*"] is the literal key "*", never a wildcard
 * - "a.0" is the key "0"; indices are always bracketed: "a[0]"
 * - "\." "\[" "\]" "\*" "\\" are literal characters inside keys
 * - A slice step of 0 is rejected
 */

#ifndef DEEPCOL_PATHPARSER_HPP
#define DEEPCOL_PATHPARSER_HPP

#include "deepcol/Path.hpp"
#include "deepcol/Errors.hpp"
#include <string>

namespace deepcol {

/**
 * @brief Parse path text into steps
 *
 * @param text Path text, e.g. "users[2].roles.*"
 * @param delimiter Key separator; must not be '[', ']', '\\' or '*'
 * @return Parsed path (empty for "")
 * @throws InvalidPathSyntax if the grammar is violated
 *
 * Examples:
 * - "a.b.c" → Key(a), Key(b), Key(c)
 * - "a[0]" → Key(a), Index(0)
 * - "a[-1]" → Key(a), Index(-1)
 * - "a.*.c" → Key(a), Wildcard, Key(c)
 * - "a[1:3]" → Key(a), Slice(1, 3, -)
 * - "a[x]" → throws InvalidPathSyntax
 */
Path parse_path(const std::string& text, char delimiter = '.');

/**
 * @brief Render a path as text that parses back to the same steps
 *
 * Examples:
 * - Key(a), Index(0), Key(x) → "a[0].x"
 * - Key("a.b") → "a\.b"
 * - Key("*") → "\*"
 * - Key(a), Key("") → "a[\"\"]"
 */
std::string format_path(const Path& path, char delimiter = '.');

/**
 * @brief Escape the characters of a key that are special in path text
 */
std::string escape_key(const std::string& key, char delimiter = '.');

} // namespace deepcol

#endif // DEEPCOL_PATHPARSER_HPP
