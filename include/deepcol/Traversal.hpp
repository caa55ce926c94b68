/**
 * @file Traversal.hpp
 * @brief Traversal engine: deterministic resolution and search
 *
 * Deterministic operations (resolve, assign_path, erase_path) walk one
 * step at a time and reject Wildcard/Slice steps with InvalidPathSyntax.
 * At every step the node kind must fit the step: Key needs a mapping,
 * Index a sequence. A mismatch always throws TypeMismatch.
 *
 * Search operations (SearchCursor, FieldSearch) are lazy cursors over
 * (concrete path, value) matches. They never throw for absent members;
 * they throw CyclicStructure when a branch re-enters one of its own
 * ancestors or exceeds the depth limit.
 *
 * No operation keeps state between calls. Views handed in are borrowed.
 */

#ifndef DEEPCOL_TRAVERSAL_HPP
#define DEEPCOL_TRAVERSAL_HPP

#include "deepcol/ValueView.hpp"
#include "deepcol/Errors.hpp"

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace deepcol {

/// Depth at which search gives up with CyclicStructure
constexpr std::size_t kDefaultMaxDepth = 256;

/**
 * @brief Locate the value at a path
 * @return View of the located value (a clone of root for the empty path)
 * @throws KeyNotFound / IndexOutOfRange if a member is absent
 * @throws TypeMismatch if a step does not fit the node kind
 * @throws InvalidPathSyntax if the path contains Wildcard or Slice steps
 */
ViewPtr resolve(const ValueView& root, const Path& path);

/**
 * @brief Locate the value at a path, tolerating absence
 * @return View of the located value, or nullptr if any member is absent
 * @throws TypeMismatch if a step does not fit the node kind
 * @throws InvalidPathSyntax if the path contains Wildcard or Slice steps
 */
ViewPtr resolve_if_present(const ValueView& root, const Path& path);

/**
 * @brief Store a value at a path
 *
 * The whole path is validated against the tree before anything is
 * written, and the missing part is built detached and attached with a
 * single set_member() call. On any error the tree is unchanged.
 *
 * With auto_create, missing intermediates become empty mappings (next
 * step is a Key) or sequences (next step is an Index), and indices past
 * the end grow the sequence with null padding. Without it, a missing
 * intermediate throws PathNotCreatable and an index past the end throws
 * IndexOutOfRange. The final step may always add a key to an existing
 * mapping. Out-of-range negative indices always throw IndexOutOfRange,
 * as does an index that would pad a sequence with more than
 * kMaxSequencePadding nulls.
 *
 * The empty path replaces the root.
 *
 * @throws TypeMismatch, PathNotCreatable, IndexOutOfRange, InvalidPathSyntax
 */
void assign_path(ValueView& root, const Path& path, const Value& value, bool auto_create);

/**
 * @brief Remove the member at a path
 * @param strict If true, an absent member throws; otherwise it is a no-op
 * @return true if a member was removed
 * @throws KeyNotFound / IndexOutOfRange (strict only), TypeMismatch,
 *         InvalidPathSyntax (patterns, or the empty path)
 */
bool erase_path(ValueView& root, const Path& path, bool strict);

/**
 * @brief Sequence indices selected by a slice
 *
 * Negative bounds count from the end; out-of-range bounds are clamped, so
 * the result is empty rather than an error.
 */
std::vector<std::size_t> slice_indices(const SliceBounds& bounds, std::size_t size);

/**
 * @brief One search result: a concrete (pattern-free) path and its value
 */
struct Match {
    Path path;
    ViewPtr value;
};

/**
 * @brief Breadth-first, lazy expansion of a path pattern
 *
 * States are expanded in FIFO order, so results come out level by level
 * and, within a level, in member order. For a fixed-length pattern every
 * result sits at the same depth, so this is also document order.
 *
 * Key and Index steps select a single member, Wildcard every member,
 * Slice the selected sequence indices. Branches whose node kind does not
 * fit the step produce nothing. Index and Slice steps appear in the
 * result paths as normalised non-negative indices.
 *
 * Example:
 * ```cpp
 * Value doc = {{"a", {{{"x", 1}}, {{"x", 2}}}}};
 * JsonView view(doc);
 * SearchCursor cursor(view, "a.*.x");
 * while (auto m = cursor.next()) {
 *     // "a[0].x" → 1, then "a[1].x" → 2
 * }
 * ```
 *
 * The root must outlive the cursor and must not be mutated while the
 * cursor is in use.
 */
class SearchCursor {
public:
    SearchCursor(const ValueView& root, Path pattern,
                 std::size_t max_depth = kDefaultMaxDepth);

    /**
     * @brief Produce the next match, or std::nullopt when exhausted
     * @throws CyclicStructure
     */
    std::optional<Match> next();

    /**
     * @brief Drain the remaining matches
     */
    std::vector<Match> collect();

private:
    struct State {
        ViewPtr view;
        Path path;
        std::vector<const void*> ancestors;
    };

    Path pattern_;
    std::size_t max_depth_;
    std::deque<State> frontier_;

    void expand(const State& state);
    void push(const State& parent, Step step, ViewPtr child);
};

/**
 * @brief Depth-first, lazy search for a field anywhere in a tree
 *
 * Simple field (a single Key step):
 * - every mapping entry with that key matches, and the search still
 *   descends into its value;
 * - every scalar sequence element equal to the key string matches.
 *
 * Compound field (any other concrete path): at every container visited,
 * if the field resolves from there it matches as current path + field
 * and that branch is not searched further; otherwise the search descends
 * into every container member.
 *
 * Results come out in document order.
 *
 * @throws TypeMismatch (constructor) if the root is a scalar
 * @throws InvalidPathSyntax (constructor) if the field is empty or a pattern
 */
class FieldSearch {
public:
    FieldSearch(const ValueView& root, Path field,
                std::size_t max_depth = kDefaultMaxDepth);

    /**
     * @brief Produce the next match, or std::nullopt when exhausted
     * @throws CyclicStructure
     */
    std::optional<Match> next();

    std::vector<Match> collect();

private:
    struct Frame {
        ViewPtr view;
        Path path;
        std::vector<const void*> ancestors;
        std::unique_ptr<MemberCursor> members;
    };

    Path field_;
    bool simple_;
    std::size_t max_depth_;
    std::vector<Frame> stack_;
    std::deque<Match> pending_;

    void visit(Frame& frame);
    void step_into(Frame& frame, Member member);
};

} // namespace deepcol

#endif // DEEPCOL_TRAVERSAL_HPP
