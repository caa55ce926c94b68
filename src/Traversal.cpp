/**
 * @file Traversal.cpp
 * @brief Implementation of the traversal engine
 */

#include "deepcol/Traversal.hpp"
#include "deepcol/PathParser.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace deepcol {

namespace {

    /**
     * @brief Reject Wildcard/Slice steps for single-path operations
     */
    void require_concrete(const Path& path, const char* operation) {
        for (std::size_t i = 0; i < path.size(); ++i) {
            if (path[i].is_pattern()) {
                throw InvalidPathSyntax(
                    format_path(path),
                    format_path(path.prefix(i)).size(),
                    std::string(operation) + " does not accept wildcard or slice steps"
                );
            }
        }
    }

    /**
     * @brief Throw TypeMismatch unless the node kind fits the step
     */
    void check_kind(const ValueView& node, const Step& step, const Path& path) {
        const Kind wanted = step.is_key() ? Kind::Mapping : Kind::Sequence;
        if (node.kind() != wanted) {
            throw TypeMismatch(format_path(path), kind_name(wanted), node.type_name());
        }
    }

    /**
     * @brief Map a possibly negative index onto [0, size)
     */
    std::optional<std::size_t> normalize_index(std::int64_t index, std::size_t size) {
        if (index < 0) {
            index += static_cast<std::int64_t>(size);
        }
        if (index < 0 || static_cast<std::size_t>(index) >= size) {
            return std::nullopt;
        }
        return static_cast<std::size_t>(index);
    }

    ViewPtr find_member(const ValueView& node, const Step& step) {
        if (step.is_key()) {
            return node.get_member(step);
        }
        const auto idx = normalize_index(step.index(), node.size());
        if (!idx) return nullptr;
        return node.get_member(Step::of_index(static_cast<std::int64_t>(*idx)));
    }

    [[noreturn]] void throw_missing(const ValueView& node, const Step& step, const Path& path) {
        if (step.is_key()) {
            throw KeyNotFound(format_path(path), step.key());
        }
        throw IndexOutOfRange(format_path(path), step.index(), node.size());
    }

    /**
     * @brief Walk the first `count` steps of a concrete path
     * @return Located view, or nullptr at the first absent member unless strict
     */
    ViewPtr walk(const ValueView& root, const Path& path, std::size_t count, bool strict) {
        ViewPtr current = root.clone();
        for (std::size_t i = 0; i < count; ++i) {
            const Step& step = path[i];
            check_kind(*current, step, path);
            ViewPtr next = find_member(*current, step);
            if (!next) {
                if (strict) throw_missing(*current, step, path);
                return nullptr;
            }
            current = std::move(next);
        }
        return current;
    }

    /**
     * @brief Probe a concrete path without throwing for absence or kind mismatch
     */
    ViewPtr probe(const ValueView& root, const Path& path) {
        ViewPtr current = root.clone();
        for (const Step& step : path) {
            const Kind wanted = step.is_key() ? Kind::Mapping : Kind::Sequence;
            if (current->kind() != wanted) return nullptr;
            ViewPtr next = find_member(*current, step);
            if (!next) return nullptr;
            current = std::move(next);
        }
        return current;
    }

    /**
     * @brief Build the detached subtree for steps [from, end) holding `leaf`
     *
     * Index steps become sequences padded with nulls up to the index,
     * at most kMaxSequencePadding of them.
     */
    Value build_tail(const Path& path, std::size_t from, const Value& leaf) {
        Value node = leaf;
        for (std::size_t i = path.size(); i-- > from;) {
            const Step& step = path[i];
            if (step.is_key()) {
                Value mapping = Value::object();
                mapping[step.key()] = std::move(node);
                node = std::move(mapping);
            } else {
                if (step.index() < 0) {
                    // A freshly created sequence is empty
                    throw IndexOutOfRange(format_path(path), step.index(), 0);
                }
                if (static_cast<std::size_t>(step.index()) > kMaxSequencePadding) {
                    throw IndexOutOfRange(format_path(path), step.index(), 0);
                }
                Value sequence = Value::array();
                for (std::int64_t pad = 0; pad < step.index(); ++pad) {
                    sequence.push_back(Value());
                }
                sequence.push_back(std::move(node));
                node = std::move(sequence);
            }
        }
        return node;
    }

    /**
     * @brief Throw CyclicStructure if `node` re-enters an ancestor or is too deep
     */
    void guard_cycles(const ValueView& node, const Path& path,
                      const std::vector<const void*>& ancestors, std::size_t max_depth) {
        if (path.size() > max_depth) {
            spdlog::debug("search: depth limit {} exceeded at '{}'", max_depth, format_path(path));
            throw CyclicStructure(format_path(path), path.size());
        }
        if (node.kind() == Kind::Scalar) return;
        if (std::find(ancestors.begin(), ancestors.end(), node.identity()) != ancestors.end()) {
            spdlog::debug("search: '{}' re-enters one of its ancestors", format_path(path));
            throw CyclicStructure(format_path(path), path.size());
        }
    }

    std::int64_t clamp_bound(std::int64_t bound, std::int64_t size,
                             std::int64_t lo, std::int64_t hi) {
        if (bound < 0) bound += size;
        return std::clamp(bound, lo, hi);
    }

} // anonymous namespace

// ============================================================================
// Deterministic resolution
// ============================================================================

ViewPtr resolve(const ValueView& root, const Path& path) {
    require_concrete(path, "get");
    return walk(root, path, path.size(), true);
}

ViewPtr resolve_if_present(const ValueView& root, const Path& path) {
    require_concrete(path, "get");
    return walk(root, path, path.size(), false);
}

void assign_path(ValueView& root, const Path& path, const Value& value, bool auto_create) {
    require_concrete(path, "set");

    if (path.empty()) {
        root.assign(value);
        return;
    }

    // Descend through members that already exist; nothing is written yet.
    ViewPtr parent = root.clone();
    std::size_t depth = 0;
    for (; depth + 1 < path.size(); ++depth) {
        check_kind(*parent, path[depth], path);
        ViewPtr next = find_member(*parent, path[depth]);
        if (!next) break;
        parent = std::move(next);
    }

    const Step& step = path[depth];
    check_kind(*parent, step, path);

    const bool missing_tail = depth + 1 < path.size();
    if (missing_tail && !auto_create) {
        throw PathNotCreatable(format_path(path), step.to_string());
    }

    Step target = step;
    if (step.is_index()) {
        const std::size_t size = parent->size();
        if (step.index() < 0) {
            const auto idx = normalize_index(step.index(), size);
            if (!idx) {
                throw IndexOutOfRange(format_path(path), step.index(), size);
            }
            target = Step::of_index(static_cast<std::int64_t>(*idx));
        } else if (static_cast<std::size_t>(step.index()) >= size) {
            const std::size_t padding = static_cast<std::size_t>(step.index()) - size;
            if (!auto_create || padding > kMaxSequencePadding) {
                throw IndexOutOfRange(format_path(path), step.index(), size);
            }
        }
    }

    if (missing_tail) {
        const Value tail = build_tail(path, depth + 1, value);
        spdlog::debug("set '{}': creating {} missing segment(s) from '{}'",
                      format_path(path), path.size() - depth, step.to_string());
        parent->set_member(target, tail);
    } else {
        parent->set_member(target, value);
    }
}

bool erase_path(ValueView& root, const Path& path, bool strict) {
    require_concrete(path, "delete");
    if (path.empty()) {
        throw InvalidPathSyntax(format_path(path), 0, "cannot delete the root value");
    }

    ViewPtr parent = walk(root, path, path.size() - 1, strict);
    if (!parent) {
        spdlog::debug("delete '{}': parent absent, nothing to delete", format_path(path));
        return false;
    }

    const Step& step = path.back();
    check_kind(*parent, step, path);

    Step target = step;
    if (step.is_index()) {
        const auto idx = normalize_index(step.index(), parent->size());
        if (!idx) {
            if (strict) throw_missing(*parent, step, path);
            spdlog::debug("delete '{}': index absent, nothing to delete", format_path(path));
            return false;
        }
        target = Step::of_index(static_cast<std::int64_t>(*idx));
    }

    if (!parent->delete_member(target)) {
        if (strict) throw_missing(*parent, step, path);
        spdlog::debug("delete '{}': key absent, nothing to delete", format_path(path));
        return false;
    }
    return true;
}

std::vector<std::size_t> slice_indices(const SliceBounds& bounds, std::size_t size) {
    const auto n = static_cast<std::int64_t>(size);
    const std::int64_t step = bounds.step.value_or(1);
    std::vector<std::size_t> out;

    if (step > 0) {
        const std::int64_t start = bounds.start ? clamp_bound(*bounds.start, n, 0, n) : 0;
        const std::int64_t stop = bounds.stop ? clamp_bound(*bounds.stop, n, 0, n) : n;
        for (std::int64_t i = start; i < stop;) {
            out.push_back(static_cast<std::size_t>(i));
            if (stop - i <= step) break;
            i += step;
        }
    } else if (step < 0) {
        const std::int64_t start = bounds.start ? clamp_bound(*bounds.start, n, -1, n - 1) : n - 1;
        const std::int64_t stop = bounds.stop ? clamp_bound(*bounds.stop, n, -1, n - 1) : -1;
        for (std::int64_t i = start; i > stop;) {
            out.push_back(static_cast<std::size_t>(i));
            if (stop - i >= step) break;
            i += step;
        }
    }
    return out;
}

// ============================================================================
// SearchCursor
// ============================================================================

SearchCursor::SearchCursor(const ValueView& root, Path pattern, std::size_t max_depth)
    : pattern_(std::move(pattern))
    , max_depth_(max_depth)
{
    frontier_.push_back(State{root.clone(), Path(), {}});
}

std::optional<Match> SearchCursor::next() {
    while (!frontier_.empty()) {
        State state = std::move(frontier_.front());
        frontier_.pop_front();

        if (state.path.size() == pattern_.size()) {
            return Match{std::move(state.path), std::move(state.view)};
        }
        expand(state);
    }
    return std::nullopt;
}

std::vector<Match> SearchCursor::collect() {
    std::vector<Match> matches;
    while (auto match = next()) {
        matches.push_back(std::move(*match));
    }
    return matches;
}

void SearchCursor::expand(const State& state) {
    const Step& step = pattern_[state.path.size()];
    const ValueView& node = *state.view;

    switch (step.kind()) {
        case StepKind::Key: {
            if (node.kind() != Kind::Mapping) return;
            if (auto child = node.get_member(step)) {
                push(state, step, std::move(child));
            }
            return;
        }
        case StepKind::Index: {
            if (node.kind() != Kind::Sequence) return;
            const auto idx = normalize_index(step.index(), node.size());
            if (!idx) return;
            Step concrete = Step::of_index(static_cast<std::int64_t>(*idx));
            if (auto child = node.get_member(concrete)) {
                push(state, std::move(concrete), std::move(child));
            }
            return;
        }
        case StepKind::Wildcard: {
            if (node.kind() == Kind::Scalar) return;
            auto members = node.iter_members();
            while (auto member = members->next()) {
                push(state, std::move(member->step), std::move(member->value));
            }
            return;
        }
        case StepKind::Slice: {
            if (node.kind() != Kind::Sequence) return;
            for (std::size_t i : slice_indices(step.slice(), node.size())) {
                Step concrete = Step::of_index(static_cast<std::int64_t>(i));
                if (auto child = node.get_member(concrete)) {
                    push(state, std::move(concrete), std::move(child));
                }
            }
            return;
        }
    }
}

void SearchCursor::push(const State& parent, Step step, ViewPtr child) {
    State state;
    state.path = parent.path.child(std::move(step));
    state.ancestors = parent.ancestors;
    state.ancestors.push_back(parent.view->identity());
    guard_cycles(*child, state.path, state.ancestors, max_depth_);
    state.view = std::move(child);
    frontier_.push_back(std::move(state));
}

// ============================================================================
// FieldSearch
// ============================================================================

FieldSearch::FieldSearch(const ValueView& root, Path field, std::size_t max_depth)
    : field_(std::move(field))
    , simple_(field_.size() == 1 && field_[0].is_key())
    , max_depth_(max_depth)
{
    if (field_.empty()) {
        throw InvalidPathSyntax("", 0, "field search needs a non-empty field");
    }
    require_concrete(field_, "field search");
    if (root.kind() == Kind::Scalar) {
        throw TypeMismatch("", "mapping or sequence", root.type_name());
    }
    stack_.push_back(Frame{root.clone(), Path(), {}, nullptr});
}

std::optional<Match> FieldSearch::next() {
    for (;;) {
        if (!pending_.empty()) {
            Match match = std::move(pending_.front());
            pending_.pop_front();
            return std::optional<Match>(std::move(match));
        }
        if (stack_.empty()) {
            return std::nullopt;
        }

        Frame& top = stack_.back();
        if (!top.members) {
            visit(top);
            continue;
        }

        auto member = top.members->next();
        if (!member) {
            stack_.pop_back();
            continue;
        }
        step_into(top, std::move(*member));
    }
}

std::vector<Match> FieldSearch::collect() {
    std::vector<Match> matches;
    while (auto match = next()) {
        matches.push_back(std::move(*match));
    }
    return matches;
}

void FieldSearch::visit(Frame& frame) {
    if (!simple_) {
        if (ViewPtr hit = probe(*frame.view, field_)) {
            pending_.push_back(Match{frame.path.concat(field_), std::move(hit)});
            stack_.pop_back();
            return;
        }
    }
    frame.members = frame.view->iter_members();
}

void FieldSearch::step_into(Frame& frame, Member member) {
    Path path = frame.path.child(member.step);

    if (simple_) {
        const std::string& name = field_[0].key();
        const bool key_hit = member.step.is_key() && member.step.key() == name;
        const bool element_hit = member.step.is_index() &&
                                 member.value->kind() == Kind::Scalar &&
                                 member.value->to_value() == Value(name);
        if (key_hit || element_hit) {
            pending_.push_back(Match{path, member.value->clone()});
        }
    }

    if (member.value->kind() == Kind::Scalar) {
        return;
    }

    std::vector<const void*> ancestors = frame.ancestors;
    ancestors.push_back(frame.view->identity());
    guard_cycles(*member.value, path, ancestors, max_depth_);

    // May reallocate stack_; `frame` is not used past this point.
    stack_.push_back(Frame{std::move(member.value), std::move(path), std::move(ancestors), nullptr});
}

} // namespace deepcol
