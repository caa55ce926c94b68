/**
 * @file ValueView.hpp
 * @brief Capability interface over nested values
 *
 * The traversal engine never touches a concrete container type. It sees
 * every node through a ValueView, which reports whether the node is a
 * mapping, a sequence or a scalar and exposes member access, mutation and
 * enumeration. JsonView (JsonView.hpp) adapts deepcol::Value; callers can
 * adapt their own tree types by implementing this interface.
 *
 * A view is a handle, like a pointer: it never owns the viewed node, and
 * the constness of the handle does not propagate to the node. Member
 * views inherit the writability of the view they came from.
 */

#ifndef DEEPCOL_VALUEVIEW_HPP
#define DEEPCOL_VALUEVIEW_HPP

#include "deepcol/Path.hpp"
#include "deepcol/Value.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

namespace deepcol {

class ValueView;

using ViewPtr = std::unique_ptr<ValueView>;

/// Most nulls a single write may add to grow a sequence
constexpr std::size_t kMaxSequencePadding = 4096;

/**
 * @brief One (step, value) pair produced by member enumeration
 */
struct Member {
    Step step;
    ViewPtr value;
};

/**
 * @brief Lazy, finite sequence of members of one node
 */
class MemberCursor {
public:
    virtual ~MemberCursor() = default;

    /**
     * @brief Produce the next member, or std::nullopt once exhausted
     */
    virtual std::optional<Member> next() = 0;
};

class ValueView {
public:
    virtual ~ValueView() = default;

    virtual Kind kind() const = 0;

    /**
     * @brief Number of members (0 for scalars)
     */
    virtual std::size_t size() const = 0;

    /**
     * @brief Concrete type name for diagnostics ("integer", "mapping", ...)
     */
    virtual std::string type_name() const = 0;

    /**
     * @brief Another handle to the same node
     */
    virtual ViewPtr clone() const = 0;

    /**
     * @brief Look up the member addressed by a Key or non-negative Index step
     * @return View of the member, or nullptr if absent or not addressable
     */
    virtual ViewPtr get_member(const Step& step) const = 0;

    /**
     * @brief Insert or replace a member
     *
     * For a mapping, Key steps insert or replace an entry. For a sequence,
     * an Index below size() replaces the element, and an Index at or past
     * the end grows the sequence, padding with nulls. Callers decide
     * whether growth is allowed before calling.
     *
     * @throws std::invalid_argument if the step does not fit this node
     * @throws std::length_error if growth would take more than
     *         kMaxSequencePadding nulls
     * @throws std::logic_error if the view is read-only
     */
    virtual void set_member(const Step& step, const Value& value) = 0;

    /**
     * @brief Remove a member; later sequence elements shift down
     * @return false if there was no such member
     * @throws std::logic_error if the view is read-only
     */
    virtual bool delete_member(const Step& step) = 0;

    /**
     * @brief Replace the viewed node as a whole
     * @throws std::logic_error if the view is read-only
     */
    virtual void assign(const Value& value) = 0;

    /**
     * @brief Enumerate members in live order
     *
     * Each call returns a fresh cursor starting at the first member.
     * Scalars yield nothing.
     */
    virtual std::unique_ptr<MemberCursor> iter_members() const = 0;

    /**
     * @brief Stable address of the viewed node, used to detect cycles
     */
    virtual const void* identity() const noexcept = 0;

    /**
     * @brief Copy the viewed node out as a deepcol::Value
     */
    virtual Value to_value() const = 0;
};

} // namespace deepcol

#endif // DEEPCOL_VALUEVIEW_HPP
