/**
 * @file Path.hpp
 * @brief Typed path steps and paths
 *
 * A Path is an ordered, possibly empty sequence of Steps. The empty path
 * denotes the root value. Steps are one of:
 * - Key: select a mapping entry by name
 * - Index: select a sequence element; negative indices count from the end
 * - Wildcard: every member at this level (search only)
 * - Slice: a run of sequence elements, start:stop:step (search only)
 *
 * Text form: "users[2].roles.*", "matrix[1:3][-1]". See PathParser.hpp for
 * the grammar.
 */

#ifndef DEEPCOL_PATH_HPP
#define DEEPCOL_PATH_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace deepcol {

enum class StepKind {
    Key,
    Index,
    Wildcard,
    Slice
};

/**
 * @brief Bounds of a slice step
 *
 * Absent start/stop cover the whole sequence in the step direction; an
 * absent step is 1.
 */
struct SliceBounds {
    std::optional<std::int64_t> start;
    std::optional<std::int64_t> stop;
    std::optional<std::int64_t> step;

    bool operator==(const SliceBounds& other) const {
        return start == other.start && stop == other.stop && step == other.step;
    }
    bool operator!=(const SliceBounds& other) const { return !(*this == other); }
};

/**
 * @brief One immutable unit of a path
 *
 * Built through the factory functions. Accessors for the wrong kind throw
 * std::bad_variant_access; check kind() first.
 */
class Step {
public:
    static Step of_key(std::string name);
    static Step of_index(std::int64_t index);
    static Step wildcard();
    static Step of_slice(std::optional<std::int64_t> start,
                         std::optional<std::int64_t> stop,
                         std::optional<std::int64_t> step = std::nullopt);

    StepKind kind() const noexcept {
        return static_cast<StepKind>(storage_.index());
    }

    bool is_key() const noexcept { return kind() == StepKind::Key; }
    bool is_index() const noexcept { return kind() == StepKind::Index; }

    /**
     * @brief True for Wildcard and Slice steps, which may match many members
     */
    bool is_pattern() const noexcept {
        return kind() == StepKind::Wildcard || kind() == StepKind::Slice;
    }

    const std::string& key() const { return std::get<std::string>(storage_); }
    std::int64_t index() const { return std::get<std::int64_t>(storage_); }
    const SliceBounds& slice() const { return std::get<SliceBounds>(storage_); }

    /**
     * @brief Render this step on its own: "host", "[3]", "*", "[1:4:2]"
     *
     * Keys are rendered raw (unescaped); use format_path() for text that
     * parses back.
     */
    std::string to_string() const;

    bool operator==(const Step& other) const { return storage_ == other.storage_; }
    bool operator!=(const Step& other) const { return !(*this == other); }

private:
    struct WildcardTag {
        bool operator==(const WildcardTag&) const { return true; }
    };

    // Alternative order matches StepKind
    using Storage = std::variant<std::string, std::int64_t, WildcardTag, SliceBounds>;

    explicit Step(Storage storage) : storage_(std::move(storage)) {}

    Storage storage_;
};

/**
 * @brief Raw pre-split segment: a literal key or an index
 */
using Segment = std::variant<std::string, std::int64_t>;

/**
 * @brief Ordered sequence of steps identifying a location in a nested value
 */
class Path {
public:
    using const_iterator = std::vector<Step>::const_iterator;

    Path() = default;

    // Implicit on purpose: accessors are mostly called with path text.
    Path(const char* text);
    Path(const std::string& text);

    explicit Path(std::vector<Step> steps) : steps_(std::move(steps)) {}

    /**
     * @brief Build a path from pre-split keys and indices, bypassing text parsing
     *
     * Every string is a literal key, including "*", "" and keys that
     * contain the delimiter.
     *
     * Example:
     * ```cpp
     * Path p = Path::from_segments({"servers", 0, "a.b"});
     * // Key("servers"), Index(0), Key("a.b")
     * ```
     */
    static Path from_segments(const std::vector<Segment>& segments);

    const std::vector<Step>& steps() const noexcept { return steps_; }
    bool empty() const noexcept { return steps_.empty(); }
    std::size_t size() const noexcept { return steps_.size(); }
    const Step& operator[](std::size_t i) const { return steps_[i]; }
    const Step& back() const { return steps_.back(); }
    const_iterator begin() const noexcept { return steps_.begin(); }
    const_iterator end() const noexcept { return steps_.end(); }

    /**
     * @brief True if any step is a Wildcard or Slice
     */
    bool has_pattern() const noexcept;

    /**
     * @brief Copy of this path with one more step appended
     */
    Path child(Step step) const;

    /**
     * @brief Copy of this path followed by all steps of another
     */
    Path concat(const Path& tail) const;

    /**
     * @brief Copy of the first `count` steps
     */
    Path prefix(std::size_t count) const;

    /**
     * @brief Canonical text form with '.' delimiters (format_path)
     */
    std::string to_string() const;

    bool operator==(const Path& other) const { return steps_ == other.steps_; }
    bool operator!=(const Path& other) const { return !(*this == other); }

private:
    std::vector<Step> steps_;
};

} // namespace deepcol

#endif // DEEPCOL_PATH_HPP
