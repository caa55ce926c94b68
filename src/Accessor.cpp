/**
 * @file Accessor.cpp
 * @brief Public access API implementation
 */

#include "deepcol/Accessor.hpp"

#include <algorithm>
#include <utility>

namespace deepcol {

// ============================================================================
// ValueView roots
// ============================================================================

ViewPtr get(const ValueView& root, const Path& path) {
    return resolve(root, path);
}

Value get(const ValueView& root, const Path& path, const Value& default_value) {
    ViewPtr found = resolve_if_present(root, path);
    if (!found) {
        return default_value;
    }
    return found->to_value();
}

ViewPtr get_if_present(const ValueView& root, const Path& path) {
    return resolve_if_present(root, path);
}

void set(ValueView& root, const Path& path, const Value& value, bool auto_create) {
    assign_path(root, path, value, auto_create);
}

bool erase(ValueView& root, const Path& path, bool strict) {
    return erase_path(root, path, strict);
}

bool has(const ValueView& root, const Path& path) {
    try {
        return resolve(root, path) != nullptr;
    } catch (const MemberNotFound&) {
        return false;
    } catch (const TypeMismatch&) {
        return false;
    }
}

SearchCursor search(const ValueView& root, const Path& pattern, std::size_t max_depth) {
    return SearchCursor(root, pattern, max_depth);
}

FieldSearch paths_to_field(const ValueView& root, const Path& field, std::size_t max_depth) {
    return FieldSearch(root, field, max_depth);
}

std::vector<Value> values_for_field(const ValueView& root, const Path& field,
                                    std::size_t max_depth) {
    std::vector<Value> values;
    FieldSearch cursor(root, field, max_depth);
    while (auto match = cursor.next()) {
        values.push_back(match->value->to_value());
    }
    return values;
}

std::vector<Value> deduped_values_for_field(const ValueView& root, const Path& field,
                                            std::size_t max_depth) {
    std::vector<Value> unique;
    for (auto& value : values_for_field(root, field, max_depth)) {
        // Values need not be hashable or ordered; compare pairwise.
        if (std::find(unique.begin(), unique.end(), value) == unique.end()) {
            unique.push_back(std::move(value));
        }
    }
    return unique;
}

// ============================================================================
// deepcol::Value roots
// ============================================================================

const Value& get(const Value& root, const Path& path) {
    JsonView view(root);
    ViewPtr found = resolve(view, path);
    return json_value(*found);
}

Value get(const Value& root, const Path& path, const Value& default_value) {
    const Value* found = get_if_present(root, path);
    return found != nullptr ? *found : default_value;
}

const Value* get_if_present(const Value& root, const Path& path) {
    JsonView view(root);
    ViewPtr found = resolve_if_present(view, path);
    if (!found) {
        return nullptr;
    }
    return &json_value(*found);
}

void set(Value& root, const Path& path, const Value& value, bool auto_create) {
    JsonView view(root);
    assign_path(view, path, value, auto_create);
}

bool erase(Value& root, const Path& path, bool strict) {
    JsonView view(root);
    return erase_path(view, path, strict);
}

bool has(const Value& root, const Path& path) {
    JsonView view(root);
    return has(static_cast<const ValueView&>(view), path);
}

SearchCursor search(const Value& root, const Path& pattern, std::size_t max_depth) {
    JsonView view(root);
    return SearchCursor(view, pattern, max_depth);
}

FieldSearch paths_to_field(const Value& root, const Path& field, std::size_t max_depth) {
    JsonView view(root);
    return FieldSearch(view, field, max_depth);
}

std::vector<Value> values_for_field(const Value& root, const Path& field,
                                    std::size_t max_depth) {
    JsonView view(root);
    return values_for_field(static_cast<const ValueView&>(view), field, max_depth);
}

std::vector<Value> deduped_values_for_field(const Value& root, const Path& field,
                                            std::size_t max_depth) {
    JsonView view(root);
    return deduped_values_for_field(static_cast<const ValueView&>(view), field, max_depth);
}

} // namespace deepcol
