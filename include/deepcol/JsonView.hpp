/**
 * @file JsonView.hpp
 * @brief ValueView adapter for deepcol::Value
 */

#ifndef DEEPCOL_JSONVIEW_HPP
#define DEEPCOL_JSONVIEW_HPP

#include "deepcol/ValueView.hpp"

namespace deepcol {

/**
 * @brief View over a deepcol::Value node
 *
 * Built from a mutable reference, the view and all member views may
 * mutate the tree. Built from a const reference, the view is read-only
 * and every mutator throws std::logic_error.
 *
 * Example:
 * ```cpp
 * Value doc = {{"users", {{{"name", "ada"}}}}};
 * JsonView view(doc);
 * auto first = view.get_member(Step::of_key("users"));
 * first->set_member(Step::of_index(1), {{"name", "bob"}});
 * ```
 */
class JsonView : public ValueView {
public:
    explicit JsonView(Value& value) noexcept
        : value_(&value), target_(&value) {}

    explicit JsonView(const Value& value) noexcept
        : value_(&value), target_(nullptr) {}

    // Views never own; binding a temporary would dangle.
    explicit JsonView(Value&&) = delete;

    const Value& value() const noexcept { return *value_; }
    bool read_only() const noexcept { return target_ == nullptr; }

    Kind kind() const override;
    std::size_t size() const override;
    std::string type_name() const override;
    ViewPtr clone() const override;
    ViewPtr get_member(const Step& step) const override;
    void set_member(const Step& step, const Value& value) override;
    bool delete_member(const Step& step) override;
    void assign(const Value& value) override;
    std::unique_ptr<MemberCursor> iter_members() const override;
    const void* identity() const noexcept override { return value_; }
    Value to_value() const override { return *value_; }

private:
    const Value* value_;
    Value* target_;

    Value& writable() const;
};

/**
 * @brief Underlying Value of a view produced from a JsonView root
 * @throws std::invalid_argument if the view is not a JsonView
 */
const Value& json_value(const ValueView& view);

} // namespace deepcol

#endif // DEEPCOL_JSONVIEW_HPP
