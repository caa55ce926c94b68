/**
 * @file JsonView.cpp
 * @brief ValueView adapter for deepcol::Value
 */

#include "deepcol/JsonView.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

namespace deepcol {

namespace {

    /**
     * @brief Member lookup shared by the writable and read-only views
     *
     * Node is Value or const Value; the member view is built from the
     * same constness, so writability carries over.
     */
    template <typename Node>
    ViewPtr lookup(Node& node, const Step& step) {
        if (step.is_key()) {
            if (!node.is_object()) return nullptr;
            auto it = node.find(step.key());
            if (it == node.end()) return nullptr;
            return std::make_unique<JsonView>(*it);
        }
        if (step.is_index()) {
            if (!node.is_array() || step.index() < 0) return nullptr;
            const auto i = static_cast<std::size_t>(step.index());
            if (i >= node.size()) return nullptr;
            return std::make_unique<JsonView>(node[i]);
        }
        return nullptr;
    }

    template <typename Node>
    class JsonMemberCursor : public MemberCursor {
    public:
        explicit JsonMemberCursor(Node& node)
            : node_(node), it_(node.begin()) {}

        std::optional<Member> next() override {
            if (!node_.is_object() && !node_.is_array()) return std::nullopt;
            if (it_ == node_.end()) return std::nullopt;

            Step step = node_.is_object() ? Step::of_key(it_.key())
                                          : Step::of_index(position_);
            ViewPtr value = std::make_unique<JsonView>(*it_);
            ++it_;
            ++position_;
            return Member{std::move(step), std::move(value)};
        }

    private:
        Node& node_;
        decltype(std::declval<Node&>().begin()) it_;
        std::int64_t position_ = 0;
    };

} // anonymous namespace

Kind JsonView::kind() const {
    return kind_of(*value_);
}

std::size_t JsonView::size() const {
    return (value_->is_object() || value_->is_array()) ? value_->size() : 0;
}

std::string JsonView::type_name() const {
    return deepcol::type_name(*value_);
}

ViewPtr JsonView::clone() const {
    if (target_ != nullptr) {
        return std::make_unique<JsonView>(*target_);
    }
    return std::make_unique<JsonView>(*value_);
}

ViewPtr JsonView::get_member(const Step& step) const {
    if (target_ != nullptr) {
        return lookup(*target_, step);
    }
    return lookup(*value_, step);
}

void JsonView::set_member(const Step& step, const Value& value) {
    Value& node = writable();

    if (step.is_key() && node.is_object()) {
        node[step.key()] = value;
        return;
    }

    if (step.is_index() && node.is_array() && step.index() >= 0) {
        const auto i = static_cast<std::size_t>(step.index());
        if (i < node.size()) {
            node[i] = value;
            return;
        }
        if (i - node.size() > kMaxSequencePadding) {
            throw std::length_error("Index " + std::to_string(i) +
                                    " is too far past the end of a sequence of " +
                                    std::to_string(node.size()));
        }
        while (node.size() < i) {
            node.push_back(Value());
        }
        node.push_back(value);
        return;
    }

    throw std::invalid_argument("Step '" + step.to_string() +
                                "' does not address a member of " +
                                deepcol::type_name(node));
}

bool JsonView::delete_member(const Step& step) {
    Value& node = writable();

    if (step.is_key() && node.is_object()) {
        return node.erase(step.key()) > 0;
    }

    if (step.is_index() && node.is_array() && step.index() >= 0) {
        const auto i = static_cast<std::size_t>(step.index());
        if (i >= node.size()) return false;
        node.erase(i);
        return true;
    }

    return false;
}

void JsonView::assign(const Value& value) {
    writable() = value;
}

std::unique_ptr<MemberCursor> JsonView::iter_members() const {
    if (target_ != nullptr) {
        return std::make_unique<JsonMemberCursor<Value>>(*target_);
    }
    return std::make_unique<JsonMemberCursor<const Value>>(*value_);
}

Value& JsonView::writable() const {
    if (target_ == nullptr) {
        throw std::logic_error("Cannot mutate through a read-only JsonView");
    }
    return *target_;
}

const Value& json_value(const ValueView& view) {
    const auto* json = dynamic_cast<const JsonView*>(&view);
    if (json == nullptr) {
        throw std::invalid_argument("View does not wrap a deepcol::Value");
    }
    return json->value();
}

} // namespace deepcol
