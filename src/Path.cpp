/**
 * @file Path.cpp
 * @brief Step and Path implementation
 */

#include "deepcol/Path.hpp"
#include "deepcol/PathParser.hpp"

#include <algorithm>

namespace deepcol {

Step Step::of_key(std::string name) {
    return Step(Storage(std::in_place_index<0>, std::move(name)));
}

Step Step::of_index(std::int64_t index) {
    return Step(Storage(std::in_place_index<1>, index));
}

Step Step::wildcard() {
    return Step(Storage(std::in_place_index<2>));
}

Step Step::of_slice(std::optional<std::int64_t> start,
                    std::optional<std::int64_t> stop,
                    std::optional<std::int64_t> step) {
    return Step(Storage(std::in_place_index<3>, SliceBounds{start, stop, step}));
}

std::string Step::to_string() const {
    switch (kind()) {
        case StepKind::Key:
            return key();
        case StepKind::Index:
            return "[" + std::to_string(index()) + "]";
        case StepKind::Wildcard:
            return "*";
        case StepKind::Slice: {
            const SliceBounds& s = slice();
            std::string out = "[";
            if (s.start) out += std::to_string(*s.start);
            out += ':';
            if (s.stop) out += std::to_string(*s.stop);
            if (s.step) {
                out += ':';
                out += std::to_string(*s.step);
            }
            return out + "]";
        }
    }
    return {};
}

Path::Path(const char* text)
    : Path(std::string(text)) {}

Path::Path(const std::string& text)
    : steps_(parse_path(text).steps_) {}

Path Path::from_segments(const std::vector<Segment>& segments) {
    std::vector<Step> steps;
    steps.reserve(segments.size());
    for (const auto& seg : segments) {
        if (const auto* key = std::get_if<std::string>(&seg)) {
            steps.push_back(Step::of_key(*key));
        } else {
            steps.push_back(Step::of_index(std::get<std::int64_t>(seg)));
        }
    }
    return Path(std::move(steps));
}

bool Path::has_pattern() const noexcept {
    return std::any_of(steps_.begin(), steps_.end(),
                       [](const Step& s) { return s.is_pattern(); });
}

Path Path::child(Step step) const {
    std::vector<Step> steps = steps_;
    steps.push_back(std::move(step));
    return Path(std::move(steps));
}

Path Path::concat(const Path& tail) const {
    std::vector<Step> steps = steps_;
    steps.insert(steps.end(), tail.steps_.begin(), tail.steps_.end());
    return Path(std::move(steps));
}

Path Path::prefix(std::size_t count) const {
    count = std::min(count, steps_.size());
    return Path(std::vector<Step>(steps_.begin(), steps_.begin() + static_cast<std::ptrdiff_t>(count)));
}

std::string Path::to_string() const {
    return format_path(*this);
}

} // namespace deepcol
