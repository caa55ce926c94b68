/**
 * @file PathParser.cpp
 * @brief Implementation of path text parsing and formatting
 */

#include "deepcol/PathParser.hpp"

#include <cctype>
#include <stdexcept>

namespace deepcol {

namespace {

    bool is_reserved(char c) {
        return c == '[' || c == ']' || c == '\\' || c == '*';
    }

    /**
     * @brief Single-pass scanner over one path text
     */
    class PathScanner {
    public:
        PathScanner(const std::string& text, char delimiter)
            : text_(text), delim_(delimiter) {}

        Path run() {
            if (is_reserved(delim_)) {
                fail(0, std::string("'") + delim_ + "' cannot be used as a delimiter");
            }

            std::vector<Step> steps;
            if (text_.empty()) {
                return Path(std::move(steps));
            }

            steps.push_back(at('[') ? read_bracket() : read_key());

            while (pos_ < text_.size()) {
                const char c = text_[pos_];
                if (c == delim_) {
                    ++pos_;
                    if (pos_ == text_.size()) {
                        fail(pos_ - 1, "trailing delimiter");
                    }
                    steps.push_back(read_key());
                } else if (c == '[') {
                    steps.push_back(read_bracket());
                } else {
                    // Only reachable right after a closing bracket
                    fail(pos_, "expected delimiter or '[' after ']'");
                }
            }

            return Path(std::move(steps));
        }

    private:
        const std::string& text_;
        char delim_;
        std::size_t pos_ = 0;

        [[noreturn]] void fail(std::size_t position, const std::string& reason) const {
            throw InvalidPathSyntax(text_, position, reason);
        }

        bool at(char c) const {
            return pos_ < text_.size() && text_[pos_] == c;
        }

        Step read_key() {
            const std::size_t start = pos_;
            std::string name;
            bool escaped = false;

            while (pos_ < text_.size()) {
                const char c = text_[pos_];
                if (c == '\\') {
                    if (pos_ + 1 == text_.size()) {
                        fail(pos_, "dangling escape character");
                    }
                    name += text_[pos_ + 1];
                    pos_ += 2;
                    escaped = true;
                    continue;
                }
                if (c == delim_ || c == '[') break;
                if (c == ']') fail(pos_, "unmatched ']'");
                name += c;
                ++pos_;
            }

            if (name.empty()) {
                fail(start, "empty key segment");
            }
            if (!escaped && name == "*") {
                return Step::wildcard();
            }
            return Step::of_key(std::move(name));
        }

        /**
         * @brief Read ["..."], a literal key that may be empty
         *
         * Inside the quotes a backslash takes the next character as is.
         */
        Step read_quoted_key() {
            const std::size_t open = pos_;
            pos_ += 2;
            std::string name;
            for (;;) {
                if (pos_ >= text_.size()) {
                    fail(open, "unterminated quoted key");
                }
                const char c = text_[pos_];
                if (c == '\\') {
                    if (pos_ + 1 == text_.size()) {
                        fail(pos_, "dangling escape character");
                    }
                    name += text_[pos_ + 1];
                    pos_ += 2;
                    continue;
                }
                ++pos_;
                if (c == '"') break;
                name += c;
            }
            if (!at(']')) {
                fail(pos_, "expected ']' after quoted key");
            }
            ++pos_;
            return Step::of_key(std::move(name));
        }

        Step read_bracket() {
            const std::size_t open = pos_;
            if (open + 1 < text_.size() && text_[open + 1] == '"') {
                return read_quoted_key();
            }
            const std::size_t close = text_.find(']', open + 1);
            if (close == std::string::npos) {
                fail(open, "unmatched '['");
            }

            const std::string body = text_.substr(open + 1, close - open - 1);
            pos_ = close + 1;

            if (body.empty()) {
                fail(open, "empty brackets");
            }
            if (body == "*") {
                return Step::wildcard();
            }

            if (body.find(':') == std::string::npos) {
                return Step::of_index(read_int(body, open + 1));
            }

            // Slice: start:stop or start:stop:step, every part optional
            std::vector<std::string> parts;
            std::size_t from = 0;
            for (;;) {
                const std::size_t colon = body.find(':', from);
                parts.push_back(body.substr(from, colon == std::string::npos
                                                      ? std::string::npos
                                                      : colon - from));
                if (colon == std::string::npos) break;
                from = colon + 1;
            }
            if (parts.size() > 3) {
                fail(open, "slice takes at most three parts");
            }

            std::optional<std::int64_t> bounds[3];
            std::size_t offset = open + 1;
            for (std::size_t i = 0; i < parts.size(); ++i) {
                if (!parts[i].empty()) {
                    bounds[i] = read_int(parts[i], offset);
                }
                offset += parts[i].size() + 1;
            }
            if (bounds[2] && *bounds[2] == 0) {
                fail(open, "slice step cannot be zero");
            }
            return Step::of_slice(bounds[0], bounds[1], bounds[2]);
        }

        std::int64_t read_int(const std::string& token, std::size_t offset) const {
            std::size_t i = 0;
            if (token[0] == '+' || token[0] == '-') i = 1;
            if (i == token.size()) {
                fail(offset, "non-integer index '" + token + "'");
            }
            for (std::size_t j = i; j < token.size(); ++j) {
                if (!std::isdigit(static_cast<unsigned char>(token[j]))) {
                    fail(offset + j, "non-integer index '" + token + "'");
                }
            }
            try {
                return static_cast<std::int64_t>(std::stoll(token));
            } catch (const std::out_of_range&) {
                fail(offset, "index '" + token + "' out of integer range");
            }
        }
    };

} // anonymous namespace

Path parse_path(const std::string& text, char delimiter) {
    return PathScanner(text, delimiter).run();
}

std::string escape_key(const std::string& key, char delimiter) {
    if (key == "*") {
        return "\\*";
    }
    std::string out;
    out.reserve(key.size());
    for (char c : key) {
        if (c == delimiter || c == '[' || c == ']' || c == '\\') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

std::string format_path(const Path& path, char delimiter) {
    std::string out;
    for (std::size_t i = 0; i < path.size(); ++i) {
        const Step& step = path[i];
        switch (step.kind()) {
            case StepKind::Key:
                // An empty key has no bare form
                if (step.key().empty()) {
                    out += "[\"\"]";
                    break;
                }
                if (i > 0) out += delimiter;
                out += escape_key(step.key(), delimiter);
                break;
            case StepKind::Wildcard:
                if (i > 0) out += delimiter;
                out += '*';
                break;
            case StepKind::Index:
            case StepKind::Slice:
                out += step.to_string();
                break;
        }
    }
    return out;
}

} // namespace deepcol
