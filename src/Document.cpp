#include "deepcol/Document.hpp"
#include "deepcol/Loader.hpp"
#include "deepcol/PathParser.hpp"

namespace deepcol {

Document Document::load(const std::string& file, AccessOptions options) {
    return Document(load_document_file(file), options);
}

Path Document::parse(const std::string& path) const {
    return parse_path(path, options_.delimiter);
}

const Value& Document::get(const std::string& path) const {
    return deepcol::get(data_, parse(path));
}

Value Document::get(const std::string& path, const Value& default_value) const {
    return deepcol::get(data_, parse(path), default_value);
}

void Document::set(const std::string& path, const Value& value) {
    deepcol::set(data_, parse(path), value, options_.auto_create);
}

bool Document::erase(const std::string& path) {
    return deepcol::erase(data_, parse(path), options_.strict);
}

bool Document::has(const std::string& path) const {
    return deepcol::has(data_, parse(path));
}

SearchCursor Document::search(const std::string& pattern) const {
    return deepcol::search(data_, parse(pattern), options_.max_depth);
}

FieldSearch Document::paths_to_field(const std::string& field) const {
    return deepcol::paths_to_field(data_, parse(field), options_.max_depth);
}

std::vector<Value> Document::values_for_field(const std::string& field, bool dedupe) const {
    if (dedupe) {
        return deepcol::deduped_values_for_field(data_, parse(field), options_.max_depth);
    }
    return deepcol::values_for_field(data_, parse(field), options_.max_depth);
}

std::string Document::to_json_string(int indent) const {
    // Invalid UTF-8 in strings is shown as U+FFFD rather than failing
    return data_.dump(indent, ' ', false, Value::error_handler_t::replace);
}

void Document::save(const std::string& file) const {
    write_document_file(file, data_);
}

} // namespace deepcol
