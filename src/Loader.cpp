/**
 * @file Loader.cpp
 * @brief JSON/TOML reading and writing
 */

#include "deepcol/Loader.hpp"
#include "deepcol/Errors.hpp"

#include <spdlog/spdlog.h>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <type_traits>
#include <utility>

namespace fs = std::filesystem;

namespace deepcol {

namespace {

enum class Format { Json, Toml };

/**
 * @brief Pick the document format from the file extension
 * @throws UnsupportedFormat for anything but .json and .toml
 */
Format format_for(const std::string& path) {
    const std::string ext = get_file_extension(path);
    if (ext == ".json") return Format::Json;
    if (ext == ".toml") return Format::Toml;
    throw UnsupportedFormat(path, ext);
}

void require_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw FileNotFoundError(path);
    }
}

std::string read_all(std::istream& in) {
    std::ostringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

template <typename T>
std::string to_text(const T& printable) {
    std::ostringstream out;
    out << printable;
    return out.str();
}

/**
 * @brief Parse JSON text, reporting errors with a line and column
 */
Value parse_json_text(const std::string& content, const std::string& source) {
    try {
        return Value::parse(content);
    } catch (const Value::parse_error& e) {
        // e.byte is 1-based and points just past the offending character
        const std::size_t end = std::min(e.byte, content.size());
        int line = 1;
        int column = 1;
        for (std::size_t i = 0; i + 1 < end; ++i) {
            if (content[i] == '\n') {
                ++line;
                column = 1;
            } else {
                ++column;
            }
        }
        throw DocumentParseError(source, line, column, e.what());
    }
}

// ---- TOML -> Value ---------------------------------------------------------

Value from_toml(const toml::node& node) {
    return node.visit([](const auto& n) -> Value {
        using Node = std::decay_t<decltype(n)>;
        if constexpr (toml::is_table<Node>) {
            Value mapping = Value::object();
            for (const auto& [key, child] : n) {
                mapping[std::string(key.str())] = from_toml(child);
            }
            return mapping;
        } else if constexpr (toml::is_array<Node>) {
            Value sequence = Value::array();
            for (const auto& child : n) {
                sequence.push_back(from_toml(child));
            }
            return sequence;
        } else if constexpr (toml::is_date<Node> || toml::is_time<Node> || toml::is_date_time<Node>) {
            return Value(to_text(n.get()));
        } else {
            return Value(n.get());
        }
    });
}

// ---- Value -> TOML ---------------------------------------------------------

toml::table to_toml_table(const Value& mapping);
toml::array to_toml_array(const Value& sequence);

/**
 * @brief Hand a Value to a toml++ inserter as the closest TOML type
 *
 * TOML has no null: nulls become empty strings. Unsigned integers that do
 * not fit int64 become floats.
 */
template <typename Inserter>
void put(const Value& v, Inserter&& insert) {
    switch (v.type()) {
        case Value::value_t::object:
            insert(to_toml_table(v));
            break;
        case Value::value_t::array:
            insert(to_toml_array(v));
            break;
        case Value::value_t::string:
            insert(v.get_ref<const std::string&>());
            break;
        case Value::value_t::boolean:
            insert(v.get<bool>());
            break;
        case Value::value_t::number_integer:
            insert(v.get<std::int64_t>());
            break;
        case Value::value_t::number_unsigned: {
            const auto u = v.get<std::uint64_t>();
            if (u > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                insert(static_cast<double>(u));
            } else {
                insert(static_cast<std::int64_t>(u));
            }
            break;
        }
        case Value::value_t::number_float:
            insert(v.get<double>());
            break;
        case Value::value_t::null:
            insert(std::string());
            break;
        default:
            insert(v.dump());
            break;
    }
}

toml::table to_toml_table(const Value& mapping) {
    toml::table out;
    for (auto it = mapping.begin(); it != mapping.end(); ++it) {
        const std::string& key = it.key();
        put(it.value(), [&out, &key](auto&& x) { out.insert(key, std::forward<decltype(x)>(x)); });
    }
    return out;
}

toml::array to_toml_array(const Value& sequence) {
    toml::array out;
    for (const auto& element : sequence) {
        put(element, [&out](auto&& x) { out.push_back(std::forward<decltype(x)>(x)); });
    }
    return out;
}

/**
 * @brief TOML requires a table at the root; wrap anything else under "value"
 */
toml::table to_toml_document(const Value& value) {
    if (value.is_object()) {
        return to_toml_table(value);
    }
    toml::table root;
    put(value, [&root](auto&& x) { root.insert("value", std::forward<decltype(x)>(x)); });
    return root;
}

std::ofstream open_for_write(const std::string& path) {
    std::ofstream ofs(path);
    if (!ofs) {
        throw DocumentError("Failed to open for write: " + path);
    }
    return ofs;
}

} // anonymous namespace

// ============================================================================
// Reading
// ============================================================================

Value load_json_file(const std::string& path) {
    require_file(path);
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw FileNotFoundError(path);
    }

    Value document = parse_json_text(read_all(in), path);
    spdlog::debug("loaded JSON document '{}'", path);
    return document;
}

Value load_json_stream(std::istream& in, const std::string& source) {
    return parse_json_text(read_all(in), source);
}

Value load_toml_file(const std::string& path) {
    require_file(path);

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        const toml::source_region& where = e.source();
        throw DocumentParseError(path,
                                 static_cast<int>(where.begin.line),
                                 static_cast<int>(where.begin.column),
                                 std::string(e.description()));
    }

    Value document = from_toml(table);
    spdlog::debug("loaded TOML document '{}'", path);
    return document;
}

std::string get_file_extension(const std::string& path) {
    std::string ext = fs::path(path).extension().string();
    for (char& c : ext) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return ext;
}

Value load_document_file(const std::string& path) {
    require_file(path);
    switch (format_for(path)) {
        case Format::Json:
            return load_json_file(path);
        case Format::Toml:
            return load_toml_file(path);
    }
    throw UnsupportedFormat(path, get_file_extension(path));
}

Value parse_literal(const std::string& text) {
    try {
        return Value::parse(text);
    } catch (const Value::parse_error&) {
        return Value(text);
    }
}

// ============================================================================
// Writing
// ============================================================================

std::string to_toml_string(const Value& value) {
    return to_text(to_toml_document(value));
}

void write_json_file(const std::string& path, const Value& value, int indent) {
    std::string text;
    try {
        text = value.dump(indent);
    } catch (const Value::type_error& e) {
        throw DocumentError("Cannot write JSON to " + path + ": " + e.what());
    }
    std::ofstream ofs = open_for_write(path);
    ofs << text << "\n";
    spdlog::debug("wrote JSON document '{}'", path);
}

void write_toml_file(const std::string& path, const Value& value) {
    const toml::table document = to_toml_document(value);
    std::ofstream ofs = open_for_write(path);
    ofs << document << "\n";
    spdlog::debug("wrote TOML document '{}'", path);
}

void write_document_file(const std::string& path, const Value& value) {
    switch (format_for(path)) {
        case Format::Json:
            write_json_file(path, value);
            return;
        case Format::Toml:
            write_toml_file(path, value);
            return;
    }
}

} // namespace deepcol
