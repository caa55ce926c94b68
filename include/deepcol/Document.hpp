/**
 * @file Document.hpp
 * @brief Owned document tree with path-based access
 */

#ifndef DEEPCOL_DOCUMENT_HPP
#define DEEPCOL_DOCUMENT_HPP

#include "deepcol/Accessor.hpp"

#include <string>
#include <utility>
#include <vector>

namespace deepcol {

/**
 * @brief A Value tree plus the options used to access it
 *
 * String paths are parsed with options().delimiter. Use the free
 * functions of Accessor.hpp on data() for pre-built Paths.
 *
 * Example:
 * ```cpp
 * Document doc = Document::load("servers.toml");
 * doc.set("servers.alpha.ip", "10.0.0.1");
 * int port = doc.get_as<int>("servers.alpha.port", 22);
 * doc.save("servers.toml");
 * ```
 */
class Document {
public:
    Document() = default;
    explicit Document(Value data, AccessOptions options = {})
        : data_(std::move(data)), options_(options) {}

    /**
     * @brief Load a .json or .toml file
     * @throws FileNotFoundError, UnsupportedFormat, DocumentParseError
     */
    static Document load(const std::string& file, AccessOptions options = {});

    // Access the underlying tree
    const Value& data() const noexcept { return data_; }
    Value& data() noexcept { return data_; }

    const AccessOptions& options() const noexcept { return options_; }
    AccessOptions& options() noexcept { return options_; }

    // Path helpers
    const Value& get(const std::string& path) const;
    Value get(const std::string& path, const Value& default_value) const;
    void set(const std::string& path, const Value& value);
    bool erase(const std::string& path);
    bool has(const std::string& path) const;

    /**
     * @brief Typed read with fallback
     *
     * Returns fallback when the path is absent or the value does not
     * convert to T. Kind mismatches along the path still throw.
     */
    template <typename T>
    T get_as(const std::string& path, const T& fallback) const {
        const Value* found = deepcol::get_if_present(data_, parse(path));
        if (found == nullptr) return fallback;
        try {
            return found->get<T>();
        } catch (const Value::type_error&) {
            return fallback;
        }
    }

    // Search
    SearchCursor search(const std::string& pattern) const;
    FieldSearch paths_to_field(const std::string& field) const;
    std::vector<Value> values_for_field(const std::string& field, bool dedupe = false) const;

    // Serialization; invalid UTF-8 in strings becomes U+FFFD
    std::string to_json_string(int indent = 2) const;
    void save(const std::string& file) const;

private:
    Value data_ = Value::object();
    AccessOptions options_;

    Path parse(const std::string& path) const;
};

} // namespace deepcol

#endif // DEEPCOL_DOCUMENT_HPP
