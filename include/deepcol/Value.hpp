/**
 * @file Value.hpp
 * @brief Value type for nested documents
 *
 * Uses nlohmann::ordered_json as the concrete value model:
 * - Null, Bool, Integer, Float, String (scalars)
 * - Array ([Value, ...]) (sequence)
 * - Object ({String: Value, ...}) (mapping, iterated in insertion order)
 */

#ifndef DEEPCOL_VALUE_HPP
#define DEEPCOL_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace deepcol {

/**
 * @brief JSON-like value type for nested documents
 *
 * Alias for nlohmann::ordered_json so that mapping members are visited
 * in the order they were inserted, both by search and by serialization.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief Structural kind of a value, as seen by the traversal engine
 */
enum class Kind {
    Mapping,
    Sequence,
    Scalar
};

/**
 * @brief Get human-readable name of a kind ("mapping", "sequence", "scalar")
 */
inline const char* kind_name(Kind kind) {
    switch (kind) {
        case Kind::Mapping: return "mapping";
        case Kind::Sequence: return "sequence";
        case Kind::Scalar: return "scalar";
    }
    return "unknown";
}

/**
 * @brief Name of a value's type as used in error messages
 *
 * Containers report their kind ("mapping", "sequence"); scalars report
 * "null", "boolean", "integer", "float" or "string".
 */
inline std::string type_name(const Value& val) {
    switch (val.type()) {
        case Value::value_t::object: return "mapping";
        case Value::value_t::array: return "sequence";
        case Value::value_t::null: return "null";
        case Value::value_t::boolean: return "boolean";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned: return "integer";
        case Value::value_t::number_float: return "float";
        case Value::value_t::string: return "string";
        case Value::value_t::binary: return "binary";
        case Value::value_t::discarded: break;
    }
    return "discarded";
}

/**
 * @brief Classify a Value as mapping, sequence or scalar
 */
inline Kind kind_of(const Value& val) {
    if (val.is_object()) return Kind::Mapping;
    if (val.is_array()) return Kind::Sequence;
    return Kind::Scalar;
}

} // namespace deepcol

#endif // DEEPCOL_VALUE_HPP
