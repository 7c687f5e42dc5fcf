/**
 * @file Value.hpp
 * @brief Value type for patched documents
 *
 * Uses nlohmann::json as the underlying value model to support:
 * - Null
 * - Bool (true | false)
 * - Integer (int64_t / uint64_t)
 * - Float (double)
 * - String (std::string, UTF-8)
 * - Sequence ([Value, ...])
 * - Mapping ({String: Value, ...})
 */

#ifndef TREEPATCH_VALUE_HPP
#define TREEPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace treepatch {

/**
 * @brief JSON-like value type for documents and patch payloads
 *
 * This is an alias for nlohmann::json. A Mapping is a json object and a
 * Sequence is a json array.
 */
using Value = nlohmann::json;

/**
 * @brief Get human-readable type name for a Value
 * @param val The value to inspect
 * @return Type name string (e.g., "null", "boolean", "integer", "float",
 *         "string", "array", "object")
 */
inline std::string type_name(const Value& val) {
    if (val.is_null()) return "null";
    if (val.is_boolean()) return "boolean";
    if (val.is_number_integer()) return "integer";
    if (val.is_number_float()) return "float";
    if (val.is_string()) return "string";
    if (val.is_array()) return "array";
    if (val.is_object()) return "object";
    return "unknown";
}

/**
 * @brief Check if value is a container (array or object)
 */
inline bool is_container(const Value& val) {
    return val.is_array() || val.is_object();
}

/**
 * @brief Exact structural equality
 *
 * Both sides must hold the same kind of value at every level. Signed and
 * unsigned integers count as one kind; floats are a different kind, so
 * `1` and `1.0` are not strictly equal. No string/number coercion.
 */
bool strict_equal(const Value& a, const Value& b);

/**
 * @brief Coercive equality used by non-strict `test` patches
 *
 * - bool against anything compares the other side's truthiness
 * - null against a string is equal only to ""; against anything else it
 *   is equal when the other side is falsy
 * - number against a numeric string compares numerically, and so do two
 *   numeric strings ("1" == "01")
 * - containers of the same kind compare element-wise (loosely)
 * - otherwise falls back to strict_equal()
 *
 * Examples:
 * ```cpp
 * loose_equal(1, "1");        // true
 * loose_equal(true, "yes");   // true
 * loose_equal(nullptr, 0);    // true
 * loose_equal(nullptr, "0");  // false
 * loose_equal("a", "b");      // false
 * ```
 */
bool loose_equal(const Value& a, const Value& b);

/**
 * @brief Truthiness of a value (empty string, "0", 0, null, false and
 *        empty containers are falsy)
 */
bool truthy(const Value& val);

/**
 * @brief Check whether a value may be used to pad sequences
 *
 * Only the literals `""`, `[]`, `{}`, `0`, `1`, `true`, `false` and `null`
 * are accepted. The comparison is made on the compact serialization, so
 * `0.0` or `"0"` are rejected.
 */
bool is_canonical_fill(const Value& val);

} // namespace treepatch

#endif // TREEPATCH_VALUE_HPP
