/**
 * @file Value.cpp
 * @brief Equality and fill helpers for Value
 */

#include "treepatch/Value.hpp"

#include <array>
#include <cctype>
#include <cstdlib>

namespace treepatch {

namespace {

bool is_integer_kind(const Value& v) {
    return v.is_number_integer();
}

/**
 * @brief Parse a string as a full numeric literal
 * @return true and sets out when the whole string is a decimal number;
 *         surrounding whitespace is allowed ("1 ", " 1e3")
 */
bool numeric_string(const std::string& s, double& out) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c)) &&
            !std::isspace(static_cast<unsigned char>(c)) &&
            c != '+' && c != '-' && c != '.' && c != 'e' && c != 'E') {
            return false;
        }
    }
    const char* begin = s.c_str();
    char* end = nullptr;
    out = std::strtod(begin, &end);
    if (end == begin) return false;
    while (std::isspace(static_cast<unsigned char>(*end))) ++end;
    return *end == '\0';
}

double as_double(const Value& v) {
    return v.get<double>();
}

} // anonymous namespace

bool strict_equal(const Value& a, const Value& b) {
    if (a.is_number() && b.is_number()) {
        if (is_integer_kind(a) != is_integer_kind(b)) return false;
        return a == b;
    }

    if (a.type() != b.type()) return false;

    if (a.is_array()) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (!strict_equal(a[i], b[i])) return false;
        }
        return true;
    }

    if (a.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end()) return false;
            if (!strict_equal(it.value(), *other)) return false;
        }
        return true;
    }

    return a == b;
}

bool truthy(const Value& val) {
    if (val.is_null()) return false;
    if (val.is_boolean()) return val.get<bool>();
    if (val.is_number()) return as_double(val) != 0.0;
    if (val.is_string()) {
        const auto& s = val.get_ref<const std::string&>();
        return !(s.empty() || s == "0");
    }
    return !val.empty();
}

bool loose_equal(const Value& a, const Value& b) {
    if (a.is_boolean()) return a.get<bool>() == truthy(b);
    if (b.is_boolean()) return b.get<bool>() == truthy(a);

    // null against a string compares as the empty string, so null != "0"
    if (a.is_null()) return b.is_string() ? b.get_ref<const std::string&>().empty() : !truthy(b);
    if (b.is_null()) return a.is_string() ? a.get_ref<const std::string&>().empty() : !truthy(a);

    if (a.is_number() && b.is_number()) {
        return as_double(a) == as_double(b);
    }

    double parsed = 0.0;
    if (a.is_number() && b.is_string()) {
        return numeric_string(b.get_ref<const std::string&>(), parsed) &&
               parsed == as_double(a);
    }
    if (a.is_string() && b.is_number()) {
        return numeric_string(a.get_ref<const std::string&>(), parsed) &&
               parsed == as_double(b);
    }
    if (a.is_string() && b.is_string()) {
        double other = 0.0;
        if (numeric_string(a.get_ref<const std::string&>(), parsed) &&
            numeric_string(b.get_ref<const std::string&>(), other)) {
            return parsed == other;
        }
        return strict_equal(a, b);
    }

    if (a.is_array() && b.is_array()) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (!loose_equal(a[i], b[i])) return false;
        }
        return true;
    }

    if (a.is_object() && b.is_object()) {
        if (a.size() != b.size()) return false;
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end()) return false;
            if (!loose_equal(it.value(), *other)) return false;
        }
        return true;
    }

    return strict_equal(a, b);
}

bool is_canonical_fill(const Value& val) {
    static const std::array<const char*, 8> canonical = {
        "\"\"", "[]", "{}", "0", "1", "true", "false", "null"
    };

    const std::string encoded = val.dump();
    for (const char* literal : canonical) {
        if (encoded == literal) return true;
    }
    return false;
}

} // namespace treepatch
