/**
 * @file Builtins.cpp
 * @brief Builtin validators and hooks
 */

#include "treepatch/Builtins.hpp"
#include "treepatch/Path.hpp"
#include "treepatch/Traverse.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <regex>
#include <stdexcept>

namespace treepatch {

namespace {

std::string option_string(const Value& options, const char* name) {
    auto it = options.find(name);
    if (it == options.end() || !it->is_string()) {
        throw std::invalid_argument(std::string("option '") + name + "' must be a string");
    }
    return it->get<std::string>();
}

Value validate_type(const Value& value, const Value& options) {
    const std::string want = option_string(options, "type");

    bool ok = false;
    if (want == "string") ok = value.is_string();
    else if (want == "number") ok = value.is_number();
    else if (want == "integer") ok = value.is_number_integer();
    else if (want == "boolean") ok = value.is_boolean();
    else if (want == "null") ok = value.is_null();
    else if (want == "object") ok = value.is_object();
    else if (want == "array") ok = value.is_array();
    else return "unknown type '" + want + "'";

    if (ok) return true;
    return "expected " + want + ", got " + type_name(value);
}

Value validate_pattern(const Value& value, const Value& options) {
    if (!value.is_string()) {
        return "expected string, got " + type_name(value);
    }
    const std::regex re(option_string(options, "regex"));
    if (std::regex_search(value.get<std::string>(), re)) return true;
    return "value does not match pattern";
}

Value validate_range(const Value& value, const Value& options) {
    if (!value.is_number()) {
        return "expected number, got " + type_name(value);
    }
    const double v = value.get<double>();
    if (auto it = options.find("min"); it != options.end() && it->is_number()) {
        if (v < it->get<double>()) return "value below minimum " + it->dump();
    }
    if (auto it = options.find("max"); it != options.end() && it->is_number()) {
        if (v > it->get<double>()) return "value above maximum " + it->dump();
    }
    return true;
}

Value validate_max_length(const Value& value, const Value& options) {
    auto it = options.find("max");
    if (it == options.end() || !it->is_number_integer() || it->get<long long>() < 0) {
        throw std::invalid_argument("option 'max' must be a non-negative integer");
    }
    const auto max = it->get<std::size_t>();

    std::size_t length = 0;
    if (value.is_string()) length = value.get_ref<const std::string&>().size();
    else if (is_container(value)) length = value.size();
    else return "expected string, array or object, got " + type_name(value);

    if (length <= max) return true;
    return "length " + std::to_string(length) + " exceeds " + std::to_string(max);
}

Value validate_enum(const Value& value, const Value& options) {
    auto it = options.find("values");
    if (it == options.end() || !it->is_array()) {
        throw std::invalid_argument("option 'values' must be an array");
    }
    for (const auto& allowed : *it) {
        if (strict_equal(value, allowed)) return true;
    }
    return "value not in " + it->dump();
}

Value validate_not_null(const Value& value, const Value&) {
    if (value.is_null()) return "value must not be null";
    return true;
}

std::vector<Patch> hook_set(const Patch&, const Value&, const Value& options) {
    auto it = options.find("value");
    return {Patch::add(option_string(options, "path"),
                       it == options.end() ? Value() : *it)};
}

std::vector<Patch> hook_remove(const Patch&, const Value&, const Value& options) {
    Patch p = Patch::remove(option_string(options, "path"));
    p.silent = true;
    return {p};
}

/**
 * @brief Exact sum of an integer node and an integer step
 *
 * Results above INT64_MAX are kept as unsigned. nullopt when the sum fits
 * neither int64 nor uint64.
 */
std::optional<Value> integer_sum(const Value& current, std::int64_t by) {
    constexpr auto u64_max = std::numeric_limits<std::uint64_t>::max();
    constexpr auto i64_max = std::numeric_limits<std::int64_t>::max();
    constexpr auto i64_min = std::numeric_limits<std::int64_t>::min();

    if (current.is_number_unsigned()) {
        const auto base = current.get<std::uint64_t>();
        if (by >= 0) {
            const auto step = static_cast<std::uint64_t>(by);
            if (base > u64_max - step) return std::nullopt;
            return Value(base + step);
        }
        // magnitude of a negative int64, INT64_MIN included
        const auto step = static_cast<std::uint64_t>(-(by + 1)) + 1;
        if (base >= step) return Value(base - step);
        const auto below = step - base;   // at most 2^63
        if (below == static_cast<std::uint64_t>(i64_max) + 1) return Value(i64_min);
        return Value(-static_cast<std::int64_t>(below));
    }

    const auto base = current.get<std::int64_t>();
    if (base >= 0 && by >= 0) {
        return Value(static_cast<std::uint64_t>(base) + static_cast<std::uint64_t>(by));
    }
    if (by > 0 && base > i64_max - by) return std::nullopt;
    if (by < 0 && base < i64_min - by) return std::nullopt;
    return Value(base + by);
}

/**
 * @brief Integer step value, when `by` is integral and fits int64
 */
std::optional<std::int64_t> integer_step(const Value& by) {
    // 2^63, exactly representable
    constexpr double limit = 9223372036854775808.0;

    if (by.is_number_unsigned()) {
        const auto v = by.get<std::uint64_t>();
        if (v > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::int64_t>(v);
    }
    if (by.is_number_integer()) return by.get<std::int64_t>();

    const double d = by.get<double>();
    if (!(d >= -limit && d < limit) || d != std::trunc(d)) return std::nullopt;
    return static_cast<std::int64_t>(d);
}

std::vector<Patch> hook_increment(const Patch&, const Value& document, const Value& options) {
    const std::string target = option_string(options, "path");

    Value by = 1;
    if (auto it = options.find("by"); it != options.end() && it->is_number()) {
        by = *it;
    }

    Value current = 0;
    Result read = read_path(document, parse_path(target));
    if (read.ok() && read.payload().is_number()) {
        current = read.payload();
    }

    if (current.is_number_integer()) {
        if (auto step = integer_step(by)) {
            if (auto sum = integer_sum(current, *step)) {
                return {Patch::add(target, *sum)};
            }
        }
    }
    return {Patch::add(target, current.get<double>() + by.get<double>())};
}

} // anonymous namespace

void register_builtins(CallbackRegistry& registry) {
    registry.add_validator("type", validate_type);
    registry.add_validator("pattern", validate_pattern);
    registry.add_validator("range", validate_range);
    registry.add_validator("max_length", validate_max_length);
    registry.add_validator("enum", validate_enum);
    registry.add_validator("not_null", validate_not_null);

    registry.add_hook("set", hook_set);
    registry.add_hook("remove", hook_remove);
    registry.add_hook("increment", hook_increment);
}

std::shared_ptr<CallbackRegistry> make_builtin_registry() {
    auto registry = std::make_shared<CallbackRegistry>();
    register_builtins(*registry);
    return registry;
}

} // namespace treepatch
