/**
 * @file Loader.cpp
 * @brief File loading implementation
 *
 * Implements file loading for:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 */

#include "treepatch/Loader.hpp"
#include "treepatch/Engine.hpp"
#include "treepatch/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace treepatch {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

/**
 * @brief Read entire file into string.
 */
std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * @brief Convert toml++ value to nlohmann::json.
 */
Value toml_value_to_json(const toml::node& node) {
    switch (node.type()) {
        case toml::node_type::string:
            return Value(node.as_string()->get());

        case toml::node_type::integer:
            return Value(node.as_integer()->get());

        case toml::node_type::floating_point:
            return Value(node.as_floating_point()->get());

        case toml::node_type::boolean:
            return Value(node.as_boolean()->get());

        case toml::node_type::date: {
            std::ostringstream ss;
            ss << node.as_date()->get();
            return Value(ss.str());
        }

        case toml::node_type::time: {
            std::ostringstream ss;
            ss << node.as_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::date_time: {
            std::ostringstream ss;
            ss << node.as_date_time()->get();
            return Value(ss.str());
        }

        case toml::node_type::array: {
            Value arr = Value::array();
            for (const auto& elem : *node.as_array()) {
                arr.push_back(toml_value_to_json(elem));
            }
            return arr;
        }

        case toml::node_type::table: {
            Value obj = Value::object();
            for (const auto& [key, val] : *node.as_table()) {
                obj[std::string(key.str())] = toml_value_to_json(val);
            }
            return obj;
        }

        default:
            return Value(nullptr);
    }
}

/**
 * @brief Fetch a required string field of a rule entry
 */
std::string rule_string(const Value& entry, const char* field, const std::string& section) {
    auto it = entry.find(field);
    if (it == entry.end() || !it->is_string()) {
        throw RegistrationError("Rule in [" + section + "] needs a string '" + field + "'");
    }
    return it->get<std::string>();
}

Value rule_options(const Value& entry) {
    auto it = entry.find("options");
    return it == entry.end() ? Value::object() : *it;
}

/**
 * @brief Entries of one rules section; missing sections are empty
 */
Value rule_section(const Value& rules, const char* section) {
    auto it = rules.find(section);
    if (it == rules.end()) return Value::array();
    if (!it->is_array()) {
        throw RegistrationError(std::string("Rules section [") + section + "] must be a list");
    }
    for (const auto& entry : *it) {
        if (!entry.is_object()) {
            throw RegistrationError(std::string("Rules section [") + section +
                                    "] must contain objects");
        }
    }
    return *it;
}

} // anonymous namespace

// ============================================================================
// JSON / TOML loading
// ============================================================================

Value parse_json_text(const std::string& text, const std::string& origin) {
    try {
        return nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw DocumentParseError(origin, e.what());
    }
}

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }
    return parse_json_text(read_file(path), path);
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        std::ostringstream details;
        details << e.description() << " (line " << e.source().begin.line
                << ", column " << e.source().begin.column << ")";
        throw DocumentParseError(path, details.str());
    }

    return toml_value_to_json(table);
}

std::string get_file_extension(const std::string& path) {
    fs::path p(path);
    return to_lower(p.extension().string());
}

Value load_document_file(const std::string& path) {
    if (path.empty()) {
        return Value::object();
    }

    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".json") {
        return load_json_file(path);
    }
    if (ext == ".toml") {
        return load_toml_file(path);
    }
    throw PatchError("Unsupported file type: " + ext + " (expected .json or .toml)");
}

Value load_patches_file(const std::string& path) {
    Value loaded = load_document_file(path);
    if (get_file_extension(path) != ".toml") {
        return loaded;
    }

    auto it = loaded.find("patches");
    if (it == loaded.end()) {
        throw DocumentParseError(path, "missing [[patches]] array of tables");
    }
    return *it;
}

void write_json_file(const std::string& path, const Value& value, int indent) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw PatchError("Cannot write to " + path);
    }
    out << value.dump(indent) << "\n";
}

// ============================================================================
// Rules
// ============================================================================

void apply_rules(const Value& rules, Engine& engine) {
    if (!rules.is_object()) {
        throw RegistrationError("Rules must be an object");
    }

    for (const auto& entry : rule_section(rules, "restrict")) {
        engine.restrict(rule_string(entry, "pattern", "restrict"),
                        rule_string(entry, "deny", "restrict"));
    }

    for (const auto& entry : rule_section(rules, "validate")) {
        engine.validate_named(rule_string(entry, "pattern", "validate"),
                              rule_string(entry, "validator", "validate"),
                              rule_options(entry));
    }

    for (const auto& entry : rule_section(rules, "prepatch")) {
        engine.prepatch_named(rule_string(entry, "pattern", "prepatch"),
                              rule_string(entry, "hook", "prepatch"),
                              rule_options(entry));
    }

    for (const auto& entry : rule_section(rules, "postpatch")) {
        engine.postpatch_named(rule_string(entry, "pattern", "postpatch"),
                               rule_string(entry, "hook", "postpatch"),
                               rule_options(entry));
    }
}

void load_rules_file(const std::string& path, Engine& engine) {
    if (path.empty()) {
        throw FileNotFoundError(path);
    }
    apply_rules(load_document_file(path), engine);
}

} // namespace treepatch
