/**
 * @file Loader.hpp
 * @brief Loading documents, patch lists and rules from files
 *
 * Supported formats:
 * - JSON files (using nlohmann::json)
 * - TOML files (using toml++)
 *
 * A rules object has the shape
 * ```json
 * {
 *   "restrict":  [{"pattern": "^/secret", "deny": "rwd"}],
 *   "validate":  [{"pattern": "^/age$", "validator": "range", "options": {"min": 0}}],
 *   "prepatch":  [{"pattern": "^/items", "hook": "increment", "options": {"path": "/count"}}],
 *   "postpatch": []
 * }
 * ```
 * or, in TOML, `[[restrict]]`, `[[validate]]`, `[[prepatch]]` and
 * `[[postpatch]]` tables with the same keys. Validators and hooks are
 * referenced by name and resolved through the engine's registry.
 */

#ifndef TREEPATCH_LOADER_HPP
#define TREEPATCH_LOADER_HPP

#include "treepatch/Value.hpp"
#include <string>

namespace treepatch {

class Engine;

/**
 * @brief Parse JSON text
 * @param text Serialized JSON
 * @param origin Label used in error messages
 * @throws DocumentParseError if the text is not valid JSON
 */
Value parse_json_text(const std::string& text, const std::string& origin = "<text>");

/**
 * @brief Load a JSON file
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML file as a Value
 *
 * Tables become mappings, arrays become sequences, dates and times become
 * their string form.
 *
 * @throws FileNotFoundError if file doesn't exist
 * @throws DocumentParseError if TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Get file extension (lowercase), including the dot
 */
std::string get_file_extension(const std::string& path);

/**
 * @brief Load a document, detecting the format by extension
 *
 * An empty path yields an empty mapping.
 *
 * @throws FileNotFoundError, DocumentParseError
 * @throws PatchError if the extension is not .json or .toml
 */
Value load_document_file(const std::string& path);

/**
 * @brief Load a patch list
 *
 * JSON files hold the list itself. TOML files hold it under a
 * `[[patches]]` array of tables.
 *
 * @throws FileNotFoundError, DocumentParseError, PatchError
 */
Value load_patches_file(const std::string& path);

/**
 * @brief Write a value as pretty-printed JSON
 * @throws PatchError if the file cannot be written
 */
void write_json_file(const std::string& path, const Value& value, int indent = 2);

/**
 * @brief Register the restrictions, validators and hooks of a rules object
 * @throws RegistrationError if the rules object is malformed
 */
void apply_rules(const Value& rules, Engine& engine);

/**
 * @brief Load a rules file (JSON or TOML) and apply it to engine
 * @throws FileNotFoundError, DocumentParseError, RegistrationError
 */
void load_rules_file(const std::string& path, Engine& engine);

} // namespace treepatch

#endif // TREEPATCH_LOADER_HPP
