/**
 * @file Patch.hpp
 * @brief Patch operations and their decoding from structured data
 *
 * A patch object looks like:
 * ```json
 * {"op": "add", "path": "/a/b", "value": 1, "fill": null, "silent": false}
 * {"op": "move", "from": "/a", "path": "/c", "mode": "replace"}
 * {"op": "test", "path": "/a", "value": "1", "strict": false}
 * ```
 *
 * Required fields:
 * - value: add, replace, insert, test
 * - from:  copy, move
 */

#ifndef TREEPATCH_PATCH_HPP
#define TREEPATCH_PATCH_HPP

#include "treepatch/Result.hpp"
#include "treepatch/Value.hpp"

#include <optional>
#include <string>
#include <vector>

namespace treepatch {

enum class Op { Add, Replace, Insert, Remove, Copy, Move, Test };

/// Lowercase wire name of an operation ("add", "replace", ...)
std::string op_name(Op op);

/// Parse a wire name; nullopt for unknown names
std::optional<Op> parse_op(const std::string& name);

struct Patch {
    Op op = Op::Add;
    std::string path;
    std::optional<Value> value;
    std::optional<std::string> from;
    std::optional<Value> fill;
    bool silent = false;
    bool strict = true;   ///< test only
    Op mode = Op::Add;    ///< copy/move target write mode

    static Patch add(std::string path, Value value);
    static Patch replace(std::string path, Value value);
    static Patch insert(std::string path, Value value);
    static Patch remove(std::string path);
    static Patch copy(std::string from, std::string path);
    static Patch move(std::string from, std::string path);
    static Patch test(std::string path, Value value, bool strict = true);

    /// True when the operation writes to `path`
    bool writes() const noexcept;
};

/**
 * @brief Decode a patch object
 *
 * @param j Patch object
 * @param out Receives the decoded patch
 * @return 200 on success; 400 for a non-object, a missing or mistyped field;
 *         422 for an unsupported operation or copy/move mode
 */
Result decode_patch(const Value& j, Patch& out);

/// Encode a patch back to its object form
Value to_json(const Patch& patch);

/// Encode a list of patches as a sequence
Value to_json(const std::vector<Patch>& patches);

} // namespace treepatch

#endif // TREEPATCH_PATCH_HPP
