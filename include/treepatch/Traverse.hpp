/**
 * @file Traverse.hpp
 * @brief Walking and mutating a document along a path
 *
 * Traversal behavior by mode:
 * - Read:    missing nodes → 404; returns the reached node
 * - Replace: missing nodes → 404 (or a silent no-op when `silent`)
 * - Remove:  missing nodes → no-op; a present final node is erased
 *            (sequence elements are spliced out)
 * - Add:     missing containers are created on the way; final node written
 * - Insert:  like Add, but an existing final node → 422 unless `silent`
 *
 * Descending through a scalar is a 422 "path mismatch". A null node standing
 * where a container is needed counts as missing, so Add/Insert replace it
 * with the container the next segment requires.
 */

#ifndef TREEPATCH_TRAVERSE_HPP
#define TREEPATCH_TRAVERSE_HPP

#include "treepatch/Path.hpp"
#include "treepatch/Result.hpp"
#include "treepatch/Value.hpp"

#include <cstddef>

namespace treepatch {

/// Maximum number of segments a single traversal will walk
constexpr std::size_t MAX_TRAVERSAL_DEPTH = 100;

enum class TraverseMode { Read, Add, Replace, Insert, Remove };

struct TraverseOptions {
    TraverseMode mode = TraverseMode::Read;
    Value value;                ///< written by Add/Replace/Insert
    Value fill;                 ///< sequence padding, must be canonical
    bool silent = false;
};

/**
 * @brief Walk the document along path, applying the requested mode
 *
 * @param document Root node, mutated in place for writing modes
 * @param path Parsed path
 * @param options Mode, value, fill and silent flag
 * @return 200 with the reached node as payload when the walk ends on a node;
 *         200 without payload for no-op and early-exit successes;
 *         404/422 on failure
 *
 * Examples:
 * ```cpp
 * Value doc = Value::object();
 * TraverseOptions add{TraverseMode::Add, 7};
 * traverse(doc, parse_path("/a:2/b"), add);
 * // doc == {"a": [null, null, {"b": 7}]}
 * ```
 */
Result traverse(Value& document, const Path& path, const TraverseOptions& options);

/**
 * @brief Read-only traversal
 * @return 200 with a copy of the node as payload, 404 or 422 otherwise
 */
Result read_path(const Value& document, const Path& path);

} // namespace treepatch

#endif // TREEPATCH_TRAVERSE_HPP
