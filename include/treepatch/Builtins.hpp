/**
 * @file Builtins.hpp
 * @brief Named validators and hooks available to rules files
 *
 * Validators (options in parentheses):
 * - type       ({"type": "string|number|integer|boolean|null|object|array"})
 * - pattern    ({"regex": "..."}) strings only, unanchored search
 * - range      ({"min": n, "max": n}) numbers only, both bounds optional
 * - max_length ({"max": n}) string length or container size
 * - enum       ({"values": [...]}) value must strictly equal one entry
 * - not_null
 *
 * Hooks:
 * - set        ({"path": "...", "value": v}) adds v at path
 * - remove     ({"path": "..."}) silently removes path
 * - increment  ({"path": "...", "by": n}) adds the number at path plus n
 *              (missing number counts as 0, n defaults to 1). Integer
 *              sums stay exact; a sum outside the int64/uint64 range, or a
 *              non-integral n, gives a float
 */

#ifndef TREEPATCH_BUILTINS_HPP
#define TREEPATCH_BUILTINS_HPP

#include "treepatch/Rules.hpp"
#include <memory>

namespace treepatch {

/// Install every builtin into registry
void register_builtins(CallbackRegistry& registry);

/// Fresh registry holding only the builtins
std::shared_ptr<CallbackRegistry> make_builtin_registry();

} // namespace treepatch

#endif // TREEPATCH_BUILTINS_HPP
