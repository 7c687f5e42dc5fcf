/**
 * @file Engine.hpp
 * @brief Applies an ordered list of patches to a document
 *
 * For every patch, in order:
 * 1. preflight   - structure, restrictions, validators, existence, and a
 *                  recursive check of every value nested in the written value
 * 2. pre-hooks   - patches returned by matching pre-patch hooks are run
 * 3. the patch itself
 * 4. post-hooks  - patches returned by matching post-patch hooks are run
 *
 * The first failure stops the batch and is returned. Patches applied before
 * the failure stay applied unless EngineOptions::atomic is set.
 *
 * Example:
 * ```cpp
 * Engine engine(Value::parse(R"({"a": {"b": [1, 2, 3]}})"),
 *               Value::parse(R"([{"op": "remove", "path": "/a/b:-"}])"));
 * engine.restrict("^/locked", "wd");
 * Result r = engine.process();   // r.code() == 204
 * ```
 */

#ifndef TREEPATCH_ENGINE_HPP
#define TREEPATCH_ENGINE_HPP

#include "treepatch/Patch.hpp"
#include "treepatch/Result.hpp"
#include "treepatch/Rules.hpp"
#include "treepatch/Value.hpp"

#include <iosfwd>
#include <memory>
#include <string>
#include <vector>

namespace treepatch {

struct EngineOptions {
    /// Restore the original document when any patch of the batch fails
    bool atomic = false;

    /// Receives one line per executed patch when set
    std::ostream* trace = nullptr;
};

class Engine {
public:
    Engine() = default;
    Engine(Value document, Value patches, EngineOptions options = {});
    Engine(Value document, const std::vector<Patch>& patches, EngineOptions options = {});

    /**
     * @brief Build an engine from serialized JSON text
     * @throws DocumentParseError if either text is not valid JSON
     */
    static Engine from_text(const std::string& document, const std::string& patches,
                            EngineOptions options = {});

    // Registration -----------------------------------------------------------

    /**
     * @brief Forbid operations on matching paths
     * @param pattern Regular expression searched in path text
     * @param disallowed Any combination of r (read), w (write), d (delete)
     * @throws RegistrationError on a bad pattern or letter
     */
    void restrict(const std::string& pattern, const std::string& disallowed);

    /// @throws RegistrationError on a bad pattern or an empty callable
    void validate(const std::string& pattern, ValidatorFn fn,
                  Value options = Value::object());

    /// Validator looked up by name in the registry when it runs
    void validate_named(const std::string& pattern, const std::string& name,
                        Value options = Value::object());

    void prepatch(const std::string& pattern, HookFn fn, Value options = Value::object());
    void prepatch_named(const std::string& pattern, const std::string& name,
                        Value options = Value::object());

    void postpatch(const std::string& pattern, HookFn fn, Value options = Value::object());
    void postpatch_named(const std::string& pattern, const std::string& name,
                         Value options = Value::object());

    void set_registry(std::shared_ptr<const CallbackRegistry> registry) {
        registry_ = std::move(registry);
    }

    // Processing -------------------------------------------------------------

    /**
     * @brief Run every patch in order
     * @return 204 when all patches applied; the first failure otherwise
     */
    Result process();

    /**
     * @brief Check a patch against the current document without applying it
     * @param patch Patch to check
     * @param label Position label used in messages ("3", "3/key", "3:0")
     */
    Result preflight(const Patch& patch, const std::string& label = "0") const;

    /**
     * @brief Apply a single patch, with no preflight and no hooks
     */
    Result run_patch(const Patch& patch, const std::string& label = "0");

    // Accessors --------------------------------------------------------------

    const Value& document() const noexcept { return document_; }
    void set_document(Value document) { document_ = std::move(document); }

    const Value& patches() const noexcept { return patches_; }
    void set_patches(Value patches) { patches_ = std::move(patches); }

    const EngineOptions& options() const noexcept { return options_; }
    void set_options(EngineOptions options) { options_ = options; }

private:
    Result process_all();
    Result run_hooks(const std::vector<HookRule>& hooks, const Patch& patch,
                     const std::string& label, const std::string& stage);
    Result write_value(const Patch& patch, const std::string& prefix, Value value);

    Result check_restrictions(const Patch& patch, const std::string& prefix) const;
    Result run_validators(const Patch& patch, const std::string& prefix,
                          const Value* written) const;

    const ValidatorFn* resolve(const ValidatorRule& rule) const;
    const HookFn* resolve(const HookRule& rule) const;

    void trace(const std::string& label, const Patch& patch, const Result& result) const;

    Value document_ = Value::object();
    Value patches_ = Value::array();
    EngineOptions options_;

    std::vector<Restriction> restrictions_;
    std::vector<ValidatorRule> validators_;
    std::vector<HookRule> prepatches_;
    std::vector<HookRule> postpatches_;
    std::shared_ptr<const CallbackRegistry> registry_;
};

} // namespace treepatch

#endif // TREEPATCH_ENGINE_HPP
