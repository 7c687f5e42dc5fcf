/**
 * @file Rules.hpp
 * @brief Restrictions, validators and hooks attached to path patterns
 *
 * Every rule carries a regular expression searched in the raw path text of a
 * patch. Validators and hooks either hold their callable directly (captured
 * at registration) or name one that is looked up in a CallbackRegistry each
 * time it is needed.
 */

#ifndef TREEPATCH_RULES_HPP
#define TREEPATCH_RULES_HPP

#include "treepatch/Patch.hpp"
#include "treepatch/Value.hpp"

#include <functional>
#include <map>
#include <regex>
#include <string>
#include <vector>

namespace treepatch {

/**
 * @brief Permission bits a restriction may take away
 */
enum Permission : unsigned {
    PERMISSION_READ = 1u << 0,
    PERMISSION_WRITE = 1u << 1,
    PERMISSION_DELETE = 1u << 2
};

/**
 * @brief Parse permission letters: any combination of r, w, d
 *
 * @param letters e.g. "wd"
 * @return Bitwise OR of Permission values
 * @throws RegistrationError on any other letter
 */
unsigned parse_permissions(const std::string& letters);

/**
 * @brief Validator callback
 *
 * Receives the value about to be written and the rule's options. Must
 * return `true` to pass or a string describing the failure. Any other
 * return is treated as a misbehaving validator.
 */
using ValidatorFn = std::function<Value(const Value& value, const Value& options)>;

/**
 * @brief Pre/post patch hook callback
 *
 * Receives the patch being applied, the current document and the rule's
 * options. Returns patches to run immediately (may be empty).
 */
using HookFn = std::function<std::vector<Patch>(const Patch& patch,
                                                const Value& document,
                                                const Value& options)>;

/**
 * @brief Compiled path pattern
 */
class PathPattern {
public:
    /**
     * @brief Compile an ECMAScript regular expression
     * @throws RegistrationError if the expression is malformed
     */
    explicit PathPattern(const std::string& source);

    /// Unanchored search in the raw path text
    bool matches(const std::string& path) const;

    const std::string& source() const noexcept { return source_; }

private:
    std::string source_;
    std::regex regex_;
};

struct Restriction {
    PathPattern pattern;
    unsigned disallowed = 0;

    bool forbids(Permission permission) const noexcept {
        return (disallowed & permission) != 0;
    }
};

struct ValidatorRule {
    PathPattern pattern;
    ValidatorFn fn;        ///< set when registered with a callable
    std::string name;      ///< set when registered by name
    Value options;
};

struct HookRule {
    PathPattern pattern;
    HookFn fn;
    std::string name;
    Value options;
};

/**
 * @brief Named validators and hooks, looked up at call time
 */
class CallbackRegistry {
public:
    /// @throws RegistrationError if name is empty or fn is empty
    void add_validator(const std::string& name, ValidatorFn fn);

    /// @throws RegistrationError if name is empty or fn is empty
    void add_hook(const std::string& name, HookFn fn);

    /// @return nullptr if no validator has that name
    const ValidatorFn* find_validator(const std::string& name) const;

    /// @return nullptr if no hook has that name
    const HookFn* find_hook(const std::string& name) const;

    std::vector<std::string> validator_names() const;
    std::vector<std::string> hook_names() const;

private:
    std::map<std::string, ValidatorFn> validators_;
    std::map<std::string, HookFn> hooks_;
};

} // namespace treepatch

#endif // TREEPATCH_RULES_HPP
