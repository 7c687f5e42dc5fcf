/**
 * @file Rules.cpp
 * @brief Rule and registry implementation
 */

#include "treepatch/Rules.hpp"
#include "treepatch/Errors.hpp"

namespace treepatch {

unsigned parse_permissions(const std::string& letters) {
    unsigned bits = 0;
    for (char c : letters) {
        switch (c) {
            case 'r': bits |= PERMISSION_READ; break;
            case 'w': bits |= PERMISSION_WRITE; break;
            case 'd': bits |= PERMISSION_DELETE; break;
            default:
                throw RegistrationError(std::string("Unknown permission letter '") +
                                        c + "' in \"" + letters + "\"");
        }
    }
    return bits;
}

PathPattern::PathPattern(const std::string& source)
    : source_(source)
{
    try {
        regex_ = std::regex(source, std::regex_constants::ECMAScript);
    } catch (const std::regex_error& ex) {
        throw RegistrationError("Invalid path pattern '" + source + "': " + ex.what());
    }
}

bool PathPattern::matches(const std::string& path) const {
    return std::regex_search(path, regex_);
}

void CallbackRegistry::add_validator(const std::string& name, ValidatorFn fn) {
    if (name.empty()) throw RegistrationError("Validator name must not be empty");
    if (!fn) throw RegistrationError("Validator '" + name + "' has no callable");
    validators_[name] = std::move(fn);
}

void CallbackRegistry::add_hook(const std::string& name, HookFn fn) {
    if (name.empty()) throw RegistrationError("Hook name must not be empty");
    if (!fn) throw RegistrationError("Hook '" + name + "' has no callable");
    hooks_[name] = std::move(fn);
}

const ValidatorFn* CallbackRegistry::find_validator(const std::string& name) const {
    auto it = validators_.find(name);
    return it == validators_.end() ? nullptr : &it->second;
}

const HookFn* CallbackRegistry::find_hook(const std::string& name) const {
    auto it = hooks_.find(name);
    return it == hooks_.end() ? nullptr : &it->second;
}

std::vector<std::string> CallbackRegistry::validator_names() const {
    std::vector<std::string> names;
    for (const auto& entry : validators_) {
        names.push_back(entry.first);
    }
    return names;
}

std::vector<std::string> CallbackRegistry::hook_names() const {
    std::vector<std::string> names;
    for (const auto& entry : hooks_) {
        names.push_back(entry.first);
    }
    return names;
}

} // namespace treepatch
