/**
 * @file Engine.cpp
 * @brief Patch engine implementation
 */

#include "treepatch/Engine.hpp"
#include "treepatch/Errors.hpp"
#include "treepatch/Loader.hpp"
#include "treepatch/Path.hpp"
#include "treepatch/Traverse.hpp"

#include <ostream>

namespace treepatch {

namespace {

std::string prefix_for(const std::string& label) {
    return "Patch " + label + ": ";
}

bool needs_value(Op op) {
    return op == Op::Add || op == Op::Replace || op == Op::Insert || op == Op::Test;
}

bool carries_value(Op op) {
    return op == Op::Add || op == Op::Replace || op == Op::Insert;
}

TraverseMode mode_for(Op op) {
    switch (op) {
        case Op::Replace: return TraverseMode::Replace;
        case Op::Insert: return TraverseMode::Insert;
        case Op::Remove: return TraverseMode::Remove;
        default: return TraverseMode::Add;
    }
}

} // anonymous namespace

Engine::Engine(Value document, Value patches, EngineOptions options)
    : document_(std::move(document))
    , patches_(std::move(patches))
    , options_(options)
{}

Engine::Engine(Value document, const std::vector<Patch>& patches, EngineOptions options)
    : document_(std::move(document))
    , patches_(to_json(patches))
    , options_(options)
{}

Engine Engine::from_text(const std::string& document, const std::string& patches,
                         EngineOptions options) {
    return Engine(parse_json_text(document, "document"), parse_json_text(patches, "patches"),
                  options);
}

// ============================================================================
// Registration
// ============================================================================

void Engine::restrict(const std::string& pattern, const std::string& disallowed) {
    restrictions_.push_back(Restriction{PathPattern(pattern), parse_permissions(disallowed)});
}

void Engine::validate(const std::string& pattern, ValidatorFn fn, Value options) {
    if (!fn) {
        throw RegistrationError("Validator for '" + pattern + "' has no callable");
    }
    validators_.push_back(ValidatorRule{PathPattern(pattern), std::move(fn), "", std::move(options)});
}

void Engine::validate_named(const std::string& pattern, const std::string& name,
                            Value options) {
    if (name.empty()) {
        throw RegistrationError("Validator for '" + pattern + "' has no name");
    }
    validators_.push_back(ValidatorRule{PathPattern(pattern), nullptr, name, std::move(options)});
}

void Engine::prepatch(const std::string& pattern, HookFn fn, Value options) {
    if (!fn) {
        throw RegistrationError("Pre-patch hook for '" + pattern + "' has no callable");
    }
    prepatches_.push_back(HookRule{PathPattern(pattern), std::move(fn), "", std::move(options)});
}

void Engine::prepatch_named(const std::string& pattern, const std::string& name,
                            Value options) {
    if (name.empty()) {
        throw RegistrationError("Pre-patch hook for '" + pattern + "' has no name");
    }
    prepatches_.push_back(HookRule{PathPattern(pattern), nullptr, name, std::move(options)});
}

void Engine::postpatch(const std::string& pattern, HookFn fn, Value options) {
    if (!fn) {
        throw RegistrationError("Post-patch hook for '" + pattern + "' has no callable");
    }
    postpatches_.push_back(HookRule{PathPattern(pattern), std::move(fn), "", std::move(options)});
}

void Engine::postpatch_named(const std::string& pattern, const std::string& name,
                             Value options) {
    if (name.empty()) {
        throw RegistrationError("Post-patch hook for '" + pattern + "' has no name");
    }
    postpatches_.push_back(HookRule{PathPattern(pattern), nullptr, name, std::move(options)});
}

const ValidatorFn* Engine::resolve(const ValidatorRule& rule) const {
    if (rule.fn) return &rule.fn;
    if (!registry_) return nullptr;
    return registry_->find_validator(rule.name);
}

const HookFn* Engine::resolve(const HookRule& rule) const {
    if (rule.fn) return &rule.fn;
    if (!registry_) return nullptr;
    return registry_->find_hook(rule.name);
}

// ============================================================================
// Processing
// ============================================================================

Result Engine::process() {
    if (!options_.atomic) {
        return process_all();
    }

    Value original = document_;
    Result result = process_all();
    if (result.failed()) {
        document_ = std::move(original);
    }
    return result;
}

Result Engine::process_all() {
    if (!patches_.is_array()) {
        return Result::failure(Status::BadRequest, "Malformed patches array");
    }
    if (patches_.empty()) {
        return Result::failure(Status::BadRequest, "No patches found");
    }

    for (std::size_t index = 0; index < patches_.size(); ++index) {
        const std::string label = std::to_string(index);

        Patch patch;
        Result result = decode_patch(patches_[index], patch);
        if (result.failed()) {
            return result.with_prefix(prefix_for(label));
        }

        result = preflight(patch, label);
        if (result.failed()) {
            return result;
        }

        result = run_hooks(prepatches_, patch, label, "pre-patch");
        if (result.failed()) {
            return result;
        }

        result = run_patch(patch, label);
        trace(label, patch, result);
        if (result.failed()) {
            return result;
        }

        result = run_hooks(postpatches_, patch, label, "post-patch");
        if (result.failed()) {
            return result;
        }
    }

    return Result::done();
}

Result Engine::run_hooks(const std::vector<HookRule>& hooks, const Patch& patch,
                         const std::string& label, const std::string& stage) {
    const std::string prefix = prefix_for(label);

    for (const auto& hook : hooks) {
        if (!hook.pattern.matches(patch.path)) continue;

        const HookFn* fn = resolve(hook);
        if (fn == nullptr) {
            return Result::failure(Status::InternalError,
                                   prefix + "Server error " + stage +
                                   " (unknown hook '" + hook.name + "')");
        }

        std::vector<Patch> extra;
        try {
            extra = (*fn)(patch, document_, hook.options);
        } catch (const std::exception& ex) {
            return Result::failure(Status::InternalError,
                                   prefix + "Server error " + stage + ": " + ex.what());
        }

        for (const auto& injected : extra) {
            Result result = run_patch(injected, label);
            trace(label + " (" + stage + ")", injected, result);
            if (result.failed()) {
                return result;
            }
        }
    }

    return Result::success();
}

// ============================================================================
// Preflight
// ============================================================================

Result Engine::check_restrictions(const Patch& patch, const std::string& prefix) const {
    for (const auto& r : restrictions_) {
        if (r.pattern.matches(patch.path)) {
            if (patch.writes() && r.forbids(PERMISSION_WRITE)) {
                return Result::failure(Status::Forbidden,
                    prefix + "Writing to [" + patch.path + "] not allowed");
            }
            if (patch.op == Op::Remove && r.forbids(PERMISSION_DELETE)) {
                return Result::failure(Status::Forbidden,
                    prefix + "Removing [" + patch.path + "] not allowed");
            }
            if (patch.op == Op::Test && r.forbids(PERMISSION_READ)) {
                return Result::failure(Status::Forbidden,
                    prefix + "Reading [" + patch.path + "] not allowed");
            }
        }

        if (!patch.from || (patch.op != Op::Copy && patch.op != Op::Move)) continue;
        if (!r.pattern.matches(*patch.from)) continue;

        // a move deletes its source, so it needs both delete and read
        if (patch.op == Op::Move && r.forbids(PERMISSION_DELETE)) {
            return Result::failure(Status::Forbidden,
                prefix + "Removing [" + *patch.from + "] not allowed");
        }
        if (r.forbids(PERMISSION_READ)) {
            return Result::failure(Status::Forbidden,
                prefix + "Reading [" + *patch.from + "] not allowed");
        }
    }
    return Result::success();
}

Result Engine::run_validators(const Patch& patch, const std::string& prefix,
                              const Value* written) const {
    for (const auto& rule : validators_) {
        if (!rule.pattern.matches(patch.path)) continue;

        const ValidatorFn* fn = resolve(rule);
        if (fn == nullptr) {
            return Result::failure(Status::InternalError,
                prefix + "[" + patch.path + "] unknown validator '" + rule.name + "'");
        }

        // nothing is written by remove and test
        if (written == nullptr) continue;

        Value verdict;
        try {
            verdict = (*fn)(*written, rule.options);
        } catch (const std::exception& ex) {
            return Result::failure(Status::InternalError,
                prefix + "[" + patch.path + "] validator raised: " + ex.what());
        }

        if (verdict.is_boolean() && verdict.get<bool>()) continue;

        if (verdict.is_string()) {
            return Result::failure(Status::Forbidden,
                prefix + "[" + patch.path + "] failed validation: " +
                verdict.get<std::string>());
        }

        return Result::failure(Status::Unprocessable,
                               prefix + "[" + patch.path + "] validator error");
    }
    return Result::success();
}

Result Engine::preflight(const Patch& patch, const std::string& label) const {
    const std::string prefix = prefix_for(label);

    // structure
    Path path;
    if (Result r = Path::parse(patch.path, path); r.failed()) {
        return Result::failure(Status::BadRequest,
            prefix + "Invalid path [" + patch.path + "]: " + r.message());
    }

    Path from;
    if (patch.op == Op::Copy || patch.op == Op::Move) {
        if (!patch.from) {
            return Result::failure(Status::BadRequest,
                                   prefix + "Missing required property [from]");
        }
        if (Result r = Path::parse(*patch.from, from); r.failed()) {
            return Result::failure(Status::BadRequest,
                prefix + "Invalid from [" + *patch.from + "]: " + r.message());
        }
    } else if (needs_value(patch.op) && !patch.value) {
        return Result::failure(Status::BadRequest,
                               prefix + "Missing required property [value]");
    }

    Result result = check_restrictions(patch, prefix);
    if (result.failed()) return result;

    // the value that will land at patch.path
    Value source;
    const Value* written = nullptr;
    if (carries_value(patch.op)) {
        written = &*patch.value;
    } else if (patch.op == Op::Copy || patch.op == Op::Move) {
        Result read = read_path(document_, from);
        if (read.failed()) {
            return read.with_prefix(prefix + "[" + *patch.from + "] ");
        }
        source = read.take_payload();
        written = &source;
    }

    result = run_validators(patch, prefix, written);
    if (result.failed()) return result;

    if ((patch.op == Op::Replace && !patch.silent) || patch.op == Op::Test) {
        Result target = read_path(document_, path);
        if (target.failed()) {
            return target.with_prefix(prefix + "[" + patch.path + "] ");
        }
    }

    // nested values are checked as individual adds so that a composite
    // write cannot smuggle content past restrictions or validators
    if (written == nullptr || !is_container(*written)) {
        return Result::success();
    }

    const char separator = written->is_array() ? INDEX_SEPARATOR : KEY_SEPARATOR;
    if (written->is_array()) {
        for (std::size_t i = 0; i < written->size(); ++i) {
            const std::string child = std::to_string(i);
            Patch sub = Patch::add(join_child(patch.path, separator, child), (*written)[i]);
            result = preflight(sub, label + separator + child);
            if (result.failed()) return result;
        }
    } else {
        for (auto it = written->begin(); it != written->end(); ++it) {
            Patch sub = Patch::add(join_child(patch.path, separator, it.key()), it.value());
            result = preflight(sub, label + separator + escape_key(it.key()));
            if (result.failed()) return result;
        }
    }

    return Result::success();
}

// ============================================================================
// Execution
// ============================================================================

Result Engine::write_value(const Patch& patch, const std::string& prefix, Value value) {
    Path path;
    if (Result r = Path::parse(patch.path, path); r.failed()) {
        return Result::failure(Status::BadRequest,
            prefix + "Invalid path [" + patch.path + "]: " + r.message());
    }

    TraverseOptions opts;
    opts.mode = mode_for(patch.op == Op::Copy || patch.op == Op::Move ? patch.mode : patch.op);
    opts.value = std::move(value);
    opts.fill = patch.fill.value_or(Value());
    opts.silent = patch.silent;

    Result result = traverse(document_, path, opts);
    if (result.failed()) {
        return result.with_prefix(prefix + "[" + patch.path + "] ");
    }
    return Result::success();
}

Result Engine::run_patch(const Patch& patch, const std::string& label) {
    const std::string prefix = prefix_for(label);

    switch (patch.op) {
        case Op::Add:
        case Op::Replace:
        case Op::Insert:
            if (!patch.value) {
                return Result::failure(Status::BadRequest,
                                       prefix + "Missing required property [value]");
            }
            return write_value(patch, prefix, *patch.value);

        case Op::Remove:
            return write_value(patch, prefix, Value());

        case Op::Copy:
        case Op::Move: {
            if (!patch.from) {
                return Result::failure(Status::BadRequest,
                                       prefix + "Missing required property [from]");
            }
            Path from;
            if (Result r = Path::parse(*patch.from, from); r.failed()) {
                return Result::failure(Status::BadRequest,
                    prefix + "Invalid from [" + *patch.from + "]: " + r.message());
            }

            Result retrieved = read_path(document_, from);
            if (retrieved.failed()) {
                return retrieved.with_prefix(prefix + "[" + *patch.from + "] ");
            }

            if (patch.op == Op::Move) {
                TraverseOptions remove;
                remove.mode = TraverseMode::Remove;
                Result removed = traverse(document_, from, remove);
                if (removed.failed()) {
                    return removed.with_prefix(prefix + "[" + *patch.from + "] ");
                }
            }

            return write_value(patch, prefix, retrieved.take_payload());
        }

        case Op::Test: {
            if (!patch.value) {
                return Result::failure(Status::BadRequest,
                                       prefix + "Missing required property [value]");
            }
            Path path;
            if (Result r = Path::parse(patch.path, path); r.failed()) {
                return Result::failure(Status::BadRequest,
                    prefix + "Invalid path [" + patch.path + "]: " + r.message());
            }

            Result retrieved = read_path(document_, path);
            if (retrieved.failed()) {
                return retrieved.with_prefix(prefix + "[" + patch.path + "] ");
            }

            if (patch.strict) {
                if (!strict_equal(retrieved.payload(), *patch.value)) {
                    return Result::failure(Status::FailedPrecondition,
                                           prefix + "failed test [strict]");
                }
            } else if (!loose_equal(retrieved.payload(), *patch.value)) {
                return Result::failure(Status::FailedPrecondition,
                                       prefix + "failed test [non-strict]");
            }
            return Result::success();
        }
    }

    return Result::failure(Status::Unprocessable, prefix + "Unsupported operation");
}

void Engine::trace(const std::string& label, const Patch& patch, const Result& result) const {
    if (options_.trace == nullptr) return;
    *options_.trace << "patch " << label << " " << op_name(patch.op)
                    << " " << patch.path;
    if (patch.from) *options_.trace << " from " << *patch.from;
    *options_.trace << " -> " << result.code();
    if (result.failed()) *options_.trace << " " << result.message();
    *options_.trace << "\n";
}

} // namespace treepatch
