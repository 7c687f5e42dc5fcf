/**
 * @file Patch.cpp
 * @brief Patch model implementation
 */

#include "treepatch/Patch.hpp"

namespace treepatch {

std::string op_name(Op op) {
    switch (op) {
        case Op::Add: return "add";
        case Op::Replace: return "replace";
        case Op::Insert: return "insert";
        case Op::Remove: return "remove";
        case Op::Copy: return "copy";
        case Op::Move: return "move";
        case Op::Test: return "test";
    }
    return "unknown";
}

std::optional<Op> parse_op(const std::string& name) {
    if (name == "add") return Op::Add;
    if (name == "replace") return Op::Replace;
    if (name == "insert") return Op::Insert;
    if (name == "remove") return Op::Remove;
    if (name == "copy") return Op::Copy;
    if (name == "move") return Op::Move;
    if (name == "test") return Op::Test;
    return std::nullopt;
}

Patch Patch::add(std::string path, Value value) {
    Patch p;
    p.op = Op::Add;
    p.path = std::move(path);
    p.value = std::move(value);
    return p;
}

Patch Patch::replace(std::string path, Value value) {
    Patch p = add(std::move(path), std::move(value));
    p.op = Op::Replace;
    return p;
}

Patch Patch::insert(std::string path, Value value) {
    Patch p = add(std::move(path), std::move(value));
    p.op = Op::Insert;
    return p;
}

Patch Patch::remove(std::string path) {
    Patch p;
    p.op = Op::Remove;
    p.path = std::move(path);
    return p;
}

Patch Patch::copy(std::string from, std::string path) {
    Patch p;
    p.op = Op::Copy;
    p.from = std::move(from);
    p.path = std::move(path);
    return p;
}

Patch Patch::move(std::string from, std::string path) {
    Patch p = copy(std::move(from), std::move(path));
    p.op = Op::Move;
    return p;
}

Patch Patch::test(std::string path, Value value, bool strict) {
    Patch p = add(std::move(path), std::move(value));
    p.op = Op::Test;
    p.strict = strict;
    return p;
}

bool Patch::writes() const noexcept {
    switch (op) {
        case Op::Add:
        case Op::Replace:
        case Op::Insert:
        case Op::Copy:
        case Op::Move:
            return true;
        default:
            return false;
    }
}

namespace {

Result missing_property(const std::string& name) {
    return Result::failure(Status::BadRequest,
                           "Missing required property [" + name + "]");
}

Result wrong_type(const std::string& name, const std::string& expected) {
    return Result::failure(Status::BadRequest,
                           "Property [" + name + "] must be " + expected);
}

} // anonymous namespace

Result decode_patch(const Value& j, Patch& out) {
    if (!j.is_object()) {
        return Result::failure(Status::BadRequest, "Malformed patch object");
    }

    auto op_it = j.find("op");
    if (op_it == j.end()) return missing_property("op");
    if (!op_it->is_string()) return wrong_type("op", "a string");

    auto path_it = j.find("path");
    if (path_it == j.end()) return missing_property("path");
    if (!path_it->is_string()) return wrong_type("path", "a string");

    auto op = parse_op(op_it->get<std::string>());
    if (!op) {
        return Result::failure(Status::Unprocessable, "Unsupported operation");
    }

    Patch p;
    p.op = *op;
    p.path = path_it->get<std::string>();

    if (auto it = j.find("value"); it != j.end()) {
        p.value = *it;
    }

    if (auto it = j.find("from"); it != j.end()) {
        if (!it->is_string()) return wrong_type("from", "a string");
        p.from = it->get<std::string>();
    }

    if (auto it = j.find("fill"); it != j.end()) {
        p.fill = *it;
    }

    if (auto it = j.find("silent"); it != j.end()) {
        if (!it->is_boolean()) return wrong_type("silent", "a boolean");
        p.silent = it->get<bool>();
    }

    if (auto it = j.find("strict"); it != j.end()) {
        if (!it->is_boolean()) return wrong_type("strict", "a boolean");
        p.strict = it->get<bool>();
    }

    if (auto it = j.find("mode"); it != j.end()) {
        if (!it->is_string()) return wrong_type("mode", "a string");
        auto mode = parse_op(it->get<std::string>());
        if (!mode || (*mode != Op::Add && *mode != Op::Replace && *mode != Op::Insert)) {
            return Result::failure(Status::Unprocessable, "Unsupported mode");
        }
        p.mode = *mode;
    }

    out = std::move(p);
    return Result::success();
}

Value to_json(const Patch& patch) {
    Value j = Value::object();
    j["op"] = op_name(patch.op);
    j["path"] = patch.path;
    if (patch.value) j["value"] = *patch.value;
    if (patch.from) j["from"] = *patch.from;
    if (patch.fill) j["fill"] = *patch.fill;
    if (patch.silent) j["silent"] = true;
    if (patch.op == Op::Test && !patch.strict) j["strict"] = false;
    if ((patch.op == Op::Copy || patch.op == Op::Move) && patch.mode != Op::Add) {
        j["mode"] = op_name(patch.mode);
    }
    return j;
}

Value to_json(const std::vector<Patch>& patches) {
    Value arr = Value::array();
    for (const auto& p : patches) {
        arr.push_back(to_json(p));
    }
    return arr;
}

} // namespace treepatch
