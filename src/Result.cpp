/**
 * @file Result.cpp
 * @brief Result envelope implementation
 */

#include "treepatch/Result.hpp"
#include <stdexcept>

namespace treepatch {

std::string status_name(int code) {
    switch (static_cast<Status>(code)) {
        case Status::Ok: return "ok";
        case Status::NoContent: return "no content";
        case Status::BadRequest: return "bad request";
        case Status::Forbidden: return "forbidden";
        case Status::NotFound: return "not found";
        case Status::Unprocessable: return "unprocessable";
        case Status::FailedPrecondition: return "failed precondition";
        case Status::InternalError: return "internal error";
    }
    return code < 400 ? "success" : "error";
}

Result Result::success(Value payload) {
    Result r;
    r.payload_ = std::move(payload);
    return r;
}

Result Result::success() {
    return Result();
}

Result Result::done() {
    Result r;
    r.code_ = static_cast<int>(Status::NoContent);
    return r;
}

Result Result::failure(Status status, std::string message) {
    return failure(static_cast<int>(status), std::move(message));
}

Result Result::failure(int code, std::string message) {
    Result r;
    r.code_ = code;
    r.message_ = std::move(message);
    return r;
}

const Value& Result::payload() const {
    if (!payload_) {
        throw std::logic_error("Result has no payload");
    }
    return *payload_;
}

Value Result::take_payload() {
    if (!payload_) {
        return Value();
    }
    Value out = std::move(*payload_);
    payload_.reset();
    return out;
}

Result Result::with_prefix(const std::string& prefix) const {
    if (ok()) return *this;
    Result r = *this;
    r.message_ = prefix + message_;
    return r;
}

Value to_json(const Result& result) {
    Value out = Value::object();
    out["code"] = result.code();
    if (result.failed()) {
        out["message"] = result.message();
    } else if (result.has_payload()) {
        out["results"] = result.payload();
    }
    return out;
}

} // namespace treepatch
