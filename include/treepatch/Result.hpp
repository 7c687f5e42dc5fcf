/**
 * @file Result.hpp
 * @brief Result envelope returned by every stage of the patch pipeline
 *
 * A Result carries a status code, a message (failures only) and an
 * optional payload (successes only). Codes below 400 are successes.
 */

#ifndef TREEPATCH_RESULT_HPP
#define TREEPATCH_RESULT_HPP

#include "treepatch/Value.hpp"
#include <optional>
#include <string>

namespace treepatch {

/**
 * @brief Status codes used by the engine
 */
enum class Status : int {
    Ok = 200,
    NoContent = 204,
    BadRequest = 400,
    Forbidden = 403,
    NotFound = 404,
    Unprocessable = 422,
    FailedPrecondition = 424,
    InternalError = 500
};

/**
 * @brief Short name for a status code ("ok", "not found", ...)
 */
std::string status_name(int code);

class Result {
public:
    Result() = default;

    /// Success carrying a payload (200)
    static Result success(Value payload);

    /// Success without payload (200)
    static Result success();

    /// Batch completion (204)
    static Result done();

    static Result failure(Status status, std::string message);
    static Result failure(int code, std::string message);

    int code() const noexcept { return code_; }
    bool ok() const noexcept { return code_ < 400; }
    bool failed() const noexcept { return code_ >= 400; }

    const std::string& message() const noexcept { return message_; }

    bool has_payload() const noexcept { return payload_.has_value(); }
    const Value& payload() const;
    Value take_payload();

    /**
     * @brief Copy of this result whose message starts with prefix
     *
     * Successes are returned unchanged.
     */
    Result with_prefix(const std::string& prefix) const;

private:
    int code_ = static_cast<int>(Status::Ok);
    std::string message_;
    std::optional<Value> payload_;
};

/**
 * @brief Serialize a result envelope
 *
 * Failures become `{"code": n, "message": "..."}`, successes
 * `{"code": n, "results": payload}` (no `results` key when there is no
 * payload).
 */
Value to_json(const Result& result);

} // namespace treepatch

#endif // TREEPATCH_RESULT_HPP
