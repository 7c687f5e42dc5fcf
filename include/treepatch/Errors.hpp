/**
 * @file Errors.hpp
 * @brief Exception types for treepatch errors raised outside the patch pipeline
 *
 * The patch pipeline itself reports through Result envelopes. Exceptions are
 * used for file loading, rule registration and programmatic path parsing:
 * - PatchError: Base class
 * - FileNotFoundError: Document, patch or rules file not found
 * - DocumentParseError: JSON/TOML syntax errors
 * - PathError: Malformed path text
 * - RegistrationError: Bad restriction, validator or hook registration
 */

#ifndef TREEPATCH_ERRORS_HPP
#define TREEPATCH_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace treepatch {

/**
 * @brief Base class for all treepatch exceptions
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Input file not found
 */
class FileNotFoundError : public PatchError {
public:
    /**
     * @brief Construct with file path
     * @param path Path to the missing file
     */
    explicit FileNotFoundError(std::string path)
        : PatchError("File not found: " + path)
        , path_(std::move(path))
    {}

    /**
     * @brief Get the file path that was not found
     */
    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Structured-data parse error (JSON/TOML syntax)
 */
class DocumentParseError : public PatchError {
public:
    /**
     * @brief Construct with origin and error details
     * @param origin File path, or a label for in-memory text
     * @param details Detailed error message from parser
     */
    DocumentParseError(std::string origin, std::string details)
        : PatchError("Parse error in '" + origin + "': " + details)
        , origin_(std::move(origin))
        , details_(std::move(details))
    {}

    const std::string& origin() const noexcept {
        return origin_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string origin_;
    std::string details_;
};

/**
 * @brief Malformed path text
 */
class PathError : public PatchError {
public:
    /**
     * @brief Construct with the offending path and the reason
     * @param path Raw path text
     * @param reason What is wrong with it
     */
    PathError(std::string path, const std::string& reason)
        : PatchError("Invalid path [" + path + "]: " + reason)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Invalid restriction, validator or hook registration
 *
 * Raised for malformed patterns, unknown permission letters and empty
 * callbacks.
 */
class RegistrationError : public PatchError {
public:
    using PatchError::PatchError;
};

} // namespace treepatch

#endif // TREEPATCH_ERRORS_HPP
