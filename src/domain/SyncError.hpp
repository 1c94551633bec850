/**
 * @file SyncError.hpp
 * @brief Error taxonomy and the Result type returned across package boundaries.
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace bundlesync::domain {

/**
 * @enum ErrorKind
 * @brief Categorization of failures raised while processing a package or setting up a run.
 */
enum class ErrorKind {
    LinkExtraction,      ///< No identifier could be extracted from a link.
    NotFound,            ///< Remote host reported the resource as missing.
    Transport,           ///< Any other network or transfer failure.
    SizeLimitExceeded,   ///< Payload larger than the configured cap. Nothing written.
    VerificationWarning, ///< Artifact at or below the minimum size.
    ConfigParse,         ///< Ledger file unreadable; defaults used instead.
    MissingTool,         ///< External utility not installed.
    Precondition,        ///< Run-level precondition unmet (e.g. not authenticated).
    WriteFailed,         ///< Local filesystem write failed.
    ExportFailed,        ///< Editor export produced no artifact.
    UploadFailed,        ///< Upload utility failed or returned no identifier.
    Timeout              ///< External process exceeded its time budget.
};

inline std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::LinkExtraction: return "LinkExtractionError";
        case ErrorKind::NotFound: return "NotFoundError";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::SizeLimitExceeded: return "SizeLimitExceeded";
        case ErrorKind::VerificationWarning: return "VerificationWarning";
        case ErrorKind::ConfigParse: return "ConfigParseError";
        case ErrorKind::MissingTool: return "MissingToolError";
        case ErrorKind::Precondition: return "PreconditionError";
        case ErrorKind::WriteFailed: return "WriteFailed";
        case ErrorKind::ExportFailed: return "ExportFailed";
        case ErrorKind::UploadFailed: return "UploadFailed";
        case ErrorKind::Timeout: return "Timeout";
    }
    return "UnknownError";
}

/**
 * @struct SyncError
 * @brief A categorized failure with a human-readable reason.
 */
struct SyncError {
    ErrorKind kind;
    std::string message;

    std::string describe() const {
        return ErrorKindToString(kind) + ": " + message;
    }
};

/**
 * @class Result
 * @brief Either a value or a SyncError. Used instead of exceptions for per-package work.
 */
template <typename T>
class Result {
public:
    static Result Ok(T value) {
        Result r;
        r.m_value = std::move(value);
        return r;
    }

    static Result Fail(ErrorKind kind, std::string message) {
        Result r;
        r.m_error = SyncError{kind, std::move(message)};
        return r;
    }

    static Result Fail(SyncError error) {
        Result r;
        r.m_error = std::move(error);
        return r;
    }

    bool ok() const { return m_value.has_value(); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return *m_value; }
    T& value() { return *m_value; }
    const SyncError& error() const { return *m_error; }

private:
    Result() = default;

    std::optional<T> m_value;
    std::optional<SyncError> m_error;
};

} // namespace bundlesync::domain
