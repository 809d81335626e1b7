#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace cvpipe {

using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;

// Error types
enum class ErrorCode {
    Success = 0,
    FileNotFound,
    PermissionDenied,
    InvalidArgument,
    InvalidData,
    NotSupported,
    ResourceExhausted,
    Timeout,
    OperationCancelled,
    ExtractionFailed,
    ParsingFailed,
    EnhancementFailed,
    MatchingFailed,
    ValidationError,
    InternalError,
    Unknown
};

// Convert error code to string
constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::PermissionDenied:
            return "Permission denied";
        case ErrorCode::InvalidArgument:
            return "Invalid argument";
        case ErrorCode::InvalidData:
            return "Invalid data";
        case ErrorCode::NotSupported:
            return "Not supported";
        case ErrorCode::ResourceExhausted:
            return "Resource exhausted";
        case ErrorCode::Timeout:
            return "Operation timed out";
        case ErrorCode::OperationCancelled:
            return "Operation cancelled";
        case ErrorCode::ExtractionFailed:
            return "Extraction failed";
        case ErrorCode::ParsingFailed:
            return "Parsing failed";
        case ErrorCode::EnhancementFailed:
            return "Enhancement failed";
        case ErrorCode::MatchingFailed:
            return "Matching failed";
        case ErrorCode::ValidationError:
            return "Validation error";
        case ErrorCode::InternalError:
            return "Internal error";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

// Error struct for detailed error information
struct Error {
    ErrorCode code;
    std::string message;

    Error() : code(ErrorCode::Success), message("") {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}

    bool operator==(ErrorCode c) const { return code == c; }
    bool operator!=(ErrorCode c) const { return code != c; }

    friend bool operator==(ErrorCode c, const Error& error) { return error.code == c; }
    friend bool operator!=(ErrorCode c, const Error& error) { return error.code != c; }
};

// Value-or-error return type used across stage boundaries
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return std::holds_alternative<T>(data_); }

    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(data_);
    }

    T&& value() && {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::get<T>(std::move(data_));
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return std::get<Error>(data_);
    }

private:
    std::variant<T, Error> data_;
};

// Specialization for void
template <> class Result<void> {
public:
    Result() : error_() {}
    Result(ErrorCode error) : error_(Error{error}) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }

    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value()) {
            throw std::runtime_error("Result contains error");
        }
    }

    const Error& error() const {
        if (has_value()) {
            throw std::runtime_error("Result contains value");
        }
        return error_;
    }

private:
    Error error_{ErrorCode::Success, ""};
};

/// Clamp a score into the closed unit interval.
inline double clampScore(double v) noexcept {
    if (!(v > 0.0)) {
        return 0.0;
    }
    return v > 1.0 ? 1.0 : v;
}

} // namespace cvpipe

// fmt support for ErrorCode (for spdlog)
template <> struct fmt::formatter<cvpipe::ErrorCode> {
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(cvpipe::ErrorCode error, FormatContext& ctx) const {
        return fmt::format_to(ctx.out(), "{}", cvpipe::errorToString(error));
    }
};
