#pragma once

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace docent {

// Type aliases
using TimePoint = std::chrono::system_clock::time_point;
using Duration = std::chrono::milliseconds;
using ConversationId = int64_t;
using DocumentId = int64_t;
using ChunkId = int64_t;
using MessageId = int64_t;
using UserId = int64_t;
using Embedding = std::vector<float>;

// Error types
enum class ErrorCode {
    Success = 0,
    InvalidArgument,
    InvalidState,
    InvalidData,
    NotFound,
    NotInitialized,
    DatabaseError,
    TransactionFailed,
    NetworkError,
    Timeout,
    RateLimited,
    ResourceExhausted,
    OperationCancelled,
    IngestionError,
    RetrievalError,
    GenerationError,
    IsolationViolation,
    InternalError,
    Unknown
};

constexpr const char* errorToString(ErrorCode error) {
    switch (error) {
        case ErrorCode::Success: return "Success";
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InvalidState: return "Invalid state";
        case ErrorCode::InvalidData: return "Invalid data";
        case ErrorCode::NotFound: return "Not found";
        case ErrorCode::NotInitialized: return "Not initialized";
        case ErrorCode::DatabaseError: return "Database error";
        case ErrorCode::TransactionFailed: return "Transaction failed";
        case ErrorCode::NetworkError: return "Network error";
        case ErrorCode::Timeout: return "Operation timed out";
        case ErrorCode::RateLimited: return "Rate limited";
        case ErrorCode::ResourceExhausted: return "Resource exhausted";
        case ErrorCode::OperationCancelled: return "Operation cancelled";
        case ErrorCode::IngestionError: return "Ingestion error";
        case ErrorCode::RetrievalError: return "Retrieval error";
        case ErrorCode::GenerationError: return "Generation error";
        case ErrorCode::IsolationViolation: return "Isolation violation";
        case ErrorCode::InternalError: return "Internal error";
        case ErrorCode::Unknown: break;
    }
    return "Unknown error";
}

// Transient failures are the only ones worth retrying against a provider
constexpr bool isTransient(ErrorCode error) {
    return error == ErrorCode::NetworkError || error == ErrorCode::Timeout ||
           error == ErrorCode::RateLimited || error == ErrorCode::ResourceExhausted;
}

struct Error {
    ErrorCode code = ErrorCode::Success;
    std::string message;

    Error() = default;
    Error(ErrorCode c) : code(c), message(errorToString(c)) {}
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool operator==(ErrorCode c) const { return code == c; }
};

/// Thrown by Result::value() and Result::error() when the other alternative is held.
class BadResultAccess : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief A value of type T or an Error.
 *
 * Callers test the result before reading it; reading the wrong side throws BadResultAccess.
 */
template <typename T> class Result {
public:
    Result(T&& value) : data_(std::move(value)) {}
    Result(const T& value) : data_(value) {}
    Result(ErrorCode error) : data_(Error{error}) {}
    Result(Error error) : data_(std::move(error)) {}

    bool has_value() const noexcept { return data_.index() == 0; }
    explicit operator bool() const noexcept { return has_value(); }

    const T& value() const& { return requireValue(), std::get<0>(data_); }
    T& value() & { return requireValue(), std::get<0>(data_); }
    T&& value() && { return requireValue(), std::get<0>(std::move(data_)); }

    const Error& error() const {
        if (has_value())
            throw BadResultAccess("error() called on a successful Result");
        return std::get<1>(data_);
    }

private:
    void requireValue() const {
        if (!has_value())
            throw BadResultAccess("value() called on a failed Result: " +
                                  std::get<1>(data_).message);
    }

    std::variant<T, Error> data_;
};

template <> class Result<void> {
public:
    Result() = default;
    Result(ErrorCode error) : error_(error) {}
    Result(Error error) : error_(std::move(error)) {}

    bool has_value() const noexcept { return error_.code == ErrorCode::Success; }
    explicit operator bool() const noexcept { return has_value(); }

    void value() const {
        if (!has_value())
            throw BadResultAccess("value() called on a failed Result: " + error_.message);
    }

    const Error& error() const {
        if (has_value())
            throw BadResultAccess("error() called on a successful Result");
        return error_;
    }

private:
    Error error_;
};

} // namespace docent
