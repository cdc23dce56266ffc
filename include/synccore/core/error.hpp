#pragma once

#include <string>
#include <utility>

namespace synccore {

/**
 * @brief Failure categories reported by the library
 */
enum class ErrorCode {
    DataFormat,     ///< Malformed or truncated binary payload
    Serialization,  ///< Structured payload / step data could not be encoded or decoded
    Storage,        ///< Transaction store read or write failed
    NotFound,       ///< Requested transaction does not exist
    InvalidState    ///< Lifecycle call not allowed in the current state
};

struct Error {
    ErrorCode code = ErrorCode::Storage;
    std::string message;

    Error() = default;
    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    std::string to_string() const;
};

const char* error_code_name(ErrorCode code) noexcept;

inline bool operator==(const Error& lhs, const Error& rhs) {
    return lhs.code == rhs.code && lhs.message == rhs.message;
}

} // namespace synccore
