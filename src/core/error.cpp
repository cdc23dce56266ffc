#include "synccore/core/error.hpp"

namespace synccore {

const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::DataFormat: return "DataFormat";
        case ErrorCode::Serialization: return "SerializationError";
        case ErrorCode::Storage: return "StorageError";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

std::string Error::to_string() const {
    return std::string(error_code_name(code)) + ": " + message;
}

} // namespace synccore
