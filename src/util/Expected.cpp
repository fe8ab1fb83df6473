#include "util/Expected.hpp"

namespace rit {

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::None: return "ok";
        case ErrorCode::InvalidArgs: return "invalid arguments";
        case ErrorCode::NotARepository: return "not a repository";
        case ErrorCode::AlreadyInitialized: return "already initialized";
        case ErrorCode::NotFound: return "not found";
        case ErrorCode::IoError: return "I/O failure";
        case ErrorCode::CorruptObject: return "corrupt object";
        case ErrorCode::InternalError: return "internal error";
    }
    return "unknown error";
}

std::string Error::describe() const {
    std::string out = errorCodeName(code);
    if (!message.empty()) {
        out += ": ";
        out += message;
    }
    return out;
}

}
