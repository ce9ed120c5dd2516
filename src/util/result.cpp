#include "util/result.hpp"

namespace splitpack {

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "None";
        case ErrorKind::InvalidSpec:          return "InvalidSpec";
        case ErrorKind::NoPartsFound:         return "NoPartsFound";
        case ErrorKind::InconsistentBase:     return "InconsistentBase";
        case ErrorKind::MissingPart:          return "MissingPart";
        case ErrorKind::ConfirmationRequired: return "ConfirmationRequired";
        case ErrorKind::CodecFailure:         return "CodecFailure";
        case ErrorKind::IOFailure:            return "IOFailure";
        case ErrorKind::HashMismatch:         return "HashMismatch";
        case ErrorKind::Cancelled:            return "Cancelled";
    }
    return "Unknown";
}

std::string Result::Describe() const {
    if (ok) return "ok";

    std::string out = ErrorKindName(kind);
    if (!phase.empty()) {
        out += " [" + phase + "]";
    }
    if (part_index > 0) {
        out += " part " + std::to_string(part_index);
    }
    out += ": " + msg;
    if (!path.empty() && msg.find(path) == std::string::npos) {
        out += " (" + path + ")";
    }
    return out;
}

} // namespace splitpack
