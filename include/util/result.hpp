#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

namespace splitpack {

enum class ErrorKind : int {
    None = 0,
    InvalidSpec,
    NoPartsFound,
    InconsistentBase,
    MissingPart,
    ConfirmationRequired,
    CodecFailure,
    IOFailure,
    HashMismatch,
    Cancelled,
};

const char* ErrorKindName(ErrorKind kind);

struct Result {
    bool ok{true};
    ErrorKind kind{ErrorKind::None};
    int err{0};
    std::string msg;

    // Where the failure happened. Empty / zero when not applicable.
    std::string phase;
    std::size_t part_index{0};
    std::string path;

    bool is_ok() const { return ok; }
    const std::string& message() const { return msg; }

    static Result Ok() { return {}; }
    static Result Fail(ErrorKind k, std::string m) {
        return {.ok = false, .kind = k, .err = -1, .msg = std::move(m)};
    }
    // errno-carrying I/O failure
    static Result Fail(int e, std::string m) {
        return {.ok = false, .kind = ErrorKind::IOFailure, .err = e, .msg = std::move(m)};
    }

    Result& WithPhase(std::string_view p) {
        if (phase.empty()) phase = std::string(p);
        return *this;
    }
    Result& WithPart(std::size_t index) {
        if (part_index == 0) part_index = index;
        return *this;
    }
    Result& WithPath(std::string p) {
        if (path.empty()) path = std::move(p);
        return *this;
    }

    // "[phase] part N: message (path)"
    std::string Describe() const;
};

} // namespace splitpack
