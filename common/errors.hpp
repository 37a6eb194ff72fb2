#ifndef FACEFLAT_COMMON_ERRORS_HPP
#define FACEFLAT_COMMON_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace faceflat {

enum class ErrorKind {
    DegenerateNormal,
    InvalidFaceId,
    NoGeometryFound,
    CurveEvaluation,
    BoundaryReconstructionFailure,
    ExportWrite,
    SessionNotFound,
    Kernel
};

const char* error_kind_name(ErrorKind kind);

// A failed stage outcome
struct Error {
    ErrorKind kind;
    std::string message;
};

// Stage outcome: either a value or the reason the stage could not produce one
template <typename T>
using Result = std::variant<T, Error>;

template <typename T>
bool is_ok(const Result<T>& r) {
    return std::holds_alternative<T>(r);
}

template <typename T>
const T& value(const Result<T>& r) {
    return std::get<T>(r);
}

template <typename T>
T& value(Result<T>& r) {
    return std::get<T>(r);
}

template <typename T>
const Error& error(const Result<T>& r) {
    return std::get<Error>(r);
}

inline Error make_error(ErrorKind kind, std::string message) {
    return Error{kind, std::move(message)};
}

// Request-level failure: session lookup, face id, or writing the artifact
class ExportError : public std::runtime_error {
public:
    ExportError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace faceflat

#endif // FACEFLAT_COMMON_ERRORS_HPP
