#include "errors.hpp"

namespace faceflat {

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::DegenerateNormal: return "DegenerateNormal";
        case ErrorKind::InvalidFaceId: return "InvalidFaceId";
        case ErrorKind::NoGeometryFound: return "NoGeometryFound";
        case ErrorKind::CurveEvaluation: return "CurveEvaluation";
        case ErrorKind::BoundaryReconstructionFailure: return "BoundaryReconstructionFailure";
        case ErrorKind::ExportWrite: return "ExportWrite";
        case ErrorKind::SessionNotFound: return "SessionNotFound";
        case ErrorKind::Kernel: return "Kernel";
    }
    return "Unknown";
}

}  // namespace faceflat
