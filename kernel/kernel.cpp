#include "kernel.hpp"

namespace faceflat {

const char* surface_kind_name(SurfaceKind kind) {
    switch (kind) {
        case SurfaceKind::Plane: return "Plane";
        case SurfaceKind::Curved: return "Curved";
        case SurfaceKind::Unknown: return "Unknown";
    }
    return "Unknown";
}

const char* curve_kind_name(CurveKind kind) {
    switch (kind) {
        case CurveKind::Line: return "Line";
        case CurveKind::Circle: return "Circle";
        case CurveKind::Ellipse: return "Ellipse";
        case CurveKind::Other: return "Other";
    }
    return "Other";
}

}  // namespace faceflat
