#ifndef FACEFLAT_EXPORT_PREVIEW_BUILDER_HPP
#define FACEFLAT_EXPORT_PREVIEW_BUILDER_HPP

#include "export_orchestrator.hpp"
#include <kernel/kernel.hpp>
#include <string>
#include <vector>

namespace faceflat {

enum class PreviewShape { Polyline, Circle };

const char* preview_shape_name(PreviewShape shape);

// One outline in the preview. Polylines use points/closed, circles use
// center/radius. Closed point lists repeat their first point.
struct PreviewOutline {
    PreviewShape type = PreviewShape::Polyline;
    std::vector<Vec2> points;
    bool closed = true;
    Vec2 center;
    double radius = 0.0;
};

struct PreviewDimensions {
    double width = 0.0;
    double height = 0.0;
    double x_min = 0.0;
    double x_max = 0.0;
    double y_min = 0.0;
    double y_max = 0.0;
};

// Lightweight drawing of a face for display; all coordinates are rounded
// to 3 decimals
struct PreviewPayload {
    size_t face_id = 0;
    std::string face_type;
    PreviewOutline boundary;
    std::vector<PreviewOutline> holes;
    PreviewDimensions dimensions;
    size_t entity_count = 0;
    bool placeholder = false;  // boundary is the fixed square
};

// Round half away from zero to 3 decimals
double round3(double value);

// Built from the face triangulation: boundary polygon, then hole detection
// inside it. Falls back to the placeholder square when no boundary of at
// least 3 points can be recovered; never fails.
PreviewPayload build_preview(size_t face_id, const FaceHandle& face,
                             const ExportConfig& config = ExportConfig{});

}  // namespace faceflat

#endif // FACEFLAT_EXPORT_PREVIEW_BUILDER_HPP
