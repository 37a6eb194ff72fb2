#ifndef FACEFLAT_SERIALIZATION_PREVIEW_JSON_HPP
#define FACEFLAT_SERIALIZATION_PREVIEW_JSON_HPP

#include <nlohmann/json.hpp>
#include <export/preview_builder.hpp>
#include <session/export_service.hpp>
#include "config_json.hpp"

namespace faceflat {

// PreviewOutline serialization
inline void to_json(nlohmann::json& j, const PreviewOutline& outline) {
    j["type"] = preview_shape_name(outline.type);
    if (outline.type == PreviewShape::Circle) {
        j["center"] = outline.center;
        j["radius"] = outline.radius;
    } else {
        j["points"] = outline.points;
        j["closed"] = outline.closed;
    }
}

// PreviewDimensions serialization
inline void to_json(nlohmann::json& j, const PreviewDimensions& dims) {
    j = {
        {"width", dims.width},
        {"height", dims.height},
        {"bounds", {
            {"x_min", dims.x_min}, {"x_max", dims.x_max},
            {"y_min", dims.y_min}, {"y_max", dims.y_max}
        }}
    };
}

// PreviewPayload serialization
inline void to_json(nlohmann::json& j, const PreviewPayload& preview) {
    j = {
        {"face_id", preview.face_id},
        {"face_type", preview.face_type},
        {"boundary", preview.boundary},
        {"holes", preview.holes},
        {"dimensions", preview.dimensions},
        {"entity_count", preview.entity_count}
    };
}

// Mesh serialization
inline void to_json(nlohmann::json& j, const Mesh& mesh) {
    j["vertices"] = mesh.vertices;
    j["triangles"] = mesh.triangles;
}

// FaceInfo serialization
inline void to_json(nlohmann::json& j, const FaceInfo& info) {
    j = {
        {"id", info.id},
        {"type", surface_kind_name(info.type)},
        {"is_plane", info.is_plane},
        {"mesh", info.mesh},
        {"normal", info.normal},
        {"wire_count", info.wire_count}
    };
}

// Export statistics
inline nlohmann::json export_stats_to_json(const ExportArtifact& artifact) {
    return {
        {"wire_count", artifact.wire_count},
        {"entity_count", artifact.entity_count},
        {"stage", export_stage_name(artifact.stage)},
        {"download_name", artifact.download_name}
    };
}

}  // namespace faceflat

#endif // FACEFLAT_SERIALIZATION_PREVIEW_JSON_HPP
