#include "preview_builder.hpp"
#include <common/logging.hpp>
#include <mesh/hole_detector.hpp>
#include <mesh/mesh_boundary.hpp>
#include <projection/normal_resolver.hpp>
#include <algorithm>
#include <cmath>
#include <utility>

namespace faceflat {

namespace {

constexpr double MIN_DIMENSION = 0.1;

std::vector<Vec2> rounded_points(const std::vector<Vec2>& points, bool closed) {
    std::vector<Vec2> out;
    out.reserve(points.size() + 1);
    for (const auto& p : points) {
        out.push_back({round3(p.x), round3(p.y)});
    }
    if (closed && !out.empty() && out.front() != out.back()) {
        out.push_back(out.front());
    }
    return out;
}

void apply_placeholder(PreviewPayload& payload, double size) {
    payload.boundary = PreviewOutline{};
    payload.boundary.points = rounded_points(placeholder_square(size), true);
    payload.boundary.closed = true;
    payload.dimensions = PreviewDimensions{size, size, 0.0, size, 0.0, size};
    payload.holes.clear();
    payload.entity_count = 1;
    payload.placeholder = true;
}

PreviewDimensions measure(const std::vector<Vec2>& points) {
    Bounds bounds;
    for (const auto& p : points) {
        bounds.expand(p);
    }
    PreviewDimensions dims;
    dims.width = round3(std::max(bounds.width(), MIN_DIMENSION));
    dims.height = round3(std::max(bounds.height(), MIN_DIMENSION));
    dims.x_min = round3(bounds.min.x);
    dims.x_max = round3(bounds.max.x);
    dims.y_min = round3(bounds.min.y);
    dims.y_max = round3(bounds.max.y);
    return dims;
}

PreviewOutline hole_outline(const Primitive& hole) {
    PreviewOutline outline;
    if (const auto* circle = std::get_if<primitive::Circle>(&hole.shape)) {
        outline.type = PreviewShape::Circle;
        outline.center = {round3(circle->center.x), round3(circle->center.y)};
        outline.radius = round3(circle->radius);
    } else if (const auto* poly = std::get_if<primitive::Polyline>(&hole.shape)) {
        outline.type = PreviewShape::Polyline;
        outline.closed = poly->closed;
        outline.points = rounded_points(poly->points, poly->closed);
    }
    return outline;
}

}  // namespace

const char* preview_shape_name(PreviewShape shape) {
    return shape == PreviewShape::Circle ? "circle" : "polyline";
}

double round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

PreviewPayload build_preview(size_t face_id, const FaceHandle& face, const ExportConfig& config) {
    auto log = logging::get_logger();
    log->debug("Generating preview for face {}", face_id);

    PreviewPayload payload;
    payload.face_id = face_id;
    payload.face_type = surface_kind_name(face.surface_kind());

    Mesh mesh;
    try {
        mesh = face.triangulation();
    } catch (const KernelError& e) {
        log->warn("Face {} triangulation unavailable: {}", face_id, e.what());
    }

    if (mesh.vertices.size() < 3) {
        apply_placeholder(payload, config.placeholder.size);
        return payload;
    }

    PlaneProjector projector(compute_basis_or_default(resolve_face_normal(face)));
    std::vector<Vec2> points = projector.project(mesh.vertices);

    auto boundary = extract_boundary(points, mesh.triangles, config.mesh);
    if (!is_ok(boundary)) {
        log->warn("Face {} preview boundary failed ({}), using placeholder",
                  face_id, error(boundary).message);
        apply_placeholder(payload, config.placeholder.size);
        return payload;
    }

    const BoundaryPath& path = value(boundary);
    payload.boundary.type = PreviewShape::Polyline;
    // The outline is always drawn closed, even when the walk stopped short
    payload.boundary.closed = true;
    payload.boundary.points = rounded_points(path.points, true);
    if (payload.boundary.points.size() < 3) {
        apply_placeholder(payload, config.placeholder.size);
        return payload;
    }
    payload.dimensions = measure(path.points);
    payload.entity_count = 1;

    for (const auto& hole : detect_holes(points, path.points, config.holes)) {
        PreviewOutline outline = hole_outline(hole);
        if (outline.type == PreviewShape::Polyline && outline.points.size() < 3) {
            continue;
        }
        payload.holes.push_back(std::move(outline));
        ++payload.entity_count;
    }

    log->info("Preview data: {} entities, {} holes", payload.entity_count, payload.holes.size());
    return payload;
}

}  // namespace faceflat
