#include "export_orchestrator.hpp"
#include <classify/wire_classifier.hpp>
#include <common/logging.hpp>
#include <projection/normal_resolver.hpp>
#include <iterator>
#include <utility>

namespace faceflat {

const char* export_stage_name(ExportStage stage) {
    switch (stage) {
        case ExportStage::Exact: return "exact";
        case ExportStage::Mesh: return "mesh";
        case ExportStage::Default: return "default";
    }
    return "unknown";
}

std::vector<Vec2> placeholder_square(double size) {
    return {{0.0, 0.0}, {size, 0.0}, {size, size}, {0.0, size}};
}

ExportOrchestrator::ExportOrchestrator(const ExportConfig& config)
    : config_(config) {}

ExportResult ExportOrchestrator::run(const FaceHandle& face) const {
    auto log = logging::get_logger();

    PlaneProjector projector(compute_basis_or_default(resolve_face_normal(face)));

    auto exact = exact_attempt(face, projector);
    if (is_ok(exact)) {
        return std::move(value(exact));
    }
    log->warn("Exact export failed ({}: {}), using mesh",
              error_kind_name(error(exact).kind), error(exact).message);

    auto mesh = mesh_attempt(face, projector);
    if (is_ok(mesh)) {
        return std::move(value(mesh));
    }
    log->warn("Mesh export failed ({}: {}), using placeholder",
              error_kind_name(error(mesh).kind), error(mesh).message);

    return default_result();
}

Result<ExportResult> ExportOrchestrator::exact_attempt(const FaceHandle& face,
                                                       const PlaneProjector& projector) const {
    auto log = logging::get_logger();

    std::vector<std::shared_ptr<const WireHandle>> wires;
    try {
        wires = face.wires();
    } catch (const KernelError& e) {
        return make_error(ErrorKind::Kernel, e.what());
    }
    if (wires.empty()) {
        return make_error(ErrorKind::NoGeometryFound, "Face has no wires");
    }

    auto roles = classify_wires(wires);
    EdgeClassifier classifier(projector, config_.edges);

    std::vector<Primitive> primitives;
    for (const auto& role : roles) {
        log->debug("Processing wire {} ({})", role.index + 1, primitive_class_name(role.role));
        try {
            auto classified = classifier.classify_wire(*wires[role.index], role.role);
            primitives.insert(primitives.end(),
                              std::make_move_iterator(classified.primitives.begin()),
                              std::make_move_iterator(classified.primitives.end()));
        } catch (const KernelError& e) {
            log->warn("Skipping wire {}: {}", role.index + 1, e.what());
        }
    }

    primitives = consolidate_arcs(primitives, config_.arcs);
    if (primitives.empty()) {
        return make_error(ErrorKind::NoGeometryFound, "No primitives from face wires");
    }

    ExportResult result;
    result.wire_count = wires.size();
    result.entity_count = primitives.size();
    result.primitives = std::move(primitives);
    result.stage = ExportStage::Exact;
    log->info("Exact export: {} wires, {} entities", result.wire_count, result.entity_count);
    return result;
}

Result<ExportResult> ExportOrchestrator::mesh_attempt(const FaceHandle& face,
                                                      const PlaneProjector& projector) const {
    Mesh mesh;
    try {
        mesh = face.triangulation();
    } catch (const KernelError& e) {
        return make_error(ErrorKind::Kernel, e.what());
    }
    if (mesh.vertices.size() < 3) {
        return make_error(ErrorKind::NoGeometryFound, "Mesh has fewer than 3 vertices");
    }

    auto boundary = extract_boundary(projector.project(mesh.vertices), mesh.triangles, config_.mesh);
    if (!is_ok(boundary)) {
        return error(boundary);
    }

    BoundaryPath& path = value(boundary);
    logging::get_logger()->info("Mesh export: boundary of {} points from {}",
                                path.points.size(), boundary_source_name(path.source));

    ExportResult result;
    if (!path.closed) {
        logging::get_logger()->debug("Mesh boundary walk is open, closing the outline");
    }
    result.primitives.push_back({primitive::Polyline{std::move(path.points), true},
                                 PrimitiveClass::Boundary});
    result.wire_count = 1;
    result.entity_count = result.primitives.size();
    result.stage = ExportStage::Mesh;
    return result;
}

ExportResult ExportOrchestrator::default_result() const {
    ExportResult result;
    result.primitives.push_back({primitive::Polyline{placeholder_square(config_.placeholder.size), true},
                                 PrimitiveClass::Boundary});
    result.wire_count = 1;
    result.entity_count = 1;
    result.stage = ExportStage::Default;
    logging::get_logger()->info("Default export: {}x{} placeholder square",
                                config_.placeholder.size, config_.placeholder.size);
    return result;
}

}  // namespace faceflat
