#ifndef FACEFLAT_EXPORT_EXPORT_ORCHESTRATOR_HPP
#define FACEFLAT_EXPORT_EXPORT_ORCHESTRATOR_HPP

#include <classify/edge_classifier.hpp>
#include <common/errors.hpp>
#include <consolidate/arc_consolidator.hpp>
#include <kernel/kernel.hpp>
#include <mesh/hole_detector.hpp>
#include <mesh/mesh_boundary.hpp>
#include <primitives/primitive.hpp>
#include <projection/plane_projector.hpp>
#include <vector>

namespace faceflat {

struct PlaceholderConfig {
    // Side of the square emitted when no boundary can be recovered
    double size = 10.0;
};

// All tunables of one export
struct ExportConfig {
    EdgeClassifierConfig edges;
    ArcConsolidationConfig arcs;
    MeshBoundaryConfig mesh;
    HoleDetectionConfig holes;
    PlaceholderConfig placeholder;
};

// Pipeline stage that produced an export
enum class ExportStage { Exact, Mesh, Default };

const char* export_stage_name(ExportStage stage);

struct ExportResult {
    std::vector<Primitive> primitives;
    size_t wire_count = 0;
    size_t entity_count = 0;
    ExportStage stage = ExportStage::Default;
};

// Corners of the square (0,0)-(size,size), counter-clockwise
std::vector<Vec2> placeholder_square(double size);

// Drives one face through Exact -> Mesh -> Default. Each attempt reports a
// typed Result; run() never fails.
class ExportOrchestrator {
public:
    explicit ExportOrchestrator(const ExportConfig& config = ExportConfig{});

    ExportResult run(const FaceHandle& face) const;

    // Wire walk with edge classification and arc consolidation.
    // Errors: NoGeometryFound, Kernel.
    Result<ExportResult> exact_attempt(const FaceHandle& face, const PlaneProjector& projector) const;

    // Boundary polygon from the face triangulation.
    // Errors: NoGeometryFound, BoundaryReconstructionFailure, Kernel.
    Result<ExportResult> mesh_attempt(const FaceHandle& face, const PlaneProjector& projector) const;

    ExportResult default_result() const;

    const ExportConfig& config() const { return config_; }

private:
    ExportConfig config_;
};

}  // namespace faceflat

#endif // FACEFLAT_EXPORT_EXPORT_ORCHESTRATOR_HPP
