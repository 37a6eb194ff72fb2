#ifndef FACEFLAT_CLASSIFY_EDGE_CLASSIFIER_HPP
#define FACEFLAT_CLASSIFY_EDGE_CLASSIFIER_HPP

#include <kernel/kernel.hpp>
#include <primitives/primitive.hpp>
#include <projection/plane_projector.hpp>
#include <optional>
#include <vector>

namespace faceflat {

struct EdgeClassifierConfig {
    // |parameter range - 2*pi| below this makes a closed circle/ellipse (radians)
    double full_turn_tolerance = 0.01;

    // Sample counts for discretized curves: free-form edges use the export
    // count, elliptical arcs and unresolvable arcs the secondary one
    int export_samples = 20;
    int secondary_samples = 12;

    // Sampled points closer than this to the previous kept point are dropped
    double min_segment_length = 0.001;
};

bool is_full_turn(double first, double last, double tolerance);

struct WireClassification {
    std::vector<Primitive> primitives;
    size_t edge_count = 0;
    size_t skipped_edges = 0;
};

// Turns kernel edges into 2D primitives in one face's projection plane
class EdgeClassifier {
public:
    EdgeClassifier(const PlaneProjector& projector,
                   const EdgeClassifierConfig& config = EdgeClassifierConfig{});

    // Primitive for one edge, or nothing when the edge collapses to fewer
    // than two distinct points. Throws KernelError when the kernel cannot
    // evaluate the edge.
    std::optional<Primitive> classify(const EdgeHandle& edge, PrimitiveClass cls) const;

    // Every edge of a wire, in wire order. Edges the kernel fails on are
    // logged and skipped; wire.edges() failures propagate.
    WireClassification classify_wire(const WireHandle& wire, PrimitiveClass cls) const;

    // samples + 1 evenly spaced, projected points with short segments removed
    std::vector<Vec2> sample_points(const EdgeHandle& edge, int samples) const;

private:
    std::optional<Primitive> classify_circle(const EdgeHandle& edge, PrimitiveClass cls) const;
    std::optional<Primitive> classify_ellipse(const EdgeHandle& edge, PrimitiveClass cls) const;
    std::optional<Primitive> as_polyline(const EdgeHandle& edge, PrimitiveClass cls, int samples) const;

    const PlaneProjector& projector_;
    EdgeClassifierConfig config_;
};

}  // namespace faceflat

#endif // FACEFLAT_CLASSIFY_EDGE_CLASSIFIER_HPP
