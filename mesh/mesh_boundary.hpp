#ifndef FACEFLAT_MESH_MESH_BOUNDARY_HPP
#define FACEFLAT_MESH_MESH_BOUNDARY_HPP

#include <common/errors.hpp>
#include <math/vec2.hpp>
#include <array>
#include <cstdint>
#include <utility>
#include <vector>

namespace faceflat {

struct MeshBoundaryConfig {
    // Hull input points closer than this on both axes are merged
    double dedup_tolerance = 0.001;
};

// Undirected mesh edge, (min index, max index)
using IndexEdge = std::pair<uint32_t, uint32_t>;

// Vertex walk along boundary edges
struct IndexPath {
    std::vector<uint32_t> vertices;
    bool closed = false;  // walk came back to its start vertex
};

enum class BoundarySource { BoundaryEdges, ConvexHull };

struct BoundaryPath {
    std::vector<Vec2> points;
    bool closed = true;
    BoundarySource source = BoundarySource::BoundaryEdges;
};

const char* boundary_source_name(BoundarySource source);

// Edges used by exactly one triangle, in order of first appearance.
// Assumes a manifold mesh.
std::vector<IndexEdge> boundary_edges(const std::vector<std::array<uint32_t, 3>>& triangles);

// Walks the edge graph from the first vertex of degree <= 2 (else the first
// vertex seen). Never steps straight back to the previous vertex and gives
// up after edges.size() + 1 vertices.
IndexPath edges_to_path(const std::vector<IndexEdge>& edges);

// Outline of a projected mesh: the boundary-edge walk when it yields at
// least 3 points, the convex hull otherwise.
// Errors: NoGeometryFound for an empty point set,
// BoundaryReconstructionFailure when neither gives 3 points.
Result<BoundaryPath> extract_boundary(const std::vector<Vec2>& points,
                                      const std::vector<std::array<uint32_t, 3>>& triangles,
                                      const MeshBoundaryConfig& config = MeshBoundaryConfig{});

}  // namespace faceflat

#endif // FACEFLAT_MESH_MESH_BOUNDARY_HPP
