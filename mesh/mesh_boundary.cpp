#include "mesh_boundary.hpp"
#include "convex_hull.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <map>

namespace faceflat {

const char* boundary_source_name(BoundarySource source) {
    switch (source) {
        case BoundarySource::BoundaryEdges: return "boundary_edges";
        case BoundarySource::ConvexHull: return "convex_hull";
    }
    return "unknown";
}

std::vector<IndexEdge> boundary_edges(const std::vector<std::array<uint32_t, 3>>& triangles) {
    std::vector<IndexEdge> order;
    std::map<IndexEdge, int> counts;

    for (const auto& tri : triangles) {
        for (int k = 0; k < 3; ++k) {
            uint32_t a = tri[k];
            uint32_t b = tri[(k + 1) % 3];
            IndexEdge edge{std::min(a, b), std::max(a, b)};
            if (counts[edge]++ == 0) {
                order.push_back(edge);
            }
        }
    }

    std::vector<IndexEdge> result;
    for (const auto& edge : order) {
        if (counts[edge] == 1) {
            result.push_back(edge);
        }
    }
    return result;
}

IndexPath edges_to_path(const std::vector<IndexEdge>& edges) {
    IndexPath path;
    if (edges.empty()) {
        return path;
    }

    // Adjacency in first-appearance order
    std::vector<uint32_t> vertex_order;
    std::map<uint32_t, std::vector<uint32_t>> adjacency;
    auto link = [&](uint32_t from, uint32_t to) {
        auto [it, inserted] = adjacency.try_emplace(from);
        if (inserted) {
            vertex_order.push_back(from);
        }
        it->second.push_back(to);
    };
    for (const auto& [a, b] : edges) {
        link(a, b);
        link(b, a);
    }

    uint32_t start = vertex_order.front();
    for (uint32_t v : vertex_order) {
        if (adjacency[v].size() <= 2) {
            start = v;
            break;
        }
    }

    path.vertices.push_back(start);
    uint32_t current = start;
    bool has_previous = false;
    uint32_t previous = 0;

    while (true) {
        const auto& neighbors = adjacency[current];
        auto next = std::find_if(neighbors.begin(), neighbors.end(), [&](uint32_t n) {
            return !has_previous || n != previous;
        });
        if (next == neighbors.end()) {
            break;
        }

        if (*next == start && path.vertices.size() > 2) {
            path.closed = true;
            break;
        }

        path.vertices.push_back(*next);
        previous = current;
        has_previous = true;
        current = *next;

        if (path.vertices.size() > edges.size() + 1) {
            logging::get_logger()->warn("Boundary walk exceeded {} steps, stopping", edges.size() + 1);
            break;
        }
    }
    return path;
}

Result<BoundaryPath> extract_boundary(const std::vector<Vec2>& points,
                                      const std::vector<std::array<uint32_t, 3>>& triangles,
                                      const MeshBoundaryConfig& config) {
    auto log = logging::get_logger();
    if (points.empty()) {
        return make_error(ErrorKind::NoGeometryFound, "Mesh has no vertices");
    }

    auto edges = boundary_edges(triangles);
    log->debug("Found {} boundary edges from {} triangles", edges.size(), triangles.size());

    if (!edges.empty()) {
        IndexPath walk = edges_to_path(edges);
        BoundaryPath path;
        path.closed = walk.closed;
        path.source = BoundarySource::BoundaryEdges;
        for (uint32_t idx : walk.vertices) {
            if (idx < points.size()) {
                path.points.push_back(points[idx]);
            }
        }
        if (path.points.size() >= 3) {
            return path;
        }
        log->debug("Boundary walk gave {} points, trying convex hull", path.points.size());
    }

    auto unique = dedup_points(points, config.dedup_tolerance);
    if (unique.size() >= 3) {
        BoundaryPath hull;
        hull.points = convex_hull(unique);
        hull.closed = true;
        hull.source = BoundarySource::ConvexHull;
        if (hull.points.size() >= 3) {
            return hull;
        }
    }

    return make_error(ErrorKind::BoundaryReconstructionFailure,
                      "Fewer than 3 usable boundary points");
}

}  // namespace faceflat
