#ifndef FACEFLAT_SERIALIZATION_FACE_SET_JSON_HPP
#define FACEFLAT_SERIALIZATION_FACE_SET_JSON_HPP

// Face-set documents feed the in-memory kernel:
//
// {
//   "source_file": "bracket.step",
//   "faces": [{
//     "type": "Plane",                 // Plane | Curved | Unknown
//     "normal": [0, 0, 1],             // optional
//     "wires": [{"edges": [
//       {"type": "line", "start": [..], "end": [..]},
//       {"type": "circle", "center": [..], "axis": [..], "x_dir": [..],
//        "radius": r, "first": t0, "last": t1},
//       {"type": "ellipse", "center": [..], "axis": [..], "major_dir": [..],
//        "major_radius": a, "minor_radius": b, "first": t0, "last": t1},
//       {"type": "spline", "points": [[..], ...]}
//     ]}],
//     "mesh": {"vertices": [[x, y, z], ...], "triangles": [[i, j, k], ...]}
//   }]
// }

#include <nlohmann/json.hpp>
#include <kernel/memory_kernel.hpp>
#include "config_json.hpp"
#include <string>

namespace faceflat {

inline SurfaceKind surface_kind_from_string(const std::string& name) {
    if (name == "Plane" || name == "plane") return SurfaceKind::Plane;
    if (name == "Curved" || name == "curved") return SurfaceKind::Curved;
    return SurfaceKind::Unknown;
}

inline std::shared_ptr<const EdgeHandle> edge_from_json(const nlohmann::json& j) {
    std::string type = j.at("type").get<std::string>();
    if (type == "line") {
        return MemoryEdge::line(j.at("start").get<Vec3>(), j.at("end").get<Vec3>());
    }
    if (type == "circle") {
        return MemoryEdge::circle(j.at("center").get<Vec3>(), j.at("axis").get<Vec3>(),
                                  j.at("x_dir").get<Vec3>(), j.at("radius").get<double>(),
                                  j.at("first").get<double>(), j.at("last").get<double>());
    }
    if (type == "ellipse") {
        return MemoryEdge::ellipse(j.at("center").get<Vec3>(), j.at("axis").get<Vec3>(),
                                   j.at("major_dir").get<Vec3>(),
                                   j.at("major_radius").get<double>(),
                                   j.at("minor_radius").get<double>(),
                                   j.at("first").get<double>(), j.at("last").get<double>());
    }
    if (type == "spline") {
        return MemoryEdge::spline(j.at("points").get<std::vector<Vec3>>());
    }
    throw KernelError("Unknown edge type: " + type);
}

inline Mesh mesh_from_json(const nlohmann::json& j) {
    Mesh mesh;
    if (j.contains("vertices")) {
        mesh.vertices = j["vertices"].get<std::vector<Vec3>>();
    }
    if (j.contains("triangles")) {
        mesh.triangles = j["triangles"].get<std::vector<std::array<uint32_t, 3>>>();
    }
    for (const auto& tri : mesh.triangles) {
        for (uint32_t idx : tri) {
            if (idx >= mesh.vertices.size()) {
                throw KernelError("Triangle index " + std::to_string(idx) + " out of range");
            }
        }
    }
    return mesh;
}

inline FacePtr face_from_json(const nlohmann::json& j) {
    SurfaceKind kind = surface_kind_from_string(j.value("type", "Unknown"));

    std::optional<Vec3> normal;
    if (j.contains("normal")) {
        normal = j["normal"].get<Vec3>();
    }

    std::vector<std::shared_ptr<const WireHandle>> wires;
    if (j.contains("wires")) {
        for (const auto& wire_json : j["wires"]) {
            std::vector<std::shared_ptr<const EdgeHandle>> edges;
            for (const auto& edge_json : wire_json.at("edges")) {
                edges.push_back(edge_from_json(edge_json));
            }
            wires.push_back(std::make_shared<MemoryWire>(std::move(edges)));
        }
    }

    Mesh mesh;
    if (j.contains("mesh")) {
        mesh = mesh_from_json(j["mesh"]);
    }

    return std::make_shared<MemoryFace>(kind, normal, std::move(wires), std::move(mesh));
}

// Throws KernelError naming the offending face on malformed input
inline FaceSet face_set_from_json(const nlohmann::json& j) {
    FaceSet set;
    set.source_file = j.value("source_file", "");

    const auto& faces = j.at("faces");
    for (size_t i = 0; i < faces.size(); ++i) {
        try {
            set.faces.push_back(face_from_json(faces[i]));
        } catch (const nlohmann::json::exception& e) {
            throw KernelError("Face " + std::to_string(i) + ": " + e.what());
        } catch (const KernelError& e) {
            throw KernelError("Face " + std::to_string(i) + ": " + e.what());
        }
    }
    return set;
}

inline FaceSet load_face_set(const std::string& path) {
    FaceSet set;
    try {
        set = face_set_from_json(json::read_json_file(path));
    } catch (const nlohmann::json::exception& e) {
        throw KernelError("Invalid face set " + path + ": " + e.what());
    }
    if (set.source_file.empty()) {
        set.source_file = path;
    }
    return set;
}

}  // namespace faceflat

#endif // FACEFLAT_SERIALIZATION_FACE_SET_JSON_HPP
