#include "normal_resolver.hpp"
#include <common/logging.hpp>

namespace faceflat {

std::optional<Vec3> mesh_normal(const Mesh& mesh) {
    if (mesh.vertices.size() < 3 || mesh.triangles.empty()) {
        return std::nullopt;
    }

    const auto& tri = mesh.triangles.front();
    for (uint32_t idx : tri) {
        if (idx >= mesh.vertices.size()) {
            return std::nullopt;
        }
    }

    const Vec3& v1 = mesh.vertices[tri[0]];
    const Vec3& v2 = mesh.vertices[tri[1]];
    const Vec3& v3 = mesh.vertices[tri[2]];

    Vec3 n = (v2 - v1).cross(v3 - v1);
    if (n.length() <= 0.0) {
        return std::nullopt;
    }
    return n.normalized();
}

Vec3 resolve_face_normal(const FaceHandle& face) {
    auto log = logging::get_logger();

    try {
        Vec3 n = face.normal();
        if (n.length() > 0.0) {
            return n.normalized();
        }
        log->debug("Kernel returned a zero-length normal, trying the mesh");
    } catch (const KernelError& e) {
        log->debug("Kernel normal unavailable ({}), trying the mesh", e.what());
    }

    try {
        if (auto n = mesh_normal(face.triangulation())) {
            return *n;
        }
    } catch (const KernelError& e) {
        log->warn("Triangulation unavailable for normal estimate: {}", e.what());
    }

    return vec3::unit_z();
}

}  // namespace faceflat
