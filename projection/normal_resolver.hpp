#ifndef FACEFLAT_PROJECTION_NORMAL_RESOLVER_HPP
#define FACEFLAT_PROJECTION_NORMAL_RESOLVER_HPP

#include <kernel/kernel.hpp>
#include <optional>

namespace faceflat {

// Unit normal of the first triangle, if it is non-degenerate
std::optional<Vec3> mesh_normal(const Mesh& mesh);

// Face normal from the kernel; falls back to the mesh normal, then to (0, 0, 1)
Vec3 resolve_face_normal(const FaceHandle& face);

}  // namespace faceflat

#endif // FACEFLAT_PROJECTION_NORMAL_RESOLVER_HPP
