#ifndef FACEFLAT_PROJECTION_PLANE_PROJECTOR_HPP
#define FACEFLAT_PROJECTION_PLANE_PROJECTOR_HPP

#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <common/errors.hpp>
#include <vector>

namespace faceflat {

// Orthonormal in-plane axes of a face, derived from its normal
struct ProjectionBasis {
    Vec3 normal;
    Vec3 u;
    Vec3 v;
};

// Build (u, v) by Gram-Schmidt against the global axes least aligned with
// the normal. Fails with DegenerateNormal when the normal has ~zero length.
Result<ProjectionBasis> compute_basis(const Vec3& normal);

// compute_basis, substituting (0, 0, 1) for a degenerate normal
ProjectionBasis compute_basis_or_default(const Vec3& normal);

// Maps 3D points to (p.u, p.v). One projector is used for every point and
// curve of a face so that all of its primitives share coordinates.
class PlaneProjector {
public:
    explicit PlaneProjector(const ProjectionBasis& basis) : basis_(basis) {}

    Vec2 project(const Vec3& p) const {
        return {p.dot(basis_.u), p.dot(basis_.v)};
    }

    std::vector<Vec2> project(const std::vector<Vec3>& points) const;

    const ProjectionBasis& basis() const { return basis_; }

private:
    ProjectionBasis basis_;
};

}  // namespace faceflat

#endif // FACEFLAT_PROJECTION_PLANE_PROJECTOR_HPP
