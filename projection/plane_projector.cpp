#include "plane_projector.hpp"
#include <common/logging.hpp>
#include <algorithm>
#include <array>
#include <cmath>

namespace faceflat {

namespace {

constexpr double kDegenerateNormalLength = 1e-12;

}  // namespace

Result<ProjectionBasis> compute_basis(const Vec3& normal) {
    double len = normal.length();
    if (!(len > kDegenerateNormalLength)) {
        return make_error(ErrorKind::DegenerateNormal, "Face normal has zero length");
    }
    Vec3 n = normal / len;

    // Order the global axes by how little they align with the normal;
    // stable so ties keep X, Y, Z order
    std::array<Vec3, 3> axes = {vec3::unit_x(), vec3::unit_y(), vec3::unit_z()};
    std::stable_sort(axes.begin(), axes.end(), [&n](const Vec3& a, const Vec3& b) {
        return std::abs(a.dot(n)) < std::abs(b.dot(n));
    });
    const Vec3& u_ref = axes[0];
    const Vec3& v_ref = axes[1];

    Vec3 u = (u_ref - n * n.dot(u_ref)).normalized();
    Vec3 v = v_ref - n * n.dot(v_ref);
    v = (v - u * u.dot(v)).normalized();

    return ProjectionBasis{n, u, v};
}

ProjectionBasis compute_basis_or_default(const Vec3& normal) {
    auto result = compute_basis(normal);
    if (is_ok(result)) {
        return value(result);
    }
    logging::get_logger()->warn("Projection: {}, substituting (0, 0, 1)", error(result).message);
    return value(compute_basis(vec3::unit_z()));
}

std::vector<Vec2> PlaneProjector::project(const std::vector<Vec3>& points) const {
    std::vector<Vec2> out;
    out.reserve(points.size());
    for (const auto& p : points) {
        out.push_back(project(p));
    }
    return out;
}

}  // namespace faceflat
