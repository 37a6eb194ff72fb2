#ifndef FACEFLAT_KERNEL_KERNEL_HPP
#define FACEFLAT_KERNEL_KERNEL_HPP

// Read-only views the B-rep kernel hands to the export core.
//
// Implementations wrap whatever reader produced the faces. Any accessor may
// throw KernelError when the underlying data cannot be evaluated; callers
// decide whether that costs an edge, a wire, or the exact pipeline.

#include <math/vec3.hpp>
#include <array>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace faceflat {

enum class SurfaceKind { Plane, Curved, Unknown };
enum class CurveKind { Line, Circle, Ellipse, Other };

const char* surface_kind_name(SurfaceKind kind);
const char* curve_kind_name(CurveKind kind);

class KernelError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct CircleData {
    Vec3 center;
    double radius = 0.0;
};

struct EllipseData {
    Vec3 center;
    Vec3 major_direction;  // unit vector
    double major_radius = 0.0;
    double minor_radius = 0.0;
};

// Triangulated approximation of a face
struct Mesh {
    std::vector<Vec3> vertices;
    std::vector<std::array<uint32_t, 3>> triangles;

    bool empty() const { return vertices.empty(); }
};

class EdgeHandle {
public:
    virtual ~EdgeHandle() = default;

    virtual CurveKind curve_kind() const = 0;

    // Parameter domain [first, last]
    virtual std::pair<double, double> domain() const = 0;

    virtual Vec3 value_at(double param) const = 0;

    // Only meaningful for CurveKind::Circle / CurveKind::Ellipse
    virtual CircleData circle() const = 0;
    virtual EllipseData ellipse() const = 0;

    virtual double length() const = 0;
};

class WireHandle {
public:
    virtual ~WireHandle() = default;

    // Edges in traversal order
    virtual std::vector<std::shared_ptr<const EdgeHandle>> edges() const = 0;

    virtual double length() const = 0;
};

class FaceHandle {
public:
    virtual ~FaceHandle() = default;

    virtual SurfaceKind surface_kind() const = 0;

    // Unit normal at the middle of the face's parameter range
    virtual Vec3 normal() const = 0;

    virtual std::vector<std::shared_ptr<const WireHandle>> wires() const = 0;

    virtual Mesh triangulation() const = 0;
};

using FacePtr = std::shared_ptr<const FaceHandle>;

// Faces extracted from one input file, in kernel order
struct FaceSet {
    std::string source_file;
    std::vector<FacePtr> faces;

    size_t size() const { return faces.size(); }
};

}  // namespace faceflat

#endif // FACEFLAT_KERNEL_KERNEL_HPP
