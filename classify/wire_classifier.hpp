#ifndef FACEFLAT_CLASSIFY_WIRE_CLASSIFIER_HPP
#define FACEFLAT_CLASSIFY_WIRE_CLASSIFIER_HPP

#include <kernel/kernel.hpp>
#include <primitives/primitive.hpp>
#include <memory>
#include <vector>

namespace faceflat {

struct WireRole {
    size_t index = 0;
    double length = 0.0;
    PrimitiveClass role = PrimitiveClass::Hole;
};

// The longest wire is the boundary, every other wire a hole. Equal lengths
// keep the earliest wire as boundary. Empty input gives an empty result.
std::vector<WireRole> classify_wire_lengths(const std::vector<double>& lengths);

// Same rule over kernel wires; a wire whose length cannot be measured
// counts as length 0
std::vector<WireRole> classify_wires(const std::vector<std::shared_ptr<const WireHandle>>& wires);

}  // namespace faceflat

#endif // FACEFLAT_CLASSIFY_WIRE_CLASSIFIER_HPP
