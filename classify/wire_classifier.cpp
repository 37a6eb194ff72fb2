#include "wire_classifier.hpp"
#include <common/logging.hpp>

namespace faceflat {

std::vector<WireRole> classify_wire_lengths(const std::vector<double>& lengths) {
    std::vector<WireRole> roles;
    if (lengths.empty()) {
        return roles;
    }

    size_t boundary = 0;
    for (size_t i = 1; i < lengths.size(); ++i) {
        if (lengths[i] > lengths[boundary]) {
            boundary = i;
        }
    }

    roles.reserve(lengths.size());
    for (size_t i = 0; i < lengths.size(); ++i) {
        roles.push_back({i, lengths[i],
                         i == boundary ? PrimitiveClass::Boundary : PrimitiveClass::Hole});
    }
    return roles;
}

std::vector<WireRole> classify_wires(const std::vector<std::shared_ptr<const WireHandle>>& wires) {
    auto log = logging::get_logger();
    std::vector<double> lengths;
    lengths.reserve(wires.size());

    for (size_t i = 0; i < wires.size(); ++i) {
        double length = 0.0;
        try {
            length = wires[i]->length();
        } catch (const KernelError& e) {
            log->warn("Wire {} length unavailable ({}), ranking it as 0", i + 1, e.what());
        }
        log->debug("Wire {} length: {:.2f}", i + 1, length);
        lengths.push_back(length);
    }

    auto roles = classify_wire_lengths(lengths);
    for (const auto& r : roles) {
        if (r.role == PrimitiveClass::Boundary) {
            log->debug("Wire {} identified as boundary", r.index + 1);
        }
    }
    return roles;
}

}  // namespace faceflat
