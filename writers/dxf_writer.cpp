#include "dxf_writer.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <iomanip>
#include <numbers>
#include <set>
#include <sstream>
#include <type_traits>

namespace faceflat {

namespace {

void write_point(std::ostringstream& ss, int code, const Vec2& p) {
    ss << code << "\n" << p.x << "\n"
       << code + 10 << "\n" << p.y << "\n"
       << code + 20 << "\n0.0\n";
}

void write_header(std::ostringstream& ss) {
    ss << "0\nSECTION\n2\nHEADER\n";
    ss << "9\n$ACADVER\n1\nAC1024\n";
    ss << "9\n$INSUNITS\n70\n4\n";  // millimetres
    ss << "0\nENDSEC\n";
}

void write_layers(std::ostringstream& ss, const std::vector<const LayerStyle*>& layers) {
    ss << "0\nSECTION\n2\nTABLES\n";
    ss << "0\nTABLE\n2\nLAYER\n70\n" << layers.size() + 1 << "\n";
    ss << "0\nLAYER\n2\n0\n70\n0\n62\n7\n6\nCONTINUOUS\n";
    for (const auto* style : layers) {
        ss << "0\nLAYER\n2\n" << style->layer << "\n70\n0\n62\n" << style->color
           << "\n6\nCONTINUOUS\n";
    }
    ss << "0\nENDTAB\n";
    ss << "0\nENDSEC\n";
}

void write_entity(std::ostringstream& ss, const Primitive& prim, const LayerStyle& style) {
    std::visit([&](auto&& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, primitive::Line>) {
            ss << "0\nLINE\n8\n" << style.layer << "\n";
            write_point(ss, 10, s.p1);
            write_point(ss, 11, s.p2);
        } else if constexpr (std::is_same_v<T, primitive::Circle>) {
            ss << "0\nCIRCLE\n8\n" << style.layer << "\n";
            write_point(ss, 10, s.center);
            ss << "40\n" << s.radius << "\n";
        } else if constexpr (std::is_same_v<T, primitive::Arc>) {
            // DXF arcs always run counter-clockwise from 50 to 51
            ss << "0\nARC\n8\n" << style.layer << "\n";
            write_point(ss, 10, s.center);
            ss << "40\n" << s.radius << "\n";
            ss << "50\n" << s.start_angle << "\n";
            ss << "51\n" << s.end_angle << "\n";
        } else if constexpr (std::is_same_v<T, primitive::Ellipse>) {
            ss << "0\nELLIPSE\n8\n" << style.layer << "\n";
            write_point(ss, 10, s.center);
            write_point(ss, 11, s.major_axis);  // relative to center
            ss << "40\n" << s.ratio << "\n";
            ss << "41\n0.0\n";
            ss << "42\n" << 2.0 * std::numbers::pi << "\n";
        } else {
            ss << "0\nLWPOLYLINE\n8\n" << style.layer << "\n";
            ss << "90\n" << s.points.size() << "\n";
            ss << "70\n" << (s.closed ? 1 : 0) << "\n";
            for (const auto& p : s.points) {
                ss << "10\n" << p.x << "\n20\n" << p.y << "\n";
            }
        }
    }, prim.shape);
}

}  // namespace

std::string DxfWriter::render(const std::vector<Primitive>& primitives) const {
    if (primitives.empty()) {
        throw ExportError(ErrorKind::NoGeometryFound, "No geometry found for DXF");
    }

    std::vector<const LayerStyle*> layers;
    std::set<PrimitiveClass> seen;
    for (const auto& prim : primitives) {
        if (seen.insert(prim.cls).second) {
            layers.push_back(&styles_.for_class(prim.cls));
        }
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(6);

    write_header(ss);
    write_layers(ss, layers);

    ss << "0\nSECTION\n2\nENTITIES\n";
    for (const auto& prim : primitives) {
        write_entity(ss, prim, styles_.for_class(prim.cls));
    }
    ss << "0\nENDSEC\n";
    ss << "0\nEOF\n";

    logging::get_logger()->debug("DXF: {} entities on {} layer(s)", primitives.size(), layers.size());
    return ss.str();
}

}  // namespace faceflat
