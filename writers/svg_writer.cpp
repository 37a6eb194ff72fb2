#include "svg_writer.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <numbers>
#include <sstream>
#include <type_traits>

namespace faceflat {

namespace {

void write_element(std::ostringstream& ss, const Primitive& prim, const std::string& css_class) {
    std::visit([&](auto&& s) {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, primitive::Line>) {
            ss << "  <line x1=\"" << s.p1.x << "\" y1=\"" << s.p1.y
               << "\" x2=\"" << s.p2.x << "\" y2=\"" << s.p2.y << "\"";
        } else if constexpr (std::is_same_v<T, primitive::Circle>) {
            ss << "  <circle cx=\"" << s.center.x << "\" cy=\"" << s.center.y
               << "\" r=\"" << s.radius << "\"";
        } else if constexpr (std::is_same_v<T, primitive::Arc>) {
            // Stored angles run CCW start -> end; a CW source edge is drawn
            // from its own start, which is the stored end
            Vec2 from = arc_point(s, s.sweep_flag == 1 ? s.start_angle : s.end_angle);
            Vec2 to = arc_point(s, s.sweep_flag == 1 ? s.end_angle : s.start_angle);
            ss << "  <path d=\"M " << from.x << " " << from.y
               << " A " << s.radius << " " << s.radius << " 0 "
               << s.large_arc_flag << " " << s.sweep_flag << " "
               << to.x << " " << to.y << "\"";
        } else if constexpr (std::is_same_v<T, primitive::Ellipse>) {
            double rx = s.major_axis.length();
            double rotation = std::atan2(s.major_axis.y, s.major_axis.x) * 180.0 / std::numbers::pi;
            ss << "  <ellipse cx=\"" << s.center.x << "\" cy=\"" << s.center.y
               << "\" rx=\"" << rx << "\" ry=\"" << rx * s.ratio
               << "\" transform=\"rotate(" << rotation << " "
               << s.center.x << " " << s.center.y << ")\"";
        } else {
            ss << (s.closed ? "  <polygon points=\"" : "  <polyline points=\"");
            for (size_t i = 0; i < s.points.size(); ++i) {
                if (i > 0) ss << " ";
                ss << s.points[i].x << "," << s.points[i].y;
            }
            ss << "\"";
        }
    }, prim.shape);
    ss << " class=\"" << css_class << "\"/>\n";
}

}  // namespace

std::string SvgWriter::render(const std::vector<Primitive>& primitives) const {
    Bounds bounds = primitive_bounds(primitives);
    if (primitives.empty() || !bounds.valid) {
        throw ExportError(ErrorKind::NoGeometryFound, "No geometry found for SVG");
    }

    double padding = std::max(bounds.width(), bounds.height()) * padding_fraction_;
    double min_x = bounds.min.x - padding;
    double min_y = bounds.min.y - padding;
    double width = bounds.width() + 2.0 * padding;
    double height = bounds.height() + 2.0 * padding;

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(3);

    ss << "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n";
    ss << "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"" << width << "mm\" height=\""
       << height << "mm\" viewBox=\"" << min_x << " " << min_y << " "
       << width << " " << height << "\">\n";

    ss << "  <defs>\n    <style>\n";
    for (PrimitiveClass cls : {PrimitiveClass::Boundary, PrimitiveClass::Hole}) {
        const LayerStyle& style = styles_.for_class(cls);
        ss << "      ." << style.css_class << " { fill: none; stroke: " << style.stroke
           << "; stroke-width: " << style.stroke_width << "; }\n";
    }
    ss << "    </style>\n  </defs>\n";

    for (const auto& prim : primitives) {
        write_element(ss, prim, styles_.for_class(prim.cls).css_class);
    }
    ss << "</svg>\n";

    logging::get_logger()->debug("SVG: {} elements, {:.3f}x{:.3f}mm", primitives.size(), width, height);
    return ss.str();
}

}  // namespace faceflat
