#ifndef FACEFLAT_WRITERS_FORMAT_WRITER_HPP
#define FACEFLAT_WRITERS_FORMAT_WRITER_HPP

#include <primitives/primitive.hpp>
#include <memory>
#include <string>
#include <vector>

namespace faceflat {

// How one class of primitives is drawn
struct LayerStyle {
    std::string layer;         // DXF layer name
    int color = 7;             // DXF colour index
    std::string css_class;     // SVG class name
    std::string stroke;        // SVG stroke colour
    std::string stroke_width;  // SVG stroke width, with units
};

struct StyleMap {
    LayerStyle boundary{"BOUNDARY", 1, "boundary", "#000000", "0.1mm"};
    LayerStyle hole{"HOLES", 2, "hole", "#ff0000", "0.05mm"};

    const LayerStyle& for_class(PrimitiveClass cls) const {
        return cls == PrimitiveClass::Boundary ? boundary : hole;
    }
};

// Renders a primitive list into one drawing format
class FormatWriter {
public:
    virtual ~FormatWriter() = default;

    // Whole document. Throws ExportError (NoGeometryFound) for an empty list.
    virtual std::string render(const std::vector<Primitive>& primitives) const = 0;

    // File extension without the dot
    virtual std::string extension() const = 0;
};

// "dxf" or "svg" (case-insensitive); throws std::invalid_argument otherwise
std::unique_ptr<FormatWriter> make_writer(const std::string& format,
                                          const StyleMap& styles = StyleMap{});

}  // namespace faceflat

#endif // FACEFLAT_WRITERS_FORMAT_WRITER_HPP
