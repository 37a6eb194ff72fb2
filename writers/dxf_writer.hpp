#ifndef FACEFLAT_WRITERS_DXF_WRITER_HPP
#define FACEFLAT_WRITERS_DXF_WRITER_HPP

#include "format_writer.hpp"

namespace faceflat {

// ASCII DXF (AutoCAD 2010, millimetres). Each class gets its own layer;
// only layers that carry entities are declared.
class DxfWriter : public FormatWriter {
public:
    explicit DxfWriter(const StyleMap& styles = StyleMap{}) : styles_(styles) {}

    std::string render(const std::vector<Primitive>& primitives) const override;
    std::string extension() const override { return "dxf"; }

private:
    StyleMap styles_;
};

}  // namespace faceflat

#endif // FACEFLAT_WRITERS_DXF_WRITER_HPP
