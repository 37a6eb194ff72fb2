#ifndef FACEFLAT_WRITERS_SVG_WRITER_HPP
#define FACEFLAT_WRITERS_SVG_WRITER_HPP

#include "format_writer.hpp"

namespace faceflat {

// SVG sized in millimetres. The viewBox is the content bounding box grown
// by padding_fraction of its larger side on every side.
class SvgWriter : public FormatWriter {
public:
    explicit SvgWriter(const StyleMap& styles = StyleMap{}, double padding_fraction = 0.1)
        : styles_(styles), padding_fraction_(padding_fraction) {}

    std::string render(const std::vector<Primitive>& primitives) const override;
    std::string extension() const override { return "svg"; }

private:
    StyleMap styles_;
    double padding_fraction_;
};

}  // namespace faceflat

#endif // FACEFLAT_WRITERS_SVG_WRITER_HPP
