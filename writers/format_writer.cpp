#include "format_writer.hpp"
#include "dxf_writer.hpp"
#include "svg_writer.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace faceflat {

std::unique_ptr<FormatWriter> make_writer(const std::string& format, const StyleMap& styles) {
    std::string lower = format;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "dxf") {
        return std::make_unique<DxfWriter>(styles);
    }
    if (lower == "svg") {
        return std::make_unique<SvgWriter>(styles);
    }
    throw std::invalid_argument("Unknown export format: " + format);
}

}  // namespace faceflat
