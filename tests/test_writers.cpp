#include <gtest/gtest.h>
#include "dxf_writer.hpp"
#include "svg_writer.hpp"
#include "errors.hpp"
#include <string>

using namespace faceflat;

namespace {

size_t count_occurrences(const std::string& text, const std::string& needle) {
    size_t count = 0;
    for (size_t pos = text.find(needle); pos != std::string::npos; pos = text.find(needle, pos + 1)) {
        ++count;
    }
    return count;
}

std::vector<Primitive> plate_with_hole() {
    std::vector<Primitive> prims;
    std::vector<Vec2> corners = {Vec2(0, 0), Vec2(10, 0), Vec2(10, 10), Vec2(0, 10)};
    for (size_t i = 0; i < corners.size(); ++i) {
        prims.push_back({primitive::Line{corners[i], corners[(i + 1) % 4]}, PrimitiveClass::Boundary});
    }
    prims.push_back({primitive::Circle{Vec2(5, 5), 3.0}, PrimitiveClass::Hole});
    return prims;
}

}  // namespace

// ============================================
// DXF Tests
// ============================================

TEST(DxfWriterTest, DocumentStructure) {
    std::string dxf = DxfWriter().render(plate_with_hole());

    EXPECT_EQ(dxf.rfind("0\nSECTION\n2\nHEADER\n", 0), 0u);
    EXPECT_NE(dxf.find("9\n$ACADVER\n1\nAC1024\n"), std::string::npos);
    EXPECT_NE(dxf.find("9\n$INSUNITS\n70\n4\n"), std::string::npos);
    EXPECT_NE(dxf.find("0\nSECTION\n2\nTABLES\n"), std::string::npos);
    EXPECT_NE(dxf.find("0\nSECTION\n2\nENTITIES\n"), std::string::npos);

    const std::string eof = "0\nEOF\n";
    ASSERT_GE(dxf.size(), eof.size());
    EXPECT_EQ(dxf.substr(dxf.size() - eof.size()), eof);
}

TEST(DxfWriterTest, EntitiesOnClassLayers) {
    std::string dxf = DxfWriter().render(plate_with_hole());

    EXPECT_EQ(count_occurrences(dxf, "0\nLINE\n8\nBOUNDARY\n"), 4u);
    EXPECT_EQ(count_occurrences(dxf, "0\nCIRCLE\n8\nHOLES\n"), 1u);
    EXPECT_NE(dxf.find("10\n5.000000\n20\n5.000000\n30\n0.0\n40\n3.000000\n"), std::string::npos);
    EXPECT_NE(dxf.find("0\nLAYER\n2\nBOUNDARY\n70\n0\n62\n1\n"), std::string::npos);
    EXPECT_NE(dxf.find("0\nLAYER\n2\nHOLES\n70\n0\n62\n2\n"), std::string::npos);
}

TEST(DxfWriterTest, OnlyUsedLayersDeclared) {
    std::vector<Primitive> prims = {
        {primitive::Line{Vec2(0, 0), Vec2(1, 1)}, PrimitiveClass::Boundary},
    };
    std::string dxf = DxfWriter().render(prims);
    EXPECT_EQ(dxf.find("2\nHOLES\n"), std::string::npos);
    EXPECT_NE(dxf.find("0\nTABLE\n2\nLAYER\n70\n2\n"), std::string::npos);
}

TEST(DxfWriterTest, ArcEllipseAndPolyline) {
    std::vector<Primitive> prims = {
        {primitive::Arc{Vec2(0, 0), 2.0, 0.0, 90.0, 1, 0}, PrimitiveClass::Boundary},
        {primitive::Ellipse{Vec2(1, 1), Vec2(4, 0), 0.5}, PrimitiveClass::Boundary},
        {primitive::Polyline{{Vec2(0, 0), Vec2(1, 0), Vec2(1, 1), Vec2(0, 1)}, true}, PrimitiveClass::Hole},
    };
    std::string dxf = DxfWriter().render(prims);

    EXPECT_NE(dxf.find("0\nARC\n8\nBOUNDARY\n"), std::string::npos);
    EXPECT_NE(dxf.find("40\n2.000000\n50\n0.000000\n51\n90.000000\n"), std::string::npos);

    EXPECT_NE(dxf.find("0\nELLIPSE\n8\nBOUNDARY\n"), std::string::npos);
    EXPECT_NE(dxf.find("11\n4.000000\n21\n0.000000\n31\n0.0\n40\n0.500000\n41\n0.0\n42\n6.283185\n"),
              std::string::npos);

    EXPECT_NE(dxf.find("0\nLWPOLYLINE\n8\nHOLES\n90\n4\n70\n1\n"), std::string::npos);
}

TEST(DxfWriterTest, EmptyListThrows) {
    try {
        DxfWriter().render({});
        FAIL() << "expected ExportError";
    } catch (const ExportError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::NoGeometryFound);
    }
}

TEST(DxfWriterTest, CustomLayerNames) {
    StyleMap styles;
    styles.boundary.layer = "OUTLINE";
    std::string dxf = DxfWriter(styles).render(plate_with_hole());
    EXPECT_EQ(count_occurrences(dxf, "0\nLINE\n8\nOUTLINE\n"), 4u);
}

// ============================================
// SVG Tests
// ============================================

TEST(SvgWriterTest, PaddedViewBox) {
    std::vector<Primitive> prims = {
        {primitive::Polyline{{Vec2(0, 0), Vec2(10, 0), Vec2(10, 10), Vec2(0, 10)}, true},
         PrimitiveClass::Boundary},
    };
    std::string svg = SvgWriter().render(prims);

    EXPECT_EQ(svg.rfind("<?xml", 0), 0u);
    EXPECT_NE(svg.find("width=\"12.000mm\" height=\"12.000mm\""), std::string::npos);
    EXPECT_NE(svg.find("viewBox=\"-1.000 -1.000 12.000 12.000\""), std::string::npos);
    EXPECT_NE(svg.find("<polygon points=\"0.000,0.000 10.000,0.000 10.000,10.000 0.000,10.000\" "
                       "class=\"boundary\"/>"),
              std::string::npos);
    EXPECT_NE(svg.find("</svg>"), std::string::npos);
}

TEST(SvgWriterTest, StylesForBothClasses) {
    std::string svg = SvgWriter().render(plate_with_hole());
    EXPECT_NE(svg.find(".boundary { fill: none; stroke: #000000; stroke-width: 0.1mm; }"),
              std::string::npos);
    EXPECT_NE(svg.find(".hole { fill: none; stroke: #ff0000; stroke-width: 0.05mm; }"),
              std::string::npos);
    EXPECT_EQ(count_occurrences(svg, "<line "), 4u);
    EXPECT_NE(svg.find("<circle cx=\"5.000\" cy=\"5.000\" r=\"3.000\" class=\"hole\"/>"),
              std::string::npos);
}

TEST(SvgWriterTest, ArcPathsFollowSweep) {
    std::vector<Primitive> prims = {
        {primitive::Arc{Vec2(0, 0), 5.0, 0.0, 90.0, 1, 0}, PrimitiveClass::Boundary},
        {primitive::Arc{Vec2(0, 0), 2.0, 90.0, 180.0, 0, 0}, PrimitiveClass::Boundary},
    };
    std::string svg = SvgWriter().render(prims);

    EXPECT_NE(svg.find("d=\"M 5.000 0.000 A 5.000 5.000 0 0 1 0.000 5.000\""), std::string::npos);
    EXPECT_NE(svg.find("d=\"M -2.000 0.000 A 2.000 2.000 0 0 0 0.000 2.000\""), std::string::npos);
}

TEST(SvgWriterTest, OpenPolylineAndEllipse) {
    std::vector<Primitive> prims = {
        {primitive::Polyline{{Vec2(0, 0), Vec2(1, 1)}, false}, PrimitiveClass::Boundary},
        {primitive::Ellipse{Vec2(2, 2), Vec2(0, 3), 0.5}, PrimitiveClass::Hole},
    };
    std::string svg = SvgWriter().render(prims);

    EXPECT_NE(svg.find("<polyline points=\"0.000,0.000 1.000,1.000\""), std::string::npos);
    EXPECT_NE(svg.find("<ellipse cx=\"2.000\" cy=\"2.000\" rx=\"3.000\" ry=\"1.500\" "
                       "transform=\"rotate(90.000 2.000 2.000)\" class=\"hole\"/>"),
              std::string::npos);
}

TEST(SvgWriterTest, EmptyListThrows) {
    EXPECT_THROW(SvgWriter().render({}), ExportError);
}

// ============================================
// Factory Tests
// ============================================

TEST(MakeWriterTest, KnownFormats) {
    EXPECT_EQ(make_writer("dxf")->extension(), "dxf");
    EXPECT_EQ(make_writer("SVG")->extension(), "svg");
}

TEST(MakeWriterTest, UnknownFormatThrows) {
    EXPECT_THROW(make_writer("pdf"), std::invalid_argument);
}
