#include <gtest/gtest.h>
#include "export_service.hpp"
#include "json_serialization.hpp"
#include "preview_json.hpp"
#include "errors.hpp"
#include "test_helpers.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <sstream>

using namespace faceflat;
using namespace faceflat::test;

namespace {

class ExportServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        FaceSet set;
        set.source_file = "/uploads/bracket.step";
        set.faces.push_back(planar_face({rectangle_wire(0, 0, 40, 20), circle_wire(Vec3(10, 10, 0), 3.0)},
                                        square_mesh(40.0)));
        set.faces.push_back(std::make_shared<MeshOnlyFace>(square_mesh(5.0)));
        set.faces.push_back(std::make_shared<MemoryFace>(SurfaceKind::Curved, std::nullopt,
                                                         WireList{}, Mesh{}));
        session_id = store.insert(std::move(set));
    }

    ErrorKind kind_of(const std::function<void()>& call) {
        try {
            call();
        } catch (const ExportError& e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected ExportError";
        return ErrorKind::Kernel;
    }

    SessionStore store;
    ExportService service{store};
    std::string session_id;
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

}  // namespace

TEST(DownloadNameTest, UsesSourceStemAndOneBasedId) {
    EXPECT_EQ(download_name("/tmp/uploads/bracket.step", 0, "dxf"), "bracket_face_1.dxf");
    EXPECT_EQ(download_name("plate.stp", 4, "svg"), "plate_face_5.svg");
    EXPECT_EQ(download_name("", 1, "dxf"), "face_export_face_2.dxf");
}

TEST_F(ExportServiceTest, ExportsDxf) {
    ExportArtifact artifact = service.export_face(session_id, 0, "dxf");

    EXPECT_EQ(artifact.download_name, "bracket_face_1.dxf");
    EXPECT_EQ(artifact.stage, ExportStage::Exact);
    EXPECT_EQ(artifact.wire_count, 2u);
    EXPECT_EQ(artifact.entity_count, 5u);
    ASSERT_TRUE(std::filesystem::exists(artifact.file.path()));

    std::string dxf = read_file(artifact.file.path());
    EXPECT_NE(dxf.find("0\nCIRCLE\n8\nHOLES\n"), std::string::npos);
    EXPECT_NE(dxf.find("0\nEOF\n"), std::string::npos);
}

TEST_F(ExportServiceTest, ExportsSvgAndCleansUp) {
    std::filesystem::path path;
    {
        ExportArtifact artifact = service.export_face(session_id, 1, "svg");
        EXPECT_EQ(artifact.download_name, "bracket_face_2.svg");
        EXPECT_EQ(artifact.stage, ExportStage::Mesh);
        path = artifact.file.path();
        EXPECT_NE(read_file(path).find("<polygon"), std::string::npos);
    }
    EXPECT_FALSE(std::filesystem::exists(path));
}

TEST_F(ExportServiceTest, StatisticsEnvelope) {
    ExportArtifact artifact = service.export_face(session_id, 1, "dxf");

    json::SerializedData envelope =
        json::make_envelope("export", "/uploads/bracket.step", nlohmann::json::object({{"face_id", 1}}));
    envelope.stats = export_stats_to_json(artifact);
    nlohmann::json j = envelope.to_json();

    EXPECT_EQ(j["step"], "export");
    EXPECT_EQ(j["stats"]["stage"], "mesh");
    EXPECT_EQ(j["stats"]["wire_count"], 1);
    EXPECT_EQ(j["stats"]["entity_count"], 1);
    EXPECT_EQ(j["stats"]["download_name"], "bracket_face_2.dxf");
    EXPECT_EQ(j["data"]["face_id"], 1);
}

TEST_F(ExportServiceTest, PlaceholderExport) {
    ExportArtifact artifact = service.export_face(session_id, 2, "dxf");
    EXPECT_EQ(artifact.stage, ExportStage::Default);
    EXPECT_EQ(artifact.entity_count, 1u);
    EXPECT_NE(read_file(artifact.file.path()).find("0\nLWPOLYLINE\n"), std::string::npos);
}

TEST_F(ExportServiceTest, UnknownSession) {
    EXPECT_EQ(kind_of([&] { service.export_face("nope", 0, "dxf"); }), ErrorKind::SessionNotFound);
    EXPECT_EQ(kind_of([&] { service.preview("nope", 0); }), ErrorKind::SessionNotFound);
    EXPECT_EQ(kind_of([&] { service.list_faces("nope"); }), ErrorKind::SessionNotFound);
}

TEST_F(ExportServiceTest, FaceIdOutOfRange) {
    EXPECT_EQ(kind_of([&] { service.export_face(session_id, 3, "svg"); }), ErrorKind::InvalidFaceId);
    EXPECT_EQ(kind_of([&] { service.preview(session_id, 99); }), ErrorKind::InvalidFaceId);
    EXPECT_EQ(kind_of([&] { service.face_info(session_id, 3); }), ErrorKind::InvalidFaceId);
}

TEST_F(ExportServiceTest, UnknownFormatRejectedFirst) {
    EXPECT_THROW(service.export_face("nope", 0, "step"), std::invalid_argument);
}

TEST_F(ExportServiceTest, Preview) {
    PreviewPayload preview = service.preview(session_id, 0);
    EXPECT_EQ(preview.face_id, 0u);
    EXPECT_FALSE(preview.placeholder);
    EXPECT_DOUBLE_EQ(preview.dimensions.width, 40.0);

    EXPECT_TRUE(service.preview(session_id, 2).placeholder);
}

TEST_F(ExportServiceTest, ListFaces) {
    auto faces = service.list_faces(session_id);
    ASSERT_EQ(faces.size(), 3u);

    EXPECT_EQ(faces[0].id, 0u);
    EXPECT_TRUE(faces[0].is_plane);
    EXPECT_EQ(faces[0].wire_count, 2u);
    EXPECT_EQ(faces[0].mesh.triangles.size(), 2u);
    EXPECT_NEAR(faces[0].normal.z, 1.0, 1e-12);

    EXPECT_EQ(faces[1].type, SurfaceKind::Unknown);
    EXPECT_FALSE(faces[1].is_plane);
    EXPECT_EQ(faces[1].wire_count, 0u);
    EXPECT_NEAR(faces[1].normal.z, 1.0, 1e-12);

    EXPECT_EQ(faces[2].type, SurfaceKind::Curved);
    EXPECT_TRUE(faces[2].mesh.empty());
}

TEST_F(ExportServiceTest, ExpiredSessionIsNotFound) {
    SessionStore short_store(SessionConfig{1, 4});
    SessionStore::Clock::time_point long_ago{};
    std::string id = short_store.insert(FaceSet{}, long_ago);

    ExportService short_service(short_store);
    EXPECT_EQ(kind_of([&] { short_service.list_faces(id); }), ErrorKind::SessionNotFound);
}
