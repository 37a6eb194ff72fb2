#ifndef FACEFLAT_SESSION_EXPORT_SERVICE_HPP
#define FACEFLAT_SESSION_EXPORT_SERVICE_HPP

#include "session_store.hpp"
#include "temp_artifact.hpp"
#include <export/export_orchestrator.hpp>
#include <export/preview_builder.hpp>
#include <writers/format_writer.hpp>
#include <memory>
#include <string>
#include <vector>

namespace faceflat {

// A drawing written for download. The file goes away with the artifact.
struct ExportArtifact {
    TempArtifact file;
    std::string download_name;
    size_t entity_count = 0;
    size_t wire_count = 0;
    ExportStage stage = ExportStage::Default;
};

struct FaceInfo {
    size_t id = 0;
    SurfaceKind type = SurfaceKind::Unknown;
    bool is_plane = false;
    Mesh mesh;
    Vec3 normal;
    size_t wire_count = 0;
};

// Summary of one face; kernel failures leave the affected fields empty
FaceInfo describe_face(size_t id, const FaceHandle& face);

// "<source stem>_face_<id + 1>.<extension>"
std::string download_name(const std::string& source_file, size_t face_id,
                          const std::string& extension);

// Request-level entry points over stored sessions. Every call throws
// ExportError: SessionNotFound, InvalidFaceId, or ExportWrite.
class ExportService {
public:
    explicit ExportService(const SessionStore& store,
                           const ExportConfig& config = ExportConfig{},
                           const StyleMap& styles = StyleMap{});

    // Unknown formats throw std::invalid_argument before any work is done
    ExportArtifact export_face(const std::string& session_id, size_t face_id,
                               const std::string& format) const;

    PreviewPayload preview(const std::string& session_id, size_t face_id) const;

    FaceInfo face_info(const std::string& session_id, size_t face_id) const;

    std::vector<FaceInfo> list_faces(const std::string& session_id) const;

private:
    std::shared_ptr<const Session> session(const std::string& id) const;
    const FaceHandle& face(const Session& session, size_t face_id) const;

    const SessionStore& store_;
    ExportOrchestrator orchestrator_;
    ExportConfig config_;
    StyleMap styles_;
};

}  // namespace faceflat

#endif // FACEFLAT_SESSION_EXPORT_SERVICE_HPP
