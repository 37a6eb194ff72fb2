#include "export_service.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <projection/normal_resolver.hpp>
#include <filesystem>
#include <utility>

namespace faceflat {

FaceInfo describe_face(size_t id, const FaceHandle& face) {
    auto log = logging::get_logger();
    FaceInfo info;
    info.id = id;
    info.type = face.surface_kind();
    info.is_plane = info.type == SurfaceKind::Plane;

    try {
        info.mesh = face.triangulation();
    } catch (const KernelError& e) {
        log->warn("Face {} triangulation unavailable: {}", id, e.what());
    }
    try {
        info.wire_count = face.wires().size();
    } catch (const KernelError& e) {
        log->warn("Face {} wires unavailable: {}", id, e.what());
    }
    info.normal = resolve_face_normal(face);
    return info;
}

std::string download_name(const std::string& source_file, size_t face_id,
                          const std::string& extension) {
    std::string stem = std::filesystem::path(source_file).stem().string();
    if (stem.empty()) {
        stem = "face_export";
    }
    return stem + "_face_" + std::to_string(face_id + 1) + "." + extension;
}

ExportService::ExportService(const SessionStore& store, const ExportConfig& config,
                             const StyleMap& styles)
    : store_(store), orchestrator_(config), config_(config), styles_(styles) {}

std::shared_ptr<const Session> ExportService::session(const std::string& id) const {
    auto found = store_.get(id);
    if (!found) {
        throw ExportError(ErrorKind::SessionNotFound, "Session not found: " + id);
    }
    return found;
}

const FaceHandle& ExportService::face(const Session& session, size_t face_id) const {
    if (face_id >= session.faces.size()) {
        throw ExportError(ErrorKind::InvalidFaceId,
                          "Invalid face ID " + std::to_string(face_id) + " (session has " +
                          std::to_string(session.faces.size()) + " faces)");
    }
    return *session.faces.faces[face_id];
}

ExportArtifact ExportService::export_face(const std::string& session_id, size_t face_id,
                                          const std::string& format) const {
    auto log = logging::get_logger();
    auto writer = make_writer(format, styles_);
    auto current = session(session_id);
    const FaceHandle& target = face(*current, face_id);

    log->info("Exporting face {} of session {} as {}", face_id, session_id, writer->extension());
    ExportResult result = orchestrator_.run(target);
    std::string document = writer->render(result.primitives);

    ExportArtifact artifact;
    artifact.file = TempArtifact::create(writer->extension(), document);
    artifact.download_name = download_name(current->faces.source_file, face_id, writer->extension());
    artifact.entity_count = result.entity_count;
    artifact.wire_count = result.wire_count;
    artifact.stage = result.stage;

    log->info("Face {} exported ({} stage, {} wires, {} entities) -> {}",
              face_id, export_stage_name(result.stage), result.wire_count,
              result.entity_count, artifact.download_name);
    return artifact;
}

PreviewPayload ExportService::preview(const std::string& session_id, size_t face_id) const {
    auto current = session(session_id);
    return build_preview(face_id, face(*current, face_id), config_);
}

FaceInfo ExportService::face_info(const std::string& session_id, size_t face_id) const {
    auto current = session(session_id);
    return describe_face(face_id, face(*current, face_id));
}

std::vector<FaceInfo> ExportService::list_faces(const std::string& session_id) const {
    auto current = session(session_id);
    std::vector<FaceInfo> faces;
    faces.reserve(current->faces.size());
    for (size_t i = 0; i < current->faces.size(); ++i) {
        faces.push_back(describe_face(i, *current->faces.faces[i]));
    }
    return faces;
}

}  // namespace faceflat
