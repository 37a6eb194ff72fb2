#include "cli_common.hpp"
#include <common/errors.hpp>
#include <serialization/face_set_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/preview_json.hpp>
#include <session/export_service.hpp>
#include <session/session_store.hpp>
#include <filesystem>

namespace faceflat::cli {

int command_export(int argc, char** argv) {
    auto log = faceflat::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty() || !ctx.face_id) {
            std::cerr << "Usage: faceflat export <faceset.json> --face N [--format dxf|svg] "
                         "[-o <output>] [-s <stats.json>] [-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        AppConfig config = load_config(ctx);

        SessionStore store(config.session);
        FaceSet faces = load_face_set(ctx.input_path);
        std::string source = faces.source_file;
        std::string session_id = store.insert(std::move(faces));
        ExportService service(store, config.export_config);

        ExportArtifact artifact = service.export_face(session_id, *ctx.face_id, ctx.format);

        std::string output = ctx.output_path.empty() ? artifact.download_name : ctx.output_path;
        std::error_code ec;
        std::filesystem::copy_file(artifact.file.path(), output,
                                   std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            throw ExportError(ErrorKind::ExportWrite,
                              "Cannot write to file: " + output + " (" + ec.message() + ")");
        }

        log->info("Wrote {} to {}", ctx.format, output);
        std::cerr << "Wrote " << output << " (" << artifact.entity_count << " entities, "
                  << artifact.wire_count << " wires, " << export_stage_name(artifact.stage)
                  << " geometry)\n";

        if (ctx.stats_path) {
            json::SerializedData stats = json::make_envelope(
                "export", source,
                {{"face_id", *ctx.face_id}, {"format", ctx.format}, {"output", output}});
            stats.config = app_config_to_json(config);
            stats.stats = export_stats_to_json(artifact);
            json::write_serialized(*ctx.stats_path, stats);
            log->debug("Wrote export statistics to {}", *ctx.stats_path);
        }

        return 0;

    } catch (const ExportError& e) {
        log->error("{}: {}", error_kind_name(e.kind()), e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace faceflat::cli
