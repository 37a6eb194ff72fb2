#include "cli_common.hpp"
#include <common/errors.hpp>
#include <serialization/face_set_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/preview_json.hpp>
#include <session/export_service.hpp>
#include <session/session_store.hpp>

namespace faceflat::cli {

int command_preview(int argc, char** argv) {
    auto log = faceflat::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty() || !ctx.face_id) {
            std::cerr << "Usage: faceflat preview <faceset.json> --face N [-o <preview.json>] "
                         "[-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        AppConfig config = load_config(ctx);

        SessionStore store(config.session);
        FaceSet faces = load_face_set(ctx.input_path);
        std::string source = faces.source_file;
        std::string session_id = store.insert(std::move(faces));
        ExportService service(store, config.export_config);

        PreviewPayload preview = service.preview(session_id, *ctx.face_id);

        json::SerializedData output = json::make_envelope("preview", source, preview);
        output.config = app_config_to_json(config);
        output.stats = {
            {"entity_count", preview.entity_count},
            {"hole_count", preview.holes.size()},
            {"placeholder", preview.placeholder}
        };

        if (ctx.output_path.empty()) {
            std::cout << output.to_json().dump(2) << "\n";
        } else {
            json::write_serialized(ctx.output_path, output);
            std::cerr << "Wrote " << ctx.output_path << " (" << preview.entity_count
                      << " entities, " << preview.holes.size() << " holes)\n";
        }

        log->info("Preview complete for face {}", *ctx.face_id);
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
