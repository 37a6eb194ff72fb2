#include "cli_common.hpp"
#include <serialization/face_set_json.hpp>
#include <serialization/json_serialization.hpp>
#include <serialization/preview_json.hpp>
#include <session/export_service.hpp>
#include <session/session_store.hpp>
#include <iomanip>

namespace faceflat::cli {

int command_faces(int argc, char** argv) {
    auto log = faceflat::logging::get_logger();

    try {
        auto [ctx, _] = parse_common_args(argc, argv, 2);

        if (ctx.help || ctx.input_path.empty()) {
            std::cerr << "Usage: faceflat faces <faceset.json> [-o <faces.json>] [-c <config.json>]\n";
            return ctx.help ? 0 : 1;
        }

        AppConfig config = load_config(ctx);

        log->info("Loading faces from: {}", ctx.input_path);
        SessionStore store(config.session);
        std::string session_id = store.insert(load_face_set(ctx.input_path));
        ExportService service(store, config.export_config);

        std::vector<FaceInfo> faces = service.list_faces(session_id);

        std::cout << std::left << std::setw(6) << "id" << std::setw(9) << "type"
                  << std::setw(7) << "wires" << std::setw(10) << "vertices" << "normal\n";
        std::cout << std::fixed << std::setprecision(3);
        for (const auto& face : faces) {
            std::cout << std::setw(6) << face.id << std::setw(9) << surface_kind_name(face.type)
                      << std::setw(7) << face.wire_count << std::setw(10) << face.mesh.vertices.size()
                      << "(" << face.normal.x << ", " << face.normal.y << ", " << face.normal.z << ")\n";
        }

        if (!ctx.output_path.empty()) {
            json::SerializedData output = json::make_envelope("faces", store.get(session_id)->faces.source_file,
                                                              faces);
            output.config = app_config_to_json(config);
            output.stats = {{"face_count", faces.size()}};
            json::write_serialized(ctx.output_path, output);
            log->info("Wrote face list to {}", ctx.output_path);
        }

        return 0;

    } catch (const std::exception& e) {
        log->error("Error: {}", e.what());
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}

}  // namespace faceflat::cli
