#include <iostream>
#include <string>

#include "cli_common.hpp"
#include "logging.hpp"

void print_usage(const char* program_name) {
    std::cerr << "Usage: " << program_name << " <command> <faceset.json> [options]\n";
    std::cerr << "\n";
    std::cerr << "Flattens B-rep faces into 2D drawings.\n";
    std::cerr << "\n";
    std::cerr << "Commands:\n";
    std::cerr << "  faces       List the faces of a face set\n";
    std::cerr << "  export      Write one face as DXF or SVG\n";
    std::cerr << "  preview     Write the JSON preview of one face\n";
    std::cerr << "\n";
    std::cerr << "Options:\n";
    std::cerr << "  -f, --face N        Face index (0-based)\n";
    std::cerr << "  --format dxf|svg    Drawing format for export (default dxf)\n";
    std::cerr << "  -o, --output PATH   Output file\n";
    std::cerr << "  -s, --stats PATH    Export statistics as JSON (export only)\n";
    std::cerr << "  -c, --config PATH   JSON config with thresholds\n";
    std::cerr << "  -v, --verbose       Debug logging\n";
    std::cerr << "  -h, --help          Show help\n";
    std::cerr << "\n";
    std::cerr << "Environment:\n";
    std::cerr << "  FACEFLAT_LOG_LEVEL - Set log level (trace, debug, info, warn, error)\n";
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    std::string command = argv[1];
    if (command == "-h" || command == "--help" || command == "help") {
        print_usage(argv[0]);
        return 0;
    }

    faceflat::logging::get_logger()->debug("Running command: {}", command);

    if (command == "faces") {
        return faceflat::cli::command_faces(argc, argv);
    }
    if (command == "export") {
        return faceflat::cli::command_export(argc, argv);
    }
    if (command == "preview") {
        return faceflat::cli::command_preview(argc, argv);
    }

    std::cerr << "Unknown command: " << command << "\n\n";
    print_usage(argv[0]);
    return 1;
}
