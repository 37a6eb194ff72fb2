#ifndef FACEFLAT_SERIALIZATION_CONFIG_JSON_HPP
#define FACEFLAT_SERIALIZATION_CONFIG_JSON_HPP

#include <nlohmann/json.hpp>
#include <math/vec2.hpp>
#include <math/vec3.hpp>
#include <export/export_orchestrator.hpp>
#include <session/session_store.hpp>
#include "json_serialization.hpp"

namespace faceflat {

// Vec2 / Vec3 serialization
inline void to_json(nlohmann::json& j, const Vec2& v) {
    j = nlohmann::json::array({v.x, v.y});
}

inline void from_json(const nlohmann::json& j, Vec2& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
}

inline void to_json(nlohmann::json& j, const Vec3& v) {
    j = nlohmann::json::array({v.x, v.y, v.z});
}

inline void from_json(const nlohmann::json& j, Vec3& v) {
    v.x = j.at(0).get<double>();
    v.y = j.at(1).get<double>();
    v.z = j.at(2).get<double>();
}

// EdgeClassifierConfig serialization
inline void to_json(nlohmann::json& j, const EdgeClassifierConfig& config) {
    j = {
        {"full_turn_tolerance", config.full_turn_tolerance},
        {"export_samples", config.export_samples},
        {"secondary_samples", config.secondary_samples},
        {"min_segment_length", config.min_segment_length}
    };
}

inline void from_json(const nlohmann::json& j, EdgeClassifierConfig& config) {
    config.full_turn_tolerance = j.value("full_turn_tolerance", 0.01);
    config.export_samples = j.value("export_samples", 20);
    config.secondary_samples = j.value("secondary_samples", 12);
    config.min_segment_length = j.value("min_segment_length", 0.001);
}

// ArcConsolidationConfig serialization
inline void to_json(nlohmann::json& j, const ArcConsolidationConfig& config) {
    j = {
        {"radius_decimals", config.radius_decimals},
        {"center_tolerance", config.center_tolerance},
        {"large_arc_coverage_deg", config.large_arc_coverage_deg},
        {"small_arc_coverage_deg", config.small_arc_coverage_deg},
        {"coverage_threshold_deg", config.coverage_threshold_deg}
    };
}

inline void from_json(const nlohmann::json& j, ArcConsolidationConfig& config) {
    config.radius_decimals = j.value("radius_decimals", 3);
    config.center_tolerance = j.value("center_tolerance", 0.1);
    config.large_arc_coverage_deg = j.value("large_arc_coverage_deg", 180.0);
    config.small_arc_coverage_deg = j.value("small_arc_coverage_deg", 90.0);
    config.coverage_threshold_deg = j.value("coverage_threshold_deg", 300.0);
}

// MeshBoundaryConfig serialization
inline void to_json(nlohmann::json& j, const MeshBoundaryConfig& config) {
    j = {{"dedup_tolerance", config.dedup_tolerance}};
}

inline void from_json(const nlohmann::json& j, MeshBoundaryConfig& config) {
    config.dedup_tolerance = j.value("dedup_tolerance", 0.001);
}

// HoleDetectionConfig serialization
inline void to_json(nlohmann::json& j, const HoleDetectionConfig& config) {
    j = {
        {"min_points", config.min_points},
        {"min_interior_points", config.min_interior_points},
        {"min_radius", config.min_radius},
        {"max_radius", config.max_radius},
        {"radius_tolerance_fraction", config.radius_tolerance_fraction},
        {"min_cluster_size", config.min_cluster_size},
        {"circularity_tolerance_fraction", config.circularity_tolerance_fraction},
        {"circularity_min_fraction", config.circularity_min_fraction}
    };
}

inline void from_json(const nlohmann::json& j, HoleDetectionConfig& config) {
    config.min_points = j.value("min_points", size_t{10});
    config.min_interior_points = j.value("min_interior_points", size_t{6});
    config.min_radius = j.value("min_radius", 1.0);
    config.max_radius = j.value("max_radius", 10.0);
    config.radius_tolerance_fraction = j.value("radius_tolerance_fraction", 0.2);
    config.min_cluster_size = j.value("min_cluster_size", size_t{6});
    config.circularity_tolerance_fraction = j.value("circularity_tolerance_fraction", 0.25);
    config.circularity_min_fraction = j.value("circularity_min_fraction", 0.75);
}

// PlaceholderConfig serialization
inline void to_json(nlohmann::json& j, const PlaceholderConfig& config) {
    j = {{"size", config.size}};
}

inline void from_json(const nlohmann::json& j, PlaceholderConfig& config) {
    config.size = j.value("size", 10.0);
}

// ExportConfig serialization; missing sections keep their defaults
inline void to_json(nlohmann::json& j, const ExportConfig& config) {
    j = {
        {"edges", config.edges},
        {"arcs", config.arcs},
        {"mesh", config.mesh},
        {"holes", config.holes},
        {"placeholder", config.placeholder}
    };
}

inline void from_json(const nlohmann::json& j, ExportConfig& config) {
    config = ExportConfig{};
    if (j.contains("edges")) config.edges = j["edges"].get<EdgeClassifierConfig>();
    if (j.contains("arcs")) config.arcs = j["arcs"].get<ArcConsolidationConfig>();
    if (j.contains("mesh")) config.mesh = j["mesh"].get<MeshBoundaryConfig>();
    if (j.contains("holes")) config.holes = j["holes"].get<HoleDetectionConfig>();
    if (j.contains("placeholder")) config.placeholder = j["placeholder"].get<PlaceholderConfig>();
}

// SessionConfig serialization
inline void to_json(nlohmann::json& j, const SessionConfig& config) {
    j = {
        {"ttl_seconds", config.ttl_seconds},
        {"max_sessions", config.max_sessions}
    };
}

inline void from_json(const nlohmann::json& j, SessionConfig& config) {
    config.ttl_seconds = j.value("ttl_seconds", int64_t{3600});
    config.max_sessions = j.value("max_sessions", size_t{64});
}

// Top-level config file: export sections plus an optional "session" block
struct AppConfig {
    ExportConfig export_config;
    SessionConfig session;
};

inline AppConfig app_config_from_json(const nlohmann::json& j) {
    AppConfig config;
    config.export_config = j.get<ExportConfig>();
    if (j.contains("session")) {
        config.session = j["session"].get<SessionConfig>();
    }
    return config;
}

inline nlohmann::json app_config_to_json(const AppConfig& config) {
    nlohmann::json j = config.export_config;
    j["session"] = config.session;
    return j;
}

inline AppConfig load_app_config(const std::string& path) {
    return app_config_from_json(json::read_json_file(path));
}

}  // namespace faceflat

#endif // FACEFLAT_SERIALIZATION_CONFIG_JSON_HPP
