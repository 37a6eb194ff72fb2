#ifndef FACEFLAT_SERIALIZATION_JSON_SERIALIZATION_HPP
#define FACEFLAT_SERIALIZATION_JSON_SERIALIZATION_HPP

#include <nlohmann/json.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>

namespace faceflat::json {

// Version of the output document format
constexpr const char* SERIALIZATION_VERSION = "1.0.0";

// Envelope around every JSON document the tools write
struct SerializedData {
    std::string version = SERIALIZATION_VERSION;
    std::string step;          // which command produced the document
    std::string timestamp;
    std::string source_file;   // face-set the data came from
    nlohmann::json config;
    nlohmann::json stats;
    nlohmann::json data;

    nlohmann::json to_json() const {
        nlohmann::json j;
        j["version"] = version;
        j["step"] = step;
        if (!timestamp.empty()) j["timestamp"] = timestamp;
        if (!source_file.empty()) j["source_file"] = source_file;
        if (!config.is_null()) j["config"] = config;
        if (!stats.is_null()) j["stats"] = stats;
        j["data"] = data;
        return j;
    }
};

// Current UTC time, ISO 8601
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::ostringstream oss;
    oss << std::put_time(std::gmtime(&time), "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

// Envelope stamped with the current time
inline SerializedData make_envelope(const std::string& step,
                                    const std::string& source_file,
                                    nlohmann::json data) {
    SerializedData envelope;
    envelope.step = step;
    envelope.timestamp = get_timestamp();
    envelope.source_file = source_file;
    envelope.data = std::move(data);
    return envelope;
}

inline void write_json_file(const std::string& path, const nlohmann::json& j) {
    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << j.dump(2);
}

inline nlohmann::json read_json_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    nlohmann::json j;
    file >> j;
    return j;
}

inline void write_serialized(const std::string& path, const SerializedData& data) {
    write_json_file(path, data.to_json());
}

}  // namespace faceflat::json

#endif // FACEFLAT_SERIALIZATION_JSON_SERIALIZATION_HPP
