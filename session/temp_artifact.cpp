#include "temp_artifact.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>
#include <utility>

namespace faceflat {

namespace {

std::filesystem::path unique_temp_path(const std::string& extension) {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::temp_directory_path(ec);
    if (ec) {
        throw ExportError(ErrorKind::ExportWrite, "No temporary directory: " + ec.message());
    }

    for (int attempt = 0; attempt < 16; ++attempt) {
        std::ostringstream name;
        name << "faceflat-" << std::hex << rng() << "." << extension;
        std::filesystem::path candidate = dir / name.str();
        if (!std::filesystem::exists(candidate, ec)) {
            return candidate;
        }
    }
    throw ExportError(ErrorKind::ExportWrite, "Could not pick a temporary file name");
}

}  // namespace

TempArtifact::~TempArtifact() {
    reset();
}

TempArtifact::TempArtifact(TempArtifact&& other) noexcept
    : path_(std::exchange(other.path_, {})) {}

TempArtifact& TempArtifact::operator=(TempArtifact&& other) noexcept {
    if (this != &other) {
        reset();
        path_ = std::exchange(other.path_, {});
    }
    return *this;
}

TempArtifact TempArtifact::create(const std::string& extension, const std::string& contents) {
    TempArtifact artifact(unique_temp_path(extension));

    std::ofstream file(artifact.path(), std::ios::binary);
    if (!file) {
        // Never opened, so there is nothing to remove
        std::string path = artifact.release().string();
        throw ExportError(ErrorKind::ExportWrite, "Cannot write to file: " + path);
    }
    file << contents;
    file.close();
    if (!file) {
        // Destructor of artifact removes the partial file
        throw ExportError(ErrorKind::ExportWrite, "Failed writing " + artifact.path().string());
    }

    logging::get_logger()->debug("Wrote {} bytes to {}", contents.size(), artifact.path().string());
    return artifact;
}

std::filesystem::path TempArtifact::release() {
    return std::exchange(path_, {});
}

void TempArtifact::reset() {
    if (path_.empty()) {
        return;
    }
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        logging::get_logger()->error("Error deleting temp file {}: {}", path_.string(), ec.message());
    }
    path_.clear();
}

}  // namespace faceflat
