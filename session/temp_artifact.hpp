#ifndef FACEFLAT_SESSION_TEMP_ARTIFACT_HPP
#define FACEFLAT_SESSION_TEMP_ARTIFACT_HPP

#include <filesystem>
#include <string>
#include <utility>

namespace faceflat {

// Owns a generated temporary file and deletes it when destroyed. A failed
// deletion is logged, never retried.
class TempArtifact {
public:
    TempArtifact() = default;
    explicit TempArtifact(std::filesystem::path path) : path_(std::move(path)) {}
    ~TempArtifact();

    TempArtifact(const TempArtifact&) = delete;
    TempArtifact& operator=(const TempArtifact&) = delete;
    TempArtifact(TempArtifact&& other) noexcept;
    TempArtifact& operator=(TempArtifact&& other) noexcept;

    // Writes contents to a new file in the system temp directory. On failure
    // nothing is left behind and ExportError (ExportWrite) is thrown.
    static TempArtifact create(const std::string& extension, const std::string& contents);

    const std::filesystem::path& path() const { return path_; }
    bool empty() const { return path_.empty(); }

    // Stop owning the file; the caller becomes responsible for it
    std::filesystem::path release();

    // Delete the file now
    void reset();

private:
    std::filesystem::path path_;
};

}  // namespace faceflat

#endif // FACEFLAT_SESSION_TEMP_ARTIFACT_HPP
