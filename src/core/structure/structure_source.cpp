#include <progressengine/core/structure/structure_source.hpp>
#include <spdlog/spdlog.h>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace ProgressEngine {

namespace {

// Keeps lookups inside the content directory
bool isPlainName(const std::string& subjectId) {
    return !subjectId.empty()
        && subjectId.find_first_of("/\\") == std::string::npos
        && subjectId.find("..") == std::string::npos;
}

} // namespace

FileStructureSource::FileStructureSource(std::string contentDir)
    : content_dir_(std::move(contentDir)) {}

std::string FileStructureSource::pathFor(const std::string& subjectId) const {
    return (fs::path(content_dir_) / (subjectId + ".json")).string();
}

std::optional<std::string> FileStructureSource::version(const std::string& subjectId) {
    if (!isPlainName(subjectId)) {
        spdlog::warn("[FileStructureSource] Rejected subject id {}", subjectId);
        return std::nullopt;
    }
    std::error_code ec;
    fs::path path = pathFor(subjectId);
    auto mtime = fs::last_write_time(path, ec);
    if (ec) return std::nullopt;
    auto size = fs::file_size(path, ec);
    if (ec) return std::nullopt;
    return std::to_string(mtime.time_since_epoch().count()) + "-" + std::to_string(size);
}

std::optional<StructureDocument> FileStructureSource::fetch(const std::string& subjectId) {
    // Version first: if the file changes mid-read the next lookup sees a new etag
    auto ver = version(subjectId);
    if (!ver) {
        spdlog::debug("[FileStructureSource] No structure file for subject {}", subjectId);
        return std::nullopt;
    }

    std::ifstream ifs(pathFor(subjectId), std::ios::binary);
    if (!ifs) {
        spdlog::warn("[FileStructureSource] Failed to open {}", pathFor(subjectId));
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << ifs.rdbuf();
    return StructureDocument{buffer.str(), *ver};
}

} // namespace ProgressEngine
