#pragma once

#include <optional>
#include <string>

namespace ProgressEngine {

struct StructureDocument {
    std::string json;
    std::string version;
};

/**
 * @brief Upstream provider of serialized subject hierarchies.
 *
 * version() is expected to be cheap. The loader calls it on every lookup to
 * detect content changes. Both calls return nullopt for an unknown subject.
 */
class StructureSource {
public:
    virtual ~StructureSource() = default;

    virtual std::optional<StructureDocument> fetch(const std::string& subjectId) = 0;
    virtual std::optional<std::string> version(const std::string& subjectId) = 0;
};

/**
 * @brief Reads <content_dir>/<subjectId>.json. The etag is mtime + size.
 */
class FileStructureSource : public StructureSource {
public:
    explicit FileStructureSource(std::string contentDir);

    std::optional<StructureDocument> fetch(const std::string& subjectId) override;
    std::optional<std::string> version(const std::string& subjectId) override;

private:
    std::string pathFor(const std::string& subjectId) const;

    std::string content_dir_;
};

} // namespace ProgressEngine
