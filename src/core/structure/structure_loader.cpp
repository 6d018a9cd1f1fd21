#include <progressengine/core/structure/structure_loader.hpp>
#include <progressengine/core/common/errors.hpp>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace ProgressEngine {

namespace {

constexpr int MAX_DEPTH = 32;

// Typed child lists used by the content export, in hierarchy order
constexpr const char* kTypedChildKeys[] = {"tracks", "units", "topics", "lessons"};

const Json::Value* firstMember(const Json::Value& obj, const char* a, const char* b) {
    if (obj.isMember(a)) return &obj[a];
    if (obj.isMember(b)) return &obj[b];
    return nullptr;
}

NodeType containerTypeForDepth(int depth) {
    switch (depth) {
        case 0:  return NodeType::SUBJECT;
        case 1:  return NodeType::TRACK;
        case 2:  return NodeType::UNIT;
        default: return NodeType::TOPIC;
    }
}

class TreeBuilder {
public:
    explicit TreeBuilder(const std::string& subjectId) : subject_id_(subjectId) {}

    std::vector<StructureNode> build(const Json::Value& root) {
        if (!root.isObject()) {
            invalid("root is not an object");
        }
        if (isHidden(root)) {
            throw ProgressError(ErrorCode::SUBJECT_NOT_FOUND,
                                "subject " + subject_id_ + " is not published");
        }
        if (!addNode(root, 0, -1)) {
            invalid("root node rejected");
        }
        if (nodes_.front().isLesson()) {
            invalid("root must be a container");
        }
        if (dropped_ > 0) {
            spdlog::warn("[StructureLoader] Subject {}: excluded {} lessons without a valid position",
                         subject_id_, dropped_);
        }
        return std::move(nodes_);
    }

private:
    [[noreturn]] void invalid(const std::string& why) const {
        throw ProgressError(ErrorCode::INVALID_STRUCTURE,
                            "subject " + subject_id_ + ": " + why);
    }

    static bool isHidden(const Json::Value& v) {
        if (v.isMember("published") && v["published"].isBool() && !v["published"].asBool()) {
            return true;
        }
        return v.isMember("deleted") && v["deleted"].isBool() && v["deleted"].asBool();
    }

    // Returns false when the node (and its subtree) is excluded. Entries of a
    // typed "lessons" list are lessons even when their position is missing.
    bool addNode(const Json::Value& v, int depth, int32_t parent, bool fromLessonList = false) {
        if (depth > MAX_DEPTH) invalid("hierarchy deeper than " + std::to_string(MAX_DEPTH));
        if (!v.isObject()) invalid("node is not an object");
        if (isHidden(v)) return false;

        const Json::Value& idVal = v["id"];
        if (!idVal.isString() || idVal.asString().empty()) {
            invalid("node without a string id");
        }

        std::optional<NodeType> explicitType;
        if (v.isMember("type")) {
            if (!v["type"].isString()) invalid("node " + idVal.asString() + ": type must be a string");
            explicitType = parseNodeType(v["type"].asString());
            if (!explicitType) {
                invalid("node " + idVal.asString() + ": unknown type " + v["type"].asString());
            }
        }

        const Json::Value* bit = firstMember(v, "bitPosition", "bit_index");
        bool lesson = explicitType ? (*explicitType == NodeType::LESSON)
                                   : (bit != nullptr || fromLessonList);

        StructureNode node;
        node.id = idVal.asString();
        node.title = v.get("title", "").asString();
        node.parent = parent;

        const Json::Value* sort = firstMember(v, "sortOrder", "sort_order");
        if (sort != nullptr && !sort->isNull()) {
            if (!sort->isInt()) invalid("node " + node.id + ": sortOrder must be an integer");
            node.sortOrder = sort->asInt();
        }

        if (lesson) {
            if (depth == 0) invalid("root must be a container");
            if (bit == nullptr || !bit->isIntegral() || bit->asInt64() < 0
                || bit->asInt64() > static_cast<Json::Int64>(UINT32_MAX)) {
                spdlog::warn("[StructureLoader] Subject {}: lesson {} has no valid bit position, dropped",
                             subject_id_, node.id);
                ++dropped_;
                return false;
            }
            node.type = NodeType::LESSON;
            node.kind = LessonInfo{static_cast<uint32_t>(bit->asInt64())};
            nodes_.push_back(std::move(node));
            return true;
        }

        node.type = explicitType ? *explicitType : containerTypeForDepth(depth);
        ContainerInfo info;
        info.sequential = true;
        if (const Json::Value* seq = firstMember(v, "sequential", "is_linear")) {
            if (!seq->isBool()) invalid("node " + node.id + ": sequential must be a boolean");
            info.sequential = seq->asBool();
        }
        node.kind = info;

        uint32_t self = static_cast<uint32_t>(nodes_.size());
        nodes_.push_back(std::move(node));

        std::vector<uint32_t> children;
        auto addChildren = [&](const Json::Value& list, bool lessonList) {
            if (!list.isArray()) invalid("node " + nodes_[self].id + ": children must be an array");
            for (const auto& child : list) {
                uint32_t childIdx = static_cast<uint32_t>(nodes_.size());
                if (addNode(child, depth + 1, static_cast<int32_t>(self), lessonList)) {
                    children.push_back(childIdx);
                }
            }
        };

        if (v.isMember("children")) {
            addChildren(v["children"], false);
        } else {
            for (const char* key : kTypedChildKeys) {
                if (v.isMember(key)) addChildren(v[key], std::string(key) == "lessons");
            }
        }

        std::stable_sort(children.begin(), children.end(), [this](uint32_t a, uint32_t b) {
            return nodes_[a].sortOrder < nodes_[b].sortOrder;
        });
        nodes_[self].children = std::move(children);
        return true;
    }

    const std::string& subject_id_;
    std::vector<StructureNode> nodes_;
    size_t dropped_ = 0;
};

} // namespace

StructureLoader::StructureLoader(StructureSource& source, size_t capacity)
    : source_(source), capacity_(capacity == 0 ? 1 : capacity) {}

std::shared_ptr<const StructureTree> StructureLoader::parse(const std::string& subjectId,
                                                            const StructureDocument& doc) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    Json::Value root;
    std::string errs;
    std::istringstream in(doc.json);
    if (!Json::parseFromStream(builder, in, &root, &errs)) {
        throw ProgressError(ErrorCode::INVALID_STRUCTURE,
                            "subject " + subjectId + ": malformed JSON: " + errs);
    }

    TreeBuilder tb(subjectId);
    return std::make_shared<const StructureTree>(subjectId, doc.version, tb.build(root));
}

std::shared_ptr<const StructureTree> StructureLoader::load(const std::string& subjectId) {
    auto currentVersion = source_.version(subjectId);
    if (!currentVersion) {
        invalidate(subjectId);
        throw ProgressError(ErrorCode::SUBJECT_NOT_FOUND, "no structure for subject " + subjectId);
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(subjectId);
        if (it != entries_.end()) {
            if (it->second.tree->version() == *currentVersion) {
                lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
                return it->second.tree;
            }
            spdlog::info("[StructureLoader] Subject {} changed ({} -> {}), reloading",
                         subjectId, it->second.tree->version(), *currentVersion);
        }
    }

    // Fetch and parse outside the lock; concurrent cold loads of the same
    // subject both parse and the later insert wins.
    auto doc = source_.fetch(subjectId);
    if (!doc) {
        invalidate(subjectId);
        throw ProgressError(ErrorCode::SUBJECT_NOT_FOUND, "no structure for subject " + subjectId);
    }
    auto tree = parse(subjectId, *doc);
    spdlog::info("[StructureLoader] Loaded subject {} ({} nodes, {} lessons, version {})",
                 subjectId, tree->size(), tree->lessonCount(), tree->version());

    std::lock_guard<std::mutex> lock(mutex_);
    insertLocked(subjectId, tree);
    return tree;
}

void StructureLoader::insertLocked(const std::string& subjectId,
                                   std::shared_ptr<const StructureTree> tree) {
    auto it = entries_.find(subjectId);
    if (it != entries_.end()) {
        it->second.tree = std::move(tree);
        lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
        return;
    }

    while (entries_.size() >= capacity_ && !lru_.empty()) {
        const std::string& victim = lru_.back();
        spdlog::debug("[StructureLoader] Evicting subject {}", victim);
        entries_.erase(victim);
        lru_.pop_back();
    }

    lru_.push_front(subjectId);
    entries_.emplace(subjectId, Entry{std::move(tree), lru_.begin()});
}

void StructureLoader::invalidate(const std::string& subjectId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(subjectId);
    if (it == entries_.end()) return;
    lru_.erase(it->second.lru_pos);
    entries_.erase(it);
}

void StructureLoader::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lru_.clear();
}

size_t StructureLoader::cachedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace ProgressEngine
