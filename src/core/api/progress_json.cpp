#include <progressengine/core/api/progress_json.hpp>

namespace ProgressEngine {
namespace ProgressJson {

Json::Value toJson(const ProgressNode& node) {
    Json::Value out(Json::objectValue);
    out["id"] = node.id;
    out["title"] = node.title;
    out["type"] = nodeTypeString(node.type);
    out["status"] = nodeStatusString(node.status);
    if (node.bestScore) {
        out["bestScore"] = static_cast<Json::Int64>(*node.bestScore);
    }
    Json::Value children(Json::arrayValue);
    for (const auto& child : node.children) {
        children.append(toJson(child));
    }
    out["children"] = children;
    return out;
}

Json::Value toJson(const ProgressView& view) {
    Json::Value out(Json::objectValue);
    out["subjectId"] = view.subjectId;
    out["completionPercentage"] = view.completionPercentage;
    out["suggestedNextLessonId"] = view.suggestedNextLessonId
        ? Json::Value(*view.suggestedNextLessonId)
        : Json::Value(Json::nullValue);
    out["totalLessons"] = static_cast<Json::UInt64>(view.totalLessons);
    out["passedLessons"] = static_cast<Json::UInt64>(view.passedLessons);
    out["stale"] = view.servedFromDurable;
    Json::Value tree(Json::arrayValue);
    tree.append(toJson(view.root));
    out["tree"] = tree;
    return out;
}

Json::Value toJson(const CompletionResult& result) {
    Json::Value out(Json::objectValue);
    out["success"] = result.success;
    out["xpAwarded"] = static_cast<Json::Int64>(result.xpAwarded);
    out["newTotalXp"] = static_cast<Json::Int64>(result.newTotalXp);
    out["isFirstCompletion"] = result.isFirstCompletion;
    out["isNewRecord"] = result.isNewRecord;
    return out;
}

Json::Value errorToJson(const ProgressError& error) {
    Json::Value detail(Json::objectValue);
    detail["code"] = ProgressError::codeString(error.code());
    detail["message"] = error.what();
    detail["retryable"] = error.retryable();

    Json::Value out(Json::objectValue);
    out["success"] = false;
    out["error"] = detail;
    return out;
}

std::string write(const Json::Value& value) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";
    return Json::writeString(writer, value);
}

} // namespace ProgressJson
} // namespace ProgressEngine
