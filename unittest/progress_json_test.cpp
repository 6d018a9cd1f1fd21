// ============================================================================
// PROGRESS JSON UNIT TESTS
// ============================================================================
// Response shapes produced for the read and write paths
// ============================================================================

#include <gtest/gtest.h>
#include "test_support.hpp"
#include <progressengine/core/api/progress_json.hpp>

using namespace ProgressEngine;
using namespace ProgressEngine::Testing;

TEST(ProgressJson, NodeOmitsBestScoreUnlessPresent) {
    ProgressNode lesson;
    lesson.id = "L1";
    lesson.title = "Counting";
    lesson.type = NodeType::LESSON;
    lesson.status = NodeStatus::UNLOCKED;

    Json::Value out = ProgressJson::toJson(lesson);
    EXPECT_EQ(out["id"].asString(), "L1");
    EXPECT_EQ(out["type"].asString(), "lesson");
    EXPECT_EQ(out["status"].asString(), "unlocked");
    EXPECT_FALSE(out.isMember("bestScore"));
    EXPECT_TRUE(out["children"].isArray());
    EXPECT_EQ(out["children"].size(), 0u);

    lesson.status = NodeStatus::PASSED;
    lesson.bestScore = 4;
    out = ProgressJson::toJson(lesson);
    EXPECT_EQ(out["status"].asString(), "passed");
    EXPECT_EQ(out["bestScore"].asInt64(), 4);
}

TEST(ProgressJson, ViewFromEngine) {
    FileStructureSource source(FIXTURE_DIR);
    Engine engine(source);
    engine.computer.completeLesson("u1", "scenario", "L1", 3);

    Json::Value out = ProgressJson::toJson(engine.computer.getProgress("u1", "scenario"));
    EXPECT_EQ(out["subjectId"].asString(), "scenario");
    EXPECT_EQ(out["totalLessons"].asUInt64(), 3u);
    EXPECT_EQ(out["passedLessons"].asUInt64(), 1u);
    EXPECT_DOUBLE_EQ(out["completionPercentage"].asDouble(), 33.33);
    EXPECT_EQ(out["suggestedNextLessonId"].asString(), "L2");
    EXPECT_FALSE(out["stale"].asBool());

    ASSERT_TRUE(out["tree"].isArray());
    ASSERT_EQ(out["tree"].size(), 1u);
    const Json::Value& root = out["tree"][0];
    EXPECT_EQ(root["id"].asString(), "scenario");
    EXPECT_EQ(root["type"].asString(), "subject");
    EXPECT_EQ(root["children"].size(), 2u);
}

TEST(ProgressJson, NoSuggestionIsNull) {
    ProgressView view;
    view.subjectId = "done";
    view.completionPercentage = 100.0;
    view.root.id = "done";
    view.root.type = NodeType::SUBJECT;

    Json::Value out = ProgressJson::toJson(view);
    EXPECT_TRUE(out.isMember("suggestedNextLessonId"));
    EXPECT_TRUE(out["suggestedNextLessonId"].isNull());
}

TEST(ProgressJson, CompletionResult) {
    CompletionResult result;
    result.success = true;
    result.xpAwarded = 40;
    result.newTotalXp = 140;
    result.isFirstCompletion = true;
    result.isNewRecord = true;

    Json::Value out = ProgressJson::toJson(result);
    EXPECT_TRUE(out["success"].asBool());
    EXPECT_EQ(out["xpAwarded"].asInt64(), 40);
    EXPECT_EQ(out["newTotalXp"].asInt64(), 140);
    EXPECT_TRUE(out["isFirstCompletion"].asBool());
    EXPECT_TRUE(out["isNewRecord"].asBool());
}

TEST(ProgressJson, ErrorEnvelope) {
    Json::Value out = ProgressJson::errorToJson(
        ProgressError(ErrorCode::LESSON_NOT_FOUND, "lesson X not in subject scenario"));
    EXPECT_FALSE(out["success"].asBool());
    EXPECT_EQ(out["error"]["code"].asString(), "LessonNotFound");
    EXPECT_EQ(out["error"]["message"].asString(), "lesson X not in subject scenario");
    EXPECT_FALSE(out["error"]["retryable"].asBool());

    out = ProgressJson::errorToJson(ProgressError(ErrorCode::CACHE_UNAVAILABLE, "down"));
    EXPECT_TRUE(out["error"]["retryable"].asBool());
}

TEST(ProgressJson, WriteIsSingleLine) {
    Json::Value obj(Json::objectValue);
    obj["a"] = 1;
    obj["b"] = "x";
    std::string text = ProgressJson::write(obj);
    EXPECT_EQ(text.find('\n'), std::string::npos);
    EXPECT_EQ(text, R"({"a":1,"b":"x"})");
}
