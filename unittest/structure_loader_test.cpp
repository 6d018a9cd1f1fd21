// ============================================================================
// STRUCTURE LOADER UNIT TESTS
// ============================================================================
// Parsing of subject hierarchies, format aliases and the versioned LRU cache
// ============================================================================

#include <gtest/gtest.h>
#include "test_support.hpp"
#include <progressengine/core/structure/structure_loader.hpp>

using namespace ProgressEngine;
using namespace ProgressEngine::Testing;

namespace {

std::vector<std::string> preorderIds(const StructureTree& tree) {
    std::vector<std::string> ids;
    for (uint32_t idx : tree.preorder()) ids.push_back(tree.node(idx).id);
    return ids;
}

const char* kTiny = R"({"id": "tiny", "sequential": true, "children": [
    {"id": "A", "bitPosition": 0, "sortOrder": 1}]})";

} // namespace

// ============================================================================
// FILE SOURCE
// ============================================================================

TEST(StructureLoader, LoadsScenarioFixture) {
    FileStructureSource source(FIXTURE_DIR);
    StructureLoader loader(source);

    auto tree = loader.load("scenario");
    EXPECT_EQ(tree->subjectId(), "scenario");
    EXPECT_EQ(tree->lessonCount(), 3u);
    EXPECT_EQ(tree->maxBitPosition(), 2u);
    EXPECT_FALSE(tree->root().sequential());
    EXPECT_EQ(tree->root().type, NodeType::SUBJECT);

    auto t1 = tree->findNode("T1");
    ASSERT_TRUE(t1.has_value());
    EXPECT_TRUE(tree->node(*t1).sequential());
    EXPECT_EQ(tree->node(*t1).type, NodeType::TOPIC);

    auto l2 = tree->findLesson("L2");
    ASSERT_TRUE(l2.has_value());
    EXPECT_EQ(tree->node(*l2).bitPosition(), 1u);
    EXPECT_FALSE(tree->findLesson("T1").has_value());

    EXPECT_EQ(preorderIds(*tree),
              (std::vector<std::string>{"scenario", "T1", "L1", "L2", "T2", "L3"}));
}

TEST(StructureLoader, AcceptsContentExportFormat) {
    FileStructureSource source(FIXTURE_DIR);
    StructureLoader loader(source);

    auto tree = loader.load("content_export");

    // Units re-sorted by sort_order, hidden and position-less nodes excluded
    EXPECT_EQ(preorderIds(*tree),
              (std::vector<std::string>{"content_export", "TRK-1", "UNIT-1", "TOP-1",
                                        "LES-1", "LES-2", "UNIT-2", "TOP-2", "LES-3"}));
    EXPECT_EQ(tree->lessonCount(), 3u);
    EXPECT_FALSE(tree->findNode("UNIT-HIDDEN").has_value());
    EXPECT_FALSE(tree->findLesson("LES-H").has_value());
    EXPECT_FALSE(tree->findLesson("LES-DEL").has_value());
    EXPECT_FALSE(tree->findLesson("LES-NOBIT").has_value());

    EXPECT_EQ(tree->node(*tree->findNode("TRK-1")).type, NodeType::TRACK);
    EXPECT_EQ(tree->node(*tree->findNode("UNIT-2")).type, NodeType::UNIT);
    EXPECT_FALSE(tree->node(*tree->findNode("UNIT-2")).sequential());
    EXPECT_EQ(tree->node(*tree->findNode("TOP-2")).type, NodeType::TOPIC);
}

TEST(StructureLoader, UntypedLessonListEntryWithoutPositionIsDropped) {
    MapStructureSource source;
    StructureLoader loader(source);
    source.put("export", R"({"id": "export", "is_linear": true, "units": [
        {"id": "U", "is_linear": true, "sort_order": 1, "lessons": [
            {"id": "LX", "sort_order": 1},
            {"id": "LY", "bit_index": 0, "sort_order": 2}]}]})");

    auto tree = loader.load("export");
    EXPECT_FALSE(tree->findNode("LX").has_value());
    EXPECT_EQ(tree->lessonCount(), 1u);
    EXPECT_EQ(preorderIds(*tree), (std::vector<std::string>{"export", "U", "LY"}));

    // LX must not stand in front of LY as a vacuously passed container
    Engine engine(source);
    auto view = engine.computer.getProgress("u1", "export");
    EXPECT_EQ(view.suggestedNextLessonId, std::optional<std::string>("LY"));
    EXPECT_EQ(findNode(view.root, "LX"), nullptr);
}

TEST(StructureLoader, EmptySubjectHasNoLessons) {
    FileStructureSource source(FIXTURE_DIR);
    StructureLoader loader(source);

    auto tree = loader.load("empty");
    EXPECT_EQ(tree->lessonCount(), 0u);
    EXPECT_FALSE(tree->maxBitPosition().has_value());
    EXPECT_EQ(tree->size(), 2u);
}

// ============================================================================
// ERRORS
// ============================================================================

TEST(StructureLoader, MissingSubjectIsSubjectNotFound) {
    FileStructureSource source(FIXTURE_DIR);
    StructureLoader loader(source);
    try {
        loader.load("no_such_subject");
        FAIL() << "expected SubjectNotFound";
    } catch (const ProgressError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SUBJECT_NOT_FOUND);
        EXPECT_FALSE(e.retryable());
    }
}

TEST(StructureLoader, SubjectIdCannotLeaveContentDirectory) {
    FileStructureSource source(FIXTURE_DIR);
    EXPECT_FALSE(source.version("../subjects/scenario").has_value());
    EXPECT_FALSE(source.fetch("../subjects/scenario").has_value());
    EXPECT_TRUE(source.version("scenario").has_value());

    StructureLoader loader(source);
    EXPECT_THROW(loader.load("../subjects/scenario"), ProgressError);

    Engine engine(source);
    try {
        engine.computer.getProgress("u1", "../subjects/scenario");
        FAIL() << "expected InvalidArgument";
    } catch (const ProgressError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_ARGUMENT);
    }
}

TEST(StructureLoader, UnpublishedSubjectIsSubjectNotFound) {
    FileStructureSource source(FIXTURE_DIR);
    StructureLoader loader(source);
    try {
        loader.load("unpublished");
        FAIL() << "expected SubjectNotFound";
    } catch (const ProgressError& e) {
        EXPECT_EQ(e.code(), ErrorCode::SUBJECT_NOT_FOUND);
    }
}

TEST(StructureLoader, MalformedJsonIsInvalidStructure) {
    FileStructureSource source(FIXTURE_DIR);
    StructureLoader loader(source);
    try {
        loader.load("malformed");
        FAIL() << "expected InvalidStructure";
    } catch (const ProgressError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_STRUCTURE);
    }
}

TEST(StructureLoader, DuplicateBitPositionIsInvalidStructure) {
    FileStructureSource source(FIXTURE_DIR);
    StructureLoader loader(source);
    try {
        loader.load("duplicate_bits");
        FAIL() << "expected InvalidStructure";
    } catch (const ProgressError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_STRUCTURE);
    }
}

TEST(StructureLoader, RejectsLessonAsRootAndBadFieldTypes) {
    MapStructureSource source;
    StructureLoader loader(source);

    source.put("leaf", R"({"id": "leaf", "type": "lesson", "bitPosition": 0})");
    EXPECT_THROW(loader.load("leaf"), ProgressError);

    source.put("badseq", R"({"id": "badseq", "sequential": "yes", "children": []})");
    EXPECT_THROW(loader.load("badseq"), ProgressError);

    source.put("badtype", R"({"id": "badtype", "type": "chapter", "children": []})");
    EXPECT_THROW(loader.load("badtype"), ProgressError);

    source.put("dupid", R"({"id": "dupid", "children": [
        {"id": "X", "bitPosition": 0}, {"id": "X", "bitPosition": 1}]})");
    EXPECT_THROW(loader.load("dupid"), ProgressError);
}

TEST(StructureLoader, SequentialDefaultsToTrue) {
    MapStructureSource source;
    StructureLoader loader(source);
    source.put("defaults", R"({"id": "defaults", "children": [
        {"id": "T", "children": [{"id": "A", "bitPosition": 0}]}]})");

    auto tree = loader.load("defaults");
    EXPECT_TRUE(tree->root().sequential());
    EXPECT_TRUE(tree->node(*tree->findNode("T")).sequential());
}

// ============================================================================
// CACHING
// ============================================================================

TEST(StructureLoader, ServesCachedTreeWhileVersionUnchanged) {
    MapStructureSource source;
    StructureLoader loader(source);
    source.put("tiny", kTiny);

    auto first = loader.load("tiny");
    auto second = loader.load("tiny");
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(source.fetches(), 1);
}

TEST(StructureLoader, ReloadsWhenUpstreamVersionChanges) {
    MapStructureSource source;
    StructureLoader loader(source);
    source.put("tiny", kTiny);
    auto before = loader.load("tiny");

    source.put("tiny", R"({"id": "tiny", "sequential": true, "children": [
        {"id": "A", "bitPosition": 0, "sortOrder": 1},
        {"id": "B", "bitPosition": 1, "sortOrder": 2}]})");
    auto after = loader.load("tiny");

    EXPECT_NE(before.get(), after.get());
    EXPECT_EQ(after->lessonCount(), 2u);
    // Readers holding the old snapshot keep a consistent tree
    EXPECT_EQ(before->lessonCount(), 1u);
}

TEST(StructureLoader, RemovedSubjectIsNotServedFromCache) {
    MapStructureSource source;
    StructureLoader loader(source);
    source.put("tiny", kTiny);
    loader.load("tiny");

    source.erase("tiny");
    EXPECT_THROW(loader.load("tiny"), ProgressError);
    EXPECT_EQ(loader.cachedCount(), 0u);
}

TEST(StructureLoader, EvictsLeastRecentlyUsed) {
    MapStructureSource source;
    StructureLoader loader(source, 2);
    for (const char* id : {"s1", "s2", "s3"}) {
        source.put(id, std::string(R"({"id": ")") + id + R"(", "children": []})");
    }

    loader.load("s1");
    loader.load("s2");
    loader.load("s1");  // s2 becomes least recently used
    loader.load("s3");
    EXPECT_EQ(loader.cachedCount(), 2u);

    int fetches = source.fetches();
    loader.load("s1");
    EXPECT_EQ(source.fetches(), fetches);
    loader.load("s2");
    EXPECT_EQ(source.fetches(), fetches + 1);
}

TEST(StructureLoader, InvalidateAndClearForceRefetch) {
    MapStructureSource source;
    StructureLoader loader(source);
    source.put("tiny", kTiny);

    loader.load("tiny");
    loader.invalidate("tiny");
    loader.load("tiny");
    EXPECT_EQ(source.fetches(), 2);

    loader.clear();
    EXPECT_EQ(loader.cachedCount(), 0u);
    loader.load("tiny");
    EXPECT_EQ(source.fetches(), 3);
}
