// ============================================================================
// BENCHMARK: READ AND WRITE PATH LATENCY
// ============================================================================
// Subject with 1000 lessons (10 units x 10 topics x 10 lessons)
//
// Test scenarios:
// 1. Unlock computation on a warm structure cache
// 2. getProgress on a warm bitmap
// 3. completeLesson across concurrent learners
// 4. Snapshot sync of the resulting dirty set
// ============================================================================

#include <iostream>
#include <chrono>
#include <thread>
#include <vector>
#include <atomic>
#include <iomanip>
#include <sstream>
#include <spdlog/spdlog.h>

#include <progressengine/core/cache/in_memory_cache.hpp>
#include <progressengine/core/common/errors.hpp>
#include <progressengine/core/collab/audit_sink.hpp>
#include <progressengine/core/collab/xp_wallet.hpp>
#include <progressengine/core/progress/bitmap_store.hpp>
#include <progressengine/core/progress/progress_computer.hpp>
#include <progressengine/core/storage/in_memory_snapshot_store.hpp>
#include <progressengine/core/structure/structure_loader.hpp>
#include <progressengine/core/structure/structure_source.hpp>
#include <progressengine/core/sync/cache_warmer.hpp>
#include <progressengine/core/sync/snapshot_syncer.hpp>
#include <progressengine/core/unlock/unlock_calculator.hpp>

using namespace ProgressEngine;

// ============================================================================
// FIXTURES
// ============================================================================

constexpr int UNITS = 10;
constexpr int TOPICS_PER_UNIT = 10;
constexpr int LESSONS_PER_TOPIC = 10;
constexpr int TOTAL_LESSONS = UNITS * TOPICS_PER_UNIT * LESSONS_PER_TOPIC;

static std::string lessonId(int bit) {
    return "L" + std::to_string(bit);
}

static std::string buildSubjectJson() {
    std::ostringstream out;
    out << R"({"id":"bench","title":"Bench","type":"subject","sequential":false,"children":[)";
    int bit = 0;
    for (int u = 0; u < UNITS; ++u) {
        if (u) out << ",";
        out << R"({"id":"U)" << u << R"(","title":"Unit","type":"unit","sequential":true,)"
            << R"("sortOrder":)" << u << R"(,"children":[)";
        for (int t = 0; t < TOPICS_PER_UNIT; ++t) {
            if (t) out << ",";
            out << R"({"id":"U)" << u << "T" << t << R"(","title":"Topic","type":"topic",)"
                << R"("sequential":true,"sortOrder":)" << t << R"(,"children":[)";
            for (int l = 0; l < LESSONS_PER_TOPIC; ++l, ++bit) {
                if (l) out << ",";
                out << R"({"id":")" << lessonId(bit) << R"(","title":"Lesson","bitPosition":)"
                    << bit << R"(,"sortOrder":)" << l << "}";
            }
            out << "]}";
        }
        out << "]}";
    }
    out << "]}";
    return out.str();
}

class StaticSource : public StructureSource {
public:
    explicit StaticSource(std::string json) : doc_{std::move(json), "v1"} {}

    std::optional<StructureDocument> fetch(const std::string& subjectId) override {
        if (subjectId != "bench") return std::nullopt;
        return doc_;
    }
    std::optional<std::string> version(const std::string& subjectId) override {
        if (subjectId != "bench") return std::nullopt;
        return doc_.version;
    }

private:
    StructureDocument doc_;
};

class NullAuditSink : public AuditSink {
public:
    void record(const CompletionEvent&) override {}
};

// ============================================================================
// BENCHMARK UTILITIES
// ============================================================================

struct BenchmarkResult {
    std::string name;
    uint64_t total_ops;
    uint64_t elapsed_ns;
};

void print_header(const std::string& test_name) {
    std::cout << "\n" << std::string(70, '=') << std::endl;
    std::cout << "TEST: " << test_name << std::endl;
    std::cout << std::string(70, '=') << std::endl;
}

void print_result(const BenchmarkResult& r) {
    double ns_per_op = r.total_ops ? static_cast<double>(r.elapsed_ns) / r.total_ops : 0.0;
    double ops_per_sec = r.elapsed_ns ? r.total_ops * 1e9 / r.elapsed_ns : 0.0;
    std::cout << std::left << std::setw(30) << r.name
              << std::right << std::setw(12) << r.total_ops << " ops"
              << std::setw(14) << std::fixed << std::setprecision(0) << ops_per_sec << " ops/s"
              << std::setw(12) << std::setprecision(1) << ns_per_op / 1000.0 << " us/op"
              << std::endl;
}

template <typename Fn>
BenchmarkResult time_it(const std::string& name, uint64_t ops, Fn&& fn) {
    auto start = std::chrono::high_resolution_clock::now();
    fn();
    auto end = std::chrono::high_resolution_clock::now();
    return {name, ops,
            static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(end - start).count())};
}

// ============================================================================
// MAIN
// ============================================================================

int main() {
    spdlog::set_level(spdlog::level::warn);

    StaticSource source(buildSubjectJson());
    InMemoryCache cache;
    InMemorySnapshotStore store;
    StructureLoader structures(source, 8);
    CacheWarmer warmer(cache, store);
    BitmapStore bitmaps(cache, warmer);
    InMemoryXpWallet wallet;
    NullAuditSink audit;
    ProgressComputer computer(structures, bitmaps, warmer, RewardCalculator(RewardPolicy{}),
                              wallet, audit);

    std::cout << "Subject: " << TOTAL_LESSONS << " lessons" << std::endl;

    // ------------------------------------------------------------------------
    print_header("Unlock computation (half the lessons passed)");
    auto tree = structures.load("bench");
    Bytes half;
    for (int bit = 0; bit < TOTAL_LESSONS / 2; ++bit) Bitmap::set(half, bit);
    const int unlockIters = 2000;
    print_result(time_it("UnlockCalculator::compute", unlockIters, [&]() {
        size_t sink = 0;
        for (int i = 0; i < unlockIters; ++i) {
            sink += UnlockCalculator::compute(*tree, half).passedLessons;
        }
        if (sink == 0) std::cout << "unexpected" << std::endl;
    }));

    // ------------------------------------------------------------------------
    print_header("getProgress (warm cache)");
    for (int bit = 0; bit < TOTAL_LESSONS / 2; ++bit) {
        computer.completeLesson("reader", "bench", lessonId(bit), 4);
    }
    const int readIters = 2000;
    print_result(time_it("getProgress", readIters, [&]() {
        for (int i = 0; i < readIters; ++i) {
            computer.getProgress("reader", "bench");
        }
    }));

    // ------------------------------------------------------------------------
    print_header("completeLesson (concurrent learners)");
    for (int numThreads : {1, 4, 8}) {
        const int perThread = 500;
        std::atomic<int> failures{0};
        auto result = time_it("completeLesson x" + std::to_string(numThreads) + " threads",
                              static_cast<uint64_t>(numThreads) * perThread, [&]() {
            std::vector<std::thread> threads;
            for (int t = 0; t < numThreads; ++t) {
                threads.emplace_back([&, t]() {
                    std::string learner = "writer-" + std::to_string(numThreads) + "-" + std::to_string(t);
                    for (int i = 0; i < perThread; ++i) {
                        try {
                            computer.completeLesson(learner, "bench", lessonId(i % TOTAL_LESSONS), i % 6);
                        } catch (const ProgressError&) {
                            failures.fetch_add(1);
                        }
                    }
                });
            }
            for (auto& th : threads) th.join();
        });
        print_result(result);
        if (failures.load() > 0) {
            std::cout << "  failures: " << failures.load() << std::endl;
        }
    }

    // ------------------------------------------------------------------------
    print_header("Snapshot sync of dirty set");
    size_t dirty = cache.dirtyCount();
    SyncerOptions options;
    options.batchSize = 1000;
    SnapshotSyncer syncer(cache, store, options);
    print_result(time_it("syncPending", dirty, [&]() {
        while (cache.dirtyCount() > 0) {
            if (syncer.syncPending().synced == 0) break;
        }
    }));
    std::cout << "Snapshots stored: " << store.size() << std::endl;

    return 0;
}
