#include <spdlog/spdlog.h>
#include <json/json.h>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <chrono>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

#include <progressengine/core/api/progress_json.hpp>
#include <progressengine/core/cache/in_memory_cache.hpp>
#include <progressengine/core/collab/audit_sink.hpp>
#include <progressengine/core/collab/xp_wallet.hpp>
#include <progressengine/core/common/errors.hpp>
#include <progressengine/core/config/loader.hpp>
#include <progressengine/core/metrics/registry.hpp>
#include <progressengine/core/progress/bitmap_store.hpp>
#include <progressengine/core/progress/progress_computer.hpp>
#include <progressengine/core/storage/sqlite_snapshot_store.hpp>
#include <progressengine/core/structure/structure_loader.hpp>
#include <progressengine/core/structure/structure_source.hpp>
#include <progressengine/core/sync/cache_warmer.hpp>
#include <progressengine/core/sync/snapshot_syncer.hpp>

using namespace ProgressEngine;

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_running{true};

static void signalHandler(int) {
    g_running.store(false, std::memory_order_release);
}

// ============================================================================
// Initialization Functions
// ============================================================================

static void setupLogging() {
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("ProgressEngine v1.0.0 starting...");
    spdlog::info("Build: {} {}", __DATE__, __TIME__);
}

static void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
}

static AppConfig::AppConfiguration loadConfiguration(int argc, char* argv[]) {
    const char* configPath = (argc > 1) ? argv[1] : "config/config.yaml";
    spdlog::info("Loading configuration from: {}", configPath);
    auto config = ConfigLoader::loadConfig(configPath);
    spdlog::set_level(spdlog::level::from_str(config.logging.level));
    return config;
}

// ============================================================================
// Component Lifecycle
// ============================================================================

struct Components {
    // Declaration order is construction order; destruction runs in reverse
    std::unique_ptr<InMemoryCache> cache;
    std::unique_ptr<SqliteSnapshotStore> store;
    std::unique_ptr<FileStructureSource> source;
    std::unique_ptr<StructureLoader> structures;
    std::unique_ptr<CacheWarmer> warmer;
    std::unique_ptr<BitmapStore> bitmaps;
    std::unique_ptr<InMemoryXpWallet> wallet;
    std::unique_ptr<AsyncAuditSink> audit;
    std::unique_ptr<ProgressComputer> computer;
    std::unique_ptr<SnapshotSyncer> syncer;
};

static Components initializeComponents(const AppConfig::AppConfiguration& config) {
    Components c;

    c.cache = std::make_unique<InMemoryCache>(config.cache.shards);
    c.store = std::make_unique<SqliteSnapshotStore>(config.storage.sqlitePath);
    c.source = std::make_unique<FileStructureSource>(config.structure.contentDir);
    c.structures = std::make_unique<StructureLoader>(*c.source, config.structure.cacheCapacity);
    c.warmer = std::make_unique<CacheWarmer>(*c.cache, *c.store);
    c.bitmaps = std::make_unique<BitmapStore>(*c.cache, *c.warmer);
    c.wallet = std::make_unique<InMemoryXpWallet>();
    c.audit = std::make_unique<AsyncAuditSink>(std::make_shared<LogAuditSink>(),
                                               config.audit.workerThreads);

    RewardPolicy policy;
    policy.baseXp = config.reward.baseXp;
    policy.perPointBonus = config.reward.perPointBonus;
    policy.minScore = config.reward.minScore;
    policy.maxScore = config.reward.maxScore;
    c.computer = std::make_unique<ProgressComputer>(*c.structures, *c.bitmaps, *c.warmer,
                                                    RewardCalculator(policy), *c.wallet, *c.audit);

    SyncerOptions options;
    options.interval = std::chrono::seconds(config.sync.intervalSeconds);
    options.batchSize = config.sync.batchSize;
    options.leaseTtl = std::chrono::seconds(config.sync.leaseTtlSeconds);
    c.syncer = std::make_unique<SnapshotSyncer>(*c.cache, *c.store, options);

    return c;
}

static void stopComponents(Components& c) {
    spdlog::info("=== SHUTDOWN SEQUENCE ===");

    // Final sync runs inside stop()
    if (c.syncer) c.syncer->stop();
    if (c.audit) c.audit->shutdown();

    spdlog::info("=== SHUTDOWN COMPLETE ===");
}

// ============================================================================
// Command Handling
// ============================================================================

static Json::Value statsToJson() {
    Json::Value out(Json::objectValue);
    for (const auto& [name, snap] : MetricRegistry::getInstance().getSnapshots()) {
        Json::Value m(Json::objectValue);
        m["operations"] = static_cast<Json::UInt64>(snap.total_operations);
        m["errors"] = static_cast<Json::UInt64>(snap.total_errors);
        m["fallbacks"] = static_cast<Json::UInt64>(snap.total_fallbacks);
        m["cacheMisses"] = static_cast<Json::UInt64>(snap.total_cache_misses);
        m["firstCompletions"] = static_cast<Json::UInt64>(snap.total_first_completions);
        m["xpAwarded"] = static_cast<Json::UInt64>(snap.total_xp_awarded);
        m["syncCycles"] = static_cast<Json::UInt64>(snap.total_sync_cycles);
        m["syncFailures"] = static_cast<Json::UInt64>(snap.total_sync_failures);
        m["avgLatencyNs"] = static_cast<Json::UInt64>(snap.get_avg_latency_ns());
        m["maxLatencyNs"] = static_cast<Json::UInt64>(snap.max_latency_ns);
        out[name] = m;
    }
    return out;
}

static Json::Value usageError(const std::string& message) {
    return ProgressJson::errorToJson(ProgressError(ErrorCode::INVALID_ARGUMENT, message));
}

static Json::Value handleCommand(Components& c, const std::string& line) {
    std::istringstream in(line);
    std::string cmd;
    in >> cmd;

    try {
        if (cmd == "progress") {
            std::string learner, subject;
            if (!(in >> learner >> subject)) return usageError("usage: progress <learner> <subject>");
            return ProgressJson::toJson(c.computer->getProgress(learner, subject));
        }
        if (cmd == "complete") {
            std::string learner, subject, lesson;
            int32_t score = 0;
            if (!(in >> learner >> subject >> lesson >> score)) {
                return usageError("usage: complete <learner> <subject> <lesson> <score>");
            }
            return ProgressJson::toJson(c.computer->completeLesson(learner, subject, lesson, score));
        }
        if (cmd == "reset") {
            std::string learner, subject;
            if (!(in >> learner >> subject)) return usageError("usage: reset <learner> <subject>");
            c.computer->adminResetProgress(learner, subject);
            Json::Value out(Json::objectValue);
            out["success"] = true;
            return out;
        }
        if (cmd == "sync") {
            auto stats = c.syncer->syncPending();
            Json::Value out(Json::objectValue);
            out["success"] = stats.leaseHeld;
            out["synced"] = static_cast<Json::UInt64>(stats.synced);
            out["failed"] = static_cast<Json::UInt64>(stats.failed);
            out["skipped"] = static_cast<Json::UInt64>(stats.skipped);
            return out;
        }
        if (cmd == "stats") {
            return statsToJson();
        }
        return usageError("unknown command: " + cmd);
    } catch (const ProgressError& e) {
        return ProgressJson::errorToJson(e);
    }
}

int main(int argc, char* argv[]) {
    setupLogging();
    setupSignalHandlers();

    try {
        auto config = loadConfiguration(argc, argv);
        spdlog::info("Configuration loaded successfully");

        auto components = initializeComponents(config);
        components.syncer->start();

        spdlog::info("ProgressEngine running. Reading commands from stdin.");

        std::string line;
        while (g_running.load(std::memory_order_acquire) && std::getline(std::cin, line)) {
            if (line.empty()) continue;
            if (line == "quit") break;
            std::cout << ProgressJson::write(handleCommand(components, line)) << std::endl;
        }

        stopComponents(components);

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("ProgressEngine terminated gracefully");
    return EXIT_SUCCESS;
}
