#pragma once
#include <string>
#include <cstddef>
#include <cstdint>

namespace AppConfig {

struct LoggingConfig {
    std::string level = "info";
};

struct StructureConfig {
    std::string contentDir;
    size_t cacheCapacity = 32;
};

struct StorageConfig {
    std::string sqlitePath;
};

struct CacheConfig {
    size_t shards = 64;
};

struct SyncConfig {
    uint32_t intervalSeconds = 30;
    size_t batchSize = 100;
    uint32_t leaseTtlSeconds = 30;
};

struct RewardConfig {
    int64_t baseXp = 10;
    int64_t perPointBonus = 10;
    int32_t minScore = 0;
    int32_t maxScore = 5;
};

struct AuditConfig {
    size_t workerThreads = 2;
};

struct AppConfiguration {
    std::string app_name;
    std::string version;
    LoggingConfig logging;
    StructureConfig structure;
    StorageConfig storage;
    CacheConfig cache;
    SyncConfig sync;
    RewardConfig reward;
    AuditConfig audit;
};

} // namespace AppConfig
