#include <progressengine/core/config/loader.hpp>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>
#include <cstdint>
#include <stdexcept>
#include <string>

namespace {

// ============================================================================
// Field helpers
// ============================================================================

YAML::Node requireNode(const YAML::Node& parent, const std::string& key, const std::string& path) {
    YAML::Node node = parent[key];
    if (!node) {
        throw std::runtime_error("Missing required config field: " + path);
    }
    return node;
}

template <typename T>
T readAs(const YAML::Node& node, const std::string& path) {
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion& e) {
        throw std::runtime_error("Invalid type for config field " + path + ": " + e.what());
    }
}

template <typename T>
T required(const YAML::Node& parent, const std::string& key, const std::string& path) {
    return readAs<T>(requireNode(parent, key, path), path);
}

template <typename T>
T optionalField(const YAML::Node& parent, const std::string& key, const std::string& path, T fallback) {
    if (!parent) return fallback;
    YAML::Node node = parent[key];
    if (!node) return fallback;
    return readAs<T>(node, path);
}

int64_t atLeast(int64_t value, int64_t min, const std::string& path) {
    if (value < min) {
        throw std::runtime_error("Invalid value for config field " + path + ": "
                                 + std::to_string(value) + " (must be >= " + std::to_string(min) + ")");
    }
    return value;
}

void checkLevel(const std::string& level) {
    static const char* LEVELS[] = {"trace", "debug", "info", "warn", "error", "critical", "off"};
    for (const char* l : LEVELS) {
        if (level == l) return;
    }
    throw std::runtime_error("Invalid value for config field logging.level: " + level);
}

} // namespace

AppConfig::AppConfiguration ConfigLoader::loadConfig(const std::string& filepath) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(filepath);
    } catch (const YAML::BadFile&) {
        spdlog::error("[ConfigLoader] Cannot open {}", filepath);
        throw std::runtime_error("Config file not found: " + filepath);
    } catch (const YAML::ParserException& e) {
        spdlog::error("[ConfigLoader] Parse error in {}: {}", filepath, e.what());
        throw std::runtime_error("Config parse error in " + filepath + ": " + e.what());
    }

    AppConfig::AppConfiguration config;
    config.app_name = required<std::string>(root, "app_name", "app_name");
    config.version = required<std::string>(root, "version", "version");

    // logging
    config.logging.level = optionalField<std::string>(root["logging"], "level", "logging.level",
                                                 config.logging.level);
    checkLevel(config.logging.level);

    // structure
    YAML::Node structure = requireNode(root, "structure", "structure");
    config.structure.contentDir = required<std::string>(structure, "content_dir", "structure.content_dir");
    config.structure.cacheCapacity = static_cast<size_t>(atLeast(
        optionalField<int64_t>(structure, "cache_capacity", "structure.cache_capacity", 32),
        1, "structure.cache_capacity"));

    // storage
    YAML::Node storage = requireNode(root, "storage", "storage");
    config.storage.sqlitePath = required<std::string>(storage, "sqlite_path", "storage.sqlite_path");
    if (config.storage.sqlitePath.empty()) {
        throw std::runtime_error("Invalid value for config field storage.sqlite_path: empty");
    }

    // cache
    config.cache.shards = static_cast<size_t>(atLeast(
        optionalField<int64_t>(root["cache"], "shards", "cache.shards", 64), 1, "cache.shards"));

    // sync
    YAML::Node sync = root["sync"];
    config.sync.intervalSeconds = static_cast<uint32_t>(atLeast(
        optionalField<int64_t>(sync, "interval_seconds", "sync.interval_seconds", 30),
        1, "sync.interval_seconds"));
    config.sync.batchSize = static_cast<size_t>(atLeast(
        optionalField<int64_t>(sync, "batch_size", "sync.batch_size", 100), 1, "sync.batch_size"));
    config.sync.leaseTtlSeconds = static_cast<uint32_t>(atLeast(
        optionalField<int64_t>(sync, "lease_ttl_seconds", "sync.lease_ttl_seconds",
                          config.sync.intervalSeconds),
        1, "sync.lease_ttl_seconds"));
    if (config.sync.leaseTtlSeconds > config.sync.intervalSeconds) {
        throw std::runtime_error("Invalid value for config field sync.lease_ttl_seconds: "
                                 "must not exceed sync.interval_seconds");
    }

    // reward
    YAML::Node reward = root["reward"];
    config.reward.baseXp = atLeast(
        optionalField<int64_t>(reward, "base_xp", "reward.base_xp", 10), 0, "reward.base_xp");
    config.reward.perPointBonus = atLeast(
        optionalField<int64_t>(reward, "per_point_bonus", "reward.per_point_bonus", 10),
        0, "reward.per_point_bonus");
    config.reward.minScore = optionalField<int32_t>(reward, "min_score", "reward.min_score", 0);
    config.reward.maxScore = optionalField<int32_t>(reward, "max_score", "reward.max_score", 5);
    if (config.reward.minScore > config.reward.maxScore) {
        throw std::runtime_error("Invalid value for config field reward.min_score: "
                                 "greater than reward.max_score");
    }

    // audit
    config.audit.workerThreads = static_cast<size_t>(atLeast(
        optionalField<int64_t>(root["audit"], "worker_threads", "audit.worker_threads", 2),
        1, "audit.worker_threads"));

    spdlog::info("[ConfigLoader] Loaded {} v{} from {}", config.app_name, config.version, filepath);
    return config;
}
