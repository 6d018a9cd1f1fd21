#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

namespace ProgressEngine {

/**
 * @brief External XP ledger. The engine only hands awards off; totals live here.
 */
class XpWallet {
public:
    virtual ~XpWallet() = default;

    /// Adds xp (may be 0) and returns the learner's new total.
    virtual int64_t award(const std::string& learnerId, int64_t xp) = 0;
};

class InMemoryXpWallet : public XpWallet {
public:
    int64_t award(const std::string& learnerId, int64_t xp) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& total = totals_[learnerId];
        total += xp;
        return total;
    }

    int64_t total(const std::string& learnerId) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = totals_.find(learnerId);
        return it == totals_.end() ? 0 : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, int64_t> totals_;
};

} // namespace ProgressEngine
