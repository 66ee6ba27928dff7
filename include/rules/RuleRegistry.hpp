#pragma once
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <atomic>
#include <string>
#include <spdlog/spdlog.h>
#include "rules/RuleSet.hpp"
#include "rules/RuleLoadError.hpp"

namespace code_sanitizer {

// Process-wide holder of the active RuleSet. Requests take a snapshot and
// keep it for their whole run; reload builds a complete new RuleSet first
// and only then swaps the pointer, so no reader sees a partial table.
class RuleRegistry {
public:
    RuleRegistry() : current_(RuleSet::builtin()) {}

    // Returns false (and keeps the previous rules) when loading fails
    bool reload(const SanitizerConfig& config) {
        std::lock_guard<std::mutex> serial(reload_mutex_);

        std::shared_ptr<const RuleSet> next;
        try {
            next = RuleSet::build(config);
        } catch (const RuleLoadError& e) {
            spdlog::error("💥 Rule reload failed, keeping generation {}: {}", generation_.load(), e.what());
            return false;
        }

        const std::string symbols_version = next->symbols.version();
        const std::string patterns_version = next->forbidden.version();
        {
            std::unique_lock lock(rules_mutex_); // Writer lock
            current_ = std::move(next);
        }
        generation_++;
        spdlog::info("🛰️ Rules swapped in: generation {}, symbols '{}', patterns '{}'",
                     generation_.load(), symbols_version, patterns_version);
        return true;
    }

    std::shared_ptr<const RuleSet> snapshot() const {
        std::shared_lock lock(rules_mutex_); // Reader lock
        return current_;
    }

    size_t generation() const { return generation_.load(); }

private:
    std::shared_ptr<const RuleSet> current_;
    mutable std::shared_mutex rules_mutex_;
    std::mutex reload_mutex_;
    std::atomic<size_t> generation_{0};
};

}
