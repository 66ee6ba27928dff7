#pragma once
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <chrono>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "sanitizer/LineTypes.hpp"
using json = nlohmann::json;

namespace code_sanitizer {

struct SanitizeTrace {
    long long timestamp;
    std::string label;
    std::string state;
    bool accepted;
    size_t diagnostics;
};

// Aggregates what the pipeline could not handle: identifiers missing from
// the symbol table and the reasons examples were rejected. Used to decide
// which entries the rule files need next.
class CoverageLog {
public:
    // Singleton access
    static CoverageLog& instance() {
        static CoverageLog instance;
        return instance;
    }

    void record(const std::string& label, const SanitizedResult& result) {
        std::lock_guard<std::mutex> lock(mtx_);
        if (result.accepted) accepted_++; else rejected_++;

        for (const auto& d : result.diagnostics) {
            if (d.code == codes::UNRESOLVED_IDENTIFIER && !d.symbol.empty()) {
                unresolved_[d.symbol]++;
            } else if (d.severity == Severity::REJECTED || d.code == codes::UNABLE_TO_REPAIR) {
                rejections_[d.code]++;
            }
        }

        long long now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        traces_.push_back({now, label, pipeline_state_to_string(result.final_state),
                           result.accepted, result.diagnostics.size()});
        if (traces_.size() > 100) traces_.pop_front();
    }

    json to_json() {
        std::lock_guard<std::mutex> lock(mtx_);
        json j_traces = json::array();
        for (auto it = traces_.rbegin(); it != traces_.rend(); ++it) {
            j_traces.push_back({
                {"timestamp", it->timestamp},
                {"label", it->label},
                {"state", it->state},
                {"accepted", it->accepted},
                {"diagnostics", it->diagnostics}
            });
        }
        return {
            {"accepted", accepted_},
            {"rejected", rejected_},
            {"unresolved_identifiers", unresolved_},
            {"rejection_codes", rejections_},
            {"recent", j_traces}
        };
    }

    size_t unresolved_count(const std::string& identifier) {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = unresolved_.find(identifier);
        return it == unresolved_.end() ? 0 : it->second;
    }

    bool save(const std::string& path) {
        json j = to_json();
        std::filesystem::path p(path);
        std::error_code ec;
        if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path(), ec);
        std::ofstream o(path);
        if (!o.is_open()) {
            spdlog::error("❌ Could not write coverage log to {}", path);
            return false;
        }
        o << j.dump(2);
        spdlog::info("💾 Coverage log saved to {}", path);
        return true;
    }

    void reset() {
        std::lock_guard<std::mutex> lock(mtx_);
        accepted_ = 0;
        rejected_ = 0;
        unresolved_.clear();
        rejections_.clear();
        traces_.clear();
    }

private:
    CoverageLog() = default;

    std::mutex mtx_;
    size_t accepted_ = 0;
    size_t rejected_ = 0;
    std::map<std::string, size_t> unresolved_;
    std::map<std::string, size_t> rejections_;
    std::deque<SanitizeTrace> traces_;
};

}
