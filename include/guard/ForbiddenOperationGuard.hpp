#pragma once
#include "sanitizer/LineTypes.hpp"
#include "rules/ForbiddenPattern.hpp"
#include "sanitizer/LineClassifier.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <vector>
#include <set>

namespace code_sanitizer {

struct GuardResult {
    bool allowed;
    std::vector<Diagnostic> violations;
};

// Never repairs. A match means the example depends on a resource that will not
// exist when it runs, and the caller has to ask for a new one.
class ForbiddenOperationGuard {
public:
    static GuardResult inspect(const std::vector<Line>& lines, const ForbiddenPatternSet& patterns) {
        GuardResult result{true, {}};
        std::set<std::pair<int, std::string>> reported; // (line, reason)

        size_t i = 0;
        while (i < lines.size()) {
            // 1. Join one logical line
            const Line& head = lines[i];
            std::string code = head.code;
            size_t j = i + 1;
            while (j < lines.size() && lines[j].continuation) {
                if (!lines[j].code.empty()) code += " " + lines[j].code;
                j++;
            }

            // 2. Only statements and headers can touch a resource
            if (head.role == LineRole::SIMPLE_STATEMENT || head.role == LineRole::BLOCK_HEADER) {
                const std::string masked = LineClassifier::mask_string_literals(code);
                for (const auto& pattern : patterns.patterns()) {
                    std::string matched;
                    const std::string& subject = pattern.scope == MatchScope::LITERALS ? code : masked;
                    if (!pattern.matches(subject, &matched)) continue;
                    if (!reported.insert({head.source_index, pattern.reason_code}).second) continue;

                    spdlog::warn("⛔ Guard: line {} matches {} ('{}')", head.source_index,
                                 pattern.reason_code, matched);
                    result.violations.push_back({Severity::REJECTED, pattern.reason_code, head.source_index,
                                                 pattern.description, matched});
                    result.allowed = false;
                }
            }
            i = j;
        }
        return result;
    }
};

}
