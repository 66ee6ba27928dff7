#include "rules/RuleSet.hpp"
#include <spdlog/spdlog.h>

namespace code_sanitizer {

std::shared_ptr<const RuleSet> RuleSet::build(const SanitizerConfig& config) {
    auto rules = std::make_shared<RuleSet>();
    rules->config = config;
    rules->symbols = config.symbol_table_source.empty()
        ? SymbolTable::builtin()
        : SymbolTable::load_file(config.symbol_table_source);
    rules->forbidden = config.forbidden_pattern_set.empty()
        ? ForbiddenPatternSet::builtin()
        : ForbiddenPatternSet::load_file(config.forbidden_pattern_set);

    if (rules->forbidden.empty()) {
        spdlog::warn("⚠️ Forbidden pattern set is empty; no external-resource checks will run");
    }
    return rules;
}

std::shared_ptr<const RuleSet> RuleSet::builtin() {
    return build(SanitizerConfig{});
}

}
