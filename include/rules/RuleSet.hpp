#pragma once
#include <memory>
#include "rules/SanitizerConfig.hpp"
#include "rules/SymbolTable.hpp"
#include "rules/ForbiddenPattern.hpp"

namespace code_sanitizer {

// Everything a pipeline run reads. Immutable once built; shared by pointer
// so a reload never changes rules under a running request.
struct RuleSet {
    SanitizerConfig config;
    SymbolTable symbols;
    ForbiddenPatternSet forbidden;

    // Throws RuleLoadError
    static std::shared_ptr<const RuleSet> build(const SanitizerConfig& config);

    static std::shared_ptr<const RuleSet> builtin();
};

}
