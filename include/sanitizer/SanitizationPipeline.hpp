#pragma once
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>
#include "sanitizer/LineTypes.hpp"
#include "rules/RuleSet.hpp"
#include "utils/CodeBlockExtractor.hpp"

namespace code_sanitizer {

struct ValidationOutcome {
    bool ok = true;
    std::string failed_check;
    std::optional<int> row; // 0-based row of the rendered text
};

struct DocumentBlockResult {
    CodeBlock block;
    SanitizedResult result;
};

struct DocumentResult {
    std::string text;
    std::vector<DocumentBlockResult> blocks;
    bool all_accepted = true;

    nlohmann::json to_json() const {
        nlohmann::json j_blocks = nlohmann::json::array();
        for (const auto& b : blocks) {
            auto j = b.result.to_json();
            j["format"] = b.block.format == BlockFormat::HTML_PRE ? "html_pre" : "markdown_fence";
            j["language"] = b.block.language;
            j_blocks.push_back(j);
        }
        return {{"text", text}, {"all_accepted", all_accepted}, {"blocks", j_blocks}};
    }
};

// Received -> Classified -> DepthAssigned -> ImportsNormalized -> Guarded
//          -> Validated -> Accepted | Rejected
// Stateless between calls; any number of threads may share one instance.
class SanitizationPipeline {
public:
    explicit SanitizationPipeline(std::shared_ptr<const RuleSet> rules);

    SanitizedResult sanitize(const std::string& raw_text, const RequestContext& ctx = {}) const;
    SanitizedResult sanitize(const RawExample& example) const;

    // Sanitizes every Python block of a full model response; accepted blocks are replaced
    DocumentResult sanitize_document(const std::string& document, const RequestContext& ctx = {}) const;

    // Structural checks on rendered output, plus the syntax probe when enabled
    ValidationOutcome validate(const std::string& rendered) const;

    const RuleSet& rules() const { return *rules_; }

private:
    std::shared_ptr<const RuleSet> rules_;
};

}
