#include "sanitizer/SanitizationPipeline.hpp"
#include "sanitizer/LineClassifier.hpp"
#include "sanitizer/BlockDepthTracker.hpp"
#include "sanitizer/ImportNormalizer.hpp"
#include "sanitizer/ExecutabilityChecks.hpp"
#include "guard/ForbiddenOperationGuard.hpp"
#include "syntax_probe.hpp"
#include "utils/Scrubber.hpp"
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace code_sanitizer {

namespace {

void append(std::vector<Diagnostic>& to, const std::vector<Diagnostic>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

}

SanitizationPipeline::SanitizationPipeline(std::shared_ptr<const RuleSet> rules)
    : rules_(rules ? std::move(rules) : RuleSet::builtin()) {}

SanitizedResult SanitizationPipeline::sanitize(const RawExample& example) const {
    return sanitize(example.text, example.context);
}

SanitizedResult SanitizationPipeline::sanitize(const std::string& raw_text, const RequestContext& ctx) const {
    SanitizedResult result;
    const std::string label = ctx.label();

    auto advance = [&](PipelineState next) {
        spdlog::debug("🔁 [{}] {} -> {}", label, pipeline_state_to_string(result.final_state),
                      pipeline_state_to_string(next));
        result.final_state = next;
    };
    auto give_up = [&](const std::string& why, std::optional<int> line_index) {
        result.diagnostics.push_back({Severity::WARNING, codes::UNABLE_TO_REPAIR, line_index,
                                      "Could not produce valid structure: " + why, ""});
        result.text = raw_text;
        result.accepted = false;
        advance(PipelineState::REJECTED);
        spdlog::warn("⚠️ [{}] Unable to repair example: {}", label, why);
    };

    try {
        // 1. Classify
        const std::string text = scrub_code_text(raw_text);
        auto classified = LineClassifier::classify(text);

        // Line indices refer to the raw input, not the scrubbed text
        const auto origins = scrubbed_line_origins(raw_text);
        auto to_raw = [&](int index) {
            return index >= 0 && index < (int)origins.size() ? origins[index] : index;
        };
        for (auto& l : classified.lines) l.source_index = to_raw(l.source_index);
        for (auto& d : classified.diagnostics) {
            if (d.line_index) d.line_index = to_raw(*d.line_index);
        }
        append(result.diagnostics, classified.diagnostics);
        advance(PipelineState::CLASSIFIED);

        // 2. Depth
        auto tracked = BlockDepthTracker::assign_depths(classified.lines);
        append(result.diagnostics, tracked.diagnostics);
        advance(PipelineState::DEPTH_ASSIGNED);

        // 3. Declarations
        auto normalized = ImportNormalizer::normalize(tracked.lines, rules_->symbols);
        append(result.diagnostics, normalized.diagnostics);
        advance(PipelineState::IMPORTS_NORMALIZED);

        // 4. Guard: a match is never repaired
        auto guard = ForbiddenOperationGuard::inspect(normalized.lines, rules_->forbidden);
        advance(PipelineState::GUARDED);
        if (!guard.allowed) {
            append(result.diagnostics, guard.violations);
            result.text = raw_text;
            result.accepted = false;
            advance(PipelineState::REJECTED);
            spdlog::warn("⛔ [{}] Example rejected: {} forbidden operation(s)", label, guard.violations.size());
            return result;
        }

        // 5. Render and validate the output, not the intermediate state
        const std::string rendered = BlockDepthTracker::render(normalized.lines, rules_->config.indent_width);
        ValidationOutcome validation = validate(rendered);
        if (!validation.ok) {
            std::optional<int> line_index;
            if (validation.row && *validation.row < (int)normalized.lines.size()) {
                int source = normalized.lines[*validation.row].source_index;
                if (source >= 0) line_index = source;
            }
            give_up(validation.failed_check, line_index);
            return result;
        }
        advance(PipelineState::VALIDATED);

        append(result.diagnostics, ExecutabilityChecks::inspect(normalized.lines));
        result.text = rendered;
        result.accepted = true;
        advance(PipelineState::ACCEPTED);
        spdlog::info("✅ [{}] Example accepted ({} warnings)", label, result.count(Severity::WARNING));
    } catch (const std::exception& e) {
        spdlog::error("💥 [{}] Sanitization failed: {}", label, e.what());
        give_up(std::string("internal error: ") + e.what(), std::nullopt);
    }
    return result;
}

ValidationOutcome SanitizationPipeline::validate(const std::string& rendered) const {
    const int width = rules_->config.indent_width;
    const auto classified = LineClassifier::classify(rendered);
    const auto& lines = classified.lines;

    if (classified.unclosed) return {false, "bracket or string literal left open", std::nullopt};

    // 1. Indentation of every logical line head
    int prev_level = 0;
    int prev_row = -1;
    bool prev_header = false;
    std::unordered_set<std::string> declarations;

    for (size_t i = 0; i < lines.size(); ++i) {
        const Line& l = lines[i];
        if (l.continuation || l.role == LineRole::COMMENT_OR_BLANK) continue;

        const size_t spaces = l.text.find_first_not_of(' ');
        if (spaces % width != 0) return {false, "indentation is not a multiple of the unit", (int)i};
        const int level = (int)spaces / width;

        if (prev_header && level != prev_level + 1) {
            return {false, "block opened at row " + std::to_string(prev_row) + " has no body", prev_row};
        }
        if (!prev_header && prev_row >= 0 && level > prev_level) {
            return {false, "unexpected indent", (int)i};
        }
        if (prev_row < 0 && level != 0) return {false, "unexpected indent", (int)i};

        // 2. Declarations appear once
        if (l.role == LineRole::MODULE_DECLARATION) {
            std::string key = l.code;
            for (size_t k = i + 1; k < lines.size() && lines[k].continuation; ++k) {
                if (!lines[k].code.empty()) key += " " + lines[k].code;
            }
            if (!declarations.insert(key).second) return {false, "duplicate declaration '" + key + "'", (int)i};
        }

        prev_level = level;
        prev_row = (int)i;
        prev_header = l.role == LineRole::BLOCK_HEADER;
    }
    if (prev_header) {
        return {false, "block opened at row " + std::to_string(prev_row) + " has no body", prev_row};
    }

    // 3. Grammar
    if (rules_->config.syntax_probe) {
        syntax::SyntaxProbe probe;
        auto probed = probe.check_python(rendered);
        if (!probed.ok) return {false, "syntax probe found a parse error", probed.first_error_row};
    }
    return {};
}

DocumentResult SanitizationPipeline::sanitize_document(const std::string& document, const RequestContext& ctx) const {
    DocumentResult out;
    const auto blocks = CodeBlockExtractor::extract(document);

    std::vector<std::optional<std::string>> replacements;
    replacements.reserve(blocks.size());
    for (const auto& block : blocks) {
        SanitizedResult r = sanitize(block.code, ctx);
        replacements.push_back(r.accepted ? std::optional<std::string>(r.text) : std::nullopt);
        if (!r.accepted) out.all_accepted = false;
        out.blocks.push_back({block, std::move(r)});
    }
    out.text = CodeBlockExtractor::replace(document, blocks, replacements);

    spdlog::info("📄 [{}] Document: {} code blocks, all accepted: {}", ctx.label(), blocks.size(), out.all_accepted);
    return out;
}

}
