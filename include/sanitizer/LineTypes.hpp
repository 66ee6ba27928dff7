#pragma once
#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace code_sanitizer {

enum class LineRole {
    MODULE_DECLARATION, // import / from-import
    BLOCK_HEADER,       // def/class/if/for/... ending with ':'
    SIMPLE_STATEMENT,
    COMMENT_OR_BLANK
};

// Keyword that opened (or continues) a compound statement
enum class BlockKind {
    FUNCTION,
    CLASS,
    IF,
    ELIF,
    ELSE,
    FOR,
    WHILE,
    TRY,
    EXCEPT,
    FINALLY,
    WITH,
    MATCH,
    CASE
};

enum class Severity { INFO, WARNING, REJECTED };

enum class PipelineState {
    RECEIVED,
    CLASSIFIED,
    DEPTH_ASSIGNED,
    IMPORTS_NORMALIZED,
    GUARDED,
    VALIDATED,
    ACCEPTED,
    REJECTED
};

inline std::string line_role_to_string(LineRole r) {
    switch (r) {
        case LineRole::MODULE_DECLARATION: return "MODULE_DECLARATION";
        case LineRole::BLOCK_HEADER: return "BLOCK_HEADER";
        case LineRole::SIMPLE_STATEMENT: return "SIMPLE_STATEMENT";
        default: return "COMMENT_OR_BLANK";
    }
}

inline std::string severity_to_string(Severity s) {
    switch (s) {
        case Severity::INFO: return "INFO";
        case Severity::WARNING: return "WARNING";
        default: return "REJECTED";
    }
}

inline std::string pipeline_state_to_string(PipelineState s) {
    switch (s) {
        case PipelineState::RECEIVED: return "RECEIVED";
        case PipelineState::CLASSIFIED: return "CLASSIFIED";
        case PipelineState::DEPTH_ASSIGNED: return "DEPTH_ASSIGNED";
        case PipelineState::IMPORTS_NORMALIZED: return "IMPORTS_NORMALIZED";
        case PipelineState::GUARDED: return "GUARDED";
        case PipelineState::VALIDATED: return "VALIDATED";
        case PipelineState::ACCEPTED: return "ACCEPTED";
        default: return "REJECTED";
    }
}

// Diagnostic codes emitted by the pipeline stages
namespace codes {
    constexpr const char* UNABLE_TO_REPAIR = "UNABLE_TO_REPAIR";
    constexpr const char* AMBIGUOUS_DEDENT = "AMBIGUOUS_DEDENT";
    constexpr const char* UNMATCHED_CONTINUATION = "UNMATCHED_CONTINUATION";
    constexpr const char* MISSING_BLOCK_COLON = "MISSING_BLOCK_COLON";
    constexpr const char* UNTERMINATED_STRING = "UNTERMINATED_STRING";
    constexpr const char* UNRESOLVED_IDENTIFIER = "UNRESOLVED_IDENTIFIER";
    constexpr const char* DUPLICATE_DECLARATION = "DUPLICATE_DECLARATION";
    constexpr const char* DECLARATION_SYNTHESIZED = "DECLARATION_SYNTHESIZED";
    constexpr const char* NO_VISIBLE_OUTPUT = "NO_VISIBLE_OUTPUT";
    constexpr const char* PLACEHOLDER_IDENTIFIER = "PLACEHOLDER_IDENTIFIER";
}

struct Line {
    std::string text;                 // physical line, original whitespace included
    std::string code;                 // trimmed, trailing comment removed
    LineRole role = LineRole::SIMPLE_STATEMENT;
    std::optional<BlockKind> kind;    // set for keyword-led lines, header or not
    std::optional<int> depth;         // nullopt until the tracker runs
    int source_index = -1;            // -1 for synthesized lines
    bool continuation = false;        // inside an open bracket / backslash / string
    bool verbatim = false;            // inside a triple-quoted string
};

struct BlockFrame {
    int opened_by_line_index;
    int depth;                        // depth of the block body
    BlockKind kind;
    int statements = 0;
};

struct Diagnostic {
    Severity severity = Severity::INFO;
    std::string code;
    std::optional<int> line_index;    // 0-based, raw input
    std::string message;
    std::string symbol;               // identifier / matched text, may be empty

    nlohmann::json to_json() const {
        nlohmann::json j = {
            {"severity", severity_to_string(severity)},
            {"code", code},
            {"message", message}
        };
        j["line_index"] = line_index ? nlohmann::json(*line_index) : nlohmann::json(nullptr);
        if (!symbol.empty()) j["symbol"] = symbol;
        return j;
    }
};

struct SanitizedResult {
    std::string text;
    std::vector<Diagnostic> diagnostics;
    bool accepted = false;
    PipelineState final_state = PipelineState::RECEIVED;

    bool has_diagnostic(const std::string& code) const {
        for (const auto& d : diagnostics) {
            if (d.code == code) return true;
        }
        return false;
    }

    size_t count(Severity severity) const {
        size_t n = 0;
        for (const auto& d : diagnostics) {
            if (d.severity == severity) n++;
        }
        return n;
    }

    nlohmann::json to_json() const {
        nlohmann::json diags = nlohmann::json::array();
        for (const auto& d : diagnostics) diags.push_back(d.to_json());
        return {
            {"text", text},
            {"accepted", accepted},
            {"state", pipeline_state_to_string(final_state)},
            {"diagnostics", diags}
        };
    }
};

// Read-only request metadata; only used to correlate log lines
struct RequestContext {
    std::vector<std::string> subject_hints;
    std::vector<std::string> style_hints;
    std::string lesson_title;
    std::vector<std::string> keywords;

    std::string label() const {
        if (!lesson_title.empty()) return lesson_title;
        if (!subject_hints.empty()) return subject_hints.front();
        return "-";
    }
};

struct RawExample {
    std::string text;
    RequestContext context;
};

}
