#pragma once
#include <string>
#include <optional>

// Forward declaration so callers do not need tree-sitter headers
struct TSParser;

namespace code_sanitizer::syntax {

struct ProbeResult {
    bool ok;
    std::optional<int> first_error_row; // 0-based row of the first ERROR / MISSING node
};

// Owns one tree-sitter parser. Not thread-safe; create one per pipeline run.
class SyntaxProbe {
public:
    SyntaxProbe();
    ~SyntaxProbe();

    SyntaxProbe(const SyntaxProbe&) = delete;
    SyntaxProbe& operator=(const SyntaxProbe&) = delete;

    ProbeResult check_python(const std::string& code);

    // Jupyter "%magic" / "!shell" lines become "pass" at the same indentation
    static std::string mask_notebook_magics(const std::string& code);

private:
    TSParser* parser_;
};

}
