#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include "sanitizer/LineTypes.hpp"

namespace code_sanitizer {

struct ClassifiedText {
    std::vector<Line> lines;
    std::vector<Diagnostic> diagnostics;
    bool unclosed = false; // bracket, backslash or triple-quoted string still open at end of text
};

// Labels each physical line by syntactic role using trimmed content only.
// Leading whitespace of the input is never consulted.
class LineClassifier {
public:
    static ClassifiedText classify(const std::string& text);

    static std::vector<std::string> split_lines(const std::string& text);

    // Block keyword the code starts with (e.g. "def", "elif", "async with")
    static std::optional<BlockKind> leading_keyword(std::string_view code);

    static bool is_module_declaration(std::string_view code);

    // elif / else / except / finally / case: align with an earlier opener
    static bool is_continuation_kind(BlockKind kind);

    static std::string trim(std::string_view s);

    // Blanks the contents of string literals, quotes kept, so code-only
    // patterns do not match prose
    static std::string mask_string_literals(std::string_view code);
};

}
