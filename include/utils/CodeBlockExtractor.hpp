#pragma once
#include <string>
#include <vector>
#include <optional>

namespace code_sanitizer {

enum class BlockFormat { MARKDOWN_FENCE, HTML_PRE };

struct CodeBlock {
    BlockFormat format;
    std::string language; // "" when the block does not name one
    size_t body_start;    // byte range of the body inside the document
    size_t body_end;
    std::string code;     // body with HTML entities decoded (HTML_PRE only)
};

// Finds the Python code a model embedded in a lesson response:
// ```python / ```py / ``` fences and <pre><code ...> blocks.
class CodeBlockExtractor {
public:
    static std::vector<CodeBlock> extract(const std::string& document);

    // replacements[i] == nullopt keeps block i as written
    static std::string replace(const std::string& document,
                               const std::vector<CodeBlock>& blocks,
                               const std::vector<std::optional<std::string>>& replacements);

    static std::string html_unescape(const std::string& s);
    static std::string html_escape(const std::string& s);

    static bool is_python_language(const std::string& language);
};

}
