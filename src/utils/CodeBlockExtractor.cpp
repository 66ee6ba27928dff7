#include "utils/CodeBlockExtractor.hpp"
#include <algorithm>
#include <cctype>
#include <spdlog/spdlog.h>

namespace code_sanitizer {

namespace {

struct TextRange {
    size_t start;
    size_t end;
};

std::string to_lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

std::string ltrim_copy(const std::string& s) {
    size_t i = s.find_first_not_of(" \t");
    return i == std::string::npos ? "" : s.substr(i);
}

std::string fence_language(const std::string& low_line) {
    std::string lang = low_line.substr(3);
    size_t end = lang.find_first_of(" \t\r{");
    if (end != std::string::npos) lang = lang.substr(0, end);
    return lang;
}

// 1) fenced blocks, any language; only Python ones are returned
void scan_fences(const std::string& text, std::vector<CodeBlock>& out, std::vector<TextRange>& fenced) {
    bool in = false;
    size_t fence_start = 0;
    size_t body_start = 0;
    std::string language;

    size_t pos = 0;
    while (pos <= text.size()) {
        const size_t line_start = pos;
        size_t line_end = text.find('\n', pos);
        if (line_end == std::string::npos) line_end = text.size();
        const std::string low = to_lower(ltrim_copy(text.substr(line_start, line_end - line_start)));

        if (!in) {
            if (low.rfind("```", 0) == 0) {
                in = true;
                fence_start = line_start;
                language = fence_language(low);
                body_start = (line_end < text.size()) ? (line_end + 1) : text.size();
            }
        } else if (low.rfind("```", 0) == 0) {
            size_t body_end = std::max(line_start, body_start);
            if (body_end > body_start && text[body_end - 1] == '\n') body_end--;
            if (CodeBlockExtractor::is_python_language(language)) {
                out.push_back({BlockFormat::MARKDOWN_FENCE, language, body_start, body_end,
                               text.substr(body_start, body_end - body_start)});
            }
            fenced.push_back({fence_start, line_end});
            in = false;
        }

        if (line_end >= text.size()) break;
        pos = line_end + 1;
    }
}

// 2) <pre><code class="language-x">...</code></pre> outside fences
void scan_pre_blocks(const std::string& text, const std::vector<TextRange>& fenced, std::vector<CodeBlock>& out) {
    const std::string low = to_lower(text);
    size_t pos = 0;
    while ((pos = low.find("<pre", pos)) != std::string::npos) {
        const size_t pre_start = pos;
        pos += 4;
        bool inside_fence = std::any_of(fenced.begin(), fenced.end(), [&](const TextRange& r) {
            return pre_start >= r.start && pre_start < r.end;
        });
        if (inside_fence) continue;

        size_t pre_close = low.find('>', pre_start);
        if (pre_close == std::string::npos) break;
        size_t code_open = low.find_first_not_of(" \t\r\n", pre_close + 1);
        if (code_open == std::string::npos || low.compare(code_open, 5, "<code") != 0) continue;
        size_t code_tag_end = low.find('>', code_open);
        if (code_tag_end == std::string::npos) break;

        std::string language;
        const std::string tag = low.substr(code_open, code_tag_end - code_open);
        size_t lang_pos = tag.find("language-");
        if (lang_pos != std::string::npos) {
            size_t lang_end = tag.find_first_of("\"' ", lang_pos);
            language = tag.substr(lang_pos + 9, lang_end == std::string::npos ? std::string::npos : lang_end - lang_pos - 9);
        }

        const size_t body_start = code_tag_end + 1;
        size_t body_end = low.find("</code>", body_start);
        if (body_end == std::string::npos) break;
        pos = body_end + 7;

        if (!CodeBlockExtractor::is_python_language(language)) continue;
        out.push_back({BlockFormat::HTML_PRE, language, body_start, body_end,
                       CodeBlockExtractor::html_unescape(text.substr(body_start, body_end - body_start))});
    }
}

}

bool CodeBlockExtractor::is_python_language(const std::string& language) {
    return language.empty() || language == "python" || language == "py" ||
           language == "python3" || language == "ipython";
}

std::vector<CodeBlock> CodeBlockExtractor::extract(const std::string& document) {
    std::vector<CodeBlock> blocks;
    std::vector<TextRange> fenced;
    scan_fences(document, blocks, fenced);
    scan_pre_blocks(document, fenced, blocks);

    std::sort(blocks.begin(), blocks.end(),
              [](const CodeBlock& a, const CodeBlock& b) { return a.body_start < b.body_start; });
    spdlog::debug("🧩 Extracted {} code blocks", blocks.size());
    return blocks;
}

std::string CodeBlockExtractor::replace(const std::string& document,
                                        const std::vector<CodeBlock>& blocks,
                                        const std::vector<std::optional<std::string>>& replacements) {
    std::string out;
    out.reserve(document.size());
    size_t cursor = 0;
    for (size_t i = 0; i < blocks.size(); ++i) {
        const CodeBlock& b = blocks[i];
        out.append(document, cursor, b.body_start - cursor);
        if (i < replacements.size() && replacements[i]) {
            out += b.format == BlockFormat::HTML_PRE ? html_escape(*replacements[i]) : *replacements[i];
        } else {
            out.append(document, b.body_start, b.body_end - b.body_start);
        }
        cursor = b.body_end;
    }
    out.append(document, cursor, std::string::npos);
    return out;
}

std::string CodeBlockExtractor::html_unescape(const std::string& s) {
    static const std::pair<const char*, const char*> kEntities[] = {
        {"&lt;", "<"}, {"&gt;", ">"}, {"&quot;", "\""}, {"&#39;", "'"},
        {"&#x27;", "'"}, {"&apos;", "'"}, {"&nbsp;", " "}, {"&amp;", "&"}
    };
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        if (s[i] == '&') {
            bool replaced = false;
            for (const auto& [entity, ch] : kEntities) {
                const size_t len = std::char_traits<char>::length(entity);
                if (s.compare(i, len, entity) == 0) {
                    out += ch;
                    i += len;
                    replaced = true;
                    break;
                }
            }
            if (replaced) continue;
        }
        out += s[i++];
    }
    return out;
}

std::string CodeBlockExtractor::html_escape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == '&') out += "&amp;";
        else if (c == '<') out += "&lt;";
        else if (c == '>') out += "&gt;";
        else out += c;
    }
    return out;
}

}
