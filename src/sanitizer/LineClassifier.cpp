#include "sanitizer/LineClassifier.hpp"
#include <utility>
#include <algorithm>
#include <spdlog/spdlog.h>

namespace code_sanitizer {

namespace {

// Carried from one physical line to the next
struct ScanState {
    int bracket_depth = 0;
    char triple_quote = 0;  // '"' or '\'' while inside a triple-quoted string
    bool backslash = false; // explicit line continuation
};

struct LineScan {
    size_t code_end;
    bool unterminated_string = false;
};

// Quote-aware walk over one line. Not a tokenizer: prefixes (f, r, b) and
// nested f-string quoting are not interpreted.
LineScan scan_line(const std::string& s, ScanState& st) {
    LineScan out{s.size(), false};
    const size_t n = s.size();
    size_t i = 0;

    while (i < n) {
        if (st.triple_quote) {
            const char q = st.triple_quote;
            if (s[i] == '\\') { i += 2; continue; }
            if (s[i] == q && i + 2 < n && s[i + 1] == q && s[i + 2] == q) {
                st.triple_quote = 0;
                i += 3;
                continue;
            }
            i++;
            continue;
        }

        const char c = s[i];
        if (c == '#') {
            out.code_end = i;
            break;
        }

        if (c == '"' || c == '\'') {
            if (i + 2 < n && s[i + 1] == c && s[i + 2] == c) {
                st.triple_quote = c;
                i += 3;
                continue;
            }
            size_t j = i + 1;
            bool closed = false;
            while (j < n) {
                if (s[j] == '\\') { j += 2; continue; }
                if (s[j] == c) { closed = true; break; }
                j++;
            }
            if (!closed) {
                out.unterminated_string = true;
                break;
            }
            i = j + 1;
            continue;
        }

        if (c == '(' || c == '[' || c == '{') {
            st.bracket_depth++;
        } else if ((c == ')' || c == ']' || c == '}') && st.bracket_depth > 0) {
            st.bracket_depth--;
        }
        i++;
    }
    return out;
}

bool starts_with_word(std::string_view code, std::string_view word) {
    if (code.size() < word.size() || code.compare(0, word.size(), word) != 0) return false;
    if (code.size() == word.size()) return true;
    const char next = code[word.size()];
    return next == ' ' || next == '\t' || next == ':' || next == '(';
}

bool is_soft_keyword(BlockKind kind) {
    return kind == BlockKind::MATCH || kind == BlockKind::CASE;
}

}

std::string LineClassifier::trim(std::string_view s) {
    const char* ws = " \t\r\n\f\v";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string_view::npos) return "";
    size_t end = s.find_last_not_of(ws);
    return std::string(s.substr(start, end - start + 1));
}

std::string LineClassifier::mask_string_literals(std::string_view code) {
    std::string out(code);
    const size_t n = out.size();
    size_t i = 0;

    while (i < n) {
        const char q = out[i];
        if (q != '"' && q != '\'') {
            i++;
            continue;
        }
        const size_t quote_len = (i + 2 < n && out[i + 1] == q && out[i + 2] == q) ? 3 : 1;
        size_t j = i + quote_len;
        while (j < n) {
            if (out[j] == '\\') {
                out[j] = ' ';
                if (j + 1 < n) out[j + 1] = ' ';
                j += 2;
                continue;
            }
            if (out[j] == q && (quote_len == 1 || (j + 2 < n && out[j + 1] == q && out[j + 2] == q))) break;
            out[j] = ' ';
            j++;
        }
        i = std::min(n, j + quote_len);
    }
    return out;
}

std::vector<std::string> LineClassifier::split_lines(const std::string& text) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (true) {
        size_t nl = text.find('\n', start);
        std::string line = text.substr(start, nl == std::string::npos ? std::string::npos : nl - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        if (nl == std::string::npos) break;
        start = nl + 1;
    }
    return lines;
}

std::optional<BlockKind> LineClassifier::leading_keyword(std::string_view code) {
    static const std::pair<std::string_view, BlockKind> kKeywords[] = {
        {"async def", BlockKind::FUNCTION},
        {"async for", BlockKind::FOR},
        {"async with", BlockKind::WITH},
        {"def", BlockKind::FUNCTION},
        {"class", BlockKind::CLASS},
        {"if", BlockKind::IF},
        {"elif", BlockKind::ELIF},
        {"else", BlockKind::ELSE},
        {"for", BlockKind::FOR},
        {"while", BlockKind::WHILE},
        {"try", BlockKind::TRY},
        {"except", BlockKind::EXCEPT},
        {"finally", BlockKind::FINALLY},
        {"with", BlockKind::WITH},
        {"match", BlockKind::MATCH},
        {"case", BlockKind::CASE},
    };
    for (const auto& [word, kind] : kKeywords) {
        if (starts_with_word(code, word)) return kind;
    }
    return std::nullopt;
}

bool LineClassifier::is_module_declaration(std::string_view code) {
    if (starts_with_word(code, "import")) return code.size() > 6;
    if (starts_with_word(code, "from")) return code.find(" import ") != std::string_view::npos ||
                                               code.find(" import(") != std::string_view::npos;
    return false;
}

bool LineClassifier::is_continuation_kind(BlockKind kind) {
    return kind == BlockKind::ELIF || kind == BlockKind::ELSE || kind == BlockKind::EXCEPT ||
           kind == BlockKind::FINALLY || kind == BlockKind::CASE;
}

ClassifiedText LineClassifier::classify(const std::string& text) {
    ClassifiedText out;
    const auto raw_lines = split_lines(text);
    out.lines.reserve(raw_lines.size());

    ScanState st;
    int head = -1;            // first physical line of the open logical line
    std::string logical_code; // codes of the open logical line, joined

    auto finalize_head = [&](const std::string& last_code) {
        Line& h = out.lines[head];
        if (h.role == LineRole::SIMPLE_STATEMENT && h.kind) {
            const bool has_colon_end = !last_code.empty() && last_code.back() == ':';
            if (has_colon_end) {
                h.role = LineRole::BLOCK_HEADER;
            } else if (is_soft_keyword(*h.kind)) {
                h.kind.reset(); // "match = re.match(...)" is an ordinary statement
            } else if (logical_code.find(':') == std::string::npos) {
                out.diagnostics.push_back({Severity::INFO, codes::MISSING_BLOCK_COLON, h.source_index,
                                           "Keyword-led line has no ':'; classified as a plain statement", ""});
            }
        }
        head = -1;
        logical_code.clear();
    };

    for (size_t i = 0; i < raw_lines.size(); ++i) {
        const std::string& raw = raw_lines[i];
        const bool in_string = st.triple_quote != 0;
        const bool continuation = in_string || st.bracket_depth > 0 || st.backslash;
        st.backslash = false;

        LineScan scan = scan_line(raw, st);

        Line line;
        line.text = raw;
        line.source_index = static_cast<int>(i);
        line.continuation = continuation;
        line.verbatim = in_string;
        line.code = trim(std::string_view(raw).substr(0, scan.code_end));

        if (st.triple_quote == 0 && !line.code.empty() && line.code.back() == '\\') {
            st.backslash = true;
        }
        if (scan.unterminated_string) {
            out.diagnostics.push_back({Severity::INFO, codes::UNTERMINATED_STRING, static_cast<int>(i),
                                       "String literal is not closed on its line", ""});
        }

        if (continuation) {
            line.role = (!line.verbatim && line.code.empty()) ? LineRole::COMMENT_OR_BLANK
                                                              : LineRole::SIMPLE_STATEMENT;
        } else {
            if (head >= 0) finalize_head(out.lines.back().code);
            head = static_cast<int>(i);
            if (line.code.empty()) {
                line.role = LineRole::COMMENT_OR_BLANK;
            } else if (is_module_declaration(line.code)) {
                line.role = LineRole::MODULE_DECLARATION;
            } else {
                line.role = LineRole::SIMPLE_STATEMENT;
                line.kind = leading_keyword(line.code);
            }
        }

        if (!logical_code.empty()) logical_code += '\n';
        logical_code += line.code;
        out.lines.push_back(std::move(line));

        const bool logical_open = st.triple_quote != 0 || st.bracket_depth > 0 || st.backslash;
        if (!logical_open && head >= 0) finalize_head(out.lines.back().code);
    }

    if (head >= 0) finalize_head(out.lines.back().code);
    out.unclosed = st.triple_quote != 0 || st.bracket_depth > 0 || st.backslash;

    spdlog::debug("🔎 Classifier: {} lines, unclosed={}", out.lines.size(), out.unclosed);
    return out;
}

}
