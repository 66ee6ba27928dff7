#include "sanitizer/ImportNormalizer.hpp"
#include "sanitizer/LineClassifier.hpp"
#include <unordered_set>
#include <cctype>
#include <spdlog/spdlog.h>

namespace code_sanitizer {

namespace {

// A head physical line plus its continuation lines
struct LogicalLine {
    size_t first;
    size_t last; // inclusive
    LineRole role;
    std::string code; // trimmed codes joined with a space
    int source_index;
};

struct Token {
    std::string name;
    size_t pos;
    int depth;      // bracket depth at the token
    bool after_dot; // attribute access, never a free name
    char prev;      // previous non-space character, 0 at start
    char next;      // next non-space character, 0 at end
    char next2;
};

const std::unordered_set<std::string> kKeywords = {
    "False", "None", "True", "and", "as", "assert", "async", "await", "break", "class",
    "continue", "def", "del", "elif", "else", "except", "finally", "for", "from", "global",
    "if", "import", "in", "is", "lambda", "nonlocal", "not", "or", "pass", "raise",
    "return", "try", "while", "with", "yield", "match", "case"
};

// Names available without any declaration, plus notebook globals
const std::unordered_set<std::string> kBuiltins = {
    "abs", "aiter", "all", "anext", "any", "ascii", "bin", "bool", "breakpoint", "bytearray",
    "bytes", "callable", "chr", "classmethod", "compile", "complex", "delattr", "dict", "dir",
    "divmod", "enumerate", "eval", "exec", "filter", "float", "format", "frozenset", "getattr",
    "globals", "hasattr", "hash", "help", "hex", "id", "input", "int", "isinstance",
    "issubclass", "iter", "len", "list", "locals", "map", "max", "memoryview", "min", "next",
    "object", "oct", "open", "ord", "pow", "print", "property", "range", "repr", "reversed",
    "round", "set", "setattr", "slice", "sorted", "staticmethod", "str", "sum", "super",
    "tuple", "type", "vars", "zip", "__import__", "__name__", "__file__", "__doc__",
    "NotImplemented", "Ellipsis",
    "BaseException", "Exception", "ArithmeticError", "AssertionError", "AttributeError",
    "BufferError", "EOFError", "FloatingPointError", "GeneratorExit", "ImportError",
    "ModuleNotFoundError", "IndexError", "KeyError", "KeyboardInterrupt", "LookupError",
    "MemoryError", "NameError", "NotImplementedError", "OSError", "IOError", "OverflowError",
    "RecursionError", "ReferenceError", "RuntimeError", "StopIteration", "StopAsyncIteration",
    "SyntaxError", "SystemError", "SystemExit", "TypeError", "UnboundLocalError",
    "UnicodeError", "UnicodeDecodeError", "UnicodeEncodeError", "ValueError",
    "ZeroDivisionError", "FileNotFoundError", "PermissionError", "TimeoutError",
    "ConnectionError", "Warning", "UserWarning", "DeprecationWarning", "RuntimeWarning",
    "self", "cls", "display", "get_ipython"
};

bool is_ident_start(char c) {
    const unsigned char u = static_cast<unsigned char>(c);
    return std::isalpha(u) || c == '_' || u >= 0x80;
}

bool is_ident_char(char c) {
    const unsigned char u = static_cast<unsigned char>(c);
    return std::isalnum(u) || c == '_' || u >= 0x80;
}

bool is_string_prefix(std::string_view w) {
    if (w.size() > 2) return false;
    for (char c : w) {
        const char l = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        if (l != 'r' && l != 'b' && l != 'f' && l != 'u') return false;
    }
    return true;
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

// Index just past the string literal opening at i
size_t skip_string(std::string_view code, size_t i) {
    const char q = code[i];
    const size_t n = code.size();
    const bool triple = i + 2 < n && code[i + 1] == q && code[i + 2] == q;
    size_t j = i + (triple ? 3 : 1);
    while (j < n) {
        if (code[j] == '\\') { j += 2; continue; }
        if (code[j] == q) {
            if (!triple) return j + 1;
            if (j + 2 < n && code[j + 1] == q && code[j + 2] == q) return j + 3;
        }
        j++;
    }
    return n;
}

std::vector<LogicalLine> group_logical(const std::vector<Line>& lines) {
    std::vector<LogicalLine> out;
    for (size_t i = 0; i < lines.size(); ++i) {
        const Line& l = lines[i];
        if (l.continuation && !out.empty()) {
            LogicalLine& g = out.back();
            g.last = i;
            if (!l.code.empty()) {
                if (!g.code.empty()) g.code += ' ';
                g.code += l.code;
            }
            continue;
        }
        out.push_back({i, i, l.role, l.code, l.source_index});
    }
    return out;
}

// Identifier tokens outside string literals. Numbers and string prefixes are skipped.
std::vector<Token> tokenize(std::string_view code) {
    std::vector<Token> out;
    const size_t n = code.size();
    int depth = 0;
    size_t i = 0;

    while (i < n) {
        const char c = code[i];
        if (c == '"' || c == '\'') {
            i = skip_string(code, i);
            continue;
        }
        if (std::isdigit(static_cast<unsigned char>(c))) {
            while (i < n && (is_ident_char(code[i]) || code[i] == '.')) i++;
            continue;
        }
        if (is_ident_start(c)) {
            size_t j = i;
            while (j < n && is_ident_char(code[j])) j++;
            std::string_view word = code.substr(i, j - i);
            if (j < n && (code[j] == '"' || code[j] == '\'') && is_string_prefix(word)) {
                i = j;
                continue;
            }

            size_t k = i;
            while (k > 0 && code[k - 1] == ' ') k--;
            size_t m = j;
            while (m < n && code[m] == ' ') m++;

            Token tok;
            tok.name = std::string(word);
            tok.pos = i;
            tok.depth = depth;
            tok.prev = k > 0 ? code[k - 1] : '\0';
            tok.after_dot = tok.prev == '.';
            tok.next = m < n ? code[m] : '\0';
            tok.next2 = m + 1 < n ? code[m + 1] : '\0';
            out.push_back(std::move(tok));
            i = j;
            continue;
        }
        if (c == '(' || c == '[' || c == '{') {
            depth++;
        } else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
            depth--;
        }
        i++;
    }
    return out;
}

// '=' operators (plain or augmented) at bracket depth 0; comparisons excluded
std::vector<size_t> assignment_positions(std::string_view code) {
    std::vector<size_t> out;
    const size_t n = code.size();
    int depth = 0;
    size_t i = 0;

    while (i < n) {
        const char c = code[i];
        if (c == '"' || c == '\'') {
            i = skip_string(code, i);
            continue;
        }
        if (c == '(' || c == '[' || c == '{') {
            depth++;
        } else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
            depth--;
        } else if (c == '=' && depth == 0) {
            if (i + 1 < n && code[i + 1] == '=') {
                i += 2;
                continue;
            }
            const char prev = i > 0 ? code[i - 1] : '\0';
            bool comparison = prev == '!' || prev == '<' || prev == '>' || prev == ':';
            if ((prev == '>' || prev == '<') && i >= 2 && code[i - 2] == prev) comparison = false; // >>= <<=
            if (!comparison) out.push_back(i);
        }
        i++;
    }
    return out;
}

void collect_bindings(const LogicalLine& g, const std::vector<Token>& tokens,
                      std::unordered_set<std::string>& bound) {
    const std::string& code = g.code;

    for (size_t t = 0; t < tokens.size(); ++t) {
        const Token& tok = tokens[t];
        if (tok.after_dot) continue;

        if ((tok.name == "def" || tok.name == "class") && t + 1 < tokens.size()) {
            bound.insert(tokens[t + 1].name);
            if (tok.name == "def") {
                for (size_t p = t + 2; p < tokens.size(); ++p) {
                    const Token& param = tokens[p];
                    if (param.depth == 1 && (param.prev == '(' || param.prev == ',' || param.prev == '*')) {
                        bound.insert(param.name);
                    }
                }
            }
        } else if (tok.name == "for") {
            for (size_t p = t + 1; p < tokens.size() && tokens[p].name != "in"; ++p) {
                if (!tokens[p].after_dot) bound.insert(tokens[p].name);
            }
        } else if (tok.name == "as" && t + 1 < tokens.size()) {
            bound.insert(tokens[t + 1].name);
        } else if (tok.name == "lambda") {
            const size_t colon = code.find(':', tok.pos);
            for (size_t p = t + 1; p < tokens.size() && tokens[p].pos < colon; ++p) {
                if (tokens[p].prev != '=') bound.insert(tokens[p].name);
            }
        } else if ((tok.name == "global" || tok.name == "nonlocal") && t == 0) {
            for (size_t p = 1; p < tokens.size(); ++p) bound.insert(tokens[p].name);
        } else if (tok.next == ':' && tok.next2 == '=') {
            bound.insert(tok.name); // walrus
        }
    }

    if (g.role != LineRole::SIMPLE_STATEMENT) return;

    // Targets left of the last top-level '='; "x: T = v" binds x, not T.
    // "obj.attr = v" and "obj[k] = v" use obj, they do not bind it.
    const auto eqs = assignment_positions(code);
    if (eqs.empty()) return;
    size_t eq = 0;
    bool in_annotation = false;
    for (const Token& tok : tokens) {
        if (tok.pos >= eqs.back()) break;
        while (eq < eqs.size() && tok.pos > eqs[eq]) {
            eq++;
            in_annotation = false;
        }
        if (tok.depth != 0 || tok.after_dot) continue;
        if (tok.prev == ':') in_annotation = true;
        if (in_annotation || kKeywords.count(tok.name)) continue;
        if (tok.next == '.' || tok.next == '[') continue;
        bound.insert(tok.name);
    }
}

bool is_use(const Token& tok) {
    if (tok.after_dot || kKeywords.count(tok.name)) return false;
    // keyword argument name
    if (tok.depth > 0 && tok.next == '=' && tok.next2 != '=') return false;
    return true;
}

bool is_future_declaration(const std::string& code) {
    return starts_with(code, "from __future__ ");
}

std::string collapse_declaration(std::string_view declaration) {
    std::string text;
    bool space = false;
    for (char c : declaration) {
        const bool ws = c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '(' || c == ')' || c == '\\';
        if (ws) {
            space = !text.empty();
            continue;
        }
        if (space) text += ' ';
        space = false;
        text += c;
    }
    return text;
}

std::vector<std::string> split_commas(const std::string& list) {
    std::vector<std::string> pieces;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        std::string piece = LineClassifier::trim(
            std::string_view(list).substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if (!piece.empty()) pieces.push_back(std::move(piece));
        if (comma == std::string::npos) break;
        start = comma + 1;
    }
    return pieces;
}

}

std::vector<std::string> ImportNormalizer::declared_names(std::string_view declaration) {
    const std::string text = collapse_declaration(declaration);
    std::vector<std::string> names;

    if (starts_with(text, "from ")) {
        const size_t imp = text.find(" import ");
        if (imp == std::string::npos) return names;
        for (const auto& piece : split_commas(text.substr(imp + 8))) {
            const size_t as = piece.find(" as ");
            names.push_back(as == std::string::npos ? piece : LineClassifier::trim(piece.substr(as + 4)));
        }
    } else if (starts_with(text, "import ")) {
        for (const auto& piece : split_commas(text.substr(7))) {
            const size_t as = piece.find(" as ");
            names.push_back(as == std::string::npos ? piece.substr(0, piece.find('.'))
                                                    : LineClassifier::trim(piece.substr(as + 4)));
        }
    }
    return names;
}

std::string ImportNormalizer::source_module(std::string_view declaration) {
    const std::string text = collapse_declaration(declaration);
    if (!starts_with(text, "from ")) return "";
    const size_t imp = text.find(" import");
    if (imp == std::string::npos) return "";
    return LineClassifier::trim(std::string_view(text).substr(5, imp - 5));
}

NormalizedLines ImportNormalizer::normalize(const std::vector<Line>& tracked, const SymbolTable& symbols) {
    NormalizedLines out;
    const auto groups = group_logical(tracked);

    // 1. Existing declarations: dedup key is the trimmed text
    std::vector<bool> dropped(groups.size(), false);
    std::unordered_set<std::string> declaration_texts;
    std::unordered_set<std::string> declared;
    std::unordered_set<std::string> star_modules;
    for (size_t i = 0; i < groups.size(); ++i) {
        const LogicalLine& g = groups[i];
        if (g.role != LineRole::MODULE_DECLARATION) continue;
        if (!declaration_texts.insert(g.code).second) {
            dropped[i] = true;
            out.diagnostics.push_back({Severity::INFO, codes::DUPLICATE_DECLARATION, g.source_index,
                                       "Repeated declaration removed", g.code});
            continue;
        }
        for (const auto& name : declared_names(g.code)) {
            if (name == "*") {
                star_modules.insert(source_module(g.code));
            } else {
                declared.insert(name);
            }
        }
    }

    // 2. Local bindings anywhere in the text
    std::vector<std::vector<Token>> tokens(groups.size());
    std::unordered_set<std::string> bound;
    for (size_t i = 0; i < groups.size(); ++i) {
        const LogicalLine& g = groups[i];
        if (g.role != LineRole::SIMPLE_STATEMENT && g.role != LineRole::BLOCK_HEADER) continue;
        tokens[i] = tokenize(g.code);
        collect_bindings(g, tokens[i], bound);
    }

    // 3. Uses, in textual order
    std::vector<std::string> synthesized;
    std::unordered_set<std::string> synthesized_texts;
    std::unordered_set<std::string> handled;
    for (size_t i = 0; i < groups.size(); ++i) {
        for (const Token& tok : tokens[i]) {
            if (!is_use(tok)) continue;
            const std::string& id = tok.name;
            if (bound.count(id) || declared.count(id) || !handled.insert(id).second) continue;

            if (auto canonical = symbols.find(id)) {
                if (declaration_texts.count(*canonical)) continue;
                const std::string module = source_module(*canonical);
                if (!module.empty() && star_modules.count(module)) continue;
                if (synthesized_texts.insert(*canonical).second) synthesized.push_back(*canonical);
                out.diagnostics.push_back({Severity::INFO, codes::DECLARATION_SYNTHESIZED, groups[i].source_index,
                                           "Inserted '" + *canonical + "'", id});
                continue;
            }

            if (!star_modules.empty() || kBuiltins.count(id)) continue;
            if (tok.next != '(' && tok.next != '.') {
                handled.erase(id); // a later call or attribute use may still warn
                continue;
            }
            out.diagnostics.push_back({Severity::WARNING, codes::UNRESOLVED_IDENTIFIER, groups[i].source_index,
                                       "'" + id + "' is not defined, declared or known to the symbol table", id});
        }
    }

    // 4. Assemble
    size_t prelude_end = 0;
    while (prelude_end < groups.size() &&
           (groups[prelude_end].role == LineRole::MODULE_DECLARATION ||
            groups[prelude_end].role == LineRole::COMMENT_OR_BLANK)) {
        prelude_end++;
    }
    int last_prelude_declaration = -1;
    for (size_t i = 0; i < prelude_end; ++i) {
        if (groups[i].role == LineRole::MODULE_DECLARATION && !dropped[i] &&
            !is_future_declaration(groups[i].code)) {
            last_prelude_declaration = static_cast<int>(i);
        }
    }

    auto emit = [&](const LogicalLine& g) {
        for (size_t k = g.first; k <= g.last; ++k) {
            Line l = tracked[k];
            if (g.role == LineRole::MODULE_DECLARATION) l.depth = 0;
            out.lines.push_back(std::move(l));
        }
    };
    auto emit_hoisted = [&]() {
        for (size_t i = prelude_end; i < groups.size(); ++i) {
            if (groups[i].role == LineRole::MODULE_DECLARATION && !dropped[i] &&
                !is_future_declaration(groups[i].code)) {
                emit(groups[i]);
            }
        }
    };

    for (size_t i = 0; i < groups.size(); ++i) {
        if (groups[i].role == LineRole::MODULE_DECLARATION && !dropped[i] &&
            is_future_declaration(groups[i].code)) {
            emit(groups[i]);
        }
    }
    for (const auto& text : synthesized) {
        Line l;
        l.text = text;
        l.code = text;
        l.role = LineRole::MODULE_DECLARATION;
        l.depth = 0;
        out.lines.push_back(std::move(l));
    }
    if (last_prelude_declaration < 0) emit_hoisted();
    for (size_t i = 0; i < prelude_end; ++i) {
        const LogicalLine& g = groups[i];
        const bool declaration = g.role == LineRole::MODULE_DECLARATION;
        if (!declaration || (!dropped[i] && !is_future_declaration(g.code))) emit(g);
        if (static_cast<int>(i) == last_prelude_declaration) emit_hoisted();
    }
    for (size_t i = prelude_end; i < groups.size(); ++i) {
        if (groups[i].role != LineRole::MODULE_DECLARATION) emit(groups[i]);
    }

    spdlog::debug("📦 Import normalizer: {} declarations kept, {} synthesized",
                  declaration_texts.size(), synthesized.size());
    return out;
}

}
