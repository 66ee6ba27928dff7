#include "sanitizer/BlockDepthTracker.hpp"
#include "sanitizer/LineClassifier.hpp"
#include <unordered_set>
#include <optional>
#include <spdlog/spdlog.h>

namespace code_sanitizer {

namespace {

bool is_definition(BlockKind k) {
    return k == BlockKind::FUNCTION || k == BlockKind::CLASS;
}

// Openers an elif/else/except/finally/case may attach to.
// `strong` excludes loop openers so that "else" prefers an if/try chain.
bool accepts_continuation(const BlockFrame& frame, BlockKind chain_root, BlockKind kind, bool strong) {
    switch (kind) {
        case BlockKind::ELIF:
            return frame.kind == BlockKind::IF || frame.kind == BlockKind::ELIF;
        case BlockKind::ELSE:
            if (frame.kind == BlockKind::IF || frame.kind == BlockKind::ELIF ||
                frame.kind == BlockKind::TRY || frame.kind == BlockKind::EXCEPT) return true;
            return !strong && (frame.kind == BlockKind::FOR || frame.kind == BlockKind::WHILE);
        case BlockKind::EXCEPT:
            return frame.kind == BlockKind::TRY || frame.kind == BlockKind::EXCEPT;
        case BlockKind::FINALLY:
            return frame.kind == BlockKind::TRY || frame.kind == BlockKind::EXCEPT ||
                   (frame.kind == BlockKind::ELSE && chain_root == BlockKind::TRY);
        case BlockKind::CASE:
            return frame.kind == BlockKind::CASE;
        default:
            return false;
    }
}

// One-line compound statements that a later clause may continue
bool opens_inline_chain(BlockKind k) {
    return k == BlockKind::IF || k == BlockKind::ELIF || k == BlockKind::ELSE ||
           k == BlockKind::TRY || k == BlockKind::EXCEPT;
}

bool is_main_guard(const std::string& code) {
    return code == "if __name__ == \"__main__\":" || code == "if __name__ == '__main__':";
}

// "def name(self, ...)" / "def name(cls, ...)"
bool takes_instance_param(const std::string& code) {
    size_t open = code.find('(');
    if (open == std::string::npos) return false;
    std::string first = LineClassifier::trim(std::string_view(code).substr(open + 1));
    auto starts = [&](const char* p) {
        std::string_view f(first), w(p);
        if (f.compare(0, w.size(), w) != 0) return false;
        if (f.size() == w.size()) return true;
        const char n = f[w.size()];
        return n == ',' || n == ')' || n == ':' || n == ' ';
    };
    return starts("self") || starts("cls");
}

bool is_method_decorator(const std::string& code) {
    return code == "@staticmethod" || code == "@classmethod" || code == "@property" ||
           code == "@abstractmethod" || code == "@abc.abstractmethod" ||
           code.find(".setter") != std::string::npos || code.find(".getter") != std::string::npos ||
           code.find(".deleter") != std::string::npos;
}

}

TrackedLines BlockDepthTracker::assign_depths(const std::vector<Line>& classified) {
    TrackedLines out;
    out.lines = classified;

    std::vector<BlockFrame> stack;
    std::vector<BlockKind> chain_roots; // parallel to stack: if / try / for / while chain the frame belongs to
    std::unordered_set<std::string> top_level_headers;
    std::vector<size_t> pending;        // comments and decorators waiting for the next code line
    bool blank_run = false;
    bool method_decorated = false;
    int head_depth = 0;

    // Last one-line "if c: x" / "try: x" chain, which pushes no frame
    struct InlineChain {
        int height;
        BlockKind kind;
        BlockKind root;
    };
    std::optional<InlineChain> inline_chain;

    auto height = [&]() { return static_cast<int>(stack.size()); };
    auto current_depth = [&]() { return stack.empty() ? 0 : stack.back().depth; };
    auto count_statement = [&]() { if (!stack.empty()) stack.back().statements++; };
    auto truncate = [&](int h) {
        stack.resize(h);
        chain_roots.resize(h);
    };
    auto settle_pending = [&](int depth) {
        for (size_t idx : pending) out.lines[idx].depth = depth;
        pending.clear();
    };
    auto info = [&](const char* code, const Line& l, std::string msg) {
        out.diagnostics.push_back({Severity::INFO, code, l.source_index, std::move(msg), ""});
    };

    // Pops to the nearest frame the clause can attach to; returns the chain root.
    // A one-line opener at the current height wins over any open frame.
    auto close_to_opener = [&](BlockKind kind) -> std::optional<BlockKind> {
        if (inline_chain && inline_chain->height == height()) {
            const BlockFrame opener{-1, height(), inline_chain->kind, 0};
            if (accepts_continuation(opener, inline_chain->root, kind, true)) return inline_chain->root;
        }
        for (bool strong : {true, false}) {
            for (int j = height() - 1; j >= 0; --j) {
                if (accepts_continuation(stack[j], chain_roots[j], kind, strong)) {
                    BlockKind root = chain_roots[j];
                    truncate(j);
                    return root;
                }
            }
        }
        return std::nullopt;
    };

    // Scope close for a header that follows a comment/blank run
    auto apply_dedent_cue = [&](const Line& l, BlockKind kind) -> bool {
        if (top_level_headers.count(l.code) || is_main_guard(l.code)) {
            truncate(0);
            return true;
        }
        if (!is_definition(kind) || stack.back().statements < 1) return false;

        if (kind == BlockKind::CLASS) {
            for (int j = 0; j < height(); ++j) {
                if (is_definition(stack[j].kind)) { truncate(j); return true; }
            }
            return false;
        }
        for (int j = height() - 1; j >= 0; --j) {
            if (!is_definition(stack[j].kind)) continue;
            const bool leaves_class = stack[j].kind == BlockKind::FUNCTION && j > 0 &&
                                      stack[j - 1].kind == BlockKind::CLASS &&
                                      !takes_instance_param(l.code) && !method_decorated;
            truncate(leaves_class ? j - 1 : j);
            return true;
        }
        return false;
    };

    for (size_t i = 0; i < out.lines.size(); ++i) {
        Line& line = out.lines[i];

        if (line.continuation) {
            line.depth = head_depth;
            continue;
        }

        switch (line.role) {
            case LineRole::COMMENT_OR_BLANK:
                pending.push_back(i);
                blank_run = true;
                break;

            case LineRole::MODULE_DECLARATION:
                // Hoisted later; never moves the stack and does not end a blank run
                line.depth = 0;
                head_depth = 0;
                break;

            case LineRole::BLOCK_HEADER: {
                const BlockKind kind = line.kind.value_or(BlockKind::IF);
                BlockKind root = kind;

                if (LineClassifier::is_continuation_kind(kind)) {
                    if (auto r = close_to_opener(kind)) {
                        root = *r;
                    } else {
                        info(codes::UNMATCHED_CONTINUATION, line,
                             "No open block this clause can continue; kept nested");
                    }
                } else if (blank_run && !stack.empty()) {
                    if (!apply_dedent_cue(line, kind)) {
                        info(codes::AMBIGUOUS_DEDENT, line,
                             "Header after a blank run kept nested at depth " + std::to_string(height()));
                    }
                }

                const int depth = height();
                if (depth == 0 && !LineClassifier::is_continuation_kind(kind)) {
                    top_level_headers.insert(line.code);
                }
                count_statement();
                line.depth = depth;
                head_depth = depth;
                settle_pending(depth);

                stack.push_back({line.source_index, depth + 1, kind, 0});
                chain_roots.push_back(root);
                inline_chain.reset();
                blank_run = false;
                method_decorated = false;
                break;
            }

            case LineRole::SIMPLE_STATEMENT: {
                if (!line.code.empty() && line.code.front() == '@') {
                    // Decorators take the depth of the header they decorate
                    if (is_method_decorator(line.code)) method_decorated = true;
                    pending.push_back(i);
                    break;
                }

                std::optional<BlockKind> chain_root;
                if (line.kind && LineClassifier::is_continuation_kind(*line.kind)) {
                    // one-line clause, e.g. "else: total = 0"
                    chain_root = close_to_opener(*line.kind);
                    if (!chain_root) {
                        info(codes::UNMATCHED_CONTINUATION, line,
                             "No open block this clause can continue; kept nested");
                    }
                } else if (blank_run && !stack.empty()) {
                    info(codes::AMBIGUOUS_DEDENT, line,
                         "Statement after a blank run kept nested at depth " + std::to_string(current_depth()));
                }

                const int depth = current_depth();
                count_statement();
                line.depth = depth;
                head_depth = depth;
                settle_pending(depth);

                if (line.kind && opens_inline_chain(*line.kind)) {
                    inline_chain = InlineChain{height(), *line.kind, chain_root.value_or(*line.kind)};
                } else {
                    inline_chain.reset();
                }
                blank_run = false;
                method_decorated = false;
                break;
            }
        }
    }
    settle_pending(0);

    spdlog::debug("📐 Depth tracker: {} lines, {} open frames at end", out.lines.size(), stack.size());
    return out;
}

std::string BlockDepthTracker::render(const std::vector<Line>& lines, int indent_width) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        const Line& l = lines[i];
        if (l.verbatim) {
            out += l.text;
            continue;
        }
        std::string body = LineClassifier::trim(l.text);
        if (body.empty()) continue;
        const int depth = l.depth.value_or(0) + (l.continuation ? 1 : 0);
        out.append(static_cast<size_t>(depth * indent_width), ' ');
        out += body;
    }
    return out;
}

}
