#include "syntax_probe.hpp"
#include <tree_sitter/api.h>
#include <spdlog/spdlog.h>
#include <stack>

// 🚀 EXTERNAL SYMBOL LINKING (tree-sitter-python grammar library)
extern "C" {
    TSLanguage* tree_sitter_python();
}

namespace code_sanitizer::syntax {

SyntaxProbe::SyntaxProbe() {
    parser_ = ts_parser_new();
    if (parser_) ts_parser_set_language(parser_, tree_sitter_python());
}

SyntaxProbe::~SyntaxProbe() {
    if (parser_) ts_parser_delete(parser_);
}

std::string SyntaxProbe::mask_notebook_magics(const std::string& code) {
    std::string out;
    out.reserve(code.size());
    size_t start = 0;
    while (start <= code.size()) {
        size_t nl = code.find('\n', start);
        std::string line = code.substr(start, nl == std::string::npos ? std::string::npos : nl - start);

        size_t indent = line.find_first_not_of(' ');
        if (indent != std::string::npos && (line[indent] == '%' || line[indent] == '!')) {
            line = line.substr(0, indent) + "pass";
        }
        out += line;
        if (nl == std::string::npos) break;
        out += '\n';
        start = nl + 1;
    }
    return out;
}

ProbeResult SyntaxProbe::check_python(const std::string& code) {
    if (!parser_) {
        spdlog::error("❌ SyntaxProbe: tree-sitter parser could not be created");
        return {false, std::nullopt};
    }

    const std::string masked = mask_notebook_magics(code);
    TSTree* tree = ts_parser_parse_string(parser_, nullptr, masked.c_str(), (uint32_t)masked.length());
    if (!tree) return {false, std::nullopt};

    TSNode root = ts_tree_root_node(tree);
    if (!ts_node_has_error(root)) {
        ts_tree_delete(tree);
        return {true, std::nullopt};
    }

    // Locate the earliest broken node for the diagnostic
    std::optional<int> first_row;
    std::stack<TSNode> traversal_stack;
    traversal_stack.push(root);
    while (!traversal_stack.empty()) {
        TSNode node = traversal_stack.top();
        traversal_stack.pop();

        if (ts_node_is_error(node) || ts_node_is_missing(node)) {
            int row = (int)ts_node_start_point(node).row;
            if (!first_row || row < *first_row) first_row = row;
            continue;
        }
        if (!ts_node_has_error(node)) continue;

        uint32_t count = ts_node_child_count(node);
        for (uint32_t i = 0; i < count; i++) {
            traversal_stack.push(ts_node_child(node, i));
        }
    }

    ts_tree_delete(tree);
    spdlog::debug("🌳 SyntaxProbe: parse error near row {}", first_row.value_or(-1));
    return {false, first_row};
}

}
