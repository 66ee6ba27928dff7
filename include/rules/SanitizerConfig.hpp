#pragma once
#include <string>
#include <filesystem>
#include <nlohmann/json.hpp>

namespace code_sanitizer {

struct SanitizerConfig {
    std::string symbol_table_source;   // empty -> SymbolTable::builtin()
    std::string forbidden_pattern_set; // empty -> ForbiddenPatternSet::builtin()
    int indent_width = 4;
    bool syntax_probe = true;
    std::string log_level = "info";

    nlohmann::json to_json() const {
        return {
            {"symbol_table_source", symbol_table_source},
            {"forbidden_pattern_set", forbidden_pattern_set},
            {"indent_width", indent_width},
            {"syntax_probe", syntax_probe},
            {"log_level", log_level}
        };
    }

    // Relative rule paths are resolved against base_dir
    static SanitizerConfig from_json(const nlohmann::json& j, const std::filesystem::path& base_dir = {});
    static SanitizerConfig load_file(const std::string& path);
};

}
