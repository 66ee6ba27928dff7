#include "rules/SanitizerConfig.hpp"
#include "rules/RuleLoadError.hpp"
#include <fstream>
#include <unordered_set>
#include <spdlog/spdlog.h>

namespace code_sanitizer {

namespace fs = std::filesystem;

namespace {

std::string resolve(const std::string& p, const fs::path& base_dir) {
    if (p.empty() || base_dir.empty()) return p;
    fs::path candidate(p);
    if (candidate.is_absolute()) return p;
    return (base_dir / candidate).lexically_normal().string();
}

}

SanitizerConfig SanitizerConfig::from_json(const nlohmann::json& j, const fs::path& base_dir) {
    if (!j.is_object()) throw RuleLoadError("configuration must be a JSON object");

    static const std::unordered_set<std::string> kKnownKeys = {
        "symbol_table_source", "forbidden_pattern_set", "indent_width", "syntax_probe", "log_level"
    };
    for (const auto& [key, value] : j.items()) {
        if (!kKnownKeys.count(key)) spdlog::warn("⚠️ Unknown config key '{}' ignored", key);
    }

    SanitizerConfig cfg;
    try {
        cfg.symbol_table_source = resolve(j.value("symbol_table_source", ""), base_dir);
        cfg.forbidden_pattern_set = resolve(j.value("forbidden_pattern_set", ""), base_dir);
        cfg.indent_width = j.value("indent_width", 4);
        cfg.syntax_probe = j.value("syntax_probe", true);
        cfg.log_level = j.value("log_level", "info");
    } catch (const nlohmann::json::type_error& e) {
        throw RuleLoadError(std::string("wrong value type: ") + e.what());
    }

    if (cfg.indent_width < 1 || cfg.indent_width > 8) {
        throw RuleLoadError("indent_width must be between 1 and 8, got " + std::to_string(cfg.indent_width));
    }
    return cfg;
}

SanitizerConfig SanitizerConfig::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw RuleLoadError("cannot open configuration", path);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw RuleLoadError(std::string("invalid JSON: ") + e.what(), path);
    }

    try {
        return from_json(j, fs::path(path).parent_path());
    } catch (const RuleLoadError& e) {
        throw RuleLoadError(e.what(), path);
    }
}

}
