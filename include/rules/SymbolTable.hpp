#pragma once
#include <string>
#include <unordered_map>
#include <optional>
#include <nlohmann/json.hpp>

namespace code_sanitizer {

// Bare identifier -> canonical declaring statement ("np" -> "import numpy as np").
// Built once, then shared read-only through a RuleSet.
class SymbolTable {
public:
    SymbolTable() = default;
    explicit SymbolTable(std::string version) : version_(std::move(version)) {}

    // Last registration wins. Only called while the table is being built.
    void register_symbol(const std::string& identifier, const std::string& declaring_statement);

    std::optional<std::string> find(const std::string& identifier) const;
    bool contains(const std::string& identifier) const { return entries_.count(identifier) > 0; }

    size_t size() const { return entries_.size(); }
    const std::string& version() const { return version_; }

    nlohmann::json to_json() const;

    static SymbolTable builtin();

    // {"version": "...", "symbols": {"np": "import numpy as np", ...}}
    static SymbolTable from_json(const nlohmann::json& j, const std::string& source = "");
    static SymbolTable load_file(const std::string& path);

private:
    std::string version_ = "empty";
    std::unordered_map<std::string, std::string> entries_;
};

}
