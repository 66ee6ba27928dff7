#pragma once
#include <string>
#include <vector>
#include <regex>
#include <utility>
#include <nlohmann/json.hpp>

namespace code_sanitizer {

// What text a signature is matched against. CODE blanks string literal
// contents first; LITERALS keeps them for patterns keyed on path strings.
enum class MatchScope { CODE, LITERALS };

// Signature over statement code that implies an external resource
// (file, network, database, interactive stdin) the example cannot rely on.
struct ForbiddenPattern {
    std::string reason_code;
    std::string signature;   // ECMAScript regex, case-insensitive
    std::string description;
    MatchScope scope = MatchScope::CODE;
    std::regex matcher;

    // Throws RuleLoadError for an invalid signature
    static ForbiddenPattern compile(const std::string& reason_code,
                                    const std::string& signature,
                                    const std::string& description,
                                    MatchScope scope = MatchScope::CODE);

    // On a match, copies the matched text into *matched when given
    bool matches(const std::string& code, std::string* matched = nullptr) const;
};

class ForbiddenPatternSet {
public:
    ForbiddenPatternSet() = default;

    void add(ForbiddenPattern pattern) { patterns_.push_back(std::move(pattern)); }

    const std::vector<ForbiddenPattern>& patterns() const { return patterns_; }
    size_t size() const { return patterns_.size(); }
    bool empty() const { return patterns_.empty(); }
    const std::string& version() const { return version_; }

    static ForbiddenPatternSet builtin();

    // {"version": "...", "patterns": [{"reason_code": "...", "signature": "...", "description": "...",
    //                                "scope": "code" | "literals"}]}
    static ForbiddenPatternSet from_json(const nlohmann::json& j, const std::string& source = "");
    static ForbiddenPatternSet load_file(const std::string& path);

private:
    std::string version_ = "empty";
    std::vector<ForbiddenPattern> patterns_;
};

}
