#pragma once
#include <string>
#include <string_view>
#include <vector>
#include "sanitizer/LineTypes.hpp"
#include "rules/SymbolTable.hpp"

namespace code_sanitizer {

struct NormalizedLines {
    std::vector<Line> lines;
    std::vector<Diagnostic> diagnostics;
};

// Hoists and deduplicates module declarations and synthesizes the ones the
// text relies on but never wrote. Output order:
//   1. from __future__ declarations
//   2. synthesized declarations, in first-reference order
//   3. the leading comment/declaration prelude, with later declarations
//      hoisted in after its last declaration
//   4. the remaining body
class ImportNormalizer {
public:
    static NormalizedLines normalize(const std::vector<Line>& tracked, const SymbolTable& symbols);

    // Names a declaration binds: "import a.b as c, d.e" -> {c, d},
    // "from m import (x as y, z)" -> {y, z}, "from m import *" -> {"*"}
    static std::vector<std::string> declared_names(std::string_view declaration);

    // "from m import ..." -> "m"; empty for plain imports
    static std::string source_module(std::string_view declaration);
};

}
