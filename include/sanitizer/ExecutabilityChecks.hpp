#pragma once
#include <vector>
#include "sanitizer/LineTypes.hpp"

namespace code_sanitizer {

// Soft checks on accepted output: will running it show anything, and did the
// model leave template placeholders in? Never changes acceptance.
class ExecutabilityChecks {
public:
    static std::vector<Diagnostic> inspect(const std::vector<Line>& lines);
};

}
