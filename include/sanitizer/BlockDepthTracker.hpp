#pragma once
#include <string>
#include <vector>
#include "sanitizer/LineTypes.hpp"

namespace code_sanitizer {

struct TrackedLines {
    std::vector<Line> lines;
    std::vector<Diagnostic> diagnostics;
};

// Re-derives block depth from classified lines with an explicit frame stack.
// Frames are only popped on structural cues (compound continuations, or a
// comment/blank run followed by a header that looks top-level); the default
// is to stay nested.
class BlockDepthTracker {
public:
    static TrackedLines assign_depths(const std::vector<Line>& classified);

    // Emits depth * indent_width spaces before each line's trimmed text.
    // Continuation lines get one extra unit; verbatim lines are copied as-is.
    static std::string render(const std::vector<Line>& lines, int indent_width);
};

}
