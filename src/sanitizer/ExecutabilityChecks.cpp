#include "sanitizer/ExecutabilityChecks.hpp"
#include <regex>
#include <spdlog/spdlog.h>

namespace code_sanitizer {

namespace {

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool produces_output(const std::string& code) {
    if (starts_with(code, "return") && (code.size() == 6 || code[6] == ' ' || code[6] == '(')) return true;
    return code.find("print(") != std::string::npos ||
           code.find("display(") != std::string::npos ||
           code.find("plt.show(") != std::string::npos;
}

}

std::vector<Diagnostic> ExecutabilityChecks::inspect(const std::vector<Line>& lines) {
    static const char* kPlaceholders[] = {"your_variable", "your_data", "название_переменной"};
    static const std::regex kAngleMarker(R"(<\s*(?:your|insert|placeholder)[^<>]*>)", std::regex::icase);

    std::vector<Diagnostic> out;
    bool has_output = false;
    bool has_code = false;

    for (const auto& line : lines) {
        if (line.role == LineRole::COMMENT_OR_BLANK || line.code.empty()) continue;
        has_code = true;
        if (produces_output(line.code)) has_output = true;

        for (const char* placeholder : kPlaceholders) {
            if (line.code.find(placeholder) != std::string::npos) {
                out.push_back({Severity::WARNING, codes::PLACEHOLDER_IDENTIFIER, line.source_index,
                               "Template placeholder left in the example", placeholder});
            }
        }
        std::smatch m;
        if (std::regex_search(line.code, m, kAngleMarker)) {
            out.push_back({Severity::WARNING, codes::PLACEHOLDER_IDENTIFIER, line.source_index,
                           "Template placeholder left in the example", m.str()});
        }
    }

    if (has_code && !has_output) {
        out.push_back({Severity::INFO, codes::NO_VISIBLE_OUTPUT, std::nullopt,
                       "Running this example prints nothing", ""});
    }
    if (!out.empty()) spdlog::debug("🧪 Executability: {} findings", out.size());
    return out;
}

}
