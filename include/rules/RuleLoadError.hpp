#pragma once
#include <stdexcept>
#include <string>
#include <utility>

namespace code_sanitizer {

// Thrown while building rules or configuration; never escapes a sanitize() call
struct RuleLoadError : public std::runtime_error {
    std::string source;

    explicit RuleLoadError(const std::string& message, std::string source_ = "")
        : std::runtime_error(source_.empty() ? message : source_ + ": " + message), source(std::move(source_)) {}
};

}
