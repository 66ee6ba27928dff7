#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>
#include <iostream>
#include <fstream>
#include <sstream>
#include <memory>
#include <filesystem>

#include "CoverageLog.hpp"
#include "rules/RuleRegistry.hpp"
#include "rules/RuleLoadError.hpp"
#include "sanitizer/SanitizationPipeline.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

struct CliOptions {
    std::string config_path;
    std::string input_path;
    std::string subject;
    std::string coverage_out;
    bool document = false;
};

void print_usage() {
    std::cerr << "usage: code_sanitizer [--config FILE] [--input FILE] [--document]\n"
                 "                      [--subject TEXT] [--coverage-out FILE]\n"
                 "Reads generated code from --input (or stdin) and prints the sanitized result as JSON.\n";
}

// Returns false on a usage error
bool parse_args(int argc, char** argv, CliOptions& opts) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto value = [&](std::string& into) {
            if (i + 1 >= argc) return false;
            into = argv[++i];
            return true;
        };

        if (arg == "--config") { if (!value(opts.config_path)) return false; }
        else if (arg == "--input") { if (!value(opts.input_path)) return false; }
        else if (arg == "--subject") { if (!value(opts.subject)) return false; }
        else if (arg == "--coverage-out") { if (!value(opts.coverage_out)) return false; }
        else if (arg == "--document") { opts.document = true; }
        else {
            spdlog::error("❌ Unknown argument '{}'", arg);
            return false;
        }
    }
    return true;
}

}

class SanitizerApp {
public:
    explicit SanitizerApp(CliOptions opts) : opts_(std::move(opts)) {}

    int run() {
        // 1. Rules
        code_sanitizer::SanitizerConfig config;
        if (!opts_.config_path.empty()) {
            try {
                config = code_sanitizer::SanitizerConfig::load_file(opts_.config_path);
            } catch (const code_sanitizer::RuleLoadError& e) {
                spdlog::error("❌ {}", e.what());
                return 2;
            }
        }
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        if (!registry_.reload(config)) return 2;

        // 2. Input
        std::string input;
        if (!read_input(input)) return 2;

        code_sanitizer::RequestContext ctx;
        if (!opts_.subject.empty()) ctx.subject_hints.push_back(opts_.subject);
        if (!opts_.input_path.empty()) ctx.lesson_title = fs::path(opts_.input_path).filename().string();

        // 3. Sanitize
        code_sanitizer::SanitizationPipeline pipeline(registry_.snapshot());
        auto& coverage = code_sanitizer::CoverageLog::instance();
        bool accepted = true;

        if (opts_.document) {
            auto doc = pipeline.sanitize_document(input, ctx);
            for (const auto& block : doc.blocks) coverage.record(ctx.label(), block.result);
            accepted = doc.all_accepted;
            std::cout << doc.to_json().dump(2) << std::endl;
        } else {
            auto result = pipeline.sanitize(code_sanitizer::RawExample{input, ctx});
            coverage.record(ctx.label(), result);
            accepted = result.accepted;
            std::cout << result.to_json().dump(2) << std::endl;
        }

        if (!opts_.coverage_out.empty()) coverage.save(opts_.coverage_out);
        return accepted ? 0 : 1;
    }

private:
    CliOptions opts_;
    code_sanitizer::RuleRegistry registry_;

    bool read_input(std::string& out) {
        std::stringstream buffer;
        if (opts_.input_path.empty()) {
            buffer << std::cin.rdbuf();
        } else {
            std::ifstream f(opts_.input_path, std::ios::binary);
            if (!f.is_open()) {
                spdlog::error("❌ Cannot open input {}", opts_.input_path);
                return false;
            }
            buffer << f.rdbuf();
        }
        out = buffer.str();
        return true;
    }
};

int main(int argc, char** argv) {
    // stdout carries the JSON result; logs go to stderr
    spdlog::set_default_logger(spdlog::stderr_color_mt("code_sanitizer"));
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    CliOptions opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 2;
    }

    SanitizerApp app(std::move(opts));
    return app.run();
}
