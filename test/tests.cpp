#undef NDEBUG
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>
#include <atomic>
#include <algorithm>

#include "CoverageLog.hpp"
#include "guard/ForbiddenOperationGuard.hpp"
#include "rules/RuleLoadError.hpp"
#include "rules/RuleRegistry.hpp"
#include "sanitizer/BlockDepthTracker.hpp"
#include "sanitizer/ImportNormalizer.hpp"
#include "sanitizer/LineClassifier.hpp"
#include "sanitizer/SanitizationPipeline.hpp"
#include "syntax_probe.hpp"
#include "utils/CodeBlockExtractor.hpp"
#include "utils/Scrubber.hpp"

using namespace code_sanitizer;

static const std::string kSourceDir = CODE_SANITIZER_SOURCE_DIR;

// Built-in rules with the tree-sitter probe off, so structure is tested alone
static std::shared_ptr<const RuleSet> structural_rules(int indent_width = 4) {
    SanitizerConfig cfg;
    cfg.syntax_probe = false;
    cfg.indent_width = indent_width;
    return RuleSet::build(cfg);
}

static SanitizedResult run_structural(const std::string& text) {
    SanitizationPipeline pipeline(structural_rules());
    return pipeline.sanitize(text);
}

static bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

static std::vector<std::string> non_info_codes(const SanitizedResult& r) {
    std::vector<std::string> out;
    for (const auto& d : r.diagnostics) {
        if (d.severity != Severity::INFO) out.push_back(d.code);
    }
    std::sort(out.begin(), out.end());
    return out;
}

static void test_classifier_roles() {
    auto c = LineClassifier::classify(
        "import os\n# setup\n\nclass A:\nx = 1  # note\nmatch = re.match(p, s)\nif x == ':':");
    assert(c.lines.size() == 7);
    assert(c.lines[0].role == LineRole::MODULE_DECLARATION);
    assert(c.lines[1].role == LineRole::COMMENT_OR_BLANK);
    assert(c.lines[2].role == LineRole::COMMENT_OR_BLANK);
    assert(c.lines[3].role == LineRole::BLOCK_HEADER);
    assert(c.lines[3].kind == BlockKind::CLASS);
    assert(c.lines[4].role == LineRole::SIMPLE_STATEMENT);
    assert(c.lines[4].code == "x = 1");
    assert(c.lines[5].role == LineRole::SIMPLE_STATEMENT);
    assert(!c.lines[5].kind.has_value());
    assert(c.lines[6].role == LineRole::BLOCK_HEADER);
    assert(!c.unclosed);
    assert(c.diagnostics.empty());
}

static void test_classifier_missing_colon_and_unclosed() {
    auto c = LineClassifier::classify("for i in range(3)\nprint(i)");
    assert(c.lines[0].role == LineRole::SIMPLE_STATEMENT);
    assert(c.diagnostics.size() == 1);
    assert(c.diagnostics[0].code == codes::MISSING_BLOCK_COLON);
    assert(c.diagnostics[0].line_index == 0);

    auto open = LineClassifier::classify("values = [1, 2\nprint(values)");
    assert(open.unclosed);
    assert(open.lines[1].continuation);
}

static void test_scenario_nested_body() {
    auto r = run_structural("def f():\nprint('hi')\nreturn 1");
    assert(r.accepted);
    assert(r.text == "def f():\n    print('hi')\n    return 1");
    assert(r.diagnostics.empty());
    assert(r.final_state == PipelineState::ACCEPTED);
}

static void test_scenario_declarations_hoisted() {
    auto r = run_structural("from a import make_x\ndef g():\nfrom a import make_y\nx = make_x()\ny = make_y()");
    assert(r.accepted);
    assert(r.text ==
           "from a import make_x\n"
           "from a import make_y\n"
           "def g():\n"
           "    x = make_x()\n"
           "    y = make_y()");
}

static void test_scenario_declaration_synthesized() {
    auto rules = std::make_shared<RuleSet>();
    rules->config.syntax_probe = false;
    rules->symbols.register_symbol("Classifier", "from lib.models import Classifier");
    rules->forbidden = ForbiddenPatternSet::builtin();
    SanitizationPipeline pipeline(rules);

    auto r = pipeline.sanitize("model = Classifier()\nmodel.fit(X, y)");
    assert(r.accepted);
    assert(r.text == "from lib.models import Classifier\nmodel = Classifier()\nmodel.fit(X, y)");
    assert(r.has_diagnostic(codes::DECLARATION_SYNTHESIZED));
    assert(r.count(Severity::WARNING) == 0);
}

static void test_scenario_forbidden_file_read() {
    const std::string raw = "data = load_table('data.csv')";
    auto r = run_structural(raw);
    assert(!r.accepted);
    assert(r.text == raw);
    assert(r.count(Severity::REJECTED) == 1);
    assert(r.has_diagnostic("FILE_PATH_READ"));
    assert(r.final_state == PipelineState::REJECTED);
}

static void test_scenario_empty_block_unrepairable() {
    const std::string raw = "for i in range(3):\n# nothing here";
    auto r = run_structural(raw);
    assert(!r.accepted);
    assert(r.text == raw);
    assert(r.has_diagnostic(codes::UNABLE_TO_REPAIR));
}

static void test_elif_else_align_with_if() {
    auto r = run_structural("def sign(x):\nif x > 0:\nreturn 1\nelif x < 0:\nreturn -1\nelse:\nreturn 0");
    assert(r.accepted);
    assert(r.text ==
           "def sign(x):\n"
           "    if x > 0:\n"
           "        return 1\n"
           "    elif x < 0:\n"
           "        return -1\n"
           "    else:\n"
           "        return 0");
}

static void test_try_except_finally() {
    auto r = run_structural("try:\nvalue = int(\"4\")\nexcept ValueError:\nvalue = 0\nfinally:\nprint(value)");
    assert(r.accepted);
    assert(r.text ==
           "try:\n"
           "    value = int(\"4\")\n"
           "except ValueError:\n"
           "    value = 0\n"
           "finally:\n"
           "    print(value)");
}

static void test_one_line_if_keeps_else_inside_loop() {
    auto r = run_structural("for i in range(3):\nif i % 2: print('odd')\nelse: print('even')");
    assert(r.accepted);
    assert(r.text ==
           "for i in range(3):\n"
           "    if i % 2: print('odd')\n"
           "    else: print('even')");
    assert(!r.has_diagnostic(codes::UNMATCHED_CONTINUATION));

    auto f = run_structural("def f(xs):\nfor x in xs:\nif x: return x\nelse: continue\nreturn None");
    assert(f.accepted);
    assert(f.text ==
           "def f(xs):\n"
           "    for x in xs:\n"
           "        if x: return x\n"
           "        else: continue\n"
           "        return None");

    auto block = run_structural("for n in range(4):\nif n == 2: print('two')\nelse:\nprint(n)");
    assert(block.accepted);
    assert(block.text ==
           "for n in range(4):\n"
           "    if n == 2: print('two')\n"
           "    else:\n"
           "        print(n)");

    auto chain = run_structural("try: value = int('4')\nexcept ValueError: value = 0\nfinally: print(value)");
    assert(chain.accepted);
    assert(chain.text == "try: value = int('4')\nexcept ValueError: value = 0\nfinally: print(value)");
}

static void test_unmatched_continuation_stays_nested() {
    auto r = run_structural("else:\nprint(1)");
    assert(r.has_diagnostic(codes::UNMATCHED_CONTINUATION));
}

static void test_blank_line_before_def_closes_function() {
    auto r = run_structural("def first():\nreturn 1\n\ndef second():\nreturn 2\nprint(first() + second())");
    assert(r.accepted);
    assert(r.text ==
           "def first():\n"
           "    return 1\n"
           "\n"
           "def second():\n"
           "    return 2\n"
           "    print(first() + second())");
}

static void test_function_without_self_leaves_class() {
    auto r = run_structural("class A:\ndef m(self):\nreturn 1\n\ndef helper(x):\nreturn x");
    assert(r.accepted);
    assert(r.text ==
           "class A:\n"
           "    def m(self):\n"
           "        return 1\n"
           "\n"
           "def helper(x):\n"
           "    return x");

    auto method = run_structural("class A:\ndef m(self):\nreturn 1\n\ndef n(self):\nreturn 2");
    assert(method.text.find("\n    def n(self):\n        return 2") != std::string::npos);
}

static void test_main_guard_returns_to_top_level() {
    auto r = run_structural("def main():\nprint(\"hi\")\n\nif __name__ == \"__main__\":\nmain()");
    assert(r.accepted);
    assert(r.text ==
           "def main():\n"
           "    print(\"hi\")\n"
           "\n"
           "if __name__ == \"__main__\":\n"
           "    main()");
}

static void test_statement_after_blank_is_ambiguous() {
    auto r = run_structural("for i in range(2):\nprint(i)\n\nprint('done')");
    assert(r.accepted);
    assert(r.has_diagnostic(codes::AMBIGUOUS_DEDENT));
    assert(r.text == "for i in range(2):\n    print(i)\n\n    print('done')");
}

static void test_continuation_lines_hang() {
    auto r = run_structural("result = sum([\n1,\n2,\n])\nprint(result)");
    assert(r.accepted);
    assert(r.text == "result = sum([\n    1,\n    2,\n    ])\nprint(result)");
}

static void test_docstring_kept_verbatim() {
    const std::string raw =
        "def greet(name):\n"
        "\"\"\"Say hello.\n"
        "\n"
        "    Indented detail stays as written.\n"
        "\"\"\"\n"
        "return \"Hello, \" + name";
    auto r = run_structural(raw);
    assert(r.accepted);
    assert(r.text ==
           "def greet(name):\n"
           "    \"\"\"Say hello.\n"
           "\n"
           "    Indented detail stays as written.\n"
           "\"\"\"\n"
           "    return \"Hello, \" + name");
}

static void test_duplicate_declaration_removed() {
    auto r = run_structural("import math\nimport math\nprint(math.sqrt(4))");
    assert(r.accepted);
    assert(r.text == "import math\nprint(math.sqrt(4))");
    assert(r.has_diagnostic(codes::DUPLICATE_DECLARATION));
}

static void test_nested_declaration_hoisted_to_top() {
    auto r = run_structural("def load():\nimport json\nreturn json.dumps({})\nprint(load())");
    assert(r.accepted);
    assert(r.text.rfind("import json\ndef load():\n    return json.dumps({})", 0) == 0);
}

static void test_synthesis_in_first_reference_order() {
    auto r = run_structural("x = np.array([1, 2])\ndf = pd.DataFrame({'x': x})\nprint(math.pi, df)");
    assert(r.accepted);
    assert(r.text ==
           "import numpy as np\n"
           "import pandas as pd\n"
           "import math\n"
           "x = np.array([1, 2])\n"
           "df = pd.DataFrame({'x': x})\n"
           "print(math.pi, df)");
}

static void test_local_binding_suppresses_synthesis() {
    auto r = run_structural("np = 3\nprint(np)");
    assert(r.text == "np = 3\nprint(np)");
    assert(!r.has_diagnostic(codes::DECLARATION_SYNTHESIZED));
}

static void test_attribute_assignment_is_not_a_binding() {
    auto plt = run_structural("plt.rcParams['figure.figsize'] = (8, 4)\nplt.plot([1, 2, 3])\nplt.show()");
    assert(plt.accepted);
    assert(plt.text ==
           "import matplotlib.pyplot as plt\n"
           "plt.rcParams['figure.figsize'] = (8, 4)\n"
           "plt.plot([1, 2, 3])\n"
           "plt.show()");

    auto pd = run_structural("pd.options.display.max_rows = 10\ndf = pd.DataFrame({'a': [1, 2]})\nprint(df)");
    assert(pd.accepted);
    assert(pd.text ==
           "import pandas as pd\n"
           "pd.options.display.max_rows = 10\n"
           "df = pd.DataFrame({'a': [1, 2]})\n"
           "print(df)");

    auto unknown = run_structural("config.debug = True\nprint(config.debug)");
    assert(unknown.has_diagnostic(codes::UNRESOLVED_IDENTIFIER));
}

static void test_future_import_stays_first() {
    auto r = run_structural("from __future__ import annotations\nx = math.floor(2.5)\nprint(x)");
    assert(r.accepted);
    assert(r.text == "from __future__ import annotations\nimport math\nx = math.floor(2.5)\nprint(x)");
}

static void test_unresolved_identifier_warning() {
    auto r = run_structural("result = compute_total(3)\nprint(result)");
    assert(r.accepted);
    assert(r.count(Severity::WARNING) == 1);
    auto it = std::find_if(r.diagnostics.begin(), r.diagnostics.end(),
                           [](const Diagnostic& d) { return d.code == codes::UNRESOLVED_IDENTIFIER; });
    assert(it != r.diagnostics.end());
    assert(it->symbol == "compute_total");
    assert(it->line_index == 0);

    auto star = run_structural("from math import *\nprint(sqrt(2))");
    assert(!star.has_diagnostic(codes::UNRESOLVED_IDENTIFIER));
}

static void test_declared_names() {
    auto a = ImportNormalizer::declared_names("import os.path as osp, sys");
    assert(a.size() == 2 && contains(a, "osp") && contains(a, "sys"));

    auto b = ImportNormalizer::declared_names("from m import (a as b,\n c)");
    assert(b.size() == 2 && contains(b, "b") && contains(b, "c"));

    auto star = ImportNormalizer::declared_names("from m import *");
    assert(star.size() == 1 && star[0] == "*");

    assert(ImportNormalizer::source_module("from a.b import c") == "a.b");
    assert(ImportNormalizer::source_module("import a.b").empty());
}

static void test_guard_reason_codes() {
    struct Case { const char* code; const char* reason; };
    const Case cases[] = {
        {"with open('notes.txt') as f:\nprint(f.read())", "FILE_HANDLE"},
        {"name = input('Name: ')", "INTERACTIVE_INPUT"},
        {"r = requests.get('https://example.org')", "NETWORK_ACCESS"},
        {"conn = sqlite3.connect('shop.db')", "DATABASE_ACCESS"},
        {"df.to_csv('out.csv')", "FILE_PATH_WRITE"},
    };
    for (const auto& c : cases) {
        auto r = run_structural(c.code);
        assert(!r.accepted);
        assert(r.text == c.code);
        assert(r.has_diagnostic(c.reason));
    }

    auto once = run_structural("df = pd.read_csv('sales.csv')");
    assert(once.count(Severity::REJECTED) == 1);

    auto comment = run_structural("# open('x.txt') is not allowed here\nprint(1)");
    assert(comment.accepted);

    auto generated = run_structural("iris = load_iris()\nprint(iris.data.shape)");
    assert(generated.accepted);
    assert(generated.text.rfind("from sklearn.datasets import load_iris\n", 0) == 0);
}

static void test_guard_direct() {
    auto classified = LineClassifier::classify("x = 1\nname = input()");
    auto g = ForbiddenOperationGuard::inspect(classified.lines, ForbiddenPatternSet::builtin());
    assert(!g.allowed);
    assert(g.violations.size() == 1);
    assert(g.violations[0].line_index == 1);
    assert(g.violations[0].severity == Severity::REJECTED);
}

static void test_guard_ignores_prose_in_strings() {
    auto prose = run_structural("print(\"Please open (the door)\")");
    assert(prose.accepted);
    assert(prose.text == "print(\"Please open (the door)\")");

    auto doc = run_structural("def ask():\n\"\"\"Call input() to read a name.\"\"\"\nreturn 'Ann'\nprint(ask())");
    assert(doc.accepted);

    // path patterns still see the literal
    auto path = run_structural("data = np.loadtxt('values.txt')");
    assert(!path.accepted);
    assert(path.has_diagnostic("FILE_PATH_READ"));

    assert(LineClassifier::mask_string_literals("f(\"a(b\", 'c') # x") == "f(\"   \", ' ') # x");
    assert(LineClassifier::mask_string_literals("s = '''open(x)'''") == "s = '''       '''");
}

static void test_unclosed_bracket_unrepairable() {
    const std::string raw = "values = [1, 2\nprint(values)";
    auto r = run_structural(raw);
    assert(!r.accepted);
    assert(r.text == raw);
    assert(r.has_diagnostic(codes::UNABLE_TO_REPAIR));
}

static void test_executability_checks() {
    auto silent = run_structural("x = 1 + 2");
    assert(silent.accepted);
    assert(silent.has_diagnostic(codes::NO_VISIBLE_OUTPUT));

    auto placeholder = run_structural("your_variable = 10\nprint(your_variable)");
    assert(placeholder.accepted);
    assert(placeholder.has_diagnostic(codes::PLACEHOLDER_IDENTIFIER));
}

static void test_comment_only_input() {
    auto empty = run_structural("");
    assert(empty.accepted);
    assert(empty.text.empty());

    auto comment = run_structural("   # just a comment");
    assert(comment.accepted);
    assert(comment.text == "# just a comment");
}

static void test_indent_width_from_config() {
    SanitizationPipeline pipeline(structural_rules(2));
    auto r = pipeline.sanitize("def f():\nif True:\nreturn 1");
    assert(r.text == "def f():\n  if True:\n    return 1");
}

static void test_idempotence() {
    const std::vector<std::string> inputs = {
        "def f():\nprint('hi')\nreturn 1",
        "from a import make_x\ndef g():\nfrom a import make_y\nx = make_x()\ny = make_y()",
        "x = np.array([1, 2])\ndf = pd.DataFrame({'x': x})\nprint(math.pi, df)",
        "def sign(x):\nif x > 0:\nreturn 1\nelif x < 0:\nreturn -1\nelse:\nreturn 0",
        "import math\nclass Circle:\ndef __init__(self, r):\nself.r = r\n\ndef area(self):\n"
        "return math.pi * self.r ** 2\n\nc = Circle(2)\nprint(c.area())",
        "result = sum([\n1,\n2,\n])\nprint(result)",
        "def greet(name):\n\"\"\"Say hello.\n\n    detail\n\"\"\"\nreturn name",
        "# intro\nx = 1\nimport os\n# tail\nprint(os.getcwd(), x)",
        "result = compute_total(3)\nprint(result)",
        "plt.rcParams['figure.figsize'] = (8, 4)\nplt.plot([1, 2, 3])\nplt.show()",
        "for i in range(3):\nif i % 2: print('odd')\nelse: print('even')",
    };
    for (const auto& input : inputs) {
        auto once = run_structural(input);
        assert(once.accepted);
        auto twice = run_structural(once.text);
        assert(twice.accepted);
        assert(twice.text == once.text);
        assert(non_info_codes(twice) == non_info_codes(once));
    }
}

static void test_rule_loading_errors() {
    auto throws = [](auto fn) {
        try {
            fn();
        } catch (const RuleLoadError&) {
            return true;
        }
        return false;
    };

    assert(throws([] { SymbolTable::from_json({{"symbols", {{"np", 5}}}}); }));
    assert(throws([] { SymbolTable::from_json({{"symbols", {{"bad name", "import x"}}}}); }));
    assert(throws([] { SymbolTable::from_json({{"symbols", {{"np", "numpy"}}}}); }));
    assert(throws([] { SymbolTable::from_json(nlohmann::json::array()); }));
    assert(throws([] {
        ForbiddenPatternSet::from_json({{"patterns", {{{"reason_code", "X"}, {"signature", "("}}}}});
    }));
    assert(throws([] {
        ForbiddenPatternSet::from_json({{"patterns", {{{"reason_code", "X"}, {"signature", "x"}, {"scope", "all"}}}}});
    }));
    assert(throws([] { SanitizerConfig::from_json({{"indent_width", 0}}); }));
    assert(throws([] { SanitizerConfig::from_json({{"indent_width", "four"}}); }));
    assert(throws([] { SymbolTable::load_file("/nonexistent/symbols.json"); }));

    auto table = SymbolTable::from_json({{"version", "t1"},
                                         {"symbols", {{"Classifier", "from lib.models import Classifier"}}}});
    assert(table.size() == 1);
    assert(table.version() == "t1");
    assert(table.find("Classifier") == std::optional<std::string>("from lib.models import Classifier"));
}

static void test_shipped_config_loads() {
    auto cfg = SanitizerConfig::load_file(kSourceDir + "/config/sanitizer.json");
    assert(cfg.indent_width == 4);
    assert(cfg.symbol_table_source.size() >= 17);
    assert(cfg.symbol_table_source.compare(cfg.symbol_table_source.size() - 17, 17, "symbol_table.json") == 0);

    auto rules = RuleSet::build(cfg);
    assert(rules->symbols.version() == "lesson-examples-1");
    assert(rules->symbols.find("np") == std::optional<std::string>("import numpy as np"));
    assert(rules->forbidden.size() == ForbiddenPatternSet::builtin().size());
}

static void test_builtin_rules_match_shipped_files() {
    auto symbols = SymbolTable::load_file(kSourceDir + "/config/symbol_table.json");
    assert(symbols.to_json()["symbols"] == SymbolTable::builtin().to_json()["symbols"]);

    auto shipped = ForbiddenPatternSet::load_file(kSourceDir + "/config/forbidden_patterns.json");
    auto builtin = ForbiddenPatternSet::builtin();
    assert(shipped.size() == builtin.size());
    for (size_t i = 0; i < shipped.size(); ++i) {
        const auto& a = shipped.patterns()[i];
        const auto& b = builtin.patterns()[i];
        assert(a.reason_code == b.reason_code);
        assert(a.signature == b.signature);
        assert(a.description == b.description);
        assert(a.scope == b.scope);
    }
}

static void test_registry_reload() {
    RuleRegistry registry;
    auto before = registry.snapshot();
    assert(registry.generation() == 0);

    SanitizerConfig broken;
    broken.symbol_table_source = "/nonexistent/table.json";
    assert(!registry.reload(broken));
    assert(registry.snapshot() == before);
    assert(registry.generation() == 0);

    SanitizerConfig narrow;
    narrow.indent_width = 2;
    narrow.syntax_probe = false;
    assert(registry.reload(narrow));
    assert(registry.generation() == 1);
    assert(registry.snapshot()->config.indent_width == 2);
    assert(before->config.indent_width == 4);
}

static void test_concurrent_requests_during_reload() {
    RuleRegistry registry;
    SanitizerConfig cfg;
    cfg.syntax_probe = false;
    assert(registry.reload(cfg));

    std::atomic<int> failures{0};
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&registry, &failures]() {
            for (int i = 0; i < 50; ++i) {
                SanitizationPipeline pipeline(registry.snapshot());
                auto r = pipeline.sanitize("def f():\nreturn np.zeros(3)\nprint(f())");
                if (!r.accepted || r.text.rfind("import numpy as np\n", 0) != 0) failures++;
            }
        });
    }
    for (int i = 0; i < 10; ++i) {
        if (!registry.reload(cfg)) failures++;
    }
    for (auto& w : workers) w.join();
    assert(failures.load() == 0);
    assert(registry.generation() == 11);
}

static void test_document_blocks() {
    const std::string doc =
        "Intro\n"
        "```python\n"
        "def f():\n"
        "return 1\n"
        "```\n"
        "Text\n"
        "<pre><code class=\"language-python\">if 1 &lt; 2:\n"
        "print(&quot;ok&quot;)</code></pre>\n"
        "```bash\n"
        "ls -la\n"
        "```\n";

    auto blocks = CodeBlockExtractor::extract(doc);
    assert(blocks.size() == 2);
    assert(blocks[0].format == BlockFormat::MARKDOWN_FENCE);
    assert(blocks[0].code == "def f():\nreturn 1");
    assert(blocks[1].format == BlockFormat::HTML_PRE);
    assert(blocks[1].code == "if 1 < 2:\nprint(\"ok\")");

    SanitizationPipeline pipeline(structural_rules());
    auto result = pipeline.sanitize_document(doc);
    assert(result.all_accepted);
    assert(result.blocks.size() == 2);
    assert(result.text ==
           "Intro\n"
           "```python\n"
           "def f():\n"
           "    return 1\n"
           "```\n"
           "Text\n"
           "<pre><code class=\"language-python\">if 1 &lt; 2:\n"
           "    print(\"ok\")</code></pre>\n"
           "```bash\n"
           "ls -la\n"
           "```\n");
}

static void test_html_entities() {
    assert(CodeBlockExtractor::html_unescape("&lt;b&gt; &amp;lt;") == "<b> &lt;");
    assert(CodeBlockExtractor::html_escape("a < b && c > d") == "a &lt; b &amp;&amp; c &gt; d");
}

static void test_scrubber() {
    assert(scrub_code_text("\xEF\xBB\xBFx = 1\r\nprint(x)\xE2\x80\x8B\r") == "x = 1\nprint(x)\n");
    assert(scrub_code_text("a\xC2\xA0= 1") == "a = 1");
    assert(scrub_code_text("print('\xD0\xBF\xD1\x80\xD0\xB8')\tok\x01") == "print('\xD0\xBF\xD1\x80\xD0\xB8')\tok ");
}

static void test_line_index_refers_to_raw_input() {
    auto is_unresolved = [](const Diagnostic& d) { return d.code == codes::UNRESOLVED_IDENTIFIER; };

    auto lone_cr = run_structural("a = 1\rb = compute(a)\nprint(b)");
    auto it = std::find_if(lone_cr.diagnostics.begin(), lone_cr.diagnostics.end(), is_unresolved);
    assert(it != lone_cr.diagnostics.end());
    assert(it->line_index == 0);

    auto crlf = run_structural("a = 1\r\nb = compute(a)\r\nprint(b)");
    it = std::find_if(crlf.diagnostics.begin(), crlf.diagnostics.end(), is_unresolved);
    assert(it != crlf.diagnostics.end());
    assert(it->line_index == 1);

    assert((scrubbed_line_origins("x\ry\r\nz") == std::vector<int>{0, 0, 1}));
}

static void test_syntax_probe() {
    assert(syntax::SyntaxProbe::mask_notebook_magics("  !pip install x\nprint(1)") == "  pass\nprint(1)");

    syntax::SyntaxProbe probe;
    assert(probe.check_python("def f():\n    return 1\n").ok);
    auto broken = probe.check_python("x = 1\nprint(1 +)\n");
    assert(!broken.ok);

    SanitizerConfig cfg;
    SanitizationPipeline pipeline(RuleSet::build(cfg));
    auto r = pipeline.sanitize("print(1 +)");
    assert(!r.accepted);
    assert(r.has_diagnostic(codes::UNABLE_TO_REPAIR));

    auto magic = pipeline.sanitize("%matplotlib inline\nimport math\nprint(math.pi)");
    assert(magic.accepted);
    assert(magic.text == "import math\n%matplotlib inline\nprint(math.pi)");
}

static void test_coverage_log() {
    auto& log = CoverageLog::instance();
    log.reset();

    log.record("unit", run_structural("result = compute_total(3)\nprint(result)"));
    log.record("unit", run_structural("data = load_table('data.csv')"));

    assert(log.unresolved_count("compute_total") == 1);
    auto j = log.to_json();
    assert(j["accepted"] == 1);
    assert(j["rejected"] == 1);
    assert(j["rejection_codes"]["FILE_PATH_READ"] == 1);
    assert(j["recent"].size() == 2);
    log.reset();
}

int main() {
    auto run = [](const char* name, void (*fn)()) {
        try {
            fn();
            std::cout << "PASS: " << name << "\n";
        } catch (const std::exception& e) {
            std::cerr << "FAIL: " << name << ": " << e.what() << "\n";
            throw;
        }
    };

    try {
        run("classifier_roles", test_classifier_roles);
        run("classifier_missing_colon_and_unclosed", test_classifier_missing_colon_and_unclosed);
        run("scenario_nested_body", test_scenario_nested_body);
        run("scenario_declarations_hoisted", test_scenario_declarations_hoisted);
        run("scenario_declaration_synthesized", test_scenario_declaration_synthesized);
        run("scenario_forbidden_file_read", test_scenario_forbidden_file_read);
        run("scenario_empty_block_unrepairable", test_scenario_empty_block_unrepairable);
        run("elif_else_align_with_if", test_elif_else_align_with_if);
        run("try_except_finally", test_try_except_finally);
        run("one_line_if_keeps_else_inside_loop", test_one_line_if_keeps_else_inside_loop);
        run("unmatched_continuation_stays_nested", test_unmatched_continuation_stays_nested);
        run("blank_line_before_def_closes_function", test_blank_line_before_def_closes_function);
        run("function_without_self_leaves_class", test_function_without_self_leaves_class);
        run("main_guard_returns_to_top_level", test_main_guard_returns_to_top_level);
        run("statement_after_blank_is_ambiguous", test_statement_after_blank_is_ambiguous);
        run("continuation_lines_hang", test_continuation_lines_hang);
        run("docstring_kept_verbatim", test_docstring_kept_verbatim);
        run("duplicate_declaration_removed", test_duplicate_declaration_removed);
        run("nested_declaration_hoisted_to_top", test_nested_declaration_hoisted_to_top);
        run("synthesis_in_first_reference_order", test_synthesis_in_first_reference_order);
        run("local_binding_suppresses_synthesis", test_local_binding_suppresses_synthesis);
        run("attribute_assignment_is_not_a_binding", test_attribute_assignment_is_not_a_binding);
        run("future_import_stays_first", test_future_import_stays_first);
        run("unresolved_identifier_warning", test_unresolved_identifier_warning);
        run("declared_names", test_declared_names);
        run("guard_reason_codes", test_guard_reason_codes);
        run("guard_direct", test_guard_direct);
        run("guard_ignores_prose_in_strings", test_guard_ignores_prose_in_strings);
        run("unclosed_bracket_unrepairable", test_unclosed_bracket_unrepairable);
        run("executability_checks", test_executability_checks);
        run("comment_only_input", test_comment_only_input);
        run("indent_width_from_config", test_indent_width_from_config);
        run("idempotence", test_idempotence);
        run("rule_loading_errors", test_rule_loading_errors);
        run("shipped_config_loads", test_shipped_config_loads);
        run("builtin_rules_match_shipped_files", test_builtin_rules_match_shipped_files);
        run("registry_reload", test_registry_reload);
        run("concurrent_requests_during_reload", test_concurrent_requests_during_reload);
        run("document_blocks", test_document_blocks);
        run("html_entities", test_html_entities);
        run("scrubber", test_scrubber);
        run("line_index_refers_to_raw_input", test_line_index_refers_to_raw_input);
        run("syntax_probe", test_syntax_probe);
        run("coverage_log", test_coverage_log);
        std::cout << "OK\n";
        return 0;
    } catch (...) {
        return 1;
    }
}
