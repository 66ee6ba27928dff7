#include "rules/ForbiddenPattern.hpp"
#include "rules/RuleLoadError.hpp"
#include <fstream>
#include <spdlog/spdlog.h>

namespace code_sanitizer {

ForbiddenPattern ForbiddenPattern::compile(const std::string& reason_code,
                                           const std::string& signature,
                                           const std::string& description,
                                           MatchScope scope) {
    if (reason_code.empty()) throw RuleLoadError("pattern without reason_code: " + signature);
    ForbiddenPattern p;
    p.reason_code = reason_code;
    p.signature = signature;
    p.description = description;
    p.scope = scope;
    try {
        p.matcher = std::regex(signature, std::regex_constants::icase | std::regex_constants::ECMAScript);
    } catch (const std::regex_error& e) {
        throw RuleLoadError("invalid signature for " + reason_code + ": " + std::string(e.what()));
    }
    return p;
}

bool ForbiddenPattern::matches(const std::string& code, std::string* matched) const {
    std::smatch m;
    if (!std::regex_search(code, m, matcher)) return false;
    if (matched) *matched = m.str();
    return true;
}

ForbiddenPatternSet ForbiddenPatternSet::from_json(const nlohmann::json& j, const std::string& source) {
    if (!j.is_object() || !j.contains("patterns") || !j["patterns"].is_array()) {
        throw RuleLoadError("expected an object with a 'patterns' array", source);
    }

    ForbiddenPatternSet set;
    set.version_ = j.value("version", std::string("unversioned"));
    for (const auto& item : j["patterns"]) {
        if (!item.is_object()) throw RuleLoadError("pattern entry is not an object", source);
        const std::string reason = item.value("reason_code", "");
        const std::string signature = item.value("signature", "");
        if (signature.empty()) throw RuleLoadError("pattern '" + reason + "' has no signature", source);

        const std::string scope = item.value("scope", "code");
        if (scope != "code" && scope != "literals") {
            throw RuleLoadError("pattern '" + reason + "' has unknown scope '" + scope + "'", source);
        }
        set.add(ForbiddenPattern::compile(reason, signature, item.value("description", ""),
                                          scope == "literals" ? MatchScope::LITERALS : MatchScope::CODE));
    }
    return set;
}

ForbiddenPatternSet ForbiddenPatternSet::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw RuleLoadError("cannot open forbidden pattern set", path);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw RuleLoadError(std::string("invalid JSON: ") + e.what(), path);
    }

    ForbiddenPatternSet set = from_json(j, path);
    spdlog::info("🛡️ Forbidden pattern set '{}' loaded from {} ({} patterns)", set.version(), path, set.size());
    return set;
}

ForbiddenPatternSet ForbiddenPatternSet::builtin() {
    ForbiddenPatternSet set;
    set.version_ = "builtin-1";

    // File reads
    set.add(ForbiddenPattern::compile("FILE_PATH_READ",
        R"re(\b(?:pd|pandas)\.read_(?:csv|excel|json|parquet|table|fwf|hdf|feather|pickle|xml|html|orc|sas|spss|stata)\s*\(\s*[rbuf]{0,2}['"])re",
        "pandas reader called with a path literal", MatchScope::LITERALS));
    set.add(ForbiddenPattern::compile("FILE_PATH_READ",
        R"re(\b\w*(?:load|read|open)\w*\s*\(\s*[rbuf]{0,2}['"][^'"]*\.(?:csv|tsv|txt|json|xlsx?|parquet|pkl|pickle|h5|hdf5|npy|npz|db|sqlite3?|xml|ya?ml|jpe?g|png|gif|bmp|wav|mp3|zip|gz)['"])re",
        "load/read call with a file path literal", MatchScope::LITERALS));

    // File writes
    set.add(ForbiddenPattern::compile("FILE_PATH_WRITE",
        R"re(\.(?:to_csv|to_excel|to_json|to_parquet|to_pickle|to_hdf|savefig|savetxt|save|dump)\s*\(\s*[rbuf]{0,2}['"])re",
        "save/dump call with a file path literal", MatchScope::LITERALS));
    set.add(ForbiddenPattern::compile("FILE_PATH_WRITE",
        R"re(\b(?:joblib|pickle|torch|np|numpy)\.(?:dump|save|savez)\s*\()re",
        "object serialized to a file"));

    // File handles
    set.add(ForbiddenPattern::compile("FILE_HANDLE",
        R"re((?:^|[^\w.])open\s*\()re",
        "direct file handle acquisition"));
    set.add(ForbiddenPattern::compile("FILE_HANDLE",
        R"re(\b(?:io|os|codecs)\.open\s*\()re",
        "direct file handle acquisition"));
    set.add(ForbiddenPattern::compile("FILE_HANDLE",
        R"re(\bPath\s*\([^)]*\)\s*\.(?:open|read_text|read_bytes|write_text|write_bytes)\s*\()re",
        "pathlib file access"));

    // Network
    set.add(ForbiddenPattern::compile("NETWORK_ACCESS",
        R"re(\b(?:requests|httpx)\.(?:get|post|put|delete|patch|head|request|Session)\s*\()re",
        "HTTP client call"));
    set.add(ForbiddenPattern::compile("NETWORK_ACCESS",
        R"re(\burlopen\s*\(|\burllib\.request\.|\bwget\.download\s*\(|\byf\.download\s*\()re",
        "URL download"));
    set.add(ForbiddenPattern::compile("NETWORK_ACCESS",
        R"re(\bsocket\.(?:socket|create_connection)\s*\(|\bHTTPS?Connection\s*\()re",
        "raw socket / HTTP connection"));

    // Databases
    set.add(ForbiddenPattern::compile("DATABASE_ACCESS",
        R"re(\b(?:sqlite3|psycopg2|pymysql|MySQLdb|pyodbc|cx_Oracle|oracledb|mysql\.connector)\.connect\s*\()re",
        "database driver connection"));
    set.add(ForbiddenPattern::compile("DATABASE_ACCESS",
        R"re(\bcreate_engine\s*\(|\b(?:pd|pandas)\.read_sql(?:_query|_table)?\s*\(|\bMongoClient\s*\(|\bredis\.(?:Redis|StrictRedis)\s*\()re",
        "query source connection"));

    // Interactive stdin does not exist when the example runs unattended
    set.add(ForbiddenPattern::compile("INTERACTIVE_INPUT",
        R"re((?:^|[^\w.])input\s*\()re",
        "reads from interactive input"));

    return set;
}

}
