#include "rules/SymbolTable.hpp"
#include "rules/RuleLoadError.hpp"
#include <fstream>
#include <cctype>
#include <spdlog/spdlog.h>

namespace code_sanitizer {

namespace {

bool is_identifier(const std::string& s) {
    if (s.empty()) return false;
    unsigned char first = static_cast<unsigned char>(s[0]);
    if (!(std::isalpha(first) || first == '_' || first >= 0x80)) return false;
    for (unsigned char c : s) {
        if (!(std::isalnum(c) || c == '_' || c >= 0x80)) return false;
    }
    return true;
}

bool looks_like_declaration(const std::string& s) {
    return s.rfind("import ", 0) == 0 || (s.rfind("from ", 0) == 0 && s.find(" import ") != std::string::npos);
}

}

void SymbolTable::register_symbol(const std::string& identifier, const std::string& declaring_statement) {
    entries_[identifier] = declaring_statement;
}

std::optional<std::string> SymbolTable::find(const std::string& identifier) const {
    auto it = entries_.find(identifier);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

nlohmann::json SymbolTable::to_json() const {
    nlohmann::json symbols = nlohmann::json::object();
    for (const auto& [id, decl] : entries_) symbols[id] = decl;
    return {{"version", version_}, {"symbols", symbols}};
}

SymbolTable SymbolTable::from_json(const nlohmann::json& j, const std::string& source) {
    if (!j.is_object() || !j.contains("symbols") || !j["symbols"].is_object()) {
        throw RuleLoadError("expected an object with a 'symbols' map", source);
    }

    SymbolTable table(j.value("version", std::string("unversioned")));
    for (const auto& [identifier, decl] : j["symbols"].items()) {
        if (!decl.is_string()) {
            throw RuleLoadError("declaration for '" + identifier + "' is not a string", source);
        }
        const std::string statement = decl.get<std::string>();
        if (!is_identifier(identifier)) {
            throw RuleLoadError("'" + identifier + "' is not a bare identifier", source);
        }
        if (!looks_like_declaration(statement)) {
            throw RuleLoadError("'" + statement + "' is not an import statement", source);
        }
        table.register_symbol(identifier, statement);
    }
    return table;
}

SymbolTable SymbolTable::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw RuleLoadError("cannot open symbol table", path);

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw RuleLoadError(std::string("invalid JSON: ") + e.what(), path);
    }

    SymbolTable table = from_json(j, path);
    spdlog::info("📚 Symbol table '{}' loaded from {} ({} identifiers)", table.version(), path, table.size());
    return table;
}

SymbolTable SymbolTable::builtin() {
    SymbolTable t("builtin-1");

    // Standard library
    t.register_symbol("math", "import math");
    t.register_symbol("random", "import random");
    t.register_symbol("datetime", "import datetime");
    t.register_symbol("time", "import time");
    t.register_symbol("json", "import json");
    t.register_symbol("re", "import re");
    t.register_symbol("statistics", "import statistics");
    t.register_symbol("itertools", "import itertools");
    t.register_symbol("functools", "import functools");
    t.register_symbol("string", "import string");
    t.register_symbol("Counter", "from collections import Counter");
    t.register_symbol("defaultdict", "from collections import defaultdict");
    t.register_symbol("namedtuple", "from collections import namedtuple");
    t.register_symbol("deque", "from collections import deque");
    t.register_symbol("dataclass", "from dataclasses import dataclass");

    // Scientific stack
    t.register_symbol("np", "import numpy as np");
    t.register_symbol("pd", "import pandas as pd");
    t.register_symbol("plt", "import matplotlib.pyplot as plt");
    t.register_symbol("sns", "import seaborn as sns");

    // scikit-learn, by submodule
    for (const char* name : {"load_iris", "load_digits", "load_wine", "load_breast_cancer",
                             "make_classification", "make_regression", "make_blobs", "make_moons"}) {
        t.register_symbol(name, std::string("from sklearn.datasets import ") + name);
    }
    for (const char* name : {"train_test_split", "cross_val_score", "GridSearchCV", "KFold"}) {
        t.register_symbol(name, std::string("from sklearn.model_selection import ") + name);
    }
    for (const char* name : {"RandomForestClassifier", "RandomForestRegressor", "GradientBoostingClassifier"}) {
        t.register_symbol(name, std::string("from sklearn.ensemble import ") + name);
    }
    for (const char* name : {"LinearRegression", "LogisticRegression", "Ridge", "Lasso"}) {
        t.register_symbol(name, std::string("from sklearn.linear_model import ") + name);
    }
    for (const char* name : {"accuracy_score", "mean_squared_error", "mean_absolute_error", "r2_score",
                             "confusion_matrix", "classification_report", "precision_score",
                             "recall_score", "f1_score"}) {
        t.register_symbol(name, std::string("from sklearn.metrics import ") + name);
    }
    for (const char* name : {"KMeans", "DBSCAN"}) {
        t.register_symbol(name, std::string("from sklearn.cluster import ") + name);
    }
    for (const char* name : {"StandardScaler", "MinMaxScaler", "LabelEncoder", "OneHotEncoder"}) {
        t.register_symbol(name, std::string("from sklearn.preprocessing import ") + name);
    }
    for (const char* name : {"DecisionTreeClassifier", "DecisionTreeRegressor"}) {
        t.register_symbol(name, std::string("from sklearn.tree import ") + name);
    }
    t.register_symbol("KNeighborsClassifier", "from sklearn.neighbors import KNeighborsClassifier");
    t.register_symbol("SVC", "from sklearn.svm import SVC");
    t.register_symbol("PCA", "from sklearn.decomposition import PCA");

    return t;
}

}
