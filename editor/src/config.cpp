#include "folio/config.hpp"
#include <cstdlib>
#include <stdexcept>

namespace folio {

static int parseCount(const std::string& name, const std::string& text) {
    size_t used = 0;
    int value = 0;
    try {
        value = std::stoi(text, &used);
    } catch (const std::exception&) {
        throw std::invalid_argument("invalid " + name + ": " + text);
    }
    if (used != text.size()) throw std::invalid_argument("invalid " + name + ": " + text);
    return value;
}

static std::optional<std::string> getEnv(const char* name) {
    const char* v = std::getenv(name);
    if (!v || !*v) return std::nullopt;
    return std::string(v);
}

std::optional<std::string> getArg(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc - 1; ++i) {
        if (flag == argv[i]) return std::string(argv[i + 1]);
    }
    return std::nullopt;
}

bool hasFlag(int argc, char** argv, const std::string& flag) {
    for (int i = 1; i < argc; ++i) {
        if (flag == argv[i]) return true;
    }
    return false;
}

EditorConfig EditorConfig::fromArgs(int argc, char** argv) {
    EditorConfig cfg;
    if (auto db = getArg(argc, argv, "--db")) {
        cfg.db_path = *db;
    } else if (auto env = getEnv("FOLIO_DB")) {
        cfg.db_path = *env;
    }

    if (auto n = getArg(argc, argv, "--max-history")) {
        cfg.max_history = parseCount("--max-history", *n);
    } else if (auto env = getEnv("FOLIO_MAX_HISTORY")) {
        cfg.max_history = parseCount("FOLIO_MAX_HISTORY", *env);
    }
    if (cfg.max_history < 1) {
        throw std::invalid_argument("max history must be at least 1");
    }

    if (auto doc = getArg(argc, argv, "--doc")) cfg.document_id = *doc;
    cfg.restore = hasFlag(argc, argv, "--restore");
    return cfg;
}

} // namespace folio
