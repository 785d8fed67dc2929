#pragma once

#include "folio/command.hpp"
#include <optional>
#include <string>

namespace folio {

struct EditorConfig {
    std::string db_path;                 // empty: in-memory repository
    int max_history {CommandHistory::kDefaultMaxHistory};
    bool restore {false};                // reload stored histories on start
    std::string document_id {"demo-deck"};

    // Flags: --db <path>, --max-history <n>, --doc <id>, --restore.
    // Environment fallbacks: FOLIO_DB, FOLIO_MAX_HISTORY.
    // Throws std::invalid_argument on a malformed number.
    static EditorConfig fromArgs(int argc, char** argv);
};

std::optional<std::string> getArg(int argc, char** argv, const std::string& flag);
bool hasFlag(int argc, char** argv, const std::string& flag);

} // namespace folio
