#include "folio/command.hpp"
#include "folio/command_registry.hpp"
#include "folio/errors.hpp"
#include "folio/ids.hpp"
#include <algorithm>
#include <iostream>
#include <stdexcept>

namespace folio {

static Timestamp now() {
    return std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
}

template <typename Fn>
static void inTransaction(ISlideRepository& repo, Fn&& fn) {
    repo.begin();
    try {
        fn();
        repo.commit();
    } catch (...) {
        repo.rollback();
        throw;
    }
}

json timestampToJson(const std::optional<Timestamp>& t) {
    if (!t) return nullptr;
    return static_cast<int64_t>(t->time_since_epoch().count());
}

std::optional<Timestamp> timestampFromJson(const json& j) {
    if (j.is_null()) return std::nullopt;
    return Timestamp(std::chrono::milliseconds(j.get<int64_t>()));
}

Command::Command() : id_(makeId()) {}

void Command::execute(ISlideRepository& repo) {
    doAction(repo);
    executed_at_ = now();
}

void Command::undo(ISlideRepository& repo) {
    undoAction(repo);
    undone_at_ = now();
}

json Command::toJson() const {
    json j;
    j["type"] = type();
    j["id"] = id_;
    j["executed_at"] = timestampToJson(executed_at_);
    j["undone_at"] = timestampToJson(undone_at_);
    writePayload(j);
    return j;
}

void Command::restoreBase(const json& j) {
    id_ = j.at("id").get<std::string>();
    if (auto it = j.find("executed_at"); it != j.end()) executed_at_ = timestampFromJson(*it);
    if (auto it = j.find("undone_at"); it != j.end()) undone_at_ = timestampFromJson(*it);
}

CommandHistory::CommandHistory(int max_history) : max_history_(std::max(1, max_history)) {}

void CommandHistory::execute(std::unique_ptr<Command> cmd, ISlideRepository& repo) {
    if (!cmd) throw std::invalid_argument("CommandHistory::execute: null command");
    try {
        inTransaction(repo, [&] { cmd->execute(repo); });
    } catch (const std::exception& e) {
        throw ExecutionError(std::string("Command execution failed: ") + e.what(), cmd->id(), cmd->type());
    }

    // New work invalidates the redo branch.
    while (static_cast<int>(commands_.size()) > cursor_ + 1) {
        commands_.pop_back();
    }
    commands_.push_back(std::move(cmd));
    while (static_cast<int>(commands_.size()) > max_history_) {
        commands_.pop_front();
    }
    cursor_ = static_cast<int>(commands_.size()) - 1;
}

Command* CommandHistory::undo(ISlideRepository& repo) {
    if (!canUndo()) return nullptr;
    Command* cmd = commands_[cursor_].get();
    try {
        inTransaction(repo, [&] { cmd->undo(repo); });
    } catch (const std::exception& e) {
        throw UndoError(std::string("Command undo failed: ") + e.what(), cmd->id(), cmd->type());
    }
    --cursor_;
    return cmd;
}

Command* CommandHistory::redo(ISlideRepository& repo) {
    if (!canRedo()) return nullptr;
    Command* cmd = commands_[cursor_ + 1].get();
    try {
        inTransaction(repo, [&] { cmd->execute(repo); });
    } catch (const std::exception& e) {
        throw ExecutionError(std::string("Command redo failed: ") + e.what(), cmd->id(), cmd->type());
    }
    ++cursor_;
    return cmd;
}

std::vector<Command*> CommandHistory::undoMany(int count, ISlideRepository& repo) {
    std::vector<Command*> out;
    const int steps = std::min(count, undoCount());
    for (int i = 0; i < steps; ++i) {
        out.push_back(undo(repo));
    }
    return out;
}

std::vector<Command*> CommandHistory::redoMany(int count, ISlideRepository& repo) {
    std::vector<Command*> out;
    const int steps = std::min(count, redoCount());
    for (int i = 0; i < steps; ++i) {
        out.push_back(redo(repo));
    }
    return out;
}

void CommandHistory::clear() {
    commands_.clear();
    cursor_ = -1;
}

const Command* CommandHistory::commandAt(int index) const {
    if (index < 0 || index >= size()) return nullptr;
    return commands_[index].get();
}

std::vector<HistoryEntry> CommandHistory::summary() const {
    std::vector<HistoryEntry> out;
    out.reserve(commands_.size());
    for (int i = 0; i < size(); ++i) {
        const Command& c = *commands_[i];
        HistoryEntry e;
        e.index = i;
        e.type = c.type();
        e.id = c.id();
        e.is_current = i == cursor_;
        e.can_undo = i <= cursor_;
        e.executed_at = c.executedAt();
        e.undone_at = c.undoneAt();
        out.push_back(std::move(e));
    }
    return out;
}

json CommandHistory::toJson() const {
    json j;
    j["max_history"] = max_history_;
    j["current_index"] = cursor_;
    j["commands"] = json::array();
    for (const auto& c : commands_) {
        j["commands"].push_back(c->toJson());
    }
    return j;
}

CommandHistory CommandHistory::fromJson(const json& j, const CommandRegistry& registry) {
    if (!j.is_object()) {
        throw std::invalid_argument("command history must be a JSON object");
    }
    int max_history = kDefaultMaxHistory;
    int cursor = -1;
    try {
        max_history = j.value("max_history", kDefaultMaxHistory);
        cursor = j.value("current_index", -1);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("malformed command history: ") + e.what());
    }

    CommandHistory history(max_history);
    auto it = j.find("commands");
    if (it != j.end() && it->is_array()) {
        int index = 0;
        int skipped_applied = 0;
        for (const auto& entry : *it) {
            try {
                history.commands_.push_back(registry.create(entry));
            } catch (const RegistryError& e) {
                std::cerr << "history: skipping command: " << e.what() << "\n";
                // The cursor counts entries; one that was applied is gone.
                if (index <= cursor) ++skipped_applied;
            }
            ++index;
        }
        cursor -= skipped_applied;
    }
    while (history.size() > history.max_history_) {
        history.commands_.pop_front();
        --cursor;
    }
    history.cursor_ = std::clamp(cursor, -1, history.size() - 1);
    return history;
}

} // namespace folio
