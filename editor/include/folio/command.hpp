#pragma once

#include "folio/repository.hpp"
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace folio {

class CommandRegistry;

using Timestamp = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

// A reversible mutation of a document. Concrete commands capture whatever
// prior state they need to invert themselves during doAction().
class Command {
public:
    virtual ~Command() = default;

    // Discriminator used by CommandRegistry, e.g. "UpdateSlideCommand".
    virtual std::string type() const = 0;
    virtual std::string label() const = 0;

    // Runs doAction() and stamps executed_at on success.
    void execute(ISlideRepository& repo);
    // Precondition: the last successful call on this instance was execute().
    void undo(ISlideRepository& repo);

    // {type, id, executed_at, undone_at, ...payload}
    json toJson() const;

    const std::string& id() const { return id_; }
    const std::optional<Timestamp>& executedAt() const { return executed_at_; }
    const std::optional<Timestamp>& undoneAt() const { return undone_at_; }

protected:
    Command();

    virtual void doAction(ISlideRepository& repo) = 0;
    virtual void undoAction(ISlideRepository& repo) = 0;
    virtual void writePayload(json& out) const = 0;

    // Restores id and timestamps when rebuilding from toJson() output.
    void restoreBase(const json& j);

private:
    std::string id_;
    std::optional<Timestamp> executed_at_;
    std::optional<Timestamp> undone_at_;
};

json timestampToJson(const std::optional<Timestamp>& t);
std::optional<Timestamp> timestampFromJson(const json& j);

struct HistoryEntry {
    int index {0};
    std::string type;
    std::string id;
    bool is_current {false};
    bool can_undo {false};
    std::optional<Timestamp> executed_at;
    std::optional<Timestamp> undone_at;
};

// Bounded linear undo/redo history for one document.
//
// Commands [0, cursor] are applied, (cursor, size) are redoable. Every step
// runs inside a repository transaction; a failed step is rolled back and the
// cursor does not move.
class CommandHistory {
public:
    static constexpr int kDefaultMaxHistory = 50;

    explicit CommandHistory(int max_history = kDefaultMaxHistory);

    CommandHistory(CommandHistory&&) = default;
    CommandHistory& operator=(CommandHistory&&) = default;

    // Throws ExecutionError; on success drops the redo branch and evicts the
    // oldest entry when over capacity.
    void execute(std::unique_ptr<Command> cmd, ISlideRepository& repo);
    // nullptr when there is nothing to undo. Throws UndoError.
    Command* undo(ISlideRepository& repo);
    // nullptr when there is nothing to redo. Throws ExecutionError.
    Command* redo(ISlideRepository& repo);

    // Steps min(count, available) times. Not atomic: if a step throws, the
    // steps already taken in this call stay applied.
    std::vector<Command*> undoMany(int count, ISlideRepository& repo);
    std::vector<Command*> redoMany(int count, ISlideRepository& repo);

    // Forgets all entries without undoing them.
    void clear();

    bool canUndo() const { return cursor_ >= 0; }
    bool canRedo() const { return cursor_ < static_cast<int>(commands_.size()) - 1; }
    int currentIndex() const { return cursor_; }
    int maxHistory() const { return max_history_; }
    int size() const { return static_cast<int>(commands_.size()); }
    int undoCount() const { return cursor_ + 1; }
    int redoCount() const { return size() - cursor_ - 1; }

    const Command* commandAt(int index) const;
    const Command* currentCommand() const { return commandAt(cursor_); }
    std::vector<HistoryEntry> summary() const;

    // {max_history, current_index, commands: [...]}
    json toJson() const;
    // Entries whose tag the registry cannot rebuild are skipped.
    static CommandHistory fromJson(const json& j, const CommandRegistry& registry);

private:
    int max_history_;
    std::deque<std::unique_ptr<Command>> commands_;
    int cursor_ {-1};
};

} // namespace folio
