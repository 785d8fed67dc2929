#pragma once

#include "folio/command.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace folio {

// One CommandHistory per document id, created on first access.
//
// Entries are never evicted: the map grows with every document ever touched
// for the lifetime of the process.
class DocumentHistories {
public:
    // Exclusive access to one document's history. Holds that document's lock
    // until destroyed; other documents are unaffected.
    class Session {
    public:
        Session(Session&&) = default;
        Session& operator=(Session&&) = default;

        CommandHistory& history() const { return *history_; }
        CommandHistory* operator->() const { return history_; }
        CommandHistory& operator*() const { return *history_; }
        const std::string& documentId() const { return document_id_; }

    private:
        friend class DocumentHistories;
        Session(std::string document_id, std::unique_lock<std::mutex> lock, CommandHistory& history)
            : document_id_(std::move(document_id)), lock_(std::move(lock)), history_(&history) {}

        std::string document_id_;
        std::unique_lock<std::mutex> lock_;
        CommandHistory* history_;
    };

    explicit DocumentHistories(int max_history = CommandHistory::kDefaultMaxHistory);

    // Blocks while another session holds the same document.
    Session acquire(const std::string& document_id);

    bool contains(const std::string& document_id) const;
    std::size_t size() const;
    int maxHistory() const { return max_history_; }

    // Drops one document's bookkeeping (not its slides). Must not be called
    // while the caller holds a session for the same document.
    void clear(const std::string& document_id);
    // Replaces a document's history, e.g. with one restored from storage.
    void adopt(const std::string& document_id, CommandHistory history);

private:
    struct Entry {
        explicit Entry(int max_history) : history(max_history) {}
        std::mutex mutex;
        CommandHistory history;
    };

    Entry& entryFor(const std::string& document_id);

    int max_history_;
    mutable std::mutex mutex_; // guards entries_ only
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

} // namespace folio
