#include "folio/document_histories.hpp"
#include <algorithm>

namespace folio {

DocumentHistories::DocumentHistories(int max_history) : max_history_(std::max(1, max_history)) {}

DocumentHistories::Entry& DocumentHistories::entryFor(const std::string& document_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = entries_[document_id];
    if (!slot) slot = std::make_unique<Entry>(max_history_);
    return *slot;
}

DocumentHistories::Session DocumentHistories::acquire(const std::string& document_id) {
    // Entries are never erased, so the reference outlives the map lock.
    Entry& entry = entryFor(document_id);
    std::unique_lock<std::mutex> lock(entry.mutex);
    return Session(document_id, std::move(lock), entry.history);
}

bool DocumentHistories::contains(const std::string& document_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.count(document_id) != 0;
}

std::size_t DocumentHistories::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void DocumentHistories::clear(const std::string& document_id) {
    if (!contains(document_id)) return;
    auto session = acquire(document_id);
    session->clear();
}

void DocumentHistories::adopt(const std::string& document_id, CommandHistory history) {
    auto session = acquire(document_id);
    *session = std::move(history);
}

} // namespace folio
