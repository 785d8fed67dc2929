#pragma once

#include "folio/repository.hpp"
#include <sqlite3.h>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// SQLite-backed slide repository and history store. Creates its schema on
// open. All SQLite failures throw std::runtime_error.
class SqliteStorage : public ISlideRepository, public IHistoryStore {
public:
    explicit SqliteStorage(const std::string& db_path);
    ~SqliteStorage() override;

    SqliteStorage(const SqliteStorage&) = delete;
    SqliteStorage& operator=(const SqliteStorage&) = delete;

    void begin() override;
    void commit() override;
    void rollback() override;

    std::optional<Slide> getById(const std::string& id) const override;
    Slide create(Slide slide) override;
    void update(const Slide& slide) override;
    void remove(const std::string& id) override;
    void reorder(const std::string& document_id, const std::string& slide_id, int new_order) override;
    std::vector<Slide> listByDocument(const std::string& document_id) const override;

    void saveHistory(const std::string& document_id, const std::string& history_json) override;
    std::optional<std::string> loadHistory(const std::string& document_id) const override;
    std::vector<std::string> documentIds() const override;

    // Utilities
    const std::string& dbPath() const { return db_path_; }

private:
    void setOrderIndex(const std::string& id, int order_index);

    std::string db_path_;
    sqlite3* db_ {nullptr};
    mutable std::recursive_mutex mutex_;
    bool in_tx_ {false};
};

} // namespace folio
