#pragma once

#include "folio/slide.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace folio {

// Entity storage the slide commands run against. Implementations serialize
// callers: the thread that calls begin() holds the repository until commit()
// or rollback().
class ISlideRepository {
public:
    virtual ~ISlideRepository() = default;
    virtual void begin() = 0;
    virtual void commit() = 0;
    virtual void rollback() = 0;

    virtual std::optional<Slide> getById(const std::string& id) const = 0;
    // Assigns a fresh id when slide.id is empty; throws if the id is taken.
    virtual Slide create(Slide slide) = 0;
    // Throws std::runtime_error when the slide does not exist.
    virtual void update(const Slide& slide) = 0;
    virtual void remove(const std::string& id) = 0;
    // Moves slide_id to new_order (clamped) and renumbers its siblings 0..n-1.
    virtual void reorder(const std::string& document_id, const std::string& slide_id, int new_order) = 0;
    // Sorted by (order_index, id).
    virtual std::vector<Slide> listByDocument(const std::string& document_id) const = 0;
};

// Persisted form of a document's command history (serialized JSON text).
class IHistoryStore {
public:
    virtual ~IHistoryStore() = default;
    virtual void saveHistory(const std::string& document_id, const std::string& history_json) = 0;
    virtual std::optional<std::string> loadHistory(const std::string& document_id) const = 0;
    virtual std::vector<std::string> documentIds() const = 0;
};

// Computes the reorder() result for one document: `siblings` are all slides of
// the document, the returned list carries the renumbered order indices.
std::vector<Slide> reorderSiblings(std::vector<Slide> siblings, const std::string& slide_id, int new_order);

void sortByOrder(std::vector<Slide>& slides);

class InMemorySlideRepository : public ISlideRepository {
public:
    void begin() override;
    void commit() override;
    void rollback() override;

    std::optional<Slide> getById(const std::string& id) const override;
    Slide create(Slide slide) override;
    void update(const Slide& slide) override;
    void remove(const std::string& id) override;
    void reorder(const std::string& document_id, const std::string& slide_id, int new_order) override;
    std::vector<Slide> listByDocument(const std::string& document_id) const override;

    std::size_t size() const;
    bool inTransaction() const;

private:
    mutable std::recursive_mutex mutex_;
    std::map<std::string, Slide> slides_;
    std::optional<std::map<std::string, Slide>> snapshot_; // set while a transaction is open
};

} // namespace folio
