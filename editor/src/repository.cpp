#include "folio/repository.hpp"
#include "folio/ids.hpp"
#include <algorithm>
#include <stdexcept>

namespace folio {

void sortByOrder(std::vector<Slide>& slides) {
    std::sort(slides.begin(), slides.end(), [](const Slide& a, const Slide& b) {
        if (a.order_index != b.order_index) return a.order_index < b.order_index;
        return a.id < b.id;
    });
}

std::vector<Slide> reorderSiblings(std::vector<Slide> siblings, const std::string& slide_id, int new_order) {
    sortByOrder(siblings);
    auto it = std::find_if(siblings.begin(), siblings.end(),
                           [&](const Slide& s) { return s.id == slide_id; });
    if (it == siblings.end()) {
        throw std::runtime_error("slide not found in document: " + slide_id);
    }
    Slide moved = std::move(*it);
    siblings.erase(it);
    const int pos = std::clamp(new_order, 0, static_cast<int>(siblings.size()));
    siblings.insert(siblings.begin() + pos, std::move(moved));
    for (size_t i = 0; i < siblings.size(); ++i) {
        siblings[i].order_index = static_cast<int>(i);
    }
    return siblings;
}

void InMemorySlideRepository::begin() {
    mutex_.lock();
    if (snapshot_.has_value()) {
        mutex_.unlock();
        throw std::logic_error("transaction already in progress");
    }
    snapshot_ = slides_;
}

void InMemorySlideRepository::commit() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!snapshot_.has_value()) {
        throw std::logic_error("commit without an open transaction");
    }
    snapshot_.reset();
    mutex_.unlock(); // taken in begin()
}

void InMemorySlideRepository::rollback() {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (!snapshot_.has_value()) {
        throw std::logic_error("rollback without an open transaction");
    }
    slides_ = std::move(*snapshot_);
    snapshot_.reset();
    mutex_.unlock(); // taken in begin()
}

std::optional<Slide> InMemorySlideRepository::getById(const std::string& id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = slides_.find(id);
    if (it == slides_.end()) return std::nullopt;
    return it->second;
}

Slide InMemorySlideRepository::create(Slide slide) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (slide.id.empty()) slide.id = makeId();
    if (slides_.count(slide.id) != 0) {
        throw std::runtime_error("slide already exists: " + slide.id);
    }
    slides_.emplace(slide.id, slide);
    return slide;
}

void InMemorySlideRepository::update(const Slide& slide) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    auto it = slides_.find(slide.id);
    if (it == slides_.end()) {
        throw std::runtime_error("slide not found: " + slide.id);
    }
    it->second = slide;
}

void InMemorySlideRepository::remove(const std::string& id) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    if (slides_.erase(id) == 0) {
        throw std::runtime_error("slide not found: " + id);
    }
}

void InMemorySlideRepository::reorder(const std::string& document_id, const std::string& slide_id, int new_order) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    for (auto& s : reorderSiblings(listByDocument(document_id), slide_id, new_order)) {
        slides_[s.id].order_index = s.order_index;
    }
}

std::vector<Slide> InMemorySlideRepository::listByDocument(const std::string& document_id) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    std::vector<Slide> out;
    for (const auto& kv : slides_) {
        if (kv.second.document_id == document_id) out.push_back(kv.second);
    }
    sortByOrder(out);
    return out;
}

std::size_t InMemorySlideRepository::size() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return slides_.size();
}

bool InMemorySlideRepository::inTransaction() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return snapshot_.has_value();
}

} // namespace folio
