#pragma once

#include "folio/command_registry.hpp"
#include "folio/document_histories.hpp"
#include "folio/repository.hpp"
#include <optional>
#include <string>

namespace folio {

struct UndoRedoResult {
    bool success {false};
    std::string description;
    std::optional<Slide> state; // the requested slide after the step, if it exists
    bool can_undo {false};
    bool can_redo {false};
};

struct UndoRedoStatus {
    bool can_undo {false};
    bool can_redo {false};
    int undo_count {0};
    int redo_count {0};
};

// Editing entry points for one repository: every mutation goes through the
// owning document's CommandHistory so it can be undone.
class SlideEditor {
public:
    // store may be null; when set, each successful step saves the document's
    // serialized history.
    SlideEditor(ISlideRepository& repo, DocumentHistories& histories, IHistoryStore* store = nullptr);

    Slide createSlide(const std::string& document_id, FieldMap fields, std::optional<int> order_index = std::nullopt);
    // update/delete/move throw std::runtime_error when the slide is missing or
    // belongs to another document.
    Slide updateSlide(const std::string& document_id, const std::string& slide_id, FieldMap updates);
    void deleteSlide(const std::string& document_id, const std::string& slide_id);
    Slide moveSlide(const std::string& document_id, const std::string& slide_id, int new_order);

    // success=false ("Nothing to undo"/"Nothing to redo") when the history
    // has no step in that direction. Step failures throw.
    UndoRedoResult undo(const std::string& document_id, const std::string& slide_id);
    UndoRedoResult redo(const std::string& document_id, const std::string& slide_id);

    UndoRedoStatus status(const std::string& document_id);
    void clearHistory(const std::string& document_id);

    json exportHistory(const std::string& document_id);
    void importHistory(const std::string& document_id, const json& data, const CommandRegistry& registry);
    // Loads the stored history; false when no store is attached or nothing is stored.
    bool restoreHistory(const std::string& document_id, const CommandRegistry& registry);

private:
    Slide requireSlide(const std::string& slide_id) const;
    // Throws unless slide_id exists and belongs to document_id.
    void requireSlideIn(const std::string& document_id, const std::string& slide_id) const;
    void persist(const std::string& document_id, const CommandHistory& history);

    ISlideRepository& repo_;
    DocumentHistories& histories_;
    IHistoryStore* store_;
};

} // namespace folio
