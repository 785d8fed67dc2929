#include "folio/slide_editor.hpp"
#include "commands/create_slide.hpp"
#include "commands/delete_slide.hpp"
#include "commands/move_slide.hpp"
#include "commands/update_slide.hpp"
#include <stdexcept>

namespace folio {

SlideEditor::SlideEditor(ISlideRepository& repo, DocumentHistories& histories, IHistoryStore* store)
    : repo_(repo), histories_(histories), store_(store) {}

Slide SlideEditor::requireSlide(const std::string& slide_id) const {
    auto slide = repo_.getById(slide_id);
    if (!slide) throw std::runtime_error("slide not found: " + slide_id);
    return *slide;
}

void SlideEditor::requireSlideIn(const std::string& document_id, const std::string& slide_id) const {
    auto slide = repo_.getById(slide_id);
    if (!slide || slide->document_id != document_id) throw std::runtime_error("slide not found: " + slide_id);
}

void SlideEditor::persist(const std::string& document_id, const CommandHistory& history) {
    if (store_) store_->saveHistory(document_id, history.toJson().dump());
}

Slide SlideEditor::createSlide(const std::string& document_id, FieldMap fields, std::optional<int> order_index) {
    auto cmd = std::make_unique<CreateSlideCommand>(document_id, std::move(fields), order_index);
    auto* created = cmd.get();
    auto session = histories_.acquire(document_id);
    session->execute(std::move(cmd), repo_);
    persist(document_id, *session);
    return requireSlide(created->createdSlideId());
}

Slide SlideEditor::updateSlide(const std::string& document_id, const std::string& slide_id, FieldMap updates) {
    auto session = histories_.acquire(document_id);
    requireSlideIn(document_id, slide_id);
    session->execute(std::make_unique<UpdateSlideCommand>(slide_id, std::move(updates)), repo_);
    persist(document_id, *session);
    return requireSlide(slide_id);
}

void SlideEditor::deleteSlide(const std::string& document_id, const std::string& slide_id) {
    auto session = histories_.acquire(document_id);
    requireSlideIn(document_id, slide_id);
    session->execute(std::make_unique<DeleteSlideCommand>(slide_id), repo_);
    persist(document_id, *session);
}

Slide SlideEditor::moveSlide(const std::string& document_id, const std::string& slide_id, int new_order) {
    auto session = histories_.acquire(document_id);
    requireSlideIn(document_id, slide_id);
    session->execute(std::make_unique<MoveSlideCommand>(slide_id, new_order), repo_);
    persist(document_id, *session);
    return requireSlide(slide_id);
}

UndoRedoResult SlideEditor::undo(const std::string& document_id, const std::string& slide_id) {
    auto session = histories_.acquire(document_id);
    UndoRedoResult r;
    if (Command* cmd = session->undo(repo_)) {
        r.success = true;
        r.description = "Undid " + cmd->label();
        persist(document_id, *session);
    } else {
        r.description = "Nothing to undo";
    }
    r.state = repo_.getById(slide_id);
    r.can_undo = session->canUndo();
    r.can_redo = session->canRedo();
    return r;
}

UndoRedoResult SlideEditor::redo(const std::string& document_id, const std::string& slide_id) {
    auto session = histories_.acquire(document_id);
    UndoRedoResult r;
    if (Command* cmd = session->redo(repo_)) {
        r.success = true;
        r.description = "Redid " + cmd->label();
        persist(document_id, *session);
    } else {
        r.description = "Nothing to redo";
    }
    r.state = repo_.getById(slide_id);
    r.can_undo = session->canUndo();
    r.can_redo = session->canRedo();
    return r;
}

UndoRedoStatus SlideEditor::status(const std::string& document_id) {
    auto session = histories_.acquire(document_id);
    UndoRedoStatus s;
    s.can_undo = session->canUndo();
    s.can_redo = session->canRedo();
    s.undo_count = session->undoCount();
    s.redo_count = session->redoCount();
    return s;
}

void SlideEditor::clearHistory(const std::string& document_id) {
    histories_.clear(document_id);
    if (store_ && histories_.contains(document_id)) {
        persist(document_id, *histories_.acquire(document_id));
    }
}

json SlideEditor::exportHistory(const std::string& document_id) {
    return histories_.acquire(document_id)->toJson();
}

void SlideEditor::importHistory(const std::string& document_id, const json& data, const CommandRegistry& registry) {
    histories_.adopt(document_id, CommandHistory::fromJson(data, registry));
}

bool SlideEditor::restoreHistory(const std::string& document_id, const CommandRegistry& registry) {
    if (!store_) return false;
    auto stored = store_->loadHistory(document_id);
    if (!stored) return false;
    importHistory(document_id, json::parse(*stored), registry);
    return true;
}

} // namespace folio
