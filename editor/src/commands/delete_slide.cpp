#include "commands/delete_slide.hpp"
#include <stdexcept>

namespace folio {

DeleteSlideCommand::DeleteSlideCommand(std::string slide_id) : slide_id_(std::move(slide_id)) {}

void DeleteSlideCommand::doAction(ISlideRepository& repo) {
    auto slide = repo.getById(slide_id_);
    if (!slide) throw std::runtime_error("slide not found: " + slide_id_);
    repo.remove(slide_id_);
    deleted_ = std::move(slide);
}

void DeleteSlideCommand::undoAction(ISlideRepository& repo) {
    if (!deleted_) throw std::logic_error("DeleteSlide: no deleted slide to restore");
    repo.create(*deleted_);
}

void DeleteSlideCommand::writePayload(json& out) const {
    out["slide_id"] = slide_id_;
    out["deleted_data"] = deleted_ ? deleted_->toJson() : json(nullptr);
}

std::unique_ptr<Command> DeleteSlideCommand::fromJson(const json& j) {
    auto cmd = std::make_unique<DeleteSlideCommand>(j.at("slide_id").get<std::string>());
    cmd->restoreBase(j);
    if (auto it = j.find("deleted_data"); it != j.end() && !it->is_null()) {
        cmd->deleted_ = Slide::fromJson(*it);
    }
    return cmd;
}

} // namespace folio
