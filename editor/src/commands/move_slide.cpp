#include "commands/move_slide.hpp"
#include <stdexcept>

namespace folio {

MoveSlideCommand::MoveSlideCommand(std::string slide_id, int new_order)
    : slide_id_(std::move(slide_id)), new_order_(new_order) {}

void MoveSlideCommand::doAction(ISlideRepository& repo) {
    auto slide = repo.getById(slide_id_);
    if (!slide) throw std::runtime_error("slide not found: " + slide_id_);
    const int previous = slide->order_index;
    repo.reorder(slide->document_id, slide_id_, new_order_);
    previous_order_ = previous;
}

void MoveSlideCommand::undoAction(ISlideRepository& repo) {
    if (!previous_order_) throw std::logic_error("MoveSlide: no previous order to restore");
    auto slide = repo.getById(slide_id_);
    if (!slide) throw std::runtime_error("slide not found: " + slide_id_);
    slide->order_index = *previous_order_;
    repo.update(*slide);
}

void MoveSlideCommand::writePayload(json& out) const {
    out["slide_id"] = slide_id_;
    out["new_order"] = new_order_;
    out["previous_order"] = previous_order_ ? json(*previous_order_) : json(nullptr);
}

std::unique_ptr<Command> MoveSlideCommand::fromJson(const json& j) {
    auto cmd = std::make_unique<MoveSlideCommand>(j.at("slide_id").get<std::string>(), j.at("new_order").get<int>());
    cmd->restoreBase(j);
    if (auto it = j.find("previous_order"); it != j.end() && !it->is_null()) {
        cmd->previous_order_ = it->get<int>();
    }
    return cmd;
}

} // namespace folio
