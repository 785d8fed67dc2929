#include "commands/update_slide.hpp"
#include <stdexcept>

namespace folio {

UpdateSlideCommand::UpdateSlideCommand(std::string slide_id, FieldMap updates)
    : slide_id_(std::move(slide_id)), updates_(std::move(updates)) {
    if (!updates_.is_object()) throw std::invalid_argument("UpdateSlide: updates must be a JSON object");
}

void UpdateSlideCommand::doAction(ISlideRepository& repo) {
    auto slide = repo.getById(slide_id_);
    if (!slide) throw std::runtime_error("slide not found: " + slide_id_);

    FieldMap previous = json::object();
    for (auto it = updates_.begin(); it != updates_.end(); ++it) {
        previous[it.key()] = slide->field(it.key());
    }
    std::optional<int> previous_version;
    if (updates_.contains("content")) previous_version = slide->version;

    slide->apply(updates_);
    if (previous_version) ++slide->version;
    repo.update(*slide);

    previous_ = std::move(previous);
    previous_version_ = previous_version;
}

void UpdateSlideCommand::undoAction(ISlideRepository& repo) {
    if (!previous_) throw std::logic_error("UpdateSlide: no previous values to restore");
    auto slide = repo.getById(slide_id_);
    if (!slide) throw std::runtime_error("slide not found: " + slide_id_);

    slide->apply(*previous_);
    if (previous_version_) slide->version = *previous_version_;
    repo.update(*slide);
}

void UpdateSlideCommand::writePayload(json& out) const {
    out["slide_id"] = slide_id_;
    out["updates"] = updates_;
    out["previous_data"] = previous_ ? *previous_ : json(nullptr);
    out["previous_version"] = previous_version_ ? json(*previous_version_) : json(nullptr);
}

std::unique_ptr<Command> UpdateSlideCommand::fromJson(const json& j) {
    auto cmd = std::make_unique<UpdateSlideCommand>(j.at("slide_id").get<std::string>(), j.at("updates"));
    cmd->restoreBase(j);
    if (auto it = j.find("previous_data"); it != j.end() && !it->is_null()) {
        if (!it->is_object()) throw std::invalid_argument("UpdateSlide: previous_data must be an object");
        cmd->previous_ = *it;
    }
    if (auto it = j.find("previous_version"); it != j.end() && !it->is_null()) {
        cmd->previous_version_ = it->get<int>();
    }
    return cmd;
}

} // namespace folio
