#include "commands/create_slide.hpp"
#include <stdexcept>

namespace folio {

CreateSlideCommand::CreateSlideCommand(std::string document_id, FieldMap fields, std::optional<int> order_index)
    : document_id_(std::move(document_id)), fields_(std::move(fields)), order_index_(order_index) {
    if (fields_.is_null()) fields_ = json::object();
    if (!fields_.is_object()) throw std::invalid_argument("CreateSlide: fields must be a JSON object");
}

void CreateSlideCommand::doAction(ISlideRepository& repo) {
    Slide slide;
    slide.id = created_slide_id_;
    slide.document_id = document_id_;
    slide.apply(fields_);
    slide.order_index = order_index_.value_or(static_cast<int>(repo.listByDocument(document_id_).size()));
    created_slide_id_ = repo.create(std::move(slide)).id;
}

void CreateSlideCommand::undoAction(ISlideRepository& repo) {
    if (created_slide_id_.empty()) {
        throw std::logic_error("CreateSlide: no slide was created");
    }
    repo.remove(created_slide_id_);
}

void CreateSlideCommand::writePayload(json& out) const {
    out["document_id"] = document_id_;
    out["fields"] = fields_;
    out["order_index"] = order_index_ ? json(*order_index_) : json(nullptr);
    out["created_slide_id"] = created_slide_id_.empty() ? json(nullptr) : json(created_slide_id_);
}

std::unique_ptr<Command> CreateSlideCommand::fromJson(const json& j) {
    std::optional<int> order;
    if (auto it = j.find("order_index"); it != j.end() && !it->is_null()) order = it->get<int>();
    auto cmd = std::make_unique<CreateSlideCommand>(j.at("document_id").get<std::string>(),
                                                    j.value("fields", json::object()), order);
    cmd->restoreBase(j);
    if (auto it = j.find("created_slide_id"); it != j.end() && !it->is_null()) {
        cmd->created_slide_id_ = it->get<std::string>();
    }
    return cmd;
}

} // namespace folio
