#pragma once

#include "folio/command.hpp"
#include <optional>
#include <string>

namespace folio {

class CreateSlideCommand : public Command {
public:
    static constexpr const char* kType = "CreateSlideCommand";

    // Without order_index the slide is appended after the document's last slide.
    CreateSlideCommand(std::string document_id, FieldMap fields, std::optional<int> order_index = std::nullopt);

    std::string type() const override { return kType; }
    std::string label() const override { return "CreateSlide"; }

    // Empty until the first successful execute.
    const std::string& createdSlideId() const { return created_slide_id_; }
    const std::string& documentId() const { return document_id_; }

    static std::unique_ptr<Command> fromJson(const json& j);

protected:
    void doAction(ISlideRepository& repo) override;
    void undoAction(ISlideRepository& repo) override;
    void writePayload(json& out) const override;

private:
    std::string document_id_;
    FieldMap fields_;
    std::optional<int> order_index_;
    std::string created_slide_id_; // reused on redo so later commands still resolve
};

} // namespace folio
