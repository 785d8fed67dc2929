#pragma once

#include "folio/command.hpp"
#include <optional>
#include <string>

namespace folio {

class DeleteSlideCommand : public Command {
public:
    static constexpr const char* kType = "DeleteSlideCommand";

    explicit DeleteSlideCommand(std::string slide_id);

    std::string type() const override { return kType; }
    std::string label() const override { return "DeleteSlide"; }

    const std::string& slideId() const { return slide_id_; }
    const std::optional<Slide>& deletedSlide() const { return deleted_; }

    static std::unique_ptr<Command> fromJson(const json& j);

protected:
    void doAction(ISlideRepository& repo) override;
    // Re-creates a record with the snapshot's id, order and fields.
    void undoAction(ISlideRepository& repo) override;
    void writePayload(json& out) const override;

private:
    std::string slide_id_;
    std::optional<Slide> deleted_;
};

} // namespace folio
