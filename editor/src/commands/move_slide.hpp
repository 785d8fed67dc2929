#pragma once

#include "folio/command.hpp"
#include <optional>
#include <string>

namespace folio {

// Undo puts back only the moved slide's order index; the sibling renumbering
// done by execute stays in place.
class MoveSlideCommand : public Command {
public:
    static constexpr const char* kType = "MoveSlideCommand";

    MoveSlideCommand(std::string slide_id, int new_order);

    std::string type() const override { return kType; }
    std::string label() const override { return "MoveSlide"; }

    const std::string& slideId() const { return slide_id_; }
    int newOrder() const { return new_order_; }
    const std::optional<int>& previousOrder() const { return previous_order_; }

    static std::unique_ptr<Command> fromJson(const json& j);

protected:
    void doAction(ISlideRepository& repo) override;
    void undoAction(ISlideRepository& repo) override;
    void writePayload(json& out) const override;

private:
    std::string slide_id_;
    int new_order_;
    std::optional<int> previous_order_;
};

} // namespace folio
