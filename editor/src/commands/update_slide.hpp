#pragma once

#include "folio/command.hpp"
#include <optional>
#include <string>

namespace folio {

class UpdateSlideCommand : public Command {
public:
    static constexpr const char* kType = "UpdateSlideCommand";

    UpdateSlideCommand(std::string slide_id, FieldMap updates);

    std::string type() const override { return kType; }
    std::string label() const override { return "UpdateSlide"; }

    const std::string& slideId() const { return slide_id_; }
    const FieldMap& updates() const { return updates_; }
    // Values of the updated fields before the last execute; null before that.
    const std::optional<FieldMap>& previousValues() const { return previous_; }

    static std::unique_ptr<Command> fromJson(const json& j);

protected:
    void doAction(ISlideRepository& repo) override;
    void undoAction(ISlideRepository& repo) override;
    void writePayload(json& out) const override;

private:
    std::string slide_id_;
    FieldMap updates_;
    std::optional<FieldMap> previous_;
    std::optional<int> previous_version_; // only when content changes
};

} // namespace folio
