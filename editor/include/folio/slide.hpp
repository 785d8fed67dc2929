#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

using json = nlohmann::json;

// JSON object mapping slide field names to values, e.g. {"title": "Intro"}.
using FieldMap = json;

struct Slide {
    std::string id;
    std::string document_id;
    std::string title;
    std::optional<std::string> subtitle;
    std::string layout_type {"title_content"};
    json content = json::object();
    std::optional<std::string> notes;
    std::optional<std::string> background_color;
    std::optional<std::string> text_color;
    std::optional<std::string> font_family;
    int order_index {0};
    int version {1};

    // Editable-field accessors. Unknown names and values of the wrong kind
    // throw std::invalid_argument; unset optional fields read as null.
    json field(const std::string& name) const;
    void setField(const std::string& name, const json& value);
    void apply(const FieldMap& fields);

    json toJson() const;
    static Slide fromJson(const json& j);
};

bool operator==(const Slide& a, const Slide& b);
inline bool operator!=(const Slide& a, const Slide& b) { return !(a == b); }

// Fields UpdateSlide may touch; order_index is owned by MoveSlide.
const std::vector<std::string>& editableSlideFields();

bool isValidLayout(std::string_view layout);

} // namespace folio
