#include "folio/slide.hpp"
#include <algorithm>
#include <array>
#include <stdexcept>

namespace folio {

static constexpr std::array<std::string_view, 9> kLayouts = {
    "title_only", "title_content", "two_column", "three_column", "comparison",
    "image_left", "image_right", "full_image", "blank",
};

static json optionalToJson(const std::optional<std::string>& v) {
    return v ? json(*v) : json(nullptr);
}

static std::optional<std::string> optionalFromJson(const std::string& name, const json& value) {
    if (value.is_null()) return std::nullopt;
    if (!value.is_string()) {
        throw std::invalid_argument("slide field '" + name + "' must be a string or null");
    }
    return value.get<std::string>();
}

static std::string requiredString(const std::string& name, const json& value) {
    if (!value.is_string()) {
        throw std::invalid_argument("slide field '" + name + "' must be a string");
    }
    return value.get<std::string>();
}

const std::vector<std::string>& editableSlideFields() {
    static const std::vector<std::string> fields = {
        "title", "subtitle", "layout_type", "content",
        "notes", "background_color", "text_color", "font_family",
    };
    return fields;
}

bool isValidLayout(std::string_view layout) {
    return std::find(kLayouts.begin(), kLayouts.end(), layout) != kLayouts.end();
}

json Slide::field(const std::string& name) const {
    if (name == "title") return title;
    if (name == "subtitle") return optionalToJson(subtitle);
    if (name == "layout_type") return layout_type;
    if (name == "content") return content;
    if (name == "notes") return optionalToJson(notes);
    if (name == "background_color") return optionalToJson(background_color);
    if (name == "text_color") return optionalToJson(text_color);
    if (name == "font_family") return optionalToJson(font_family);
    throw std::invalid_argument("unknown slide field: " + name);
}

void Slide::setField(const std::string& name, const json& value) {
    if (name == "title") {
        title = requiredString(name, value);
    } else if (name == "subtitle") {
        subtitle = optionalFromJson(name, value);
    } else if (name == "layout_type") {
        auto layout = requiredString(name, value);
        if (!isValidLayout(layout)) {
            throw std::invalid_argument("unknown slide layout: " + layout);
        }
        layout_type = std::move(layout);
    } else if (name == "content") {
        if (!value.is_object()) {
            throw std::invalid_argument("slide field 'content' must be an object");
        }
        content = value;
    } else if (name == "notes") {
        notes = optionalFromJson(name, value);
    } else if (name == "background_color") {
        background_color = optionalFromJson(name, value);
    } else if (name == "text_color") {
        text_color = optionalFromJson(name, value);
    } else if (name == "font_family") {
        font_family = optionalFromJson(name, value);
    } else {
        throw std::invalid_argument("unknown slide field: " + name);
    }
}

void Slide::apply(const FieldMap& fields) {
    if (!fields.is_object()) {
        throw std::invalid_argument("slide fields must be a JSON object");
    }
    // Validate everything first so a bad entry leaves the slide untouched.
    Slide next = *this;
    for (auto it = fields.begin(); it != fields.end(); ++it) {
        next.setField(it.key(), it.value());
    }
    *this = std::move(next);
}

json Slide::toJson() const {
    json j;
    j["id"] = id;
    j["document_id"] = document_id;
    j["title"] = title;
    j["subtitle"] = optionalToJson(subtitle);
    j["layout_type"] = layout_type;
    j["content"] = content;
    j["notes"] = optionalToJson(notes);
    j["background_color"] = optionalToJson(background_color);
    j["text_color"] = optionalToJson(text_color);
    j["font_family"] = optionalToJson(font_family);
    j["order_index"] = order_index;
    j["version"] = version;
    return j;
}

Slide Slide::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("slide must be a JSON object");
    }
    Slide s;
    s.id = requiredString("id", j.at("id"));
    s.document_id = requiredString("document_id", j.at("document_id"));
    s.order_index = j.value("order_index", 0);
    s.version = j.value("version", 1);
    for (const auto& name : editableSlideFields()) {
        auto it = j.find(name);
        if (it != j.end()) s.setField(name, *it);
    }
    return s;
}

bool operator==(const Slide& a, const Slide& b) {
    return a.id == b.id && a.document_id == b.document_id && a.title == b.title &&
           a.subtitle == b.subtitle && a.layout_type == b.layout_type && a.content == b.content &&
           a.notes == b.notes && a.background_color == b.background_color &&
           a.text_color == b.text_color && a.font_family == b.font_family &&
           a.order_index == b.order_index && a.version == b.version;
}

} // namespace folio
