#include "cvgen/StyleRegistry.hpp"

#include <stdexcept>

namespace cvgen {

const char* style_name(StyleId id) {
    switch (id) {
        case StyleId::Heading:    return "heading";
        case StyleId::Subheading: return "subheading";
        case StyleId::Body:       return "body";
        case StyleId::Bullet:     return "bullet";
    }
    return "body";
}

static StyleDef make_style(StyleId id, const char* docx_id, const char* display_name,
                           double point_size, bool bold) {
    StyleDef s;
    s.id = id;
    s.name = style_name(id);
    s.docx_id = docx_id;
    s.display_name = display_name;
    s.typeface = "Calibri";
    s.point_size = point_size;
    s.bold = bold;
    s.space_before_pt = 0.0;
    s.space_after_pt = 0.0;
    s.line_spacing = 1.0;
    return s;
}

StyleRegistry::StyleRegistry() {
    // Order must follow the StyleId enumerators.
    styles_.push_back(make_style(StyleId::Heading, "CvHeading", "CV Heading", 12.0, true));
    styles_.push_back(make_style(StyleId::Subheading, "CvSubheading", "CV Subheading", 10.0, true));
    styles_.push_back(make_style(StyleId::Body, "Normal", "Normal", 10.0, false));

    StyleDef bullet = make_style(StyleId::Bullet, "ListBullet", "List Bullet", 9.5, false);
    bullet.left_indent_in = 0.3;
    bullet.hanging_indent_in = 0.15;
    styles_.push_back(bullet);
}

const StyleRegistry& StyleRegistry::standard() {
    static const StyleRegistry registry;
    return registry;
}

const StyleDef& StyleRegistry::get(StyleId id) const {
    return styles_.at(static_cast<size_t>(id));
}

const StyleDef& StyleRegistry::find(const std::string& name) const {
    for (const auto& s : styles_) {
        if (s.name == name) return s;
    }
    throw std::out_of_range("unknown style: " + name);
}

}  // namespace cvgen
