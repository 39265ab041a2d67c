#pragma once

#include <string>
#include <vector>

namespace cvgen {

enum class StyleId {
    Heading,
    Subheading,
    Body,
    Bullet
};

// Registry key of a style: "heading", "subheading", "body", "bullet".
const char* style_name(StyleId id);

struct StyleDef {
    StyleId id = StyleId::Body;
    std::string name;          // registry key
    std::string docx_id;       // w:styleId written to styles.xml
    std::string display_name;  // w:name shown in the word processor

    std::string typeface;
    double point_size = 10.0;
    bool bold = false;

    double space_before_pt = 0.0;
    double space_after_pt = 0.0;
    double line_spacing = 1.0;     // multiple of single spacing

    double left_indent_in = 0.0;
    double hanging_indent_in = 0.0;  // first line starts this far left of left_indent
};

// Bottom border drawn under heading paragraphs.
struct RuleLine {
    std::string kind = "single";
    int width_eighths = 6;  // eighths of a point
    int space_pt = 1;
    std::string color = "auto";
};

// Fixed catalogue of the four styles plus the layout constants shared by all
// section renderers. Immutable once constructed.
class StyleRegistry {
    std::vector<StyleDef> styles_;  // indexed by StyleId
    double date_tab_in_ = 6.0;
    RuleLine heading_rule_;

    StyleRegistry();

public:
    static const StyleRegistry& standard();

    const StyleDef& get(StyleId id) const;

    // Throws std::out_of_range for an unknown name.
    const StyleDef& find(const std::string& name) const;

    const std::vector<StyleDef>& all() const { return styles_; }

    // Right-aligned tab stop used for every date column, in inches from the
    // left margin.
    double date_tab_position_in() const { return date_tab_in_; }

    const RuleLine& heading_rule() const { return heading_rule_; }
};

}  // namespace cvgen
