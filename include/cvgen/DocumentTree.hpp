#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cvgen/StyleRegistry.hpp"

namespace cvgen {

enum class Alignment {
    Left,
    Center,
    Right,
    Justify
};

enum class TabAlignment {
    Left,
    Right
};

struct Run {
    enum class Kind {
        Text,
        Tab
    };

    Kind kind = Kind::Text;
    std::string text;  // empty for tabs
    bool bold = false;
};

struct TabStop {
    double position_in = 0.0;
    TabAlignment alignment = TabAlignment::Left;
};

// Per-paragraph spacing that replaces the style's spacing (spacer lines).
struct SpacingOverride {
    double space_before_pt = 0.0;
    double space_after_pt = 0.0;
    double line_spacing = 1.0;
};

struct Paragraph {
    StyleId style = StyleId::Body;
    Alignment alignment = Alignment::Left;
    std::vector<TabStop> tab_stops;
    bool bottom_border = false;
    std::optional<SpacingOverride> spacing;
    std::vector<Run> runs;

    // Concatenated run text, tabs as '\t'.
    std::string text() const;
    bool empty() const { return runs.empty(); }
};

struct PageSetup {
    double width_in = 8.5;
    double height_in = 11.0;
    double margin_top_in = 0.75;
    double margin_bottom_in = 0.75;
    double margin_left_in = 1.0;
    double margin_right_in = 1.0;
};

// Output of one render pass. The serializer only reads it.
struct DocumentTree {
    PageSetup page;
    StyleRegistry styles = StyleRegistry::standard();
    std::vector<Paragraph> paragraphs;
};

Paragraph& append_paragraph(DocumentTree& tree, StyleId style, Alignment align = Alignment::Left);
void add_text(Paragraph& p, const std::string& text, bool bold = false);
void add_tab(Paragraph& p);

bool operator==(const Run& a, const Run& b);
bool operator==(const TabStop& a, const TabStop& b);
bool operator==(const SpacingOverride& a, const SpacingOverride& b);
bool operator==(const Paragraph& a, const Paragraph& b);
bool operator==(const PageSetup& a, const PageSetup& b);
bool operator==(const DocumentTree& a, const DocumentTree& b);

}  // namespace cvgen
