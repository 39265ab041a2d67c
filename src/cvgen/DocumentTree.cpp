#include "cvgen/DocumentTree.hpp"

namespace cvgen {

std::string Paragraph::text() const {
    std::string out;
    for (const auto& r : runs) {
        if (r.kind == Run::Kind::Tab) out += '\t';
        else out += r.text;
    }
    return out;
}

Paragraph& append_paragraph(DocumentTree& tree, StyleId style, Alignment align) {
    Paragraph p;
    p.style = style;
    p.alignment = align;
    tree.paragraphs.push_back(std::move(p));
    return tree.paragraphs.back();
}

void add_text(Paragraph& p, const std::string& text, bool bold) {
    Run r;
    r.kind = Run::Kind::Text;
    r.text = text;
    r.bold = bold;
    p.runs.push_back(std::move(r));
}

void add_tab(Paragraph& p) {
    Run r;
    r.kind = Run::Kind::Tab;
    p.runs.push_back(std::move(r));
}

bool operator==(const Run& a, const Run& b) {
    return a.kind == b.kind && a.text == b.text && a.bold == b.bold;
}

bool operator==(const TabStop& a, const TabStop& b) {
    return a.position_in == b.position_in && a.alignment == b.alignment;
}

bool operator==(const SpacingOverride& a, const SpacingOverride& b) {
    return a.space_before_pt == b.space_before_pt &&
           a.space_after_pt == b.space_after_pt &&
           a.line_spacing == b.line_spacing;
}

bool operator==(const Paragraph& a, const Paragraph& b) {
    return a.style == b.style &&
           a.alignment == b.alignment &&
           a.tab_stops == b.tab_stops &&
           a.bottom_border == b.bottom_border &&
           a.spacing == b.spacing &&
           a.runs == b.runs;
}

bool operator==(const PageSetup& a, const PageSetup& b) {
    return a.width_in == b.width_in && a.height_in == b.height_in &&
           a.margin_top_in == b.margin_top_in && a.margin_bottom_in == b.margin_bottom_in &&
           a.margin_left_in == b.margin_left_in && a.margin_right_in == b.margin_right_in;
}

// Styles come from the immutable registry and are not compared.
bool operator==(const DocumentTree& a, const DocumentTree& b) {
    return a.page == b.page && a.paragraphs == b.paragraphs;
}

}  // namespace cvgen
