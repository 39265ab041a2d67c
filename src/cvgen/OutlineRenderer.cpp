#include "cvgen/OutlineRenderer.hpp"

namespace cvgen {

static std::string runs_text(const Paragraph& p, bool mark_bold) {
    std::string out;
    for (const auto& r : p.runs) {
        if (r.kind == Run::Kind::Tab) {
            out += " | ";
        } else if (mark_bold && r.bold && !r.text.empty()) {
            // Keep trailing spaces outside the markers ("**Languages:** C++").
            const size_t end = r.text.find_last_not_of(' ');
            if (end == std::string::npos) {
                out += r.text;
                continue;
            }
            std::string core = r.text.substr(0, end + 1);
            out += "**" + core + "**" + r.text.substr(end + 1);
        } else {
            out += r.text;
        }
    }
    return out;
}

std::string render_outline(const DocumentTree& tree) {
    std::string out;

    for (const auto& p : tree.paragraphs) {
        if (p.empty()) {
            out += "\n";
            continue;
        }

        switch (p.style) {
            case StyleId::Heading:
                out += (p.alignment == Alignment::Center ? "# " : "## ") + runs_text(p, false) + "\n";
                break;
            case StyleId::Subheading:
                out += "### " + runs_text(p, false) + "\n";
                break;
            case StyleId::Bullet:
                out += "- " + runs_text(p, true) + "\n";
                break;
            case StyleId::Body:
                out += runs_text(p, true) + "\n";
                break;
        }
    }

    return out;
}

}  // namespace cvgen
