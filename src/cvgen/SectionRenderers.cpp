#include "cvgen/SectionRenderers.hpp"

namespace cvgen {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) out += sep;
        out += items[i];
    }
    return out;
}

static void add_heading_with_rule(DocumentTree& tree, const std::string& text) {
    Paragraph& p = append_paragraph(tree, StyleId::Heading, Alignment::Left);
    p.bottom_border = true;
    add_text(p, text);
}

// "left<TAB>dates" with the dates pushed to the shared right tab stop.
static void add_dated_subheading(DocumentTree& tree, const std::string& left,
                                 const std::string& dates, const StyleRegistry& styles) {
    Paragraph& p = append_paragraph(tree, StyleId::Subheading, Alignment::Left);

    TabStop stop;
    stop.position_in = styles.date_tab_position_in();
    stop.alignment = TabAlignment::Right;
    p.tab_stops.push_back(stop);

    add_text(p, left);
    add_tab(p);
    add_text(p, dates);
}

static void add_bullet(DocumentTree& tree, const std::string& text) {
    Paragraph& p = append_paragraph(tree, StyleId::Bullet, Alignment::Justify);
    add_text(p, text);
}

static void add_bullets(DocumentTree& tree, const std::vector<std::string>& points) {
    for (const auto& b : points) add_bullet(tree, b);
}

static void add_centered_line(DocumentTree& tree, const std::string& text) {
    Paragraph& p = append_paragraph(tree, StyleId::Body, Alignment::Center);
    add_text(p, text);
}

void render_identity(DocumentTree& tree, const PersonalInfo& pi, const StyleRegistry&) {
    Paragraph& name = append_paragraph(tree, StyleId::Heading, Alignment::Center);
    add_text(name, pi.name);

    if (!pi.phone.empty()) add_centered_line(tree, pi.phone);
    if (!pi.location.empty()) add_centered_line(tree, pi.location);

    add_centered_line(tree, "Email: " + pi.email);

    if (pi.linkedin) add_centered_line(tree, "LinkedIn: " + *pi.linkedin);
    if (pi.github) add_centered_line(tree, "GitHub: " + *pi.github);
    if (pi.visa_status) add_centered_line(tree, *pi.visa_status);
}

void render_experience(DocumentTree& tree, const std::string& title,
                       const std::vector<ExperienceEntry>& entries, const StyleRegistry& styles) {
    add_heading_with_rule(tree, title);

    for (const auto& e : entries) {
        add_dated_subheading(tree, e.company + ", " + e.location, e.dates, styles);

        Paragraph& t = append_paragraph(tree, StyleId::Body, Alignment::Left);
        add_text(t, e.title, true);

        add_bullets(tree, e.bullet_points);
    }
}

void render_education(DocumentTree& tree, const std::string& title,
                      const std::vector<EducationEntry>& entries, const StyleRegistry& styles) {
    add_heading_with_rule(tree, title);

    for (const auto& e : entries) {
        add_dated_subheading(tree, e.institution + " | " + e.degree, e.dates, styles);

        if (e.cgpa) {
            Paragraph& p = append_paragraph(tree, StyleId::Body, Alignment::Left);
            add_text(p, "CGPA: " + *e.cgpa);
        }
    }
}

void render_skills(DocumentTree& tree, const std::string& title,
                   const std::vector<SkillCategory>& categories,
                   const std::vector<std::string>& extra_skills, const StyleRegistry&) {
    add_heading_with_rule(tree, title);

    // A category without items still prints its label.
    for (const auto& c : categories) {
        Paragraph& p = append_paragraph(tree, StyleId::Body, Alignment::Left);
        add_text(p, c.name + ": ", true);
        add_text(p, join(c.items, ", "));
    }

    if (!extra_skills.empty()) {
        Paragraph& p = append_paragraph(tree, StyleId::Body, Alignment::Left);
        add_text(p, "Additional Relevant Skills:");
        add_bullets(tree, extra_skills);
    }
}

void render_certifications(DocumentTree& tree, const std::string& title,
                           const std::vector<std::string>& certifications, const StyleRegistry&) {
    add_heading_with_rule(tree, title);
    add_bullets(tree, certifications);
}

void render_extracurriculars(DocumentTree& tree, const std::string& title,
                             const std::vector<ExtracurricularEntry>& entries, const StyleRegistry& styles) {
    add_heading_with_rule(tree, title);

    for (const auto& e : entries) {
        add_dated_subheading(tree, e.organization + " | " + e.position, e.dates, styles);
        add_bullets(tree, e.bullet_points);
    }
}

void render_projects(DocumentTree& tree, const std::string& title,
                     const std::vector<ProjectEntry>& entries, const StyleRegistry&) {
    add_heading_with_rule(tree, title);

    for (const auto& p : entries) {
        Paragraph& head = append_paragraph(tree, StyleId::Subheading, Alignment::Left);
        add_text(head, p.name);

        if (!p.tech_stack.empty()) {
            Paragraph& tech = append_paragraph(tree, StyleId::Body, Alignment::Left);
            add_text(tech, "Tech Stack: " + join(p.tech_stack, ", "));
        }

        add_bullets(tree, p.bullet_points);
    }
}

void append_spacer(DocumentTree& tree, bool compact) {
    Paragraph& p = append_paragraph(tree, StyleId::Body, Alignment::Left);
    if (compact) {
        SpacingOverride s;
        s.space_before_pt = 0.0;
        s.space_after_pt = 2.0;
        s.line_spacing = 0.5;
        p.spacing = s;
    }
}

}  // namespace cvgen
