#include "cvgen/Assembler.hpp"

#include "cvgen/SectionRenderers.hpp"

namespace cvgen {

static PageSetup page_setup(const PageMargins& m) {
    PageSetup page;
    page.margin_top_in = m.top_in;
    page.margin_bottom_in = m.bottom_in;
    page.margin_left_in = m.left_in;
    page.margin_right_in = m.right_in;
    return page;
}

DocumentTree assemble(const ResumeRecord& record, const StyleRegistry& styles, const RenderConfig& cfg) {
    DocumentTree tree;
    tree.page = page_setup(cfg.margins);
    tree.styles = styles;

    render_identity(tree, record.personal_info, styles);
    append_spacer(tree, false);

    render_experience(tree, cfg.titles.experience, record.experience, styles);
    append_spacer(tree, false);

    if (!record.education.empty()) {
        render_education(tree, cfg.titles.education, record.education, styles);
        append_spacer(tree, false);
    }

    render_skills(tree, cfg.titles.skills, record.skills, cfg.extra_skills, styles);
    append_spacer(tree, true);

    if (!record.certifications.empty()) {
        render_certifications(tree, cfg.titles.certifications, record.certifications, styles);
        append_spacer(tree, true);
    }

    if (!record.extracurriculars.empty()) {
        render_extracurriculars(tree, cfg.titles.extracurriculars, record.extracurriculars, styles);
        append_spacer(tree, false);
    }

    if (!record.projects.empty()) {
        render_projects(tree, cfg.titles.projects, record.projects, styles);
        append_spacer(tree, false);
    }

    return tree;
}

}  // namespace cvgen
