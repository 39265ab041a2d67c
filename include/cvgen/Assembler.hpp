#pragma once

#include "cvgen/DocumentTree.hpp"
#include "cvgen/Models.hpp"
#include "cvgen/RenderConfig.hpp"
#include "cvgen/StyleRegistry.hpp"

namespace cvgen {

// Runs the section renderers in fixed order: identity, experience, education,
// skills, certifications, extracurriculars, projects. Education,
// certifications, extracurriculars and projects are left out entirely when
// empty; the experience and skills headings are always present. Each rendered
// section is followed by a spacer paragraph.
DocumentTree assemble(const ResumeRecord& record, const StyleRegistry& styles, const RenderConfig& cfg);

}  // namespace cvgen
