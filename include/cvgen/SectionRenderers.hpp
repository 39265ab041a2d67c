#pragma once

#include <string>
#include <vector>

#include "cvgen/DocumentTree.hpp"
#include "cvgen/Models.hpp"
#include "cvgen/StyleRegistry.hpp"

namespace cvgen {

// Each renderer appends to the tree and reads only its own section.
// Section renderers emit their heading (with rule line) before the body.

void render_identity(DocumentTree& tree, const PersonalInfo& pi, const StyleRegistry& styles);

void render_experience(DocumentTree& tree, const std::string& title,
                       const std::vector<ExperienceEntry>& entries, const StyleRegistry& styles);

void render_education(DocumentTree& tree, const std::string& title,
                      const std::vector<EducationEntry>& entries, const StyleRegistry& styles);

void render_skills(DocumentTree& tree, const std::string& title,
                   const std::vector<SkillCategory>& categories,
                   const std::vector<std::string>& extra_skills, const StyleRegistry& styles);

void render_certifications(DocumentTree& tree, const std::string& title,
                           const std::vector<std::string>& certifications, const StyleRegistry& styles);

void render_extracurriculars(DocumentTree& tree, const std::string& title,
                             const std::vector<ExtracurricularEntry>& entries, const StyleRegistry& styles);

void render_projects(DocumentTree& tree, const std::string& title,
                     const std::vector<ProjectEntry>& entries, const StyleRegistry& styles);

// Separator between sections. Compact spacers are 2pt high instead of a full line.
void append_spacer(DocumentTree& tree, bool compact);

std::string join(const std::vector<std::string>& items, const std::string& sep);

}  // namespace cvgen
