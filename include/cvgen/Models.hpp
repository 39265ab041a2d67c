#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cvgen {

struct PersonalInfo {
    std::string name;
    std::string phone;
    std::string email;
    std::string location;
    std::optional<std::string> linkedin;
    std::optional<std::string> github;
    std::optional<std::string> visa_status;
};

struct ExperienceEntry {
    std::string company;
    std::string location;
    std::string dates;
    std::string title;
    std::vector<std::string> bullet_points;
};

struct EducationEntry {
    std::string institution;
    std::string degree;
    std::optional<std::string> cgpa;
    std::string dates;
};

struct SkillCategory {
    std::string name;
    std::vector<std::string> items;
};

struct ExtracurricularEntry {
    std::string organization;
    std::string position;
    std::string dates;
    std::vector<std::string> bullet_points;
};

struct ProjectEntry {
    std::string name;
    std::vector<std::string> tech_stack;
    std::vector<std::string> bullet_points;
};

// Validated input of one render pass. Sequences keep input order.
struct ResumeRecord {
    PersonalInfo personal_info;
    std::vector<ExperienceEntry> experience;
    std::vector<EducationEntry> education;
    std::vector<SkillCategory> skills;
    std::vector<std::string> certifications;
    std::vector<ExtracurricularEntry> extracurriculars;
    std::vector<ProjectEntry> projects;
};

}  // namespace cvgen
