#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cvgen {

struct PageMargins {
    double top_in = 0.75;
    double bottom_in = 0.75;
    double left_in = 1.0;
    double right_in = 1.0;
};

struct SectionTitles {
    std::string experience = "Experience";
    std::string education = "Education";
    std::string skills = "Skills";
    std::string certifications = "Certifications";
    std::string extracurriculars = "Extracurricular Activities";
    std::string projects = "Projects";
};

struct ConverterConfig {
    // Placeholders: {input} {outdir} {output} {format}
    std::vector<std::string> command = {
        "soffice", "--headless", "--convert-to", "{format}", "--outdir", "{outdir}", "{input}"
    };
    int timeout_seconds = 120;
    std::string format = "pdf";
};

// Built once per render call and passed down explicitly.
struct RenderConfig {
    PageMargins margins;
    SectionTitles titles;
    std::vector<std::string> extra_skills;  // listed under Skills after the categories
    ConverterConfig converter;
};

// Throws ConfigError on a wrong type; absent keys keep their defaults.
RenderConfig parse_render_config(const nlohmann::json& j);

// Parses a command-line timeout in seconds. Throws ConfigError unless the
// value is an integer in [1, INT_MAX].
int parse_timeout_seconds(const std::string& text);

// Throws IOError if the file cannot be read, ConfigError if it is not valid.
RenderConfig load_render_config(const std::filesystem::path& path);

}  // namespace cvgen
