#include "cvgen/RenderConfig.hpp"

#include "cvgen/DocumentTree.hpp"
#include "cvgen/Errors.hpp"
#include "cvgen/StyleRegistry.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace cvgen {

static const json* find_key(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

static void read_double(const json& j, const char* key, const std::string& where, double& out) {
    const json* v = find_key(j, key);
    if (!v) return;
    if (!v->is_number()) throw ConfigError(where + "." + key + " must be a number");
    out = v->get<double>();
    if (out < 0.0) throw ConfigError(where + "." + key + " must not be negative");
}

static void read_string(const json& j, const char* key, const std::string& where, std::string& out) {
    const json* v = find_key(j, key);
    if (!v) return;
    if (!v->is_string()) throw ConfigError(where + "." + key + " must be a string");
    out = v->get<std::string>();
}

static std::vector<std::string> read_string_array(const json& arr, const std::string& where) {
    if (!arr.is_array()) throw ConfigError(where + " must be an array");
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_string()) {
            std::ostringstream oss;
            oss << where << "[" << i << "] must be a string";
            throw ConfigError(oss.str());
        }
        out.push_back(arr[i].get<std::string>());
    }
    return out;
}

static int checked_timeout(long long v, const std::string& what) {
    if (v <= 0) throw ConfigError(what + " must be a positive integer");
    if (v > INT_MAX) throw ConfigError(what + " is out of range");
    return static_cast<int>(v);
}

int parse_timeout_seconds(const std::string& text) {
    size_t used = 0;
    long long v = 0;
    try {
        v = std::stoll(text, &used);
    } catch (const std::exception&) {
        throw ConfigError("--timeout must be a positive integer, got '" + text + "'");
    }
    if (used != text.size()) throw ConfigError("--timeout must be a positive integer, got '" + text + "'");
    if (v <= 0) throw ConfigError("--timeout must be positive");
    return checked_timeout(v, "--timeout");
}

RenderConfig parse_render_config(const json& j) {
    if (!j.is_object()) throw ConfigError("config must be an object");

    RenderConfig cfg;

    if (const json* m = find_key(j, "margins_in")) {
        if (!m->is_object()) throw ConfigError("config.margins_in must be an object");
        read_double(*m, "top", "config.margins_in", cfg.margins.top_in);
        read_double(*m, "bottom", "config.margins_in", cfg.margins.bottom_in);
        read_double(*m, "left", "config.margins_in", cfg.margins.left_in);
        read_double(*m, "right", "config.margins_in", cfg.margins.right_in);

        // The date tab stop is fixed; the text column must be wide enough to hold it.
        const double text_width = PageSetup{}.width_in - cfg.margins.left_in - cfg.margins.right_in;
        const double tab = StyleRegistry::standard().date_tab_position_in();
        if (text_width + 1e-9 < tab) {
            std::ostringstream oss;
            oss << "config.margins_in leaves a " << text_width << "in text column, narrower than the "
                << tab << "in date tab stop";
            throw ConfigError(oss.str());
        }
    }

    if (const json* t = find_key(j, "section_titles")) {
        if (!t->is_object()) throw ConfigError("config.section_titles must be an object");
        read_string(*t, "experience", "config.section_titles", cfg.titles.experience);
        read_string(*t, "education", "config.section_titles", cfg.titles.education);
        read_string(*t, "skills", "config.section_titles", cfg.titles.skills);
        read_string(*t, "certifications", "config.section_titles", cfg.titles.certifications);
        read_string(*t, "extracurriculars", "config.section_titles", cfg.titles.extracurriculars);
        read_string(*t, "projects", "config.section_titles", cfg.titles.projects);
    }

    if (const json* e = find_key(j, "extra_skills")) {
        cfg.extra_skills = read_string_array(*e, "config.extra_skills");
    }

    if (const json* c = find_key(j, "converter")) {
        if (!c->is_object()) throw ConfigError("config.converter must be an object");

        if (const json* cmd = find_key(*c, "command")) {
            cfg.converter.command = read_string_array(*cmd, "config.converter.command");
            if (cfg.converter.command.empty()) {
                throw ConfigError("config.converter.command must not be empty");
            }
        }

        if (const json* to = find_key(*c, "timeout_seconds")) {
            if (!to->is_number_integer()) {
                throw ConfigError("config.converter.timeout_seconds must be a positive integer");
            }
            // Unsigned values above INT64_MAX would wrap, so range-check them first.
            if (to->is_number_unsigned() && to->get<unsigned long long>() > static_cast<unsigned long long>(INT_MAX)) {
                throw ConfigError("config.converter.timeout_seconds is out of range");
            }
            cfg.converter.timeout_seconds = checked_timeout(to->get<long long>(), "config.converter.timeout_seconds");
        }

        read_string(*c, "format", "config.converter", cfg.converter.format);
        if (cfg.converter.format.empty()) throw ConfigError("config.converter.format must not be empty");

        std::string lower = cfg.converter.format;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
        if (lower == "docx") {
            throw ConfigError("config.converter.format must differ from the document format (docx)");
        }
        if (lower.find('/') != std::string::npos || lower.find('.') != std::string::npos) {
            throw ConfigError("config.converter.format must be a bare extension");
        }
    }

    return cfg;
}

RenderConfig load_render_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw IOError(path.string(), "failed to open config file");

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw ConfigError(std::string("failed to parse config JSON: ") + e.what());
    }
    return parse_render_config(j);
}

}  // namespace cvgen
