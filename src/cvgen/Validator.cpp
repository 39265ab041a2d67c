#include "cvgen/Validator.hpp"

#include "cvgen/Errors.hpp"

#include <fstream>
#include <optional>
#include <sstream>

using json = nlohmann::json;

namespace cvgen {

static std::string index_path(const std::string& where, size_t i) {
    std::ostringstream oss;
    oss << where << "[" << i << "]";
    return oss.str();
}

static std::string type_name(const json& j) {
    return j.type_name();
}

// Absent and null are treated the same.
static const json* find_key(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return nullptr;
    return &*it;
}

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw SchemaError(where, "must be an object, got " + type_name(j));
    }
}

static void require_array(const json& j, const std::string& where) {
    if (!j.is_array()) {
        throw SchemaError(where, "must be an array, got " + type_name(j));
    }
}

static std::string text_field(const json& j, const char* key, const std::string& where) {
    const json* v = find_key(j, key);
    if (!v) return "";
    if (!v->is_string()) {
        throw SchemaError(where + "." + key, "must be a string, got " + type_name(*v));
    }
    return v->get<std::string>();
}

// Empty strings count as absent.
static std::optional<std::string> optional_text(const json& j, const char* key, const std::string& where) {
    std::string s = text_field(j, key, where);
    if (s.empty()) return std::nullopt;
    return s;
}

static std::vector<std::string> text_list(const json& arr, const std::string& where) {
    require_array(arr, where);
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr[i].is_string()) {
            throw SchemaError(index_path(where, i), "must be a string, got " + type_name(arr[i]));
        }
        out.push_back(arr[i].get<std::string>());
    }
    return out;
}

static std::vector<std::string> text_list_field(const json& j, const char* key, const std::string& where) {
    const json* v = find_key(j, key);
    if (!v) return {};
    return text_list(*v, where + "." + key);
}

static PersonalInfo parse_personal_info(const json& j, const std::string& where) {
    require_object(j, where);

    PersonalInfo pi;
    pi.name        = text_field(j, "name", where);
    pi.phone       = text_field(j, "phone", where);
    pi.email       = text_field(j, "email", where);
    pi.location    = text_field(j, "location", where);
    pi.linkedin    = optional_text(j, "linkedin", where);
    pi.github      = optional_text(j, "github", where);
    pi.visa_status = optional_text(j, "visa_status", where);
    return pi;
}

static ExperienceEntry parse_experience(const json& j, const std::string& where) {
    require_object(j, where);

    ExperienceEntry e;
    e.company       = text_field(j, "company", where);
    e.location      = text_field(j, "location", where);
    e.dates         = text_field(j, "dates", where);
    e.title         = text_field(j, "title", where);
    e.bullet_points = text_list_field(j, "bullet_points", where);
    return e;
}

static EducationEntry parse_education(const json& j, const std::string& where) {
    require_object(j, where);

    EducationEntry e;
    e.institution = text_field(j, "institution", where);
    e.degree      = text_field(j, "degree", where);
    e.dates       = text_field(j, "dates", where);

    // cgpa is often written as a bare number; keep its JSON spelling.
    if (const json* c = find_key(j, "cgpa")) {
        if (c->is_number()) {
            e.cgpa = c->dump();
        } else if (c->is_string()) {
            if (!c->get<std::string>().empty()) e.cgpa = c->get<std::string>();
        } else {
            throw SchemaError(where + ".cgpa", "must be a string or number, got " + type_name(*c));
        }
    }
    return e;
}

static SkillCategory parse_skill_category(const json& j, const std::string& where) {
    require_object(j, where);

    if (!find_key(j, "name")) throw SchemaError(where + ".name", "missing required field");

    SkillCategory c;
    c.name = text_field(j, "name", where);

    const json* items = find_key(j, "items");
    if (!items) throw SchemaError(where + ".items", "missing required field");
    c.items = text_list(*items, where + ".items");
    return c;
}

static std::vector<SkillCategory> parse_skills(const json& j, const std::string& where) {
    const json* categories = &j;
    std::string cat_where = where;

    if (j.is_object()) {
        categories = find_key(j, "categories");
        if (!categories) return {};
        cat_where = where + ".categories";
    } else if (!j.is_array()) {
        throw SchemaError(where, "must be an object with categories, got " + type_name(j));
    }

    require_array(*categories, cat_where);

    std::vector<SkillCategory> out;
    out.reserve(categories->size());
    for (size_t i = 0; i < categories->size(); ++i) {
        out.push_back(parse_skill_category(categories->at(i), index_path(cat_where, i)));
    }
    return out;
}

static ExtracurricularEntry parse_extracurricular(const json& j, const std::string& where) {
    require_object(j, where);

    ExtracurricularEntry e;
    e.organization  = text_field(j, "organization", where);
    e.position      = text_field(j, "position", where);
    e.dates         = text_field(j, "dates", where);
    e.bullet_points = text_list_field(j, "bullet_points", where);
    return e;
}

static ProjectEntry parse_project(const json& j, const std::string& where) {
    require_object(j, where);

    ProjectEntry p;
    p.name          = text_field(j, "name", where);
    p.tech_stack    = text_list_field(j, "tech_stack", where);
    p.bullet_points = text_list_field(j, "bullet_points", where);
    return p;
}

template <typename T, typename Parse>
static std::vector<T> parse_section(const json& root, const char* key, Parse parse) {
    const json* sec = find_key(root, key);
    if (!sec) return {};

    const std::string where = std::string("root.") + key;
    require_array(*sec, where);

    std::vector<T> out;
    out.reserve(sec->size());
    for (size_t i = 0; i < sec->size(); ++i) {
        out.push_back(parse(sec->at(i), index_path(where, i)));
    }
    return out;
}

ResumeRecord validate_record(const json& input) {
    require_object(input, "root");

    // Build into a local so a failure part-way never leaks a partial record.
    ResumeRecord r;

    if (const json* pi = find_key(input, "personal_info")) {
        r.personal_info = parse_personal_info(*pi, "root.personal_info");
    }

    r.experience = parse_section<ExperienceEntry>(input, "experience", parse_experience);
    r.education  = parse_section<EducationEntry>(input, "education", parse_education);

    if (const json* sk = find_key(input, "skills")) {
        r.skills = parse_skills(*sk, "root.skills");
    }

    if (const json* certs = find_key(input, "certifications")) {
        r.certifications = text_list(*certs, "root.certifications");
    }

    r.extracurriculars = parse_section<ExtracurricularEntry>(input, "extracurriculars", parse_extracurricular);
    r.projects         = parse_section<ProjectEntry>(input, "projects", parse_project);

    return r;
}

ResumeRecord load_resume_record(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) throw IOError(path.string(), "failed to open resume file");

    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw SchemaError("root", std::string("failed to parse JSON: ") + e.what());
    }

    return validate_record(j);
}

ValidationReport validate_file(const std::filesystem::path& path) {
    ValidationReport rep;

    auto fail = [&](const std::string& code, const std::string& where, const std::string& msg) {
        rep.pass = false;
        ValidationError e;
        e.code = code;
        e.path = where;
        e.message = msg;
        rep.errors.push_back(std::move(e));
    };

    try {
        (void)load_resume_record(path);
    } catch (const IOError& e) {
        fail("io_error", e.path(), e.what());
    } catch (const SchemaError& e) {
        fail("schema_error", e.path(), e.detail());
    }

    return rep;
}

void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep) {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) throw IOError(path.parent_path().string(), "failed to create directory");
    }

    json j;
    j["pass"] = rep.pass;
    j["errors"] = json::array();

    for (const auto& e : rep.errors) {
        json ej;
        ej["code"] = e.code;
        ej["path"] = e.path;
        ej["message"] = e.message;
        j["errors"].push_back(ej);
    }

    std::ofstream out(path, std::ios::out | std::ios::trunc);
    if (!out) throw IOError(path.string(), "failed to open report file");
    out << j.dump(2) << "\n";
    if (!out) throw IOError(path.string(), "failed to write report file");
}

}  // namespace cvgen
