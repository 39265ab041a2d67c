#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "cvgen/Models.hpp"

namespace cvgen {

// All-or-nothing check of an externally supplied record. Absent top-level
// sections are empty; a value of the wrong type anywhere is a SchemaError.
ResumeRecord validate_record(const nlohmann::json& input);

// Reads a UTF-8 JSON file and validates it. Throws IOError if unreadable,
// SchemaError if the JSON is malformed or does not conform.
ResumeRecord load_resume_record(const std::filesystem::path& path);

struct ValidationError {
    std::string code;     // "io_error" | "schema_error"
    std::string path;
    std::string message;
};

struct ValidationReport {
    bool pass = true;
    std::vector<ValidationError> errors;
};

ValidationReport validate_file(const std::filesystem::path& path);

// Throws IOError if the report cannot be written.
void write_validation_report(const std::filesystem::path& path, const ValidationReport& rep);

}  // namespace cvgen
