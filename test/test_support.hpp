#pragma once

#include <filesystem>
#include <map>
#include <string>

#include <nlohmann/json.hpp>

#include "cvgen/DocumentTree.hpp"

namespace cvgen_test {

// Temporary directory removed on destruction.
class ScratchDir {
    std::filesystem::path path_;

public:
    explicit ScratchDir(const std::string& tag);
    ~ScratchDir();

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
};

// Entry name -> uncompressed content, read through miniz. Throws
// std::runtime_error on a malformed archive or a CRC mismatch.
std::map<std::string, std::string> unzip(const std::string& archive);

std::string read_file(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, const std::string& content);

// Record used by several suites: every section populated.
nlohmann::json full_resume_json();

// Index of the first paragraph whose text() equals text, or -1.
int find_paragraph(const cvgen::DocumentTree& tree, const std::string& text);

int count_paragraphs(const cvgen::DocumentTree& tree, const std::string& text);

}  // namespace cvgen_test
