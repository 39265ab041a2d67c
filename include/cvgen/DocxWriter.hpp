#pragma once

#include <filesystem>
#include <string>

#include "cvgen/DocumentTree.hpp"
#include "cvgen/StyleRegistry.hpp"

namespace cvgen {

// Individual OOXML parts, exposed for inspection and tests.
std::string render_document_xml(const DocumentTree& tree);
std::string render_styles_xml(const StyleRegistry& styles);
std::string render_numbering_xml(const StyleRegistry& styles);

// Complete .docx package bytes. Deterministic: no timestamps are embedded.
std::string build_docx(const DocumentTree& tree);

// Writes build_docx(tree) to path via a temporary file and rename, creating
// parent directories. Throws IOError; no partial file is left behind.
void serialize(const DocumentTree& tree, const std::filesystem::path& path);

}  // namespace cvgen
